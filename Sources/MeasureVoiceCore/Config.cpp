#include "Config.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace mv {

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

const json* section_of(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return &*it;
}

ScorerKind scorer_from_string(const std::string& s) {
    if (s == "energy") return ScorerKind::energy;
    if (s == "model")  return ScorerKind::model;
    throw ConfigError("vad.scorer must be 'energy' or 'model', got '" + s + "'");
}

} // namespace

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

AppConfig default_config() {
    AppConfig c;
    c.commands.vocabulary[CommandKind::pause]  = {"暂停录音", "暂停一下", "暂停", "停一下", "等一下"};
    c.commands.vocabulary[CommandKind::resume] = {"继续录音", "继续", "恢复", "接着来"};
    c.commands.vocabulary[CommandKind::stop]   = {"停止录音", "停止", "结束", "退出"};
    c.commands.context_prefixes  = {"切换到", "切换", "设置标准序号", "设置序号",
                                    "设置", "标准序号", "序号"};
    c.commands.filler_tokens     = {"嗯", "呃", "啊", "那个"};
    c.commands.feedback_keywords = {"成功提取", "识别到", "检测到", "测量值为"};
    return c;
}

bool apply_vad_preset(VadConfig& vad, const std::string& preset) {
    if (preset == "quiet") {
        vad.energy_threshold        = 0.010f;
        vad.fvad_mode               = 1;
        vad.min_speech_duration_ms  = 200;
        vad.min_silence_duration_ms = 600;
        return true;
    }
    if (preset == "noisy") {
        vad.energy_threshold        = 0.035f;
        vad.fvad_mode               = 3;
        vad.min_speech_duration_ms  = 350;
        vad.min_silence_duration_ms = 800;
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// JSON merge
// ---------------------------------------------------------------------------

AppConfig merge_config_json(const AppConfig& base, const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    AppConfig c = base;

    if (const json* s = section_of(root, "audio")) {
        read_key(*s, "input_format", c.audio.input_format);
        read_key(*s, "device", c.audio.device);
        read_key(*s, "sample_rate", c.audio.sample_rate);
        read_key(*s, "hop_size", c.audio.hop_size);
        read_key(*s, "open_retries", c.audio.open_retries);
        read_key(*s, "retry_backoff_ms", c.audio.retry_backoff_ms);
        read_key(*s, "max_read_failures", c.audio.max_read_failures);
        read_key(*s, "queue_capacity", c.audio.queue_capacity);
    }

    if (const json* s = section_of(root, "vad")) {
        std::string preset;
        read_key(*s, "preset", preset);
        if (!preset.empty() && !apply_vad_preset(c.vad, preset)) {
            throw ConfigError("unknown vad.preset '" + preset + "'");
        }
        std::string scorer;
        read_key(*s, "scorer", scorer);
        if (!scorer.empty()) c.vad.scorer = scorer_from_string(scorer);
        read_key(*s, "energy_threshold", c.vad.energy_threshold);
        read_key(*s, "fvad_mode", c.vad.fvad_mode);
        read_key(*s, "model_speech_ratio", c.vad.model_speech_ratio);
        read_key(*s, "min_speech_duration_ms", c.vad.min_speech_duration_ms);
        read_key(*s, "min_silence_duration_ms", c.vad.min_silence_duration_ms);
        read_key(*s, "long_utterance_ms", c.vad.long_utterance_ms);
        read_key(*s, "long_utterance_silence_ms", c.vad.long_utterance_silence_ms);
        read_key(*s, "max_segment_ms", c.vad.max_segment_ms);
    }

    if (const json* s = section_of(root, "suppressor")) {
        read_key(*s, "release_tail_ms", c.suppressor.release_tail_ms);
    }

    if (const json* s = section_of(root, "segment")) {
        read_key(*s, "speech_padding_ms", c.segment.speech_padding_ms);
        read_key(*s, "min_segment_ms", c.segment.min_segment_ms);
    }

    if (const json* s = section_of(root, "recognition")) {
        read_key(*s, "model_path", c.recognition.model_path);
        read_key(*s, "language", c.recognition.language);
        read_key(*s, "n_threads", c.recognition.n_threads);
        read_key(*s, "timeout_ms", c.recognition.timeout_ms);
        read_key(*s, "max_retries", c.recognition.max_retries);
    }

    if (const json* s = section_of(root, "commands")) {
        read_key(*s, "match_mode", c.commands.match_mode);
        read_key(*s, "similarity_threshold", c.commands.similarity_threshold);
        read_key(*s, "min_match_length", c.commands.min_match_length);
        read_key(*s, "context_prefixes", c.commands.context_prefixes);
        read_key(*s, "filler_tokens", c.commands.filler_tokens);
        read_key(*s, "feedback_keywords", c.commands.feedback_keywords);
        read_key(*s, "correction_dictionary", c.commands.correction_dictionary);

        auto vocab = s->find("vocabulary");
        if (vocab != s->end()) {
            if (!vocab->is_object()) {
                throw ConfigError("commands.vocabulary must be an object");
            }
            for (auto it = vocab->begin(); it != vocab->end(); ++it) {
                auto kind = command_kind_from_string(it.key());
                if (!kind || *kind == CommandKind::set_context) {
                    throw ConfigError("unknown command '" + it.key() + "' in commands.vocabulary");
                }
                std::vector<std::string> phrases;
                read_key(*vocab, it.key().c_str(), phrases);
                c.commands.vocabulary[*kind] = std::move(phrases);
            }
        }
    }

    if (const json* s = section_of(root, "extractor")) {
        read_key(*s, "min_value", c.extractor.min_value);
        read_key(*s, "max_value", c.extractor.max_value);
        read_key(*s, "hundred_multiple", c.extractor.hundred_multiple);
        read_key(*s, "min_context_length", c.extractor.min_context_length);
    }

    if (const json* s = section_of(root, "store")) {
        read_key(*s, "database_path", c.store.database_path);
        read_key(*s, "default_context_id", c.store.default_context_id);
        read_key(*s, "renumber_on_stop", c.store.renumber_on_stop);
    }

    if (const json* s = section_of(root, "log")) {
        read_key(*s, "level", c.log.level);
        read_key(*s, "file", c.log.file);
    }

    return c;
}

// ---------------------------------------------------------------------------
// Environment overrides
// ---------------------------------------------------------------------------

void apply_environment_overrides(AppConfig& config) {
    if (const char* v = std::getenv("MEASUREVOICE_MODEL_PATH"); v && *v) {
        config.recognition.model_path = v;
    }
    if (const char* v = std::getenv("MEASUREVOICE_DB_PATH"); v && *v) {
        config.store.database_path = v;
    }
    if (const char* v = std::getenv("MEASUREVOICE_LOG_LEVEL"); v && *v) {
        config.log.level = v;
    }
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

void validate_config(const AppConfig& c) {
    if (c.audio.sample_rate <= 0)  throw ConfigError("audio.sample_rate must be positive");
    if (c.audio.hop_size <= 0)     throw ConfigError("audio.hop_size must be positive");
    if (c.audio.open_retries < 0)  throw ConfigError("audio.open_retries must be >= 0");
    if (c.audio.max_read_failures < 1) {
        throw ConfigError("audio.max_read_failures must be >= 1");
    }
    if (c.audio.queue_capacity == 0) throw ConfigError("audio.queue_capacity must be positive");
    if (c.vad.energy_threshold < 0.0f) throw ConfigError("vad.energy_threshold must be >= 0");
    if (c.vad.fvad_mode < 0 || c.vad.fvad_mode > 3) {
        throw ConfigError("vad.fvad_mode must be within 0..3");
    }
    if (c.vad.model_speech_ratio <= 0.0f || c.vad.model_speech_ratio > 1.0f) {
        throw ConfigError("vad.model_speech_ratio must be within (0, 1]");
    }
    if (c.vad.min_speech_duration_ms < 0 || c.vad.min_silence_duration_ms <= 0 ||
        c.vad.long_utterance_silence_ms <= 0) {
        throw ConfigError("vad durations must be positive");
    }
    if (c.vad.long_utterance_silence_ms > c.vad.min_silence_duration_ms) {
        throw ConfigError("vad.long_utterance_silence_ms must not exceed min_silence_duration_ms");
    }
    if (c.recognition.timeout_ms <= 0) throw ConfigError("recognition.timeout_ms must be positive");
    if (c.recognition.max_retries < 0) throw ConfigError("recognition.max_retries must be >= 0");
    if (c.commands.match_mode != "exact" && c.commands.match_mode != "contains" &&
        c.commands.match_mode != "fuzzy") {
        throw ConfigError("commands.match_mode must be exact, contains or fuzzy");
    }
    if (c.commands.similarity_threshold <= 0.0f || c.commands.similarity_threshold > 1.0f) {
        throw ConfigError("commands.similarity_threshold must be within (0, 1]");
    }
    if (c.commands.min_match_length < 1) throw ConfigError("commands.min_match_length must be >= 1");
    if (c.extractor.min_value > c.extractor.max_value) {
        throw ConfigError("extractor.min_value must not exceed max_value");
    }
    if (c.extractor.hundred_multiple <= 0) {
        throw ConfigError("extractor.hundred_multiple must be positive");
    }
    if (c.store.default_context_id <= 0 ||
        c.store.default_context_id % c.extractor.hundred_multiple != 0) {
        throw ConfigError("store.default_context_id must be a positive multiple of hundred_multiple");
    }
}

// ---------------------------------------------------------------------------
// load_config
// ---------------------------------------------------------------------------

AppConfig load_config(const std::string& path) {
    AppConfig c = default_config();

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw ConfigError("cannot open config file '" + path + "'");
        }
        std::stringstream ss;
        ss << in.rdbuf();
        c = merge_config_json(c, ss.str());
        Logger::info("Loaded configuration from " + path);
    } else {
        Logger::info("No configuration file given, using defaults");
    }

    apply_environment_overrides(c);
    validate_config(c);
    return c;
}

} // namespace mv
