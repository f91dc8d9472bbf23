#pragma once

#include "Types.hpp"

#include <map>
#include <string>
#include <vector>

namespace mv {

struct AudioConfig {
    std::string input_format     = "alsa";     // libavdevice input (alsa, pulse, avfoundation)
    std::string device           = "default";
    int         sample_rate      = 16000;
    int         hop_size         = 256;        // samples per AudioFrame
    int         open_retries     = 3;
    int         retry_backoff_ms = 500;        // doubled after every failed attempt
    int         max_read_failures = 10;        // consecutive read errors before reopening
    size_t      queue_capacity   = 512;        // frames buffered ahead of the VAD
};

enum class ScorerKind {
    energy,
    model
};

struct VadConfig {
    ScorerKind  scorer                    = ScorerKind::model;
    float       energy_threshold          = 0.015f;   // RMS, full scale = 1.0
    int         fvad_mode                 = 2;        // libfvad aggressiveness 0..3
    float       model_speech_ratio        = 0.5f;     // fraction of 10 ms windows voted speech
    int         min_speech_duration_ms    = 300;
    int         min_silence_duration_ms   = 600;
    int         long_utterance_ms         = 2000;
    int         long_utterance_silence_ms = 300;
    int         max_segment_ms            = 15000;
};

struct SuppressorConfig {
    int release_tail_ms = 200;
};

struct SegmentConfig {
    int speech_padding_ms = 300;
    int min_segment_ms    = 300;    // voiced duration below this is noise
};

struct RecognitionConfig {
    std::string model_path  = "models/ggml-base.bin";
    std::string language    = "zh";
    int         n_threads   = 4;
    int         timeout_ms  = 10000;
    int         max_retries = 1;
};

struct CommandConfig {
    std::string match_mode           = "fuzzy";   // exact | contains | fuzzy
    float       similarity_threshold = 0.8f;
    int         min_match_length     = 2;
    std::map<CommandKind, std::vector<std::string>> vocabulary;
    std::vector<std::string> context_prefixes;
    std::vector<std::string> filler_tokens;
    std::vector<std::string> feedback_keywords;
    std::string correction_dictionary;            // path to wrong=correct file
};

struct ExtractorConfig {
    double  min_value          = -1000000.0;
    double  max_value          = 1000000000000.0;
    int64_t hundred_multiple   = 100;
    size_t  min_context_length = 2;
};

struct StoreConfig {
    std::string database_path      = "measurements.db";
    int64_t     default_context_id = 100;
    bool        renumber_on_stop   = true;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct AppConfig {
    AudioConfig       audio;
    VadConfig         vad;
    SuppressorConfig  suppressor;
    SegmentConfig     segment;
    RecognitionConfig recognition;
    CommandConfig     commands;
    ExtractorConfig   extractor;
    StoreConfig       store;
    LogConfig         log;
};

/// Defaults, including the stock command vocabulary.
AppConfig default_config();

/// VAD presets for the two environments the thresholds were tuned in.
/// Known names: "quiet", "noisy".  Returns false for anything else.
bool apply_vad_preset(VadConfig& vad, const std::string& preset);

/// Load a JSON configuration file and merge it over default_config().
/// Missing keys keep their defaults.  Environment overrides are applied last.
/// Throws ConfigError on unreadable files, parse errors or invalid values.
AppConfig load_config(const std::string& path);

/// Merge a JSON document (as text) over `base`.  Exposed for tests.
AppConfig merge_config_json(const AppConfig& base, const std::string& json_text);

/// Apply MEASUREVOICE_MODEL_PATH / MEASUREVOICE_DB_PATH / MEASUREVOICE_LOG_LEVEL.
void apply_environment_overrides(AppConfig& config);

/// Throws ConfigError describing the first invalid value.
void validate_config(const AppConfig& config);

} // namespace mv
