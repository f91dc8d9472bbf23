#include "WhisperEngine.hpp"

#include "AudioConverter.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>

#include "whisper.h"

namespace mv {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperEngine::WhisperEngine(const RecognitionConfig& config)
    : config_(config) {}

WhisperEngine::~WhisperEngine() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool WhisperEngine::init() {
    std::lock_guard<std::mutex> lock(mu_);

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
    if (!ctx_) {
        Logger::error("Failed to load whisper model from " + config_.model_path);
        return false;
    }
    Logger::info("Loaded whisper model " + config_.model_path);
    return true;
}

bool WhisperEngine::is_ready() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

// ---------------------------------------------------------------------------
// transcribe
// ---------------------------------------------------------------------------

std::optional<std::string> WhisperEngine::transcribe(const std::vector<float>& pcm,
                                                     int sample_rate) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!ctx_) {
        return std::nullopt;
    }

    std::vector<float> pcm16k = sample_rate == kWhisperRate
        ? pcm
        : AudioConverter::resample(pcm, sample_rate, kWhisperRate);
    if (pcm16k.empty()) {
        return std::nullopt;
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_timestamps = false;
    params.single_segment   = true;     // one utterance per call
    params.no_context       = true;     // utterances are independent
    params.language         = config_.language.c_str();
    params.n_threads        = config_.n_threads;

    int ret = whisper_full(ctx_, params, pcm16k.data(), static_cast<int>(pcm16k.size()));
    if (ret != 0) {
        Logger::warn("whisper_full failed with code " + std::to_string(ret));
        return std::nullopt;
    }

    std::string result;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) result += text;
    }

    // Trim the leading space whisper puts before each segment.
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    return result;
}

} // namespace mv
