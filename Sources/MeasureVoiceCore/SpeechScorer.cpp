#include "SpeechScorer.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cmath>

#include <fvad.h>

namespace mv {

// ---------------------------------------------------------------------------
// EnergyScorer
// ---------------------------------------------------------------------------

float EnergyScorer::compute_rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

FrameScore EnergyScorer::score(const AudioFrame& frame) {
    FrameScore s;
    s.value  = compute_rms(frame.samples.data(), frame.samples.size());
    s.speech = s.value > threshold_;
    return s;
}

// ---------------------------------------------------------------------------
// FvadScorer
// ---------------------------------------------------------------------------

std::unique_ptr<FvadScorer> FvadScorer::create(int sample_rate, int mode,
                                               float speech_ratio,
                                               std::string& error) {
    Fvad* vad = fvad_new();
    if (!vad) {
        error = "fvad_new failed";
        return nullptr;
    }
    if (fvad_set_sample_rate(vad, sample_rate) < 0) {
        error = "libfvad does not support " + std::to_string(sample_rate) + " Hz";
        fvad_free(vad);
        return nullptr;
    }
    if (fvad_set_mode(vad, mode) < 0) {
        error = "invalid libfvad mode " + std::to_string(mode);
        fvad_free(vad);
        return nullptr;
    }
    return std::unique_ptr<FvadScorer>(new FvadScorer(vad, sample_rate, speech_ratio));
}

FvadScorer::FvadScorer(Fvad* vad, int sample_rate, float speech_ratio)
    : vad_(vad),
      window_samples_(static_cast<size_t>(sample_rate / 100)),   // 10 ms
      speech_ratio_(speech_ratio) {
    carry_.reserve(window_samples_ * 4);
}

FvadScorer::~FvadScorer() {
    if (vad_) fvad_free(vad_);
}

FrameScore FvadScorer::score(const AudioFrame& frame) {
    for (float sample : frame.samples) {
        float clamped = std::clamp(sample, -1.0f, 1.0f);
        carry_.push_back(static_cast<int16_t>(clamped * 32767.0f));
    }

    size_t windows = 0;
    size_t voiced  = 0;
    size_t offset  = 0;
    while (carry_.size() - offset >= window_samples_) {
        int rc = fvad_process(vad_, carry_.data() + offset, window_samples_);
        if (rc == 1) ++voiced;
        // rc < 0 only happens for an invalid window length, which the
        // constructor rules out; such a window counts as silence.
        ++windows;
        offset += window_samples_;
    }
    carry_.erase(carry_.begin(), carry_.begin() + static_cast<std::ptrdiff_t>(offset));

    if (windows == 0) return last_;

    FrameScore s;
    s.value  = static_cast<float>(voiced) / static_cast<float>(windows);
    s.speech = s.value >= speech_ratio_;
    last_ = s;
    return s;
}

void FvadScorer::reset() {
    carry_.clear();
    last_ = FrameScore{};
    fvad_reset(vad_);
}

// ---------------------------------------------------------------------------
// make_scorer
// ---------------------------------------------------------------------------

std::unique_ptr<SpeechScorer> make_scorer(const VadConfig& config,
                                          int sample_rate,
                                          ScorerStatus& status) {
    status = ScorerStatus{};

    if (config.scorer == ScorerKind::model) {
        status.requested = "fvad";
        std::string error;
        auto fvad = FvadScorer::create(sample_rate, config.fvad_mode,
                                       config.model_speech_ratio, error);
        if (fvad) {
            status.active = fvad->name();
            Logger::info("VAD scorer: fvad (mode " + std::to_string(config.fvad_mode) + ")");
            return fvad;
        }
        status.fallback = true;
        status.reason   = error;
        Logger::warn("Model VAD unavailable (" + error + "), falling back to energy threshold");
    } else {
        status.requested = "energy";
    }

    auto energy = std::make_unique<EnergyScorer>(config.energy_threshold);
    status.active = energy->name();
    if (!status.fallback) {
        Logger::info("VAD scorer: energy (threshold " +
                     std::to_string(config.energy_threshold) + ")");
    }
    return energy;
}

} // namespace mv
