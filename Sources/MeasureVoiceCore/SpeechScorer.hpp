#pragma once

#include "Config.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward-declare libfvad's handle so fvad.h stays out of consumers.
struct Fvad;

namespace mv {

/// Per-frame speech score.  `value` is scorer-specific (RMS for the energy
/// scorer, voted speech ratio for the model scorer).
struct FrameScore {
    float value  = 0.0f;
    bool  speech = false;
};

/// One strategy for scoring a frame as speech or silence.
class SpeechScorer {
public:
    virtual ~SpeechScorer() = default;

    virtual FrameScore score(const AudioFrame& frame) = 0;
    virtual const char* name() const = 0;
    virtual void reset() {}
};

/// RMS energy against a fixed threshold.  Always available.
class EnergyScorer : public SpeechScorer {
public:
    explicit EnergyScorer(float threshold) : threshold_(threshold) {}

    FrameScore score(const AudioFrame& frame) override;
    const char* name() const override { return "energy"; }

    static float compute_rms(const float* samples, size_t count);

private:
    float threshold_;
};

/// WebRTC GMM voice detector through libfvad.
///
/// libfvad only accepts 10/20/30 ms windows at 8/16/32/48 kHz, so incoming
/// hops are cut into 10 ms windows with the remainder carried into the next
/// frame.  A frame is speech when the share of its windows voted speech
/// reaches `speech_ratio`; a frame too short to complete a window repeats the
/// previous decision.
class FvadScorer : public SpeechScorer {
public:
    /// Returns nullptr and fills `error` when libfvad cannot be set up for
    /// this sample rate or mode.
    static std::unique_ptr<FvadScorer> create(int sample_rate, int mode,
                                              float speech_ratio,
                                              std::string& error);
    ~FvadScorer() override;

    FvadScorer(const FvadScorer&) = delete;
    FvadScorer& operator=(const FvadScorer&) = delete;

    FrameScore score(const AudioFrame& frame) override;
    const char* name() const override { return "fvad"; }
    void reset() override;

private:
    FvadScorer(Fvad* vad, int sample_rate, float speech_ratio);

    Fvad*                   vad_;
    size_t                  window_samples_;
    float                   speech_ratio_;
    std::vector<int16_t>    carry_;
    FrameScore              last_{};
};

/// Which scorer the detector ended up with.
struct ScorerStatus {
    std::string requested;
    std::string active;
    bool        fallback = false;
    std::string reason;
};

/// Build the configured scorer, falling back to EnergyScorer when the model
/// scorer is unavailable.  Never throws for an unavailable model scorer.
std::unique_ptr<SpeechScorer> make_scorer(const VadConfig& config,
                                          int sample_rate,
                                          ScorerStatus& status);

} // namespace mv
