#pragma once

#include "Config.hpp"
#include "SpeechScorer.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>

namespace mv {

enum class VadState {
    silence,
    speech
};

enum class VadEventKind {
    none,
    speech_start,
    speech_end
};

/// Boundary emitted by VoiceActivityDetector::process().
///
/// For speech_start, `sequence` is the onset: the first frame of the speech
/// run that confirmed the start.  For speech_end it is the frame that
/// confirmed the endpoint.  `forced` marks an endpoint imposed by
/// max_segment_ms rather than by silence.
struct VadEvent {
    VadEventKind kind     = VadEventKind::none;
    uint64_t     sequence = 0;
    bool         forced   = false;
};

/// Two-state speech/silence detector with hysteresis.
///
///   Silence -> Speech  after min_speech_duration_ms of uninterrupted speech
///   Speech  -> Silence after min_silence_duration_ms of non-speech, or
///                      long_utterance_silence_ms once the utterance has run
///                      longer than long_utterance_ms, or when the segment
///                      reaches max_segment_ms.
///
/// Frames tagged `suppressed` always score as non-speech.  Not thread-safe;
/// owned by the processing worker.
class VoiceActivityDetector {
public:
    VoiceActivityDetector(const VadConfig& config, int sample_rate);

    /// Detector with an injected scorer (tests, custom scorers).
    VoiceActivityDetector(const VadConfig& config,
                          std::unique_ptr<SpeechScorer> scorer);

    VoiceActivityDetector(const VoiceActivityDetector&) = delete;
    VoiceActivityDetector& operator=(const VoiceActivityDetector&) = delete;

    VadEvent process(const AudioFrame& frame);

    VadState state() const { return state_; }

    /// Whether the last processed frame scored as speech.
    bool last_frame_speech() const { return last_speech_; }
    float last_score() const { return last_score_; }

    const ScorerStatus& scorer_status() const { return status_; }

    /// Back to Silence with all accumulators cleared.
    void reset();

private:
    static int64_t ms_to_us(int ms) { return static_cast<int64_t>(ms) * 1000; }

    VadConfig                       config_;
    std::unique_ptr<SpeechScorer>   scorer_;
    ScorerStatus                    status_;

    VadState    state_        = VadState::silence;
    uint64_t    onset_seq_    = 0;
    int64_t     speech_run_us_ = 0;   // uninterrupted speech while in Silence
    int64_t     segment_us_   = 0;    // everything since the onset
    int64_t     silence_us_   = 0;    // trailing non-speech while in Speech
    bool        last_speech_  = false;
    float       last_score_   = 0.0f;
};

} // namespace mv
