#include "VoiceActivityDetector.hpp"

#include "Logger.hpp"

namespace mv {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config, int sample_rate)
    : config_(config) {
    scorer_ = make_scorer(config_, sample_rate, status_);
}

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config,
                                             std::unique_ptr<SpeechScorer> scorer)
    : config_(config), scorer_(std::move(scorer)) {
    status_.requested = scorer_->name();
    status_.active    = scorer_->name();
}

// ---------------------------------------------------------------------------
// process
// ---------------------------------------------------------------------------

VadEvent VoiceActivityDetector::process(const AudioFrame& frame) {
    FrameScore score;
    if (!frame.suppressed) {
        score = scorer_->score(frame);
    }
    last_speech_ = score.speech;
    last_score_  = score.value;

    const int64_t dur = frame.duration_us();
    VadEvent event;

    if (state_ == VadState::silence) {
        if (!score.speech) {
            speech_run_us_ = 0;
            return event;
        }
        if (speech_run_us_ == 0) onset_seq_ = frame.sequence;
        speech_run_us_ += dur;

        if (speech_run_us_ >= ms_to_us(config_.min_speech_duration_ms)) {
            state_      = VadState::speech;
            segment_us_ = speech_run_us_;
            silence_us_ = 0;
            event.kind     = VadEventKind::speech_start;
            event.sequence = onset_seq_;
            Logger::debug("VAD speech start at frame " + std::to_string(onset_seq_));
        }
        return event;
    }

    // Speech.
    segment_us_ += dur;
    silence_us_ = score.speech ? 0 : silence_us_ + dur;

    const int64_t voiced_extent = segment_us_ - silence_us_;
    const int64_t required = voiced_extent > ms_to_us(config_.long_utterance_ms)
        ? ms_to_us(config_.long_utterance_silence_ms)
        : ms_to_us(config_.min_silence_duration_ms);

    bool end    = silence_us_ > 0 && silence_us_ >= required;
    bool forced = false;
    if (!end && config_.max_segment_ms > 0 &&
        segment_us_ >= ms_to_us(config_.max_segment_ms)) {
        end = forced = true;
    }

    if (end) {
        event.kind     = VadEventKind::speech_end;
        event.sequence = frame.sequence;
        event.forced   = forced;
        Logger::debug(std::string("VAD speech end at frame ") + std::to_string(frame.sequence) +
                      (forced ? " (max segment length)" : ""));
        state_         = VadState::silence;
        speech_run_us_ = 0;
        segment_us_    = 0;
        silence_us_    = 0;
    }
    return event;
}

// ---------------------------------------------------------------------------
// reset
// ---------------------------------------------------------------------------

void VoiceActivityDetector::reset() {
    state_         = VadState::silence;
    onset_seq_     = 0;
    speech_run_us_ = 0;
    segment_us_    = 0;
    silence_us_    = 0;
    last_speech_   = false;
    last_score_    = 0.0f;
    scorer_->reset();
}

} // namespace mv
