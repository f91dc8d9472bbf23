#include "FeedbackSuppressor.hpp"

#include "Logger.hpp"

#include <algorithm>

namespace mv {

FeedbackSuppressor::FeedbackSuppressor(int release_tail_ms)
    : release_tail_us_(static_cast<int64_t>(std::max(0, release_tail_ms)) * 1000) {}

void FeedbackSuppressor::set_playing(bool playing) {
    std::lock_guard<std::mutex> lock(mu_);
    if (playing == playing_) return;

    playing_ = playing;
    if (playing) {
        ++playbacks_;
        tail_remaining_us_ = 0;
        Logger::debug("Feedback suppression on (TTS playback started)");
    } else {
        // Room echo outlives the playback call; keep muting for the tail.
        tail_remaining_us_ = release_tail_us_;
        Logger::debug("Feedback suppression releasing (TTS playback ended)");
    }
}

bool FeedbackSuppressor::is_playing() const {
    std::lock_guard<std::mutex> lock(mu_);
    return playing_;
}

bool FeedbackSuppressor::process(AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(mu_);

    bool suppress = playing_;
    if (!suppress && tail_remaining_us_ > 0) {
        suppress = true;
        tail_remaining_us_ -= frame.duration_us();
    }

    if (suppress) {
        frame.suppressed = true;
        std::fill(frame.samples.begin(), frame.samples.end(), 0.0f);
        ++suppressed_;
    }
    return suppress;
}

uint64_t FeedbackSuppressor::suppressed_frames() const {
    std::lock_guard<std::mutex> lock(mu_);
    return suppressed_;
}

uint64_t FeedbackSuppressor::playback_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return playbacks_;
}

} // namespace mv
