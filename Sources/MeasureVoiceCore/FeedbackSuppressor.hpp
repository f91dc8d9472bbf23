#pragma once

#include "Types.hpp"

#include <cstdint>
#include <mutex>

namespace mv {

/// Gate between the capture thread and the VAD that keeps the system from
/// hearing its own synthesized speech.
///
/// The TTS collaborator calls set_playing(true) right before playback starts
/// and set_playing(false) once it ends.  While playing, and for
/// `release_tail_ms` after playback ends, every frame that passes through
/// process() is tagged `suppressed` and its samples are zeroed.
///
/// set_playing() and process() serialize on the same mutex: a frame is
/// classified against exactly one side of any concurrent flag transition.
class FeedbackSuppressor {
public:
    explicit FeedbackSuppressor(int release_tail_ms = 0);

    FeedbackSuppressor(const FeedbackSuppressor&) = delete;
    FeedbackSuppressor& operator=(const FeedbackSuppressor&) = delete;

    void set_playing(bool playing);
    bool is_playing() const;

    /// Classify one frame.  Returns true if the frame was suppressed.
    bool process(AudioFrame& frame);

    uint64_t suppressed_frames() const;

    /// Number of playback start signals seen so far.
    uint64_t playback_count() const;

private:
    const int64_t       release_tail_us_;

    mutable std::mutex  mu_;
    bool                playing_        = false;
    int64_t             tail_remaining_us_ = 0;
    uint64_t            suppressed_     = 0;
    uint64_t            playbacks_      = 0;
};

} // namespace mv
