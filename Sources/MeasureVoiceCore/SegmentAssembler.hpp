#pragma once

#include "Config.hpp"
#include "Types.hpp"
#include "VoiceActivityDetector.hpp"

#include <cstdint>
#include <deque>
#include <optional>

namespace mv {

/// Turns the VAD's boundary events into SpeechSegments.
///
/// While no segment is open a ring of recent frames is kept.  It covers
/// `speech_padding_ms` ahead of the longest possible onset lookback
/// (`min_speech_duration_ms`), so that on SpeechStart the segment is seeded
/// with the confirming speech run plus the padding before it.
///
/// A closed segment whose voiced duration is below `min_segment_ms` is
/// dropped silently.  Open segments are never emitted.  Single-threaded.
class SegmentAssembler {
public:
    SegmentAssembler(const SegmentConfig& config, int min_speech_duration_ms);

    SegmentAssembler(const SegmentAssembler&) = delete;
    SegmentAssembler& operator=(const SegmentAssembler&) = delete;

    /// Feed one frame together with the VAD's verdict on it.  Returns the
    /// finished segment if this frame closed one that is long enough.
    std::optional<SpeechSegment> push(const AudioFrame& frame,
                                      const VadEvent& event,
                                      bool voiced);

    bool is_open() const { return open_.has_value(); }

    /// Drop the in-flight segment and the pre-roll.  Returns true if a
    /// segment was open.
    bool discard_open();

    uint64_t emitted_count() const   { return emitted_; }
    uint64_t discarded_count() const { return discarded_; }

private:
    struct Buffered {
        AudioFrame frame;
        bool       voiced = false;
    };

    void open_segment(uint64_t onset);
    void append(const AudioFrame& frame, bool voiced);
    void trim_ring();

    int64_t                     padding_us_;
    int64_t                     ring_capacity_us_;
    int64_t                     min_segment_us_;

    std::deque<Buffered>        ring_;
    int64_t                     ring_us_ = 0;

    std::optional<SpeechSegment> open_;
    int64_t                     open_us_   = 0;
    int64_t                     voiced_us_ = 0;

    uint64_t                    emitted_   = 0;
    uint64_t                    discarded_ = 0;
};

} // namespace mv
