#include "SegmentAssembler.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <iterator>

namespace mv {

SegmentAssembler::SegmentAssembler(const SegmentConfig& config, int min_speech_duration_ms)
    : padding_us_(static_cast<int64_t>(std::max(0, config.speech_padding_ms)) * 1000),
      ring_capacity_us_(padding_us_ +
                        static_cast<int64_t>(std::max(0, min_speech_duration_ms)) * 1000),
      min_segment_us_(static_cast<int64_t>(std::max(0, config.min_segment_ms)) * 1000) {}

// ---------------------------------------------------------------------------
// push
// ---------------------------------------------------------------------------

std::optional<SpeechSegment> SegmentAssembler::push(const AudioFrame& frame,
                                                    const VadEvent& event,
                                                    bool voiced) {
    if (!open_) {
        ring_.push_back(Buffered{frame, voiced});
        ring_us_ += frame.duration_us();

        if (event.kind == VadEventKind::speech_start) {
            open_segment(event.sequence);
        } else {
            trim_ring();
        }
        return std::nullopt;
    }

    append(frame, voiced);
    if (event.kind != VadEventKind::speech_end) {
        return std::nullopt;
    }

    SpeechSegment segment = std::move(*open_);
    open_.reset();
    const int64_t voiced_us = voiced_us_;
    segment.duration_ms = open_us_ / 1000;
    segment.voiced_ms   = voiced_us / 1000;
    open_us_ = voiced_us_ = 0;

    if (voiced_us < min_segment_us_) {
        ++discarded_;
        Logger::debug("Discarded short segment (" + std::to_string(segment.voiced_ms) +
                      " ms voiced)");
        return std::nullopt;
    }

    ++emitted_;
    Logger::debug("Segment " + std::to_string(segment.start_sequence) + ".." +
                  std::to_string(segment.end_sequence) + " closed, " +
                  std::to_string(segment.duration_ms) + " ms");
    return segment;
}

// ---------------------------------------------------------------------------
// discard_open
// ---------------------------------------------------------------------------

bool SegmentAssembler::discard_open() {
    bool was_open = open_.has_value();
    if (was_open) {
        ++discarded_;
        open_.reset();
    }
    open_us_ = voiced_us_ = 0;
    ring_.clear();
    ring_us_ = 0;
    return was_open;
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

void SegmentAssembler::open_segment(uint64_t onset) {
    open_.emplace();
    open_us_ = voiced_us_ = 0;

    // Padding ahead of the onset, counted back from the frame just before it.
    int64_t pad = 0;
    auto first = ring_.end();
    for (auto it = ring_.begin(); it != ring_.end(); ++it) {
        if (it->frame.sequence >= onset) {
            first = it;
            break;
        }
    }
    while (first != ring_.begin()) {
        auto prev = std::prev(first);
        int64_t d = prev->frame.duration_us();
        if (pad + d > padding_us_) break;
        pad += d;
        first = prev;
    }

    for (auto it = first; it != ring_.end(); ++it) {
        // Pre-roll ahead of the onset is padding, not voiced time.
        append(it->frame, it->frame.sequence >= onset && it->voiced);
    }
    ring_.clear();
    ring_us_ = 0;
}

void SegmentAssembler::append(const AudioFrame& frame, bool voiced) {
    SpeechSegment& seg = *open_;
    if (seg.frames.empty()) {
        seg.start_sequence = frame.sequence;
        seg.started_at_ms  = frame.captured_at_ms;
        seg.sample_rate    = frame.sample_rate;
    }
    const int64_t d = frame.duration_us();
    seg.end_sequence = frame.sequence;
    seg.ended_at_ms  = frame.captured_at_ms + d / 1000;
    seg.frames.push_back(frame);

    open_us_ += d;
    if (voiced) voiced_us_ += d;
}

void SegmentAssembler::trim_ring() {
    // Keep at least the capacity; the onset must never fall off the front.
    while (!ring_.empty() &&
           ring_us_ - ring_.front().frame.duration_us() >= ring_capacity_us_) {
        ring_us_ -= ring_.front().frame.duration_us();
        ring_.pop_front();
    }
}

} // namespace mv
