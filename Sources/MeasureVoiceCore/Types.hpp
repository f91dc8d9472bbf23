#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mv {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

enum class SessionState {
    idle,
    recording,
    paused,
    stopped
};

inline const char* session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::idle:      return "idle";
        case SessionState::recording: return "recording";
        case SessionState::paused:    return "paused";
        case SessionState::stopped:   return "stopped";
    }
    return "unknown";
}

enum class CommandKind {
    pause,
    resume,
    stop,
    set_context,
    unknown
};

inline const char* command_kind_to_string(CommandKind k) {
    switch (k) {
        case CommandKind::pause:       return "pause";
        case CommandKind::resume:      return "resume";
        case CommandKind::stop:        return "stop";
        case CommandKind::set_context: return "set_context";
        case CommandKind::unknown:     return "unknown";
    }
    return "unknown";
}

/// Parse a vocabulary key from the configuration file back to the enum.
inline std::optional<CommandKind> command_kind_from_string(const std::string& s) {
    if (s == "pause")       return CommandKind::pause;
    if (s == "resume")      return CommandKind::resume;
    if (s == "stop")        return CommandKind::stop;
    if (s == "set_context") return CommandKind::set_context;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// One hop of mono float32 PCM as delivered by the capture thread.
struct AudioFrame {
    uint64_t            sequence    = 0;
    int                 sample_rate = 16000;
    int64_t             captured_at_ms = 0;   // steady clock
    bool                suppressed  = false;  // set by FeedbackSuppressor
    std::vector<float>  samples;

    int64_t duration_us() const {
        return sample_rate > 0
            ? static_cast<int64_t>(samples.size()) * 1000000 / sample_rate
            : 0;
    }
};

/// Frames between a confirmed speech start and a confirmed endpoint.
struct SpeechSegment {
    uint64_t                start_sequence = 0;
    uint64_t                end_sequence   = 0;
    int64_t                 started_at_ms  = 0;
    int64_t                 ended_at_ms    = 0;
    int64_t                 duration_ms    = 0;   // all frames
    int64_t                 voiced_ms      = 0;   // frames scored as speech
    int                     sample_rate    = 16000;
    std::vector<AudioFrame> frames;

    /// Concatenated samples of every frame, in sequence order.
    std::vector<float> pcm() const {
        std::vector<float> out;
        size_t total = 0;
        for (const auto& f : frames) total += f.samples.size();
        out.reserve(total);
        for (const auto& f : frames) {
            out.insert(out.end(), f.samples.begin(), f.samples.end());
        }
        return out;
    }
};

struct RecognitionResult {
    std::string             text;
    uint64_t                segment_id  = 0;   // start sequence of the segment
    int64_t                 duration_ms = 0;
    std::optional<float>    confidence;
};

struct Command {
    CommandKind             kind = CommandKind::unknown;
    std::optional<int64_t>  context_value;     // only for set_context
    std::string             phrase;            // vocabulary entry that matched

    static Command pause()  { return Command{CommandKind::pause, std::nullopt, ""}; }
    static Command resume() { return Command{CommandKind::resume, std::nullopt, ""}; }
    static Command stop()   { return Command{CommandKind::stop, std::nullopt, ""}; }
    static Command set_context(int64_t v) {
        return Command{CommandKind::set_context, v, ""};
    }
};

enum class CandidateDisposition {
    accepted,
    contextual_noise,
    command_numeral,
    out_of_range
};

inline const char* disposition_to_string(CandidateDisposition d) {
    switch (d) {
        case CandidateDisposition::accepted:         return "accepted";
        case CandidateDisposition::contextual_noise: return "contextual_noise";
        case CandidateDisposition::command_numeral:  return "command_numeral";
        case CandidateDisposition::out_of_range:     return "out_of_range";
    }
    return "unknown";
}

struct MeasurementCandidate {
    std::string             span;           // numeral as spoken
    size_t                  byte_begin  = 0;
    size_t                  byte_end    = 0;
    size_t                  char_begin  = 0; // code points
    size_t                  char_end    = 0;
    double                  value       = 0.0;
    size_t                  left_context  = 0;
    size_t                  right_context = 0;
    CandidateDisposition    disposition = CandidateDisposition::accepted;
};

struct MeasurementRecord {
    int64_t     voice_entry_id = 0;
    int64_t     row_id         = 0;
    int64_t     context_id     = 0;
    double      value          = 0.0;
    std::string raw_text;
    int64_t     timestamp      = 0;   // unix milliseconds
    bool        deleted        = false;
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired on the capture thread for every sliced frame.  Must not block.
using FrameCallback = std::function<void(AudioFrame&&)>;

/// Fired when a measurement has been appended to the store.
using MeasurementCallback = std::function<void(const MeasurementRecord&)>;

/// Fired when a recognized command has been applied.
using CommandCallback = std::function<void(const Command&, const std::string& text)>;

} // namespace mv
