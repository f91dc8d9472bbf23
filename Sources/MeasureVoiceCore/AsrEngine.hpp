#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mv {

/// Speech-to-text boundary.  The pipeline treats the engine as a black box:
/// PCM in, text out.
class AsrEngine {
public:
    virtual ~AsrEngine() = default;

    /// Transcribe mono float32 PCM.  std::nullopt means the engine failed;
    /// an empty string means it heard nothing.
    ///
    /// Called from a single inference thread at a time, but not necessarily
    /// the same thread on every call.
    virtual std::optional<std::string> transcribe(const std::vector<float>& pcm,
                                                  int sample_rate) = 0;

    virtual bool is_ready() const = 0;
};

} // namespace mv
