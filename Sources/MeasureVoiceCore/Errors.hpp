#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace mv {

enum class ErrorCode {
    device_unavailable,
    device_read_glitch,
    recognition_failed,
    recognition_timeout,
    value_out_of_range,
    persist_failed
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::device_unavailable:  return "DeviceUnavailable";
        case ErrorCode::device_read_glitch:  return "DeviceReadGlitch";
        case ErrorCode::recognition_failed:  return "RecognitionFailed";
        case ErrorCode::recognition_timeout: return "RecognitionTimeout";
        case ErrorCode::value_out_of_range:  return "ValueOutOfRange";
        case ErrorCode::persist_failed:      return "PersistFailed";
    }
    return "Unknown";
}

/// Only device_unavailable stops the pipeline; everything else is recovered
/// where it happens and reported.
inline bool is_fatal(ErrorCode c) {
    return c == ErrorCode::device_unavailable;
}

/// Reports a recovered (non-fatal) error to whoever drives the pipeline.
using ErrorCallback = std::function<void(ErrorCode, const std::string& detail)>;

/// Thrown by AudioFrameSource::start() once device acquisition retries are
/// exhausted.
class DeviceUnavailable : public std::runtime_error {
public:
    explicit DeviceUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

/// Thrown by load_config() for unreadable or invalid configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace mv
