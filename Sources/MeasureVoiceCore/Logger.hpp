#pragma once

#include <mutex>
#include <string>

namespace mv {

enum class LogLevel {
    debug = 0,
    info  = 1,
    warn  = 2,
    error = 3
};

/// Parse "debug" / "info" / "warn" / "error" (case-sensitive).  Falls back to
/// info for anything else.
LogLevel log_level_from_string(const std::string& s);
const char* log_level_to_string(LogLevel level);

/// Process-wide line logger.  Every line is timestamped and written to stderr,
/// and additionally appended to a file when one is configured.
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

    /// Append log lines to `path` as well.  Empty path disables file output.
    /// Returns false if the file cannot be opened.
    static bool set_file(const std::string& path);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);

private:
    Logger() = delete;
};

} // namespace mv
