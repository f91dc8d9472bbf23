#include "Logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mv {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
std::mutex       g_mu;
std::ofstream    g_file;

std::string timestamp_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug") return LogLevel::debug;
    if (s == "info")  return LogLevel::info;
    if (s == "warn" || s == "warning") return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    return LogLevel::info;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO";
        case LogLevel::warn:  return "WARN";
        case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

void Logger::set_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mu);
    if (g_file.is_open()) g_file.close();
    if (path.empty()) return true;
    g_file.open(path, std::ios::app);
    return g_file.is_open();
}

void Logger::debug(const std::string& msg) { log(LogLevel::debug, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::info, msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::warn, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::error, msg); }

void Logger::log(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::string line = timestamp_now() + " [" + log_level_to_string(level) + "] " + msg;

    std::lock_guard<std::mutex> lock(g_mu);
    std::cerr << line << '\n';
    if (g_file.is_open()) {
        g_file << line << '\n';
        g_file.flush();
    }
}

} // namespace mv
