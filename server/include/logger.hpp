#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace filedrop::server {

enum class LogLevel {
    kInfo,
    kWarn,
    kError,
};

std::string_view level_tag(LogLevel level);

// Writes one timestamped line per call to std::clog and, when `file_path` is
// non-empty, appends it to that file. Safe to share between threads.
class Logger {
public:
    explicit Logger(const std::string& file_path);

    void log(LogLevel level, std::string_view message);

    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

private:
    std::mutex mutex_;
    std::ofstream file_;
};

}  // namespace filedrop::server
