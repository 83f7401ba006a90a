#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace filedrop::server {

namespace {

// Local time with milliseconds, e.g. "2024-05-01 12:30:00.250".
std::string local_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

}  // namespace

std::string_view level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
        case LogLevel::kInfo:
            break;
    }
    return "INFO";
}

Logger::Logger(const std::string& file_path) {
    if (file_path.empty()) {
        return;
    }
    const auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    file_.open(file_path, std::ios::app);
    if (!file_) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    std::string line = local_timestamp();
    line += " [";
    line += level_tag(level);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << std::flush;
    }
    std::clog << line;
}

}  // namespace filedrop::server
