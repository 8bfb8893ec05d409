#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>

namespace indiweb {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;
std::ofstream Logger::file_;

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_;
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;

    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream out;

    // Timestamp
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_DEBUG: out << " [DEBUG] "; break;
        case Level::LVL_INFO:  out << " [INFO]  "; break;
        case Level::LVL_WARN:  out << " [WARN]  "; break;
        case Level::LVL_ERROR: out << " [ERROR] "; break;
        default: break;
    }

    // Message
    out << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << out.str();
    if (file_.is_open()) {
        file_ << out.str();
    }

    // Flush on error so the last words survive a crash
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
        if (file_.is_open()) {
            file_.flush();
        }
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO; // Default
}

} // namespace logging
} // namespace indiweb
