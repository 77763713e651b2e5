#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace tether {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;
std::ostream *Logger::stream_ = &std::cerr;
std::ofstream Logger::file_;

namespace {

const char *level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return " [DEBUG] ";
        case Level::LVL_INFO:
            return " [INFO]  ";
        case Level::LVL_WARN:
            return " [WARN]  ";
        case Level::LVL_ERROR:
            return " [ERROR] ";
        default:
            return " ";
    }
}

}  // namespace

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::set_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::set_stream(std::ostream *stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream != nullptr ? stream : &std::cerr;
}

void Logger::log(Level level, const char *, int, const std::string &message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    line << level_tag(level) << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    *stream_ << line.str();
    if (file_.is_open()) {
        file_ << line.str();
    }

    // Flush on warnings and errors so they survive a crash of the shell
    if (level >= Level::LVL_WARN) {
        stream_->flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO;  // Default
}

bool is_valid_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s == "debug" || s == "info" || s == "warn" || s == "error";
}

}  // namespace logging
}  // namespace tether
