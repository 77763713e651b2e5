#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace tether {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Mirror every record into an append-only file. Empty path closes it.
    // Returns false (and keeps logging to the console only) if the file cannot be opened.
    static bool set_file(const std::string &path);

    // Redirect console output (stderr by default). Used by tests.
    static void set_stream(std::ostream *stream);

private:
    static Level threshold_;
    static std::mutex mutex_;
    static std::ostream *stream_;
    static std::ofstream file_;
};

// Helper to convert config strings ("debug", "INFO", ...) to Level
Level string_to_level(const std::string &level_str);

bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace tether

// Macro macros to handle string building
#define LOG_INTERNAL(level, msg)                                                 \
    do {                                                                         \
        std::stringstream ss;                                                    \
        ss << msg;                                                               \
        tether::logging::Logger::log(level, __FILE__, __LINE__, ss.str());      \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(tether::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(tether::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(tether::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(tether::logging::Level::LVL_ERROR, msg)
