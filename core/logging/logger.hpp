#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace kasa {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

/**
 * @brief Process-wide log sink
 *
 * Lines go to stderr unless redirected with set_output(); one line per call,
 * "[time] [LEVEL] message". Writers are serialized.
 */
class Logger {
public:
    static void init(Level threshold) { set_level(threshold); }
    static void set_level(Level level);
    static Level level();
    static bool is_enabled(Level level);

    // nullptr restores stderr
    static void set_output(std::ostream* out);

    static void log(Level level, const char* file, int line, const std::string& message);

private:
    static Level threshold_;
    static std::ostream* out_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown names map to INFO
Level string_to_level(const std::string& name);
const char* level_to_string(Level level);

}  // namespace logging
}  // namespace kasa

#define LOG_INTERNAL(level, msg)                                                   \
    do {                                                                           \
        if (kasa::logging::Logger::is_enabled(level)) {                            \
            std::ostringstream kasa_log_stream;                                    \
            kasa_log_stream << msg;                                                \
            kasa::logging::Logger::log(level, __FILE__, __LINE__, kasa_log_stream.str()); \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(kasa::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(kasa::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(kasa::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(kasa::logging::Level::LVL_ERROR, msg)
