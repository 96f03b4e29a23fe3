#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace kasa {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::ostream* Logger::out_ = nullptr;
std::mutex Logger::mutex_;

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::is_enabled(Level level) {
    if (level == Level::LVL_NONE) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void Logger::log(Level level, const char* /*file*/, int /*line*/, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis
         << "] [" << level_to_string(level) << "] " << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = out_ != nullptr ? *out_ : std::cerr;
    out << line.str();
    if (level == Level::LVL_ERROR) {
        out.flush();
    }
}

Level string_to_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return Level::LVL_DEBUG;
    if (upper == "WARN" || upper == "WARNING") return Level::LVL_WARN;
    if (upper == "ERROR") return Level::LVL_ERROR;
    if (upper == "NONE") return Level::LVL_NONE;
    return Level::LVL_INFO;
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "DEBUG";
        case Level::LVL_INFO:
            return "INFO";
        case Level::LVL_WARN:
            return "WARN";
        case Level::LVL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

}  // namespace logging
}  // namespace kasa
