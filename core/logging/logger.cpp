#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace trellico {
namespace logging {

namespace {
// Mirrors threshold_ so enabled() can be checked without taking the mutex.
std::atomic<int> g_threshold{static_cast<int>(Level::LVL_INFO)};
}  // namespace

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
    g_threshold.store(static_cast<int>(level));
}

Level Logger::level() { return static_cast<Level>(g_threshold.load()); }

bool Logger::enabled(Level level) {
    return level != Level::LVL_NONE && static_cast<int>(level) >= g_threshold.load();
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;

    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG:
            std::cerr << " [DEBUG] ";
            break;
        case Level::LVL_INFO:
            std::cerr << " [INFO]  ";
            break;
        case Level::LVL_WARN:
            std::cerr << " [WARN]  ";
            break;
        case Level::LVL_ERROR:
            std::cerr << " [ERROR] ";
            break;
        default:
            break;
    }

    std::cerr << "[" << std::this_thread::get_id() << "] " << message << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

bool try_parse_level(const std::string &level_str, Level &out) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") {
        out = Level::LVL_DEBUG;
    } else if (s == "INFO") {
        out = Level::LVL_INFO;
    } else if (s == "WARN") {
        out = Level::LVL_WARN;
    } else if (s == "ERROR") {
        out = Level::LVL_ERROR;
    } else if (s == "NONE") {
        out = Level::LVL_NONE;
    } else {
        return false;
    }
    return true;
}

Level string_to_level(const std::string &level_str) {
    Level level = Level::LVL_INFO;
    if (!try_parse_level(level_str, level)) {
        return Level::LVL_INFO;
    }
    return level;
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
        default:
            return "info";
    }
}

}  // namespace logging
}  // namespace trellico
