#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace trellico {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

// Process-wide logger. Lines go to stderr; safe to call from process
// execution contexts and watcher threads alike.
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Config helpers ("debug", "info", "warn", "error", "none"; unknown -> INFO)
Level string_to_level(const std::string &level_str);
bool try_parse_level(const std::string &level_str, Level &out);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace trellico

#define LOG_INTERNAL(level, msg)                                                   \
    do {                                                                           \
        if (trellico::logging::Logger::enabled(level)) {                           \
            std::stringstream log_ss_;                                             \
            log_ss_ << msg;                                                        \
            trellico::logging::Logger::log(level, __FILE__, __LINE__, log_ss_.str()); \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(trellico::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(trellico::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(trellico::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(trellico::logging::Level::LVL_ERROR, msg)
