#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace mwin::log {

// Ordered by severity.
enum class Level : int { Debug, Info, Warn, Error };

// Receives every line that passes the level filter. An empty sink restores the
// console writer (stdout for Debug/Info, stderr for Warn/Error).
using Sink = std::function<void(Level, const std::string&)>;

// Threshold below which lines are dropped before formatting.
void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;

void setSink(Sink sink);
void log(Level level, const std::string& message);

// "[date time.ms] [LEVEL] [thread id] message"
std::string formatLine(Level level, const std::string& message);

const char* levelToString(Level level) noexcept;
// Case-insensitive; accepts "warning" and "err" as aliases. Throws
// std::invalid_argument for anything else.
Level levelFromString(std::string_view text);

}  // namespace mwin::log

// The stream expression is only evaluated when the level is enabled.
#define MWIN_LOG_IMPL(level, expr)                                     \
    do {                                                               \
        const auto mwin_log_level__ = (level);                         \
        if (::mwin::log::shouldLog(mwin_log_level__)) {                \
            std::ostringstream mwin_log_line__;                        \
            mwin_log_line__ << expr;                                   \
            ::mwin::log::log(mwin_log_level__, mwin_log_line__.str()); \
        }                                                              \
    } while (false)

#define LOG_DEBUG(expr) MWIN_LOG_IMPL(::mwin::log::Level::Debug, expr)
#define LOG_INFO(expr) MWIN_LOG_IMPL(::mwin::log::Level::Info, expr)
#define LOG_WARN(expr) MWIN_LOG_IMPL(::mwin::log::Level::Warn, expr)
#define LOG_ERR(expr) MWIN_LOG_IMPL(::mwin::log::Level::Error, expr)
