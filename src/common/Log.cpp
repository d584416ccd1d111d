#include "common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace mwin::log {
namespace {

struct LevelName {
    Level level;
    const char* label;
    std::string_view spellings[2];
};

const LevelName kLevelNames[] = {
    {Level::Debug, "DEBUG", {"debug"}},
    {Level::Info, "INFO", {"info"}},
    {Level::Warn, "WARN", {"warn", "warning"}},
    {Level::Error, "ERROR", {"error", "err"}},
};

std::atomic<int> g_threshold{static_cast<int>(Level::Info)};
std::mutex g_sinkMutex;
Sink g_sink;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

// "YYYY-MM-DD HH:MM:SS.mmm" in local time.
std::string timestamp(std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm parts{};
#if defined(_WIN32)
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif

    char date[32];
    const auto written = std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &parts);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%.*s.%03d", static_cast<int>(written), date, millis);
    return stamp;
}

std::ostream& consoleFor(Level level) {
    return level >= Level::Warn ? std::cerr : std::cout;
}

}  // namespace

void setLevel(Level level) noexcept { g_threshold = static_cast<int>(level); }

Level getLevel() noexcept { return static_cast<Level>(g_threshold.load()); }

bool shouldLog(Level level) noexcept { return static_cast<int>(level) >= g_threshold.load(); }

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

std::string formatLine(Level level, const std::string& message) {
    std::ostringstream line;
    line << '[' << timestamp(std::chrono::system_clock::now()) << "] [" << levelToString(level) << "] [thread "
         << std::this_thread::get_id() << "] " << message;
    return line.str();
}

void log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        consoleFor(level) << formatLine(level, message) << std::endl;
    }
}

const char* levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.label;
        }
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    for (const auto& entry : kLevelNames) {
        for (const auto spelling : entry.spellings) {
            if (!spelling.empty() && equalsIgnoreCase(text, spelling)) {
                return entry.level;
            }
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace mwin::log
