#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mwin::common {
namespace {

bool isBlank(unsigned char ch) { return std::isspace(ch) != 0; }

std::string toLower(std::string_view value) {
    std::string lowered(value);
    for (auto& ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return lowered;
}

std::string trim(std::string_view value) {
    std::size_t first = 0;
    std::size_t last = value.size();
    while (first < last && isBlank(static_cast<unsigned char>(value[first]))) {
        ++first;
    }
    while (last > first && isBlank(static_cast<unsigned char>(value[last - 1]))) {
        --last;
    }
    return std::string(value.substr(first, last - first));
}

// Digits only: std::stoull would accept "-1" and wrap it.
std::size_t parseCount(const std::string& value, const std::string& label, std::size_t minimum) {
    const auto trimmed = trim(value);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    try {
        const auto parsed = std::stoull(trimmed);
        if (parsed < minimum || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("count out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseLatencyMs(const std::string& value, const std::string& label) {
    return static_cast<std::uint32_t>(parseCount(value, label, 0));
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

// Last occurrence wins.
std::string valueFromArgs(int argc, char** argv, std::string_view key) {
    std::string found;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg.size() > key.size() && arg.substr(0, key.size()) == key && arg[key.size()] == '=') {
            found.assign(arg.substr(key.size() + 1));
        } else if (arg == key && i + 1 < argc) {
            found.assign(argv[++i]);
        }
    }
    return found;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = mwin::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envWindow = std::getenv("MWIN_WINDOW_SIZE")) {
        config.windowSize = parseCount(envWindow, "MWIN_WINDOW_SIZE", 1);
    }
    if (const char* envOverscan = std::getenv("MWIN_OVERSCAN")) {
        config.overscan = parseCount(envOverscan, "MWIN_OVERSCAN", 0);
    }
    if (const char* envBatch = std::getenv("MWIN_HISTORY_BATCH")) {
        config.historyBatchSize = parseCount(envBatch, "MWIN_HISTORY_BATCH", 1);
    }
    if (const char* envLatency = std::getenv("MWIN_HISTORY_LATENCY_MS")) {
        config.historyLatencyMs = parseLatencyMs(envLatency, "MWIN_HISTORY_LATENCY_MS");
    }
    if (const char* envScript = std::getenv("MWIN_SCRIPT")) {
        config.scriptPath = trim(envScript);
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = mwin::log::levelFromString(toLower(levelArg));
    }
    if (auto windowArg = valueFromArgs(argc, argv, "--window-size"); !windowArg.empty()) {
        config.windowSize = parseCount(windowArg, "--window-size", 1);
    }
    if (auto overscanArg = valueFromArgs(argc, argv, "--overscan"); !overscanArg.empty()) {
        config.overscan = parseCount(overscanArg, "--overscan", 0);
    }
    if (auto batchArg = valueFromArgs(argc, argv, "--history-batch"); !batchArg.empty()) {
        config.historyBatchSize = parseCount(batchArg, "--history-batch", 1);
    }
    if (auto latencyArg = valueFromArgs(argc, argv, "--history-latency-ms"); !latencyArg.empty()) {
        config.historyLatencyMs = parseLatencyMs(latencyArg, "--history-latency-ms");
    }
    if (auto scriptArg = valueFromArgs(argc, argv, "--script"); !scriptArg.empty()) {
        config.scriptPath = trim(scriptArg);
    }
    if (auto printArg = valueFromArgs(argc, argv, "--print-window"); !printArg.empty()) {
        config.printWindow = parseBool(printArg);
    }

    return config;
}

}  // namespace mwin::common
