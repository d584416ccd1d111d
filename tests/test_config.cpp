#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

// Restores an environment variable on scope exit.
struct EnvGuard {
    explicit EnvGuard(std::string name) : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

::mwin::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::mwin::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsRuntimeError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard windowEnv("MWIN_WINDOW_SIZE");
    EnvGuard overscanEnv("MWIN_OVERSCAN");
    EnvGuard batchEnv("MWIN_HISTORY_BATCH");
    EnvGuard levelEnv("LOG_LEVEL");
    EnvGuard scriptEnv("MWIN_SCRIPT");
    windowEnv.clear();
    overscanEnv.clear();
    batchEnv.clear();
    levelEnv.clear();
    scriptEnv.clear();

    // Defaults when env and flags are absent.
    auto configDefault = runConfig({"app"});
    if (configDefault.windowSize != 200 || configDefault.overscan != 20 || configDefault.historyBatchSize != 300 ||
        configDefault.logLevel != mwin::log::Level::Info || !configDefault.printWindow ||
        !configDefault.scriptPath.empty()) {
        std::cerr << "Unexpected defaults: window=" << configDefault.windowSize
                  << " overscan=" << configDefault.overscan << " batch=" << configDefault.historyBatchSize << "\n";
        return 1;
    }

    // Environment variables override defaults.
    windowEnv.set("50");
    overscanEnv.set("0");
    levelEnv.set("DEBUG");
    scriptEnv.set(" /tmp/script.json ");
    auto configEnv = runConfig({"app"});
    if (configEnv.windowSize != 50 || configEnv.overscan != 0 || configEnv.logLevel != mwin::log::Level::Debug ||
        configEnv.scriptPath != "/tmp/script.json") {
        std::cerr << "Expected environment overrides, got window=" << configEnv.windowSize
                  << " script='" << configEnv.scriptPath << "'\n";
        return 1;
    }

    // CLI flags override environment variables.
    auto configFlag = runConfig({"app", "--window-size", "80", "--overscan=5", "--history-batch", "25",
                                 "--log-level", "warn", "--print-window=off", "--history-latency-ms", "15"});
    if (configFlag.windowSize != 80 || configFlag.overscan != 5 || configFlag.historyBatchSize != 25 ||
        configFlag.logLevel != mwin::log::Level::Warn || configFlag.printWindow ||
        configFlag.historyLatencyMs != 15) {
        std::cerr << "Expected flag overrides, got window=" << configFlag.windowSize
                  << " overscan=" << configFlag.overscan << " batch=" << configFlag.historyBatchSize << "\n";
        return 1;
    }

    windowEnv.clear();
    if (!throwsRuntimeError({"app", "--window-size", "0"}) || !throwsRuntimeError({"app", "--overscan", "-1"}) ||
        !throwsRuntimeError({"app", "--history-batch", "many"}) ||
        !throwsRuntimeError({"app", "--print-window", "maybe"})) {
        std::cerr << "Expected invalid values to be rejected\n";
        return 1;
    }

    bool levelRejected = false;
    try {
        runConfig({"app", "--log-level", "verbose"});
    } catch (const std::invalid_argument&) {
        levelRejected = true;
    }
    if (!levelRejected) {
        std::cerr << "Expected unknown log level to be rejected\n";
        return 1;
    }

    if (mwin::log::levelFromString("WARNING") != mwin::log::Level::Warn ||
        mwin::log::levelFromString("Err") != mwin::log::Level::Error ||
        std::string(mwin::log::levelToString(mwin::log::Level::Debug)) != "DEBUG") {
        std::cerr << "Expected level names and aliases to round-trip\n";
        return 1;
    }

    // A sink receives enabled lines only.
    std::vector<std::string> lines;
    mwin::log::setSink([&lines](mwin::log::Level level, const std::string& message) {
        lines.push_back(mwin::log::formatLine(level, message));
    });
    mwin::log::setLevel(mwin::log::Level::Warn);
    if (mwin::log::getLevel() != mwin::log::Level::Warn || mwin::log::shouldLog(mwin::log::Level::Info)) {
        std::cerr << "Expected the WARN threshold to be active\n";
        return 1;
    }
    LOG_INFO("hidden");
    LOG_WARN("visible " << 42);
    mwin::log::setSink({});
    mwin::log::setLevel(mwin::log::Level::Info);
    if (lines.size() != 1 || lines.front().find("visible 42") == std::string::npos ||
        lines.front().find("[WARN]") == std::string::npos) {
        std::cerr << "Expected exactly one formatted WARN line in the sink\n";
        return 1;
    }
    // "[YYYY-MM-DD HH:MM:SS.mmm] ..."
    if (lines.front().size() < 25 || lines.front()[0] != '[' || lines.front()[20] != '.' ||
        lines.front()[24] != ']') {
        std::cerr << "Unexpected timestamp layout: " << lines.front() << "\n";
        return 1;
    }

    return 0;
}
