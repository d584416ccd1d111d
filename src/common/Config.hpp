#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace mwin::common {

struct Config {
    mwin::log::Level logLevel = mwin::log::Level::Info;

    std::size_t windowSize = 200;
    std::size_t overscan = 20;
    std::size_t historyBatchSize = 300;

    std::uint32_t historyLatencyMs = 0;
    std::string scriptPath;
    bool printWindow = true;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace mwin::common
