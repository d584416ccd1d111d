#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

// Repairs a gap in the realtime stream by replaying history backwards from the
// newest page until the last message seen before the gap turns up again.
// Two states only: idle and recovering. One pass at a time.
class RecoveryEngine {
public:
    struct Callbacks {
        // Receives each page oldest-first.
        std::function<void(const std::vector<domain::Message>&, bool prepend)> integrate;
        std::function<void()> stateChanged;
        std::function<void(const std::string&)> error;
    };

    enum class Outcome {
        Recovered,
        Exhausted,
        Failed,
    };

    RecoveryEngine(std::size_t batchSize, Callbacks callbacks);

    RecoveryEngine(const RecoveryEngine&) = delete;
    RecoveryEngine& operator=(const RecoveryEngine&) = delete;

    void attach(std::shared_ptr<domain::contracts::IHistoryQuery> query);
    void reset();

    // Starts a pass unless one is running or no history is available. Returns
    // true when a pass was started.
    bool onDiscontinuity(const domain::Serial& lostSerial);

    bool recovering() const noexcept { return recovering_; }
    std::size_t completedPasses() const noexcept { return completedPasses_; }
    std::size_t pagesFetched() const noexcept { return pagesFetched_; }

private:
    domain::contracts::PageCallback continuation_(domain::Serial lostSerial);
    void onPage_(const domain::Serial& lostSerial,
                 std::exception_ptr error,
                 std::shared_ptr<domain::contracts::IHistoryPage> page);
    void finish_(Outcome outcome, const std::string& detail = {});

    std::size_t batchSize_;
    Callbacks callbacks_;
    std::shared_ptr<domain::contracts::IHistoryQuery> query_;
    std::shared_ptr<const std::uint64_t> session_;
    std::uint64_t generation_{0};
    bool recovering_{false};
    std::size_t completedPasses_{0};
    std::size_t pagesFetched_{0};
};

const char* outcomeToString(RecoveryEngine::Outcome outcome) noexcept;

}  // namespace app
