#include "app/RecoveryEngine.hpp"

#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "domain/Ordering.hpp"

namespace app {

const char* outcomeToString(RecoveryEngine::Outcome outcome) noexcept {
    switch (outcome) {
    case RecoveryEngine::Outcome::Recovered:
        return "recovered";
    case RecoveryEngine::Outcome::Exhausted:
        return "history exhausted";
    case RecoveryEngine::Outcome::Failed:
        return "failed";
    }
    return "unknown";
}

RecoveryEngine::RecoveryEngine(std::size_t batchSize, Callbacks callbacks)
    : batchSize_(batchSize),
      callbacks_(std::move(callbacks)),
      session_(std::make_shared<const std::uint64_t>(0)) {}

void RecoveryEngine::attach(std::shared_ptr<domain::contracts::IHistoryQuery> query) {
    reset();
    query_ = std::move(query);
}

void RecoveryEngine::reset() {
    session_ = std::make_shared<const std::uint64_t>(++generation_);
    query_.reset();
    recovering_ = false;
}

domain::contracts::PageCallback RecoveryEngine::continuation_(domain::Serial lostSerial) {
    std::weak_ptr<const std::uint64_t> token = session_;
    return [this, token, lostSerial = std::move(lostSerial)](
               std::exception_ptr error, std::shared_ptr<domain::contracts::IHistoryPage> page) {
        if (token.expired()) {
            LOG_DEBUG("RecoveryEngine: discarding page for a previous room");
            return;
        }
        onPage_(lostSerial, std::move(error), std::move(page));
    };
}

bool RecoveryEngine::onDiscontinuity(const domain::Serial& lostSerial) {
    if (recovering_) {
        LOG_DEBUG("RecoveryEngine: discontinuity ignored, recovery already running");
        return false;
    }
    if (!query_) {
        LOG_DEBUG("RecoveryEngine: discontinuity ignored, no history available");
        return false;
    }

    // Set before the first suspension point.
    recovering_ = true;
    if (callbacks_.stateChanged) {
        callbacks_.stateChanged();
    }

    LOG_INFO("RecoveryEngine: recovering messages after " << lostSerial);
    try {
        query_->query(batchSize_, continuation_(lostSerial));
    } catch (...) {
        finish_(Outcome::Failed, mwin::common::describeException(std::current_exception()));
    }
    return true;
}

void RecoveryEngine::onPage_(const domain::Serial& lostSerial,
                             std::exception_ptr error,
                             std::shared_ptr<domain::contracts::IHistoryPage> page) {
    if (!recovering_) {
        return;
    }

    std::weak_ptr<const std::uint64_t> token = session_;
    try {
        if (error) {
            std::rethrow_exception(error);
        }
        if (!page) {
            finish_(Outcome::Exhausted);
            return;
        }

        ++pagesFetched_;
        const auto& items = page->items();
        if (!items.empty() && callbacks_.integrate) {
            // The page may straddle messages we already hold, so the store's
            // general insertion path places each one.
            std::vector<domain::Message> oldestFirst(items.rbegin(), items.rend());
            callbacks_.integrate(oldestFirst, false);
            // Observers may have left or re-entered the room meanwhile.
            if (token.expired() || !recovering_) {
                LOG_DEBUG("RecoveryEngine: pass abandoned after the room changed");
                return;
            }
        }

        if (domain::findBySerial(items, lostSerial, /*descending=*/true)) {
            finish_(Outcome::Recovered);
            return;
        }
        if (!page->hasNext()) {
            finish_(Outcome::Exhausted);
            return;
        }

        page->next(continuation_(lostSerial));
    } catch (...) {
        if (!recovering_ || token.expired()) {
            // The pass already ended; the failure came from a state observer.
            throw;
        }
        finish_(Outcome::Failed, mwin::common::describeException(std::current_exception()));
    }
}

void RecoveryEngine::finish_(Outcome outcome, const std::string& detail) {
    recovering_ = false;
    ++completedPasses_;

    if (outcome == Outcome::Failed) {
        const auto description = "Discontinuity recovery failed: " + detail;
        LOG_WARN("RecoveryEngine: " << description);
        if (callbacks_.error) {
            callbacks_.error(description);
        }
    } else {
        LOG_INFO("RecoveryEngine: pass finished (" << outcomeToString(outcome) << ")");
    }

    if (callbacks_.stateChanged) {
        callbacks_.stateChanged();
    }
}

}  // namespace app
