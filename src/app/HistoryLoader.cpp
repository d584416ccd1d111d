#include "app/HistoryLoader.hpp"

#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace app {

HistoryLoader::HistoryLoader(Callbacks callbacks)
    : callbacks_(std::move(callbacks)), session_(std::make_shared<const std::uint64_t>(0)) {}

void HistoryLoader::attach(std::shared_ptr<domain::contracts::IHistoryQuery> query) {
    reset();
    query_ = std::move(query);
    hasMoreHistory_ = query_ != nullptr;
}

void HistoryLoader::reset() {
    // Replacing the token expires every callback still in flight.
    session_ = std::make_shared<const std::uint64_t>(++generation_);
    query_.reset();
    nextPage_.reset();
    loading_ = false;
    hasMoreHistory_ = false;
    initialLoadAttempted_ = false;
}

domain::contracts::PageCallback HistoryLoader::guarded_(
    std::function<void(std::exception_ptr, std::shared_ptr<domain::contracts::IHistoryPage>)> handler) {
    return [token = sessionToken_(), generation = generation_, handler = std::move(handler)](
               std::exception_ptr error, std::shared_ptr<domain::contracts::IHistoryPage> page) {
        if (token.expired()) {
            LOG_DEBUG("HistoryLoader: discarding page for stale room generation " << generation);
            return;
        }
        handler(std::move(error), std::move(page));
    };
}

void HistoryLoader::activate(std::size_t limit) {
    if (!query_ || initialLoadAttempted_) {
        return;
    }

    initialLoadAttempted_ = true;
    loading_ = true;
    notify_();

    LOG_DEBUG("HistoryLoader: initial load limit=" << limit);
    try {
        query_->query(limit, guarded_([this](std::exception_ptr error,
                                             std::shared_ptr<domain::contracts::IHistoryPage> page) {
            onInitialPage_(std::move(error), std::move(page));
        }));
    } catch (...) {
        onInitialPage_(std::current_exception(), nullptr);
    }
}

void HistoryLoader::loadMore() {
    if (loading_ || !hasMoreHistory_ || !nextPage_) {
        return;
    }

    loading_ = true;
    notify_();

    auto page = nextPage_;
    try {
        page->next(guarded_([this](std::exception_ptr error,
                                   std::shared_ptr<domain::contracts::IHistoryPage> older) {
            onNextPage_(std::move(error), std::move(older));
        }));
    } catch (...) {
        onNextPage_(std::current_exception(), nullptr);
    }
}

void HistoryLoader::onInitialPage_(std::exception_ptr error,
                                   std::shared_ptr<domain::contracts::IHistoryPage> page) {
    const auto token = sessionToken_();
    loading_ = false;
    try {
        if (error) {
            std::rethrow_exception(error);
        }
        integratePage_(page);
    } catch (...) {
        if (token.expired()) {
            throw;
        }
        // Unlatch so the next activation retries.
        initialLoadAttempted_ = false;
        reportFailure_("History load failed", std::current_exception());
    }
    if (!token.expired()) {
        notify_();
    }
}

void HistoryLoader::onNextPage_(std::exception_ptr error,
                                std::shared_ptr<domain::contracts::IHistoryPage> page) {
    const auto token = sessionToken_();
    loading_ = false;
    try {
        if (error) {
            std::rethrow_exception(error);
        }
        integratePage_(page);
    } catch (...) {
        if (token.expired()) {
            throw;
        }
        // Cursor and hasMoreHistory stay as they were so the user can retry.
        reportFailure_("History load failed", std::current_exception());
    }
    if (!token.expired()) {
        notify_();
    }
}

bool HistoryLoader::integratePage_(const std::shared_ptr<domain::contracts::IHistoryPage>& page) {
    if (!page) {
        nextPage_.reset();
        hasMoreHistory_ = false;
        return false;
    }

    const auto& items = page->items();
    if (items.empty()) {
        LOG_WARN("HistoryLoader: received an empty history page, treating history as exhausted");
        nextPage_.reset();
        hasMoreHistory_ = false;
        return false;
    }

    const auto token = sessionToken_();
    std::vector<domain::Message> oldestFirst(items.rbegin(), items.rend());
    if (callbacks_.integrate) {
        callbacks_.integrate(oldestFirst, true);
    }
    if (token.expired()) {
        LOG_DEBUG("HistoryLoader: room changed while integrating, dropping the cursor");
        return false;
    }

    const bool more = page->hasNext();
    nextPage_ = more ? page : nullptr;
    hasMoreHistory_ = more;
    LOG_DEBUG("HistoryLoader: integrated " << oldestFirst.size() << " messages, more=" << more);
    return true;
}

void HistoryLoader::reportFailure_(const char* what, std::exception_ptr error) {
    const auto description = std::string{what} + ": " + mwin::common::describeException(error);
    LOG_WARN("HistoryLoader: " << description);
    if (callbacks_.error) {
        callbacks_.error(description);
    }
}

void HistoryLoader::notify_() {
    if (callbacks_.stateChanged) {
        callbacks_.stateChanged();
    }
}

}  // namespace app
