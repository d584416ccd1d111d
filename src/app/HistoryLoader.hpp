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

// Pulls older history into the store one backward page at a time: one initial
// page per room, then more on request.
class HistoryLoader {
public:
    struct Callbacks {
        // Receives the page oldest-first.
        std::function<void(const std::vector<domain::Message>&, bool prepend)> integrate;
        std::function<void()> stateChanged;
        std::function<void(const std::string&)> error;
    };

    explicit HistoryLoader(Callbacks callbacks);

    HistoryLoader(const HistoryLoader&) = delete;
    HistoryLoader& operator=(const HistoryLoader&) = delete;

    // Binds the history capability of a new room context; drops everything bound
    // to the previous one.
    void attach(std::shared_ptr<domain::contracts::IHistoryQuery> query);
    void reset();

    // Initial load, at most once per room unless a previous attempt failed.
    void activate(std::size_t limit);
    void loadMore();

    bool loading() const noexcept { return loading_; }
    bool hasMoreHistory() const noexcept { return hasMoreHistory_; }
    bool initialLoadAttempted() const noexcept { return initialLoadAttempted_; }

private:
    using SessionToken = std::weak_ptr<const std::uint64_t>;

    SessionToken sessionToken_() const { return session_; }
    domain::contracts::PageCallback guarded_(
        std::function<void(std::exception_ptr, std::shared_ptr<domain::contracts::IHistoryPage>)> handler);

    void onInitialPage_(std::exception_ptr error, std::shared_ptr<domain::contracts::IHistoryPage> page);
    void onNextPage_(std::exception_ptr error, std::shared_ptr<domain::contracts::IHistoryPage> page);
    bool integratePage_(const std::shared_ptr<domain::contracts::IHistoryPage>& page);
    void reportFailure_(const char* what, std::exception_ptr error);
    void notify_();

    Callbacks callbacks_;
    std::shared_ptr<domain::contracts::IHistoryQuery> query_;
    std::shared_ptr<domain::contracts::IHistoryPage> nextPage_;
    std::shared_ptr<const std::uint64_t> session_;
    std::uint64_t generation_{0};
    bool loading_{false};
    bool hasMoreHistory_{false};
    bool initialLoadAttempted_{false};
};

}  // namespace app
