#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <vector>

#include "domain/Models.hpp"

namespace domain::contracts {

class IHistoryPage;

// Completion of a history request. Exactly one of the two arguments is set on
// failure (error); on success the page may still be null, meaning there is no
// further page to return.
using PageCallback = std::function<void(std::exception_ptr, std::shared_ptr<IHistoryPage>)>;

class IHistoryPage {
public:
    virtual ~IHistoryPage() = default;

    // Newest first, as produced by backward pagination.
    virtual const std::vector<Message>& items() const = 0;
    virtual bool hasNext() const = 0;
    virtual void next(PageCallback callback) = 0;
};

class IHistoryQuery {
public:
    virtual ~IHistoryQuery() = default;

    // Starts at the newest message known to the service and walks backwards.
    virtual void query(std::size_t limit, PageCallback callback) = 0;
};

struct EventListeners {
    std::function<void(const MessageEvent&)> onMessage;
    std::function<void(const ReactionSummaryEvent&)> onReactionSummary;
    std::function<void()> onDiscontinuity;
};

class IChatEventSource {
public:
    virtual ~IChatEventSource() = default;

    virtual void subscribe(EventListeners listeners) = 0;
    virtual void unsubscribe() = 0;
};

}  // namespace domain::contracts
