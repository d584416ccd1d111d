#include "adapters/replay/ScriptedHistory.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "common/Log.hpp"
#include "domain/Ordering.hpp"

namespace adapters::replay {

namespace net = boost::asio;

class ScriptedHistory::Page : public domain::contracts::IHistoryPage {
public:
    Page(std::weak_ptr<ScriptedHistory> owner, std::vector<domain::Message> items, bool hasNext,
         std::size_t limit)
        : owner_(std::move(owner)), items_(std::move(items)), hasNext_(hasNext), limit_(limit) {}

    const std::vector<domain::Message>& items() const override { return items_; }
    bool hasNext() const override { return hasNext_; }

    void next(domain::contracts::PageCallback callback) override {
        auto owner = owner_.lock();
        if (!owner) {
            throw std::runtime_error("history source is gone");
        }
        if (!hasNext_ || items_.empty()) {
            owner->complete_(std::move(callback), nullptr, nullptr);
            return;
        }
        owner->fetch_(items_.back().serial, limit_, std::move(callback));
    }

private:
    std::weak_ptr<ScriptedHistory> owner_;
    std::vector<domain::Message> items_;
    bool hasNext_;
    std::size_t limit_;
};

ScriptedHistory::ScriptedHistory(net::io_context& ioc, std::chrono::milliseconds latency)
    : ioc_(ioc), latency_(latency) {}

void ScriptedHistory::append(const std::vector<domain::Message>& messages) {
    for (const auto& message : messages) {
        if (auto index = domain::findBySerial(messages_, message.serial)) {
            messages_[*index] = message;
            continue;
        }
        messages_.insert(messages_.begin() + static_cast<std::ptrdiff_t>(domain::insertionIndex(messages_, message)),
                         message);
    }
}

void ScriptedHistory::query(std::size_t limit, domain::contracts::PageCallback callback) {
    fetch_(std::nullopt, limit, std::move(callback));
}

void ScriptedHistory::fetch_(std::optional<domain::Serial> olderThan, std::size_t limit,
                             domain::contracts::PageCallback callback) {
    ++requestCount_;
    if (pendingFailures_ > 0) {
        --pendingFailures_;
        LOG_DEBUG("ScriptedHistory: injecting failure for request " << requestCount_);
        complete_(std::move(callback),
                  std::make_exception_ptr(std::runtime_error("scripted history request failed")), nullptr);
        return;
    }

    const std::size_t pageLimit = std::max<std::size_t>(limit, 1);
    std::size_t end = messages_.size();
    if (olderThan) {
        const auto it = std::lower_bound(
            messages_.begin(), messages_.end(), *olderThan,
            [](const domain::Message& message, const domain::Serial& serial) {
                return domain::compareSerials(message.serial, serial) == domain::Order::Before;
            });
        end = static_cast<std::size_t>(it - messages_.begin());
    }
    const std::size_t start = end > pageLimit ? end - pageLimit : 0;

    std::vector<domain::Message> items(messages_.rbegin() + static_cast<std::ptrdiff_t>(messages_.size() - end),
                                       messages_.rbegin() + static_cast<std::ptrdiff_t>(messages_.size() - start));
    LOG_DEBUG("ScriptedHistory: page of " << items.size() << " messages"
                                          << (olderThan ? " before " + *olderThan : std::string{}));

    auto page = std::make_shared<Page>(weak_from_this(), std::move(items), start > 0, pageLimit);
    complete_(std::move(callback), nullptr, std::move(page));
}

void ScriptedHistory::complete_(domain::contracts::PageCallback callback, std::exception_ptr error,
                                std::shared_ptr<domain::contracts::IHistoryPage> page) {
    auto deliver = [callback = std::move(callback), error, page = std::move(page)]() {
        callback(error, page);
    };

    if (latency_.count() <= 0) {
        net::post(ioc_, std::move(deliver));
        return;
    }

    auto timer = std::make_shared<net::steady_timer>(ioc_, latency_);
    timer->async_wait([timer, deliver = std::move(deliver)](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        deliver();
    });
}

}  // namespace adapters::replay
