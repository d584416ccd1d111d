#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace adapters::replay {

// In-memory history service. Pages are served newest-first and always complete
// on the io_context, never inline, so callers observe a real suspension point.
class ScriptedHistory : public domain::contracts::IHistoryQuery,
                        public std::enable_shared_from_this<ScriptedHistory> {
public:
    explicit ScriptedHistory(boost::asio::io_context& ioc,
                             std::chrono::milliseconds latency = std::chrono::milliseconds{0});

    // Adds messages in serial order; a known serial is replaced by the newer copy.
    void append(const std::vector<domain::Message>& messages);
    // The next `count` requests complete with an error.
    void failNext(std::size_t count) noexcept { pendingFailures_ = count; }

    void query(std::size_t limit, domain::contracts::PageCallback callback) override;

    std::size_t requestCount() const noexcept { return requestCount_; }
    std::size_t size() const noexcept { return messages_.size(); }

private:
    class Page;

    void fetch_(std::optional<domain::Serial> olderThan, std::size_t limit,
                domain::contracts::PageCallback callback);
    void complete_(domain::contracts::PageCallback callback, std::exception_ptr error,
                   std::shared_ptr<domain::contracts::IHistoryPage> page);

    boost::asio::io_context& ioc_;
    std::chrono::milliseconds latency_;
    std::vector<domain::Message> messages_;
    std::size_t pendingFailures_{0};
    std::size_t requestCount_{0};
};

}  // namespace adapters::replay
