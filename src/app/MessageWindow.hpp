#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "app/HistoryLoader.hpp"
#include "app/RecoveryEngine.hpp"
#include "core/MessageStore.h"
#include "core/WindowSelector.h"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

struct MessageWindowOptions {
    // Rows kept around the anchor, overscan excluded.
    std::size_t windowSize = 200;
    // Extra rows on each side of the window.
    std::size_t overscan = 20;
    // Page size used while recovering from a discontinuity.
    std::size_t historyBatchSize = 300;
};

// Collaborators of one room. Both are optional: without history the window
// only shows live traffic; without an event source the caller feeds events
// through the handler methods.
struct RoomContext {
    std::string roomId;
    std::shared_ptr<domain::contracts::IHistoryQuery> history;
    std::shared_ptr<domain::contracts::IChatEventSource> events;
};

struct WindowSnapshot {
    std::shared_ptr<const std::vector<domain::Message>> messages;
    core::WindowBounds bounds{};
    std::size_t totalMessages{0};
    std::uint64_t version{0};
    bool followsTail{true};
    bool loading{false};
    bool hasMoreHistory{false};
};

class MessageWindow {
public:
    using WindowChangedCallback = std::function<void(const WindowSnapshot&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    explicit MessageWindow(MessageWindowOptions options = {});
    ~MessageWindow();

    MessageWindow(const MessageWindow&) = delete;
    MessageWindow& operator=(const MessageWindow&) = delete;

    void enterRoom(RoomContext context);
    void leaveRoom();
    const std::string& roomId() const noexcept { return roomId_; }

    // Entry points for the realtime dispatcher.
    void onMessageEvent(const domain::MessageEvent& event);
    void onReactionSummary(const domain::ReactionSummaryEvent& event);
    void onDiscontinuity();

    std::shared_ptr<const std::vector<domain::Message>> activeMessages() const { return snapshot_.messages; }
    const WindowSnapshot& snapshot() const noexcept { return snapshot_; }
    void updateMessages(const std::vector<domain::Message>& batch, bool prepend = false);

    void showLatestMessages();
    void scrollBy(std::int64_t delta);
    void showMessagesAroundSerial(std::string_view serial);

    bool loading() const noexcept { return history_.loading() || recovery_.recovering(); }
    bool hasMoreHistory() const noexcept { return history_.hasMoreHistory(); }
    bool recovering() const noexcept { return recovery_.recovering(); }
    void loadMoreHistory();

    std::uint64_t version() const noexcept { return store_.version(); }
    std::size_t totalMessages() const noexcept { return store_.size(); }
    const core::Anchor& anchor() const noexcept { return selector_.anchor(); }
    const MessageWindowOptions& options() const noexcept { return options_; }

    void setWindowChangedCallback(WindowChangedCallback callback);
    void setErrorCallback(ErrorCallback callback);

private:
    void integrate_(const std::vector<domain::Message>& batch, bool prepend);
    void refresh_();
    void reportError_(const std::string& description);
    void subscribe_(const std::shared_ptr<domain::contracts::IChatEventSource>& source);
    void unsubscribe_();

    MessageWindowOptions options_;
    core::MessageStore store_;
    core::WindowSelector selector_;
    HistoryLoader history_;
    RecoveryEngine recovery_;

    std::string roomId_;
    std::shared_ptr<domain::contracts::IChatEventSource> events_;
    WindowSnapshot snapshot_{};
    WindowChangedCallback windowChanged_;
    ErrorCallback errorCallback_;
};

}  // namespace app
