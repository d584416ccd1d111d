#include "app/MessageWindow.hpp"

#include <utility>

#include "common/Log.hpp"

namespace app {

MessageWindow::MessageWindow(MessageWindowOptions options)
    : options_(options),
      selector_(options.windowSize, options.overscan),
      history_(HistoryLoader::Callbacks{
          [this](const std::vector<domain::Message>& batch, bool prepend) { integrate_(batch, prepend); },
          [this]() { refresh_(); },
          [this](const std::string& description) { reportError_(description); }}),
      recovery_(options.historyBatchSize,
                RecoveryEngine::Callbacks{
                    [this](const std::vector<domain::Message>& batch, bool prepend) {
                        integrate_(batch, prepend);
                    },
                    [this]() { refresh_(); },
                    [this](const std::string& description) { reportError_(description); }}) {
    snapshot_.messages = std::make_shared<const std::vector<domain::Message>>();
}

MessageWindow::~MessageWindow() { unsubscribe_(); }

void MessageWindow::enterRoom(RoomContext context) {
    leaveRoom();

    roomId_ = std::move(context.roomId);
    history_.attach(context.history);
    recovery_.attach(context.history);
    subscribe_(context.events);

    LOG_INFO("MessageWindow: entered room '" << roomId_ << "' (window=" << options_.windowSize
                                              << " overscan=" << options_.overscan
                                              << " history=" << (context.history ? "yes" : "no") << ')');
    refresh_();
    history_.activate(options_.windowSize + 2 * options_.overscan);
}

void MessageWindow::leaveRoom() {
    unsubscribe_();
    history_.reset();
    recovery_.reset();
    store_.clear();
    selector_.reset();
    if (!roomId_.empty()) {
        LOG_INFO("MessageWindow: left room '" << roomId_ << "'");
    }
    roomId_.clear();
    refresh_();
}

void MessageWindow::onMessageEvent(const domain::MessageEvent& event) {
    LOG_DEBUG("MessageWindow: " << domain::eventTypeToString(event.type) << ' ' << event.message.serial);
    updateMessages({event.message});
}

void MessageWindow::onReactionSummary(const domain::ReactionSummaryEvent& event) {
    if (store_.applyReactionSummary(event)) {
        refresh_();
    }
}

void MessageWindow::onDiscontinuity() {
    const auto* last = store_.back();
    if (last == nullptr) {
        LOG_DEBUG("MessageWindow: discontinuity with an empty store, nothing to recover");
        return;
    }
    const domain::Serial lastSeen = last->serial;
    LOG_WARN("MessageWindow: realtime discontinuity in room '" << roomId_ << "', last seen " << lastSeen);
    recovery_.onDiscontinuity(lastSeen);
}

void MessageWindow::updateMessages(const std::vector<domain::Message>& batch, bool prepend) {
    integrate_(batch, prepend);
}

void MessageWindow::integrate_(const std::vector<domain::Message>& batch, bool prepend) {
    if (store_.integrate(batch, prepend, &selector_.anchor())) {
        refresh_();
    }
}

void MessageWindow::showLatestMessages() {
    if (selector_.showLatest()) {
        refresh_();
    }
}

void MessageWindow::scrollBy(std::int64_t delta) {
    if (selector_.scrollBy(delta, store_.size())) {
        refresh_();
    }
}

void MessageWindow::showMessagesAroundSerial(std::string_view serial) {
    if (selector_.showAround(store_.messages(), serial)) {
        refresh_();
    }
}

void MessageWindow::loadMoreHistory() { history_.loadMore(); }

void MessageWindow::setWindowChangedCallback(WindowChangedCallback callback) {
    windowChanged_ = std::move(callback);
}

void MessageWindow::setErrorCallback(ErrorCallback callback) { errorCallback_ = std::move(callback); }

void MessageWindow::refresh_() {
    WindowSnapshot next;
    next.bounds = selector_.bounds(store_.size());
    next.messages = std::make_shared<const std::vector<domain::Message>>(selector_.select(store_.messages()));
    next.totalMessages = store_.size();
    next.version = store_.version();
    next.followsTail = selector_.anchor().followsTail();
    next.loading = loading();
    next.hasMoreHistory = hasMoreHistory();
    snapshot_ = std::move(next);

    if (windowChanged_) {
        windowChanged_(snapshot_);
    }
}

void MessageWindow::reportError_(const std::string& description) {
    if (errorCallback_) {
        errorCallback_(description);
    }
}

void MessageWindow::subscribe_(const std::shared_ptr<domain::contracts::IChatEventSource>& source) {
    events_ = source;
    if (!events_) {
        return;
    }

    domain::contracts::EventListeners listeners;
    listeners.onMessage = [this](const domain::MessageEvent& event) { onMessageEvent(event); };
    listeners.onReactionSummary = [this](const domain::ReactionSummaryEvent& event) {
        onReactionSummary(event);
    };
    listeners.onDiscontinuity = [this]() { onDiscontinuity(); };
    events_->subscribe(std::move(listeners));
}

void MessageWindow::unsubscribe_() {
    if (events_) {
        events_->unsubscribe();
        events_.reset();
    }
}

}  // namespace app
