#include "adapters/replay/ReplaySession.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"

namespace adapters::replay {

ReplaySession::ReplaySession(boost::asio::io_context& ioc,
                             app::MessageWindow& window,
                             ReplayScript script,
                             std::chrono::milliseconds historyLatency)
    : ioc_(ioc),
      window_(window),
      script_(std::move(script)),
      history_(std::make_shared<ScriptedHistory>(ioc, historyLatency)),
      events_(std::make_shared<ReplayEventSource>()) {
    history_->append(script_.history);
}

void ReplaySession::start(std::function<void()> onFinished) {
    onFinished_ = std::move(onFinished);
    executed_ = 0;

    LOG_INFO("ReplaySession: room '" << script_.room << "' with " << script_.history.size()
                                     << " history messages and " << script_.steps.size() << " steps");
    window_.enterRoom(app::RoomContext{script_.room, history_, events_});
    schedule_();
}

void ReplaySession::schedule_() {
    boost::asio::post(ioc_, [this]() {
        if (finished()) {
            LOG_INFO("ReplaySession: all " << executed_ << " steps executed");
            if (onFinished_) {
                onFinished_();
            }
            return;
        }
        const auto& step = script_.steps[executed_];
        LOG_DEBUG("ReplaySession: step " << executed_ << ' ' << stepKindToString(step.kind));
        execute_(step);
        ++executed_;
        schedule_();
    });
}

void ReplaySession::execute_(const ReplayStep& step) {
    switch (step.kind) {
    case ReplayStep::Kind::Message:
        // The service stores what it publishes, so later pages include it.
        history_->append({step.message->message});
        events_->emitMessage(*step.message);
        break;
    case ReplayStep::Kind::ReactionSummary:
        events_->emitReactionSummary(*step.reaction);
        break;
    case ReplayStep::Kind::Discontinuity:
        events_->emitDiscontinuity();
        break;
    case ReplayStep::Kind::ShowLatest:
        window_.showLatestMessages();
        break;
    case ReplayStep::Kind::ScrollBy:
        window_.scrollBy(step.delta);
        break;
    case ReplayStep::Kind::ShowAround:
        window_.showMessagesAroundSerial(step.serial);
        break;
    case ReplayStep::Kind::LoadMore:
        window_.loadMoreHistory();
        break;
    case ReplayStep::Kind::HistoryAppend:
        history_->append(step.messages);
        break;
    }
}

}  // namespace adapters::replay
