#include "adapters/replay/ReplayEventSource.hpp"

#include <utility>

#include "common/Log.hpp"

namespace adapters::replay {

void ReplayEventSource::subscribe(domain::contracts::EventListeners listeners) {
    listeners_ = std::move(listeners);
    subscribed_ = true;
}

void ReplayEventSource::unsubscribe() {
    listeners_ = {};
    subscribed_ = false;
}

bool ReplayEventSource::emitMessage(const domain::MessageEvent& event) {
    if (!subscribed_ || !listeners_.onMessage) {
        LOG_DEBUG("ReplayEventSource: dropped " << domain::eventTypeToString(event.type) << " without subscriber");
        return false;
    }
    listeners_.onMessage(event);
    return true;
}

bool ReplayEventSource::emitReactionSummary(const domain::ReactionSummaryEvent& event) {
    if (!subscribed_ || !listeners_.onReactionSummary) {
        LOG_DEBUG("ReplayEventSource: dropped reaction summary for " << event.messageSerial);
        return false;
    }
    listeners_.onReactionSummary(event);
    return true;
}

bool ReplayEventSource::emitDiscontinuity() {
    if (!subscribed_ || !listeners_.onDiscontinuity) {
        return false;
    }
    listeners_.onDiscontinuity();
    return true;
}

}  // namespace adapters::replay
