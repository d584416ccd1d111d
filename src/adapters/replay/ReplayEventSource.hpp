#pragma once

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace adapters::replay {

// Realtime channel driven by a script instead of a socket. Events emitted while
// nobody is subscribed are dropped, as a live subscription would drop them.
class ReplayEventSource : public domain::contracts::IChatEventSource {
public:
    void subscribe(domain::contracts::EventListeners listeners) override;
    void unsubscribe() override;
    bool subscribed() const noexcept { return subscribed_; }

    bool emitMessage(const domain::MessageEvent& event);
    bool emitReactionSummary(const domain::ReactionSummaryEvent& event);
    bool emitDiscontinuity();

private:
    domain::contracts::EventListeners listeners_;
    bool subscribed_{false};
};

}  // namespace adapters::replay
