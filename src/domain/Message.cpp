#include "domain/Models.hpp"

#include <stdexcept>

#include "domain/Ordering.hpp"

namespace domain {

bool Message::before(const Message& other) const {
    return compareSerials(serial, other.serial) == Order::Before;
}

bool Message::after(const Message& other) const {
    return compareSerials(serial, other.serial) == Order::After;
}

Message Message::mergedWith(const Message& incoming) const {
    if (incoming.serial != serial) {
        throw std::invalid_argument("cannot merge message " + incoming.serial + " into " + serial);
    }

    switch (compareSerials(version.serial, incoming.version.serial)) {
    case Order::Before: {
        Message merged = incoming;
        if (!merged.reactions) {
            merged.reactions = reactions;
        }
        return merged;
    }
    case Order::Same:
        if (incoming.reactions && incoming.reactions != reactions) {
            return withReactions(*incoming.reactions);
        }
        return *this;
    case Order::After:
        break;
    }
    return *this;
}

Message Message::withReactions(const ReactionSummary& summary) const {
    Message copy = *this;
    copy.reactions = summary;
    return copy;
}

bool Message::operator==(const Message& other) const {
    return serial == other.serial && clientId == other.clientId && text == other.text &&
           createdAt == other.createdAt && action == other.action && version == other.version &&
           metadata == other.metadata && headers == other.headers && reactions == other.reactions;
}

}  // namespace domain
