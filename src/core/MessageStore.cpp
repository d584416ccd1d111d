#include "core/MessageStore.h"

#include <string>

#include "common/Log.hpp"
#include "domain/Ordering.hpp"

namespace core {

bool MessageStore::integrate(const std::vector<domain::Message>& batch, bool prepend, Anchor* anchor) {
    if (batch.empty()) {
        return false;
    }

    bool changed = false;
    for (const auto& message : batch) {
        if (serials_.count(message.serial) != 0) {
            changed = mergeExisting_(message) || changed;
            continue;
        }
        insertNew_(message, prepend, anchor);
        serials_.insert(message.serial);
        changed = true;
    }

    if (changed) {
        ++version_;
    }
    return changed;
}

bool MessageStore::mergeExisting_(const domain::Message& incoming) {
    const auto idx = domain::findBySerial(messages_, incoming.serial);
    if (!idx) {
        LOG_ERR("MessageStore: serial " << incoming.serial << " indexed but not in sequence");
        return false;
    }

    auto& stored = messages_[*idx];
    auto merged = stored.mergedWith(incoming);
    if (merged == stored) {
        return false;
    }
    stored = std::move(merged);
    return true;
}

void MessageStore::insertNew_(const domain::Message& incoming, bool prepend, Anchor* anchor) {
    std::size_t position = 0;
    if (messages_.empty()) {
        position = 0;
    } else if (prepend && incoming.before(messages_.front())) {
        position = 0;
    } else if (incoming.after(messages_.back())) {
        // Live traffic lands here.
        position = messages_.size();
    } else {
        position = domain::insertionIndex(messages_, incoming);
    }

    messages_.insert(messages_.begin() + static_cast<std::ptrdiff_t>(position), incoming);
    if (anchor != nullptr) {
        anchor->shiftForInsertAt(position);
    }
}

bool MessageStore::applyReactionSummary(const domain::ReactionSummaryEvent& event) {
    if (serials_.count(event.messageSerial) == 0) {
        LOG_DEBUG("MessageStore: reaction summary for unknown serial " << event.messageSerial << " dropped");
        return false;
    }

    const auto idx = domain::findBySerial(messages_, event.messageSerial);
    if (!idx) {
        return false;
    }

    auto& stored = messages_[*idx];
    if (stored.reactions && *stored.reactions == event.summary) {
        return false;
    }
    stored = stored.withReactions(event.summary);
    ++version_;
    return true;
}

void MessageStore::clear() noexcept {
    messages_.clear();
    serials_.clear();
    version_ = 0;
}

bool MessageStore::contains(std::string_view serial) const {
    return serials_.count(domain::Serial{serial}) != 0;
}

std::optional<std::size_t> MessageStore::indexOf(std::string_view serial) const {
    if (!contains(serial)) {
        return std::nullopt;
    }
    return domain::findBySerial(messages_, serial);
}

}  // namespace core
