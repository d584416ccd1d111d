#pragma once

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using Serial = std::string;
using TimestampMs = std::int64_t;
using StringMap = std::map<std::string, std::string>;

enum class MessageAction {
    Create,
    Update,
    Delete,
};

inline std::string actionToString(MessageAction action) {
    switch (action) {
    case MessageAction::Create:
        return "message.create";
    case MessageAction::Update:
        return "message.update";
    case MessageAction::Delete:
        return "message.delete";
    }
    return "";
}

inline std::optional<MessageAction> actionFromString(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized == "message.create" || normalized == "create") {
        return MessageAction::Create;
    }
    if (normalized == "message.update" || normalized == "update") {
        return MessageAction::Update;
    }
    if (normalized == "message.delete" || normalized == "delete") {
        return MessageAction::Delete;
    }
    return std::nullopt;
}

// Identifies one revision of a message. The version serial shares the ordering
// of message serials: a created message has version.serial == serial and every
// edit or delete issues a greater one.
struct MessageVersion {
    Serial serial;
    TimestampMs timestamp{0};
    std::optional<std::string> clientId;
    std::optional<std::string> description;
    StringMap metadata;

    bool operator==(const MessageVersion& other) const {
        return serial == other.serial && timestamp == other.timestamp && clientId == other.clientId &&
               description == other.description && metadata == other.metadata;
    }
    bool operator!=(const MessageVersion& other) const { return !(*this == other); }
};

struct ReactionTally {
    std::uint32_t total{0};
    std::vector<std::string> clientIds;

    bool operator==(const ReactionTally& other) const {
        return total == other.total && clientIds == other.clientIds;
    }
    bool operator!=(const ReactionTally& other) const { return !(*this == other); }
};

struct MultipleReactionTally {
    std::uint32_t total{0};
    std::map<std::string, std::uint32_t> clientIds;
    std::uint32_t totalUnidentified{0};

    bool operator==(const MultipleReactionTally& other) const {
        return total == other.total && clientIds == other.clientIds &&
               totalUnidentified == other.totalUnidentified;
    }
    bool operator!=(const MultipleReactionTally& other) const { return !(*this == other); }
};

struct ReactionSummary {
    std::map<std::string, ReactionTally> unique;
    std::map<std::string, ReactionTally> distinct;
    std::map<std::string, MultipleReactionTally> multiple;

    bool empty() const noexcept { return unique.empty() && distinct.empty() && multiple.empty(); }

    bool operator==(const ReactionSummary& other) const {
        return unique == other.unique && distinct == other.distinct && multiple == other.multiple;
    }
    bool operator!=(const ReactionSummary& other) const { return !(*this == other); }
};

struct Message {
    Serial serial;
    std::string clientId;
    std::string text;
    TimestampMs createdAt{0};
    MessageAction action{MessageAction::Create};
    MessageVersion version;
    StringMap metadata;
    StringMap headers;
    std::optional<ReactionSummary> reactions;

    bool before(const Message& other) const;
    bool after(const Message& other) const;

    bool isUpdated() const noexcept { return action == MessageAction::Update; }
    bool isDeleted() const noexcept { return action == MessageAction::Delete; }

    // Combines this stored value with an incoming copy of the same message.
    // Throws std::invalid_argument when the serials differ.
    Message mergedWith(const Message& incoming) const;
    Message withReactions(const ReactionSummary& summary) const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

enum class MessageEventType {
    Created,
    Updated,
    Deleted,
};

inline std::string eventTypeToString(MessageEventType type) {
    switch (type) {
    case MessageEventType::Created:
        return "message.created";
    case MessageEventType::Updated:
        return "message.updated";
    case MessageEventType::Deleted:
        return "message.deleted";
    }
    return "";
}

inline std::optional<MessageEventType> eventTypeFromString(std::string_view value) {
    if (value == "message.created") {
        return MessageEventType::Created;
    }
    if (value == "message.updated") {
        return MessageEventType::Updated;
    }
    if (value == "message.deleted") {
        return MessageEventType::Deleted;
    }
    return std::nullopt;
}

struct MessageEvent {
    MessageEventType type{MessageEventType::Created};
    Message message;
};

struct ReactionSummaryEvent {
    Serial messageSerial;
    ReactionSummary summary;
};

}  // namespace domain
