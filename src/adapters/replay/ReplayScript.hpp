#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Models.hpp"

namespace adapters::replay {

struct ReplayStep {
    enum class Kind {
        Message,
        ReactionSummary,
        Discontinuity,
        ShowLatest,
        ScrollBy,
        ShowAround,
        LoadMore,
        HistoryAppend,
    };

    Kind kind{Kind::Message};
    std::optional<domain::MessageEvent> message;
    std::optional<domain::ReactionSummaryEvent> reaction;
    std::int64_t delta{0};
    domain::Serial serial;
    std::vector<domain::Message> messages;
};

const char* stepKindToString(ReplayStep::Kind kind) noexcept;

// A recorded room session: the history the service holds when the room is
// entered, followed by realtime events and user navigation in order.
struct ReplayScript {
    std::string room{"replay"};
    std::vector<domain::Message> history;
    std::vector<ReplayStep> steps;

    // Both throw std::runtime_error on unreadable or malformed scripts.
    static ReplayScript fromJson(const boost::json::value& value);
    static ReplayScript load(const std::string& path);
};

}  // namespace adapters::replay
