#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/Anchor.h"
#include "domain/Models.hpp"

namespace core {

// Authoritative, strictly ordered list of every message known in the current
// room, plus the set of serials it holds. Single writer: calls must not overlap.
class MessageStore {
public:
    MessageStore() = default;

    // Applies a batch in one step. Known serials are merged, unknown ones are
    // inserted at their ordered position; `anchor`, when given, is shifted so it
    // keeps pointing at the same message. Returns true if anything changed.
    bool integrate(const std::vector<domain::Message>& batch, bool prepend = false, Anchor* anchor = nullptr);

    // Replaces the reaction summary of a known message. Unknown serials are
    // ignored; a later history page carries the current reactions anyway.
    bool applyReactionSummary(const domain::ReactionSummaryEvent& event);

    void clear() noexcept;

    const std::vector<domain::Message>& messages() const noexcept { return messages_; }
    std::size_t size() const noexcept { return messages_.size(); }
    bool empty() const noexcept { return messages_.empty(); }
    bool contains(std::string_view serial) const;
    std::optional<std::size_t> indexOf(std::string_view serial) const;
    const domain::Message* back() const noexcept { return messages_.empty() ? nullptr : &messages_.back(); }

    // Bumped once for every call that changed the sequence; 0 after clear().
    std::uint64_t version() const noexcept { return version_; }

private:
    bool mergeExisting_(const domain::Message& incoming);
    void insertNew_(const domain::Message& incoming, bool prepend, Anchor* anchor);

    std::vector<domain::Message> messages_;
    std::unordered_set<domain::Serial> serials_;
    std::uint64_t version_{0};
};

}  // namespace core
