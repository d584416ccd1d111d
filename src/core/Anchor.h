#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>

namespace core {

// Reference row of the rendering window: either a concrete index into the
// ordered sequence or tail-follow (always the newest row).
struct Anchor {
    std::optional<std::size_t> index{};

    static Anchor tail() noexcept { return Anchor{}; }
    static Anchor at(std::size_t idx) noexcept { return Anchor{idx}; }

    [[nodiscard]] bool followsTail() const noexcept { return !index.has_value(); }

    // Only meaningful for a non-empty sequence.
    [[nodiscard]] std::size_t resolve(std::size_t length) const noexcept {
        const std::size_t latest = length == 0 ? 0 : length - 1;
        return index ? std::min(*index, latest) : latest;
    }

    // Keeps the anchor on the same row when one element is inserted at `position`.
    void shiftForInsertAt(std::size_t position) noexcept {
        if (index && position <= *index) {
            ++*index;
        }
    }

    bool operator==(const Anchor& other) const noexcept { return index == other.index; }
    bool operator!=(const Anchor& other) const noexcept { return !(*this == other); }
};

}  // namespace core
