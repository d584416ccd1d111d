#include "core/WindowSelector.h"

#include <algorithm>
#include <cstdint>

#include "domain/Ordering.hpp"

namespace core {

WindowBounds computeBounds(std::size_t length,
                           const Anchor& anchor,
                           std::size_t windowSize,
                           std::size_t overscan) noexcept {
    if (length == 0) {
        return {};
    }

    const std::size_t idx = anchor.resolve(length);
    const std::size_t reach = windowSize / 2 + overscan;

    WindowBounds bounds;
    bounds.start = idx > reach ? idx - reach : 0;
    bounds.end = std::min(length, idx + reach + 1);
    return bounds;
}

std::vector<domain::Message> computeWindow(const std::vector<domain::Message>& sequence,
                                           const Anchor& anchor,
                                           std::size_t windowSize,
                                           std::size_t overscan) {
    const auto bounds = computeBounds(sequence.size(), anchor, windowSize, overscan);
    if (bounds.empty()) {
        return {};
    }
    const auto first = sequence.begin() + static_cast<std::ptrdiff_t>(bounds.start);
    const auto last = sequence.begin() + static_cast<std::ptrdiff_t>(bounds.end);
    return std::vector<domain::Message>(first, last);
}

WindowSelector::WindowSelector(std::size_t windowSize, std::size_t overscan)
    : windowSize_(windowSize), overscan_(overscan) {}

bool WindowSelector::moveTo(Anchor next) noexcept {
    if (next == anchor_) {
        return false;
    }
    anchor_ = next;
    return true;
}

bool WindowSelector::showLatest() noexcept { return moveTo(Anchor::tail()); }

bool WindowSelector::scrollBy(std::int64_t delta, std::size_t length) noexcept {
    if (length == 0) {
        return false;
    }

    const std::size_t latest = length - 1;
    const std::size_t base = anchor_.followsTail() ? latest : std::min(*anchor_.index, latest);

    if (delta >= 0) {
        // Reaching the newest row re-enables live tracking.
        if (static_cast<std::uint64_t>(delta) >= static_cast<std::uint64_t>(latest - base)) {
            return moveTo(Anchor::tail());
        }
        return moveTo(Anchor::at(base + static_cast<std::size_t>(delta)));
    }

    // Magnitude of a negative delta, INT64_MIN included.
    const auto back = static_cast<std::uint64_t>(-(delta + 1)) + 1;
    if (back >= static_cast<std::uint64_t>(base)) {
        return moveTo(Anchor::at(0));
    }
    return moveTo(Anchor::at(base - static_cast<std::size_t>(back)));
}

bool WindowSelector::showAround(const std::vector<domain::Message>& sequence, std::string_view serial) {
    const auto idx = domain::findBySerial(sequence, serial);
    if (!idx) {
        return false;
    }
    return moveTo(Anchor::at(*idx));
}

WindowBounds WindowSelector::bounds(std::size_t length) const noexcept {
    return computeBounds(length, anchor_, windowSize_, overscan_);
}

std::vector<domain::Message> WindowSelector::select(const std::vector<domain::Message>& sequence) const {
    return computeWindow(sequence, anchor_, windowSize_, overscan_);
}

}  // namespace core
