#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "core/Anchor.h"
#include "domain/Models.hpp"

namespace core {

struct WindowBounds {
    std::size_t start{0};
    std::size_t end{0};

    [[nodiscard]] std::size_t size() const noexcept { return end - start; }
    [[nodiscard]] bool empty() const noexcept { return end == start; }
};

// Half-open range [start, end) of the rows to render around the anchor.
WindowBounds computeBounds(std::size_t length,
                           const Anchor& anchor,
                           std::size_t windowSize,
                           std::size_t overscan) noexcept;

std::vector<domain::Message> computeWindow(const std::vector<domain::Message>& sequence,
                                           const Anchor& anchor,
                                           std::size_t windowSize,
                                           std::size_t overscan);

class WindowSelector {
public:
    WindowSelector(std::size_t windowSize, std::size_t overscan);

    const Anchor& anchor() const noexcept { return anchor_; }
    Anchor& anchor() noexcept { return anchor_; }
    std::size_t windowSize() const noexcept { return windowSize_; }
    std::size_t overscan() const noexcept { return overscan_; }

    // Navigation returns true when the anchor moved.
    bool showLatest() noexcept;
    bool scrollBy(std::int64_t delta, std::size_t length) noexcept;
    bool showAround(const std::vector<domain::Message>& sequence, std::string_view serial);
    void reset() noexcept { anchor_ = Anchor::tail(); }

    WindowBounds bounds(std::size_t length) const noexcept;
    std::vector<domain::Message> select(const std::vector<domain::Message>& sequence) const;

private:
    bool moveTo(Anchor next) noexcept;

    std::size_t windowSize_;
    std::size_t overscan_;
    Anchor anchor_{};
};

}  // namespace core
