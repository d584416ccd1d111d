#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace domain {

enum class Order {
    Before,
    Same,
    After,
};

// Serials are compared bytewise; the realtime service issues them so that this
// order matches publication order.
inline Order compareSerials(std::string_view lhs, std::string_view rhs) noexcept {
    const int cmp = lhs.compare(rhs);
    if (cmp < 0) {
        return Order::Before;
    }
    if (cmp > 0) {
        return Order::After;
    }
    return Order::Same;
}

// Three-way comparison built from the before/after predicates of T.
template <typename T>
Order compare(const T& lhs, const T& rhs) {
    if (lhs.before(rhs)) {
        return Order::Before;
    }
    if (lhs.after(rhs)) {
        return Order::After;
    }
    return Order::Same;
}

// Index at which `item` keeps `seq` sorted; equal elements stay in front of it.
template <typename Seq, typename T>
std::size_t insertionIndex(const Seq& seq, const T& item) {
    std::size_t left = 0;
    std::size_t right = seq.size();
    while (left < right) {
        const std::size_t mid = left + (right - left) / 2;
        if (compare(item, seq[mid]) == Order::Before) {
            right = mid;
        } else {
            left = mid + 1;
        }
    }
    return left;
}

// Binary search by serial. `descending` searches a sequence sorted newest-first,
// which is how history pages arrive.
template <typename Seq>
std::optional<std::size_t> findBySerial(const Seq& seq,
                                        std::string_view serial,
                                        bool descending = false) {
    std::size_t left = 0;
    std::size_t right = seq.size();
    while (left < right) {
        const std::size_t mid = left + (right - left) / 2;
        const Order order = compareSerials(seq[mid].serial, serial);
        if (order == Order::Same) {
            return mid;
        }
        const bool goRight = descending ? order == Order::After : order == Order::Before;
        if (goRight) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return std::nullopt;
}

}  // namespace domain
