#pragma once

#include <cstdint>
#include <type_traits>


namespace lcr {


// Monotonic sequence number generator (single-threaded).
// Unsigned types wrap around on overflow.
template <typename T>
class basic_sequence {
    static_assert(std::is_unsigned_v<T>, "basic_sequence requires an unsigned type");

    T next_seq_;

public:
    explicit constexpr basic_sequence(T start = 1) noexcept : next_seq_(start) {}
    // Disable copy semantics
    basic_sequence(const basic_sequence&) = delete;
    basic_sequence& operator=(const basic_sequence&) = delete;
    // Enable move semantics
    basic_sequence(basic_sequence&&) noexcept = default;
    basic_sequence& operator=(basic_sequence&&) noexcept = default;

    // Return next sequence number and increment
    inline T next() noexcept {
        return next_seq_++;
    }

    // Peek at the next sequence number without incrementing
    inline T current() const noexcept {
        return next_seq_;
    }

    inline void reset(T start = 1) noexcept {
        next_seq_ = start;
    }
};

using sequence   = basic_sequence<std::uint64_t>;
using sequence32 = basic_sequence<std::uint32_t>;


} // namespace lcr
