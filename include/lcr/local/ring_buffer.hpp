#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded bounded ring buffer.
//
// A fixed-capacity circular buffer used for the in-process queues of a
// cooperative event loop (inbound message rings, event rings, error channels).
//
// Characteristics:
//   • O(1) push/pop operations
//   • Power-of-two capacity for modulo-free wraparound
//   • Zero-copy consumption via front() + drop_front()
//   • Usable capacity is Capacity - 1
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//
// Example:
//   ring_buffer<Message, 256> rx;
//   rx.push(Message{...});
//   if (Message* m = rx.front()) {
//       consume(*m);
//       rx.drop_front();
//   }
//------------------------------------------------------------------------------
template <typename T, size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() = default;
    ~ring_buffer() = default;

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    // Push (copy)
    inline bool push(const T& item) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = item;
        head_ = next;
        return true;
    }

    // Push (move)
    inline bool push(T&& item) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = std::move(item);
        head_ = next;
        return true;
    }

    // Pop (move)
    inline bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        if (tail_ == head_) [[unlikely]]
            return false; // empty
        out = std::move(buffer_[tail_]);
        buffer_[tail_] = T{};
        tail_ = (tail_ + 1) & MASK;
        return true;
    }

    // Oldest element, or nullptr when empty
    [[nodiscard]] inline T* front() noexcept {
        return (tail_ == head_) ? nullptr : &buffer_[tail_];
    }

    [[nodiscard]] inline const T* front() const noexcept {
        return (tail_ == head_) ? nullptr : &buffer_[tail_];
    }

    // Release the element returned by front()
    inline void drop_front() noexcept(std::is_nothrow_move_assignable_v<T>) {
        if (tail_ == head_) [[unlikely]]
            return;
        buffer_[tail_] = T{};
        tail_ = (tail_ + 1) & MASK;
    }

    [[nodiscard]] inline bool empty() const noexcept { return head_ == tail_; }

    [[nodiscard]] inline bool full() const noexcept {
        return ((head_ + 1) & MASK) == tail_;
    }

    [[nodiscard]] inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    [[nodiscard]] inline size_t size() const noexcept {
        return (head_ - tail_) & MASK;
    }

    // Drops all elements (and their owned resources)
    inline void clear() noexcept(std::is_nothrow_move_assignable_v<T>) {
        while (tail_ != head_) {
            buffer_[tail_] = T{};
            tail_ = (tail_ + 1) & MASK;
        }
        head_ = tail_ = 0;
    }

private:
    static constexpr size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    size_t head_{0};
    size_t tail_{0};
};


} // namespace local
} // namespace lcr
