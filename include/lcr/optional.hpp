#pragma once

#include <string>
#include <sstream>
#include <type_traits>
#include <utility>
#include <cassert>


namespace lcr {

// Minimal value-or-nothing holder. T must be default constructible.
template <typename T>
class optional {
public:
    optional() : has_(false), value_{} {}
    optional(const T& v) : has_(true), value_(v) {}
    optional(T&& v) : has_(true), value_(std::move(v)) {}

    [[nodiscard]] inline bool has() const noexcept { return has_; }

    const T& value() const {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }
    [[nodiscard]] inline T& value() {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] inline T value_or(T fallback) const {
        return has_ ? value_ : std::move(fallback);
    }

    // Moves the value out and leaves the holder empty
    [[nodiscard]] inline T take() {
        assert(has_ && "lcr::optional::take() called when empty");
        has_ = false;
        return std::exchange(value_, T{});
    }

    template <typename... Args>
    inline T& emplace(Args&&... args) {
        value_ = T(std::forward<Args>(args)...);
        has_ = true;
        return value_;
    }

    inline void reset() {
        has_ = false;
        value_ = T{};
    }

    inline optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    inline optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    [[nodiscard]] friend bool operator==(const optional& a, const optional& b) {
        if (a.has_ != b.has_) return false;
        return !a.has_ || a.value_ == b.value_;
    }

private:
    bool has_;
    T value_;
};


template <typename T>
inline std::string to_string(const optional<T>& opt) {
    if (!opt.has()) {
        return "null";
    }
    if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(opt.value());
    }
    else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
        return "\"" + std::string(opt.value()) + "\"";
    }
    else {
        std::ostringstream oss;
        oss << opt.value();
        return oss.str();
    }
}

} // namespace lcr
