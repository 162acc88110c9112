#pragma once

#include <cstdint>
#include <string_view>

namespace ariwire::core::protocol::media {

//   Idle ──first frame──▶ Streaming ──HANGUP / finish()──▶ Draining ──grace──▶ Closed
//    │                        │                                                 ▲
//    └────────────────────────┴──────── cancel() / transport closed ────────────┘
//
// Closed is terminal.
enum class State : std::uint8_t {
    Idle,
    Streaming,
    Draining,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
    case State::Idle:      return "Idle";
    case State::Streaming: return "Streaming";
    case State::Draining:  return "Draining";
    case State::Closed:    return "Closed";
    default:               return "Unknown";
    }
}

} // namespace ariwire::core::protocol::media
