#pragma once

#include <cstdint>
#include <string_view>


namespace ariwire::core::transport {

// ===============================================================
// ROLE ENUM
// ===============================================================
enum class Role : uint8_t {
    Client,   // we dialed out and performed the upgrade request
    Server    // we accepted an inbound upgrade
};

[[nodiscard]]
inline constexpr std::string_view to_string(Role r) noexcept {
    switch (r) {
        case Role::Client: return "Client";
        case Role::Server: return "Server";
        default:           return "Unknown";
    }
}

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Idle,
    Connecting,
    Open,
    Closing,
    Closed
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:        return "Idle";
        case State::Connecting:  return "Connecting";
        case State::Open:        return "Open";
        case State::Closing:     return "Closing";
        case State::Closed:      return "Closed";
        default:                 return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    AdoptRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportConnected,      // upgrade completed (client) / adopted socket (server)
    TransportConnectFailed,  // connect initiation or upgrade failed
    TransportError,          // failure on an open transport
    TransportClosed
};

// ===============================================================
// Event → string
// ===============================================================
[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:          return "OpenRequested";
        case Event::AdoptRequested:         return "AdoptRequested";
        case Event::CloseRequested:         return "CloseRequested";
        case Event::TransportConnected:     return "TransportConnected";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::TransportError:         return "TransportError";
        case Event::TransportClosed:        return "TransportClosed";
        default:                            return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by user
    RemoteClose,       // peer sent a CLOSE frame
    TransportError,    // socket / IO error
    HandshakeRejected  // upgrade refused by the peer
};

// ------------------------------------------------------------
// DisconnectReason → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:              return "None";
        case DisconnectReason::LocalClose:        return "LocalClose";
        case DisconnectReason::RemoteClose:       return "RemoteClose";
        case DisconnectReason::TransportError:    return "TransportError";
        case DisconnectReason::HandshakeRejected: return "HandshakeRejected";
        default:                                  return "Unknown";
    }
}

} // namespace ariwire::core::transport
