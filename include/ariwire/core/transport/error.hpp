#pragma once

#include <cstdint>
#include <string_view>

namespace ariwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Asio / Boost.Beast).

Higher layers (transport::Connection, control and media sessions) use this
classification to decide how a failure is surfaced:

  - Caller     -> returned synchronously, connection state unchanged
  - Transport  -> connection is closed, pending work resolved
  - Protocol   -> handshake rejection or framing violation
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,        // Malformed or unsupported URL (scheme, host, port)
    InvalidState,      // Operation not allowed in current connection state
    Cancelled,         // Operation was aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,     // Connection was closed intentionally by the local endpoint
    RemoteClosed,      // Remote endpoint closed the connection gracefully (CLOSE frame)

    // --- Socket-level failures ----------------------------------------------
    Timeout,           // Transport-level timeout
    ConnectionFailed,  // Connection attempt failed (resolve, refused, routing)
    ConnectionReset,   // Established connection dropped without a CLOSE frame
    HandshakeFailed,   // WebSocket upgrade failed for a non-policy reason

    // --- Protocol / framing issues ------------------------------------------
    HandshakeRejected, // Peer refused credentials or subprotocol (HTTP 400/401/403)
    ProtocolError,     // Invalid frame, protocol violation, or unexpected message structure

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure,  // Unclassified transport failure

    // --- Flow control -------------------------------------------------------
    Backpressure,      // Queue limit reached (outbound refused or inbound overflow)
};

enum class ErrorCategory : std::uint8_t {
    None,
    Caller,
    Transport,
    Protocol,
};

[[nodiscard]]
inline constexpr ErrorCategory category(Error err) noexcept {
    switch (err) {
    case Error::None:
        return ErrorCategory::None;
    case Error::InvalidUrl:
    case Error::InvalidState:
    case Error::Cancelled:
        return ErrorCategory::Caller;
    case Error::HandshakeRejected:
    case Error::ProtocolError:
        return ErrorCategory::Protocol;
    default:
        return ErrorCategory::Transport;
    }
}

/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::ConnectionReset:   return "ConnectionReset";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::HandshakeRejected: return "HandshakeRejected";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    default:                       return "Unknown";
    }
}

inline constexpr std::string_view to_string(ErrorCategory c) noexcept {
    switch (c) {
    case ErrorCategory::None:      return "None";
    case ErrorCategory::Caller:    return "Caller";
    case ErrorCategory::Transport: return "Transport";
    case ErrorCategory::Protocol:  return "Protocol";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace ariwire::core
