#pragma once

#include <cstdint>
#include <string_view>

#include "ariwire/core/transport/error.hpp"

namespace ariwire::core::protocol::control {

/*
===============================================================================
 control::Error
===============================================================================

Outcome of a control-plane operation (request completion or error report).

  Timeout          → deadline elapsed before a matching response arrived
  ConnectionClosed → connection closed (or was never open) while pending
  Transport        → transport refused the request (backpressure, failure)
  Protocol         → malformed or unclassifiable inbound message
  Remote           → peer answered with an explicit error object
  Cancelled        → cancel() was called
  DuplicateId      → caller supplied an id that is still pending
  HandlerFailed    → a user handler threw while processing a message
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    Timeout,
    ConnectionClosed,
    Transport,
    Protocol,
    Remote,
    Cancelled,
    DuplicateId,
    HandlerFailed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
    case Error::None:             return "None";
    case Error::Timeout:          return "Timeout";
    case Error::ConnectionClosed: return "ConnectionClosed";
    case Error::Transport:        return "Transport";
    case Error::Protocol:         return "Protocol";
    case Error::Remote:           return "Remote";
    case Error::Cancelled:        return "Cancelled";
    case Error::DuplicateId:      return "DuplicateId";
    case Error::HandlerFailed:    return "HandlerFailed";
    default:                      return "Unknown";
    }
}

// Maps a refused send to the control taxonomy
[[nodiscard]]
inline constexpr Error from_transport(transport::Error e) noexcept {
    switch (e) {
    case transport::Error::None:          return Error::None;
    case transport::Error::InvalidState:
    case transport::Error::LocalShutdown:
    case transport::Error::RemoteClosed:  return Error::ConnectionClosed;
    case transport::Error::ProtocolError: return Error::Protocol;
    case transport::Error::Timeout:       return Error::Timeout;
    default:                              return Error::Transport;
    }
}

} // namespace ariwire::core::protocol::control
