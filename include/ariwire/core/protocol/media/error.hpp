#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ariwire/core/transport/error.hpp"

namespace ariwire::core::protocol::media {

/*
===============================================================================
 media::Error
===============================================================================

  Backpressure         → transport queue full, or the peer sent MEDIA_XOFF
  SequenceAnomaly      → inbound gap, duplicate or regression
  VerificationMismatch → echoed audio differs from what was sent
  InvalidFrame         → payload larger than the frame size, or a binary
                         message shorter than the frame header
  InvalidState         → operation not allowed in the current session state
  Transport            → any other transport refusal
  Protocol             → unparseable media notification
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    Backpressure,
    SequenceAnomaly,
    VerificationMismatch,
    InvalidFrame,
    InvalidState,
    Transport,
    Protocol
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
    case Error::None:                 return "None";
    case Error::Backpressure:         return "Backpressure";
    case Error::SequenceAnomaly:      return "SequenceAnomaly";
    case Error::VerificationMismatch: return "VerificationMismatch";
    case Error::InvalidFrame:         return "InvalidFrame";
    case Error::InvalidState:         return "InvalidState";
    case Error::Transport:            return "Transport";
    case Error::Protocol:             return "Protocol";
    default:                          return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Error from_transport(transport::Error e) noexcept {
    switch (e) {
    case transport::Error::None:          return Error::None;
    case transport::Error::Backpressure:  return Error::Backpressure;
    case transport::Error::InvalidState:  return Error::InvalidState;
    case transport::Error::ProtocolError: return Error::Protocol;
    default:                              return Error::Transport;
    }
}

// Report pushed to the media session error channel
struct ErrorReport {
    Error error{Error::None};
    std::string detail;
};

} // namespace ariwire::core::protocol::media
