/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents **externally observable, edge-triggered facts**
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven

The Connection does NOT expose its internal FSM or transport internals.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Opened
  The WebSocket upgrade completed (client) or an accepted socket was adopted
  (server). Messages may now flow. Emitted once per transport lifetime.

OpenFailed
  A connection attempt did not reach Open (refused, handshake rejected).
  last_error() carries the cause.

Closed
  The connection left Open (or Closing) for good. Every Closed is preceded by
  exactly one Opened.

BackpressureDetected / BackpressureCleared
  Outbound queue reached / left its limit while Open.

===============================================================================
*/


#pragma once

#include <cstdint>
#include <string_view>


namespace ariwire::core::transport::connection {


enum class Signal : uint8_t {
    None,
    Opened,
    OpenFailed,
    Closed,
    BackpressureDetected,
    BackpressureCleared,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:                 return "None";
        case Signal::Opened:               return "Opened";
        case Signal::OpenFailed:           return "OpenFailed";
        case Signal::Closed:               return "Closed";
        case Signal::BackpressureDetected: return "BackpressureDetected";
        case Signal::BackpressureCleared:  return "BackpressureCleared";
        default:                           return "Unknown";
    }
}

} // namespace ariwire::core::transport::connection
