#pragma once

#include <cstddef>

namespace ariwire::core::config {

/*
===============================================================================
Ring Buffer Sizes
===============================================================================

Ring sizes are chosen based on expected message frequency and burst behavior.

Design principles:
  - Small control-plane rings (signals, notices, errors)
  - Larger data-plane rings (inbound messages, media frames)
  - All sizes are compile-time powers of two (usable capacity is N - 1)
  - No magic numbers scattered across the codebase
===============================================================================
*/

// -----------------------------------------------------------------------------
// Transport
// -----------------------------------------------------------------------------
inline constexpr std::size_t message_ring       = 1 << 9;  // 512 inbound messages
inline constexpr std::size_t transport_event_ring = 1 << 5; // 32
inline constexpr std::size_t signal_ring        = 1 << 5;  // 32
inline constexpr std::size_t tx_queue_limit     = 1 << 10; // 1024 queued outbound messages

// Largest accepted websocket message (bytes)
inline constexpr std::size_t max_message_size   = 1 << 20; // 1 MiB

// -----------------------------------------------------------------------------
// Control plane
// -----------------------------------------------------------------------------
inline constexpr std::size_t completion_ring    = 1 << 8;  // 256
inline constexpr std::size_t error_ring         = 1 << 6;  // 64

// -----------------------------------------------------------------------------
// Media plane (20 ms frames: 1024 frames ~ 20 s of audio)
// -----------------------------------------------------------------------------
inline constexpr std::size_t frame_ring         = 1 << 10; // 1024
inline constexpr std::size_t media_notice_ring  = 1 << 5;  // 32

// -----------------------------------------------------------------------------
// Connection manager
// -----------------------------------------------------------------------------
inline constexpr std::size_t upgrade_ring       = 1 << 5;  // 32 pending upgrades per listener
inline constexpr std::size_t manager_notice_ring = 1 << 7; // 128

} // namespace ariwire::core::config
