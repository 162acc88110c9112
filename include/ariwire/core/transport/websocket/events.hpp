#pragma once

/*
===============================================================================
 ariwire::core::transport::websocket::Event
===============================================================================

Control-plane event type emitted by a WebSocket transport implementation
and delivered to the owning Connection via poll_event().

Events replace completion callbacks (on_open / on_error / on_close) with a
deterministic, poll-driven channel drained on the caller's thread.

-------------------------------------------------------------------------------
 Control-Plane vs Data-Plane
-------------------------------------------------------------------------------

This event type is strictly for CONTROL-PLANE signaling:

    • Opened               → Upgrade completed, messages may flow
    • Close                → Transport closed (local or remote), exactly once
    • Error                → Transport-level failure (precedes Close)
    • BackpressureDetected → Outbound queue reached its limit
    • BackpressureCleared  → Outbound queue drained below its limit

Message delivery (data-plane) uses the transport's inbound message ring
(peek_message() / release_message()).

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

• Opened and Close are never dropped.
• Error precedes the Close it caused.

===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "ariwire/core/transport/error.hpp"

namespace ariwire::core::transport::websocket {

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------

enum class EventType : std::uint8_t {
    Opened = 0,
    Close  = 1,
    Error  = 2,
    BackpressureDetected = 3,
    BackpressureCleared  = 4,
};

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------

struct Event {

    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // valid only if type == EventType::Error

    static constexpr Event make_opened() noexcept {
        return Event{EventType::Opened, transport::Error::None};
    }

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }

    static constexpr Event make_backpressure_detected() noexcept {
        return Event{EventType::BackpressureDetected, transport::Error::Backpressure};
    }

    static constexpr Event make_backpressure_cleared() noexcept {
        return Event{EventType::BackpressureCleared, transport::Error::None};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace ariwire::core::transport::websocket
