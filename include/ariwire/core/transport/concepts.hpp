#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "ariwire/core/transport/error.hpp"
#include "ariwire/core/transport/handshake.hpp"
#include "ariwire/core/transport/websocket/events.hpp"
#include "ariwire/core/transport/websocket/message.hpp"

namespace ariwire::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the Connection layer.
//
// The WebSocket implementation:
//
//   • Is constructed from a shared execution context (WS::context_type&)
//   • Initiates connections asynchronously; completion is reported as an
//     Opened event (or Error + Close on failure)
//   • Pushes control-plane events into an internal ring drained by
//     poll_event(); poll_event() is also where pending I/O makes progress
//   • Stores complete inbound messages in a bounded ring exposed through
//     peek_message() / release_message()
//   • Refuses sends with Error::Backpressure instead of buffering unboundedly
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    requires { typename WS::context_type; } &&
    std::constructible_from<WS, typename WS::context_type&> &&
    requires(
        WS ws,
        const WS cws,
        const std::string& host,
        const std::string& port,
        const std::string& target,
        const Handshake& hs,
        std::string_view bytes,
        websocket::MessageKind kind,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, target, hs) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(bytes, kind) } noexcept -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Data-plane
    // ---------------------------------------------------------------------

    { ws.peek_message() } noexcept -> std::same_as<websocket::Message*>;
    { ws.release_message() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Control-plane polling
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Identity
    // ---------------------------------------------------------------------

    { cws.remote_address() } -> std::convertible_to<std::string_view>;
    { cws.subprotocol() } -> std::convertible_to<std::string_view>;
};

} // namespace ariwire::core::transport
