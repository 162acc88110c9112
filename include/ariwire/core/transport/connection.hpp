#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <cstdint>

#include "ariwire/core/config/ring_sizes.hpp"
#include "ariwire/core/transport/concepts.hpp"
#include "ariwire/core/transport/handshake.hpp"
#include "ariwire/core/transport/parse_url.hpp"
#include "ariwire/core/transport/state.hpp"
#include "ariwire/core/transport/connection/signal.hpp"
#include "ariwire/core/transport/websocket/events.hpp"
#include "ariwire/core/transport/websocket/message.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace ariwire::core::transport {

/*
===============================================================================
 ariwire::core::transport::Connection
===============================================================================

Generic transport-level connection abstraction, parameterized by a WebSocket
transport implementation conforming to transport::WebSocketConcept.

A Connection owns exactly one transport instance per lifetime and exposes the
same surface in both roles:

  - Client role: open(url, handshake) dials out and performs the upgrade
  - Server role: adopt(ws, identity) takes over a socket whose upgrade was
    verified and accepted by the connection manager

Sessions (control or media) are composed on top and never see which role
produced the connection.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

  Idle ──open/adopt──▶ Connecting ──Opened──▶ Open ──close()──▶ Closing
                           │                   │                   │
                           └──fail──▶ Closed ◀─┴──transport close──┘

  Closed may be reopened (client role), which starts a new transport epoch.
  Messages buffered by a previous lifetime are discarded at that point.

-------------------------------------------------------------------------------
 Invariants
-------------------------------------------------------------------------------
- send() is accepted only in Open; anything else is Error::InvalidState
- Every Signal::Closed is preceded by exactly one Signal::Opened
- A lifetime that never reached Open ends with Signal::OpenFailed
- Messages received while Open stay readable until released, even after
  the connection has moved to Closed

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- No inheritance and no virtual functions
- Transport-agnostic via transport::WebSocketConcept
- Fully testable using mock transports
- No background threads; all logic is poll-driven
===============================================================================
*/

// Observable identity of a connection
struct Identity {
    std::string remote_address;  // "ip:port" of the peer
    std::string subprotocol;     // negotiated Sec-WebSocket-Protocol
    std::string principal;       // authenticated user (server role, empty if unchecked)
    std::string connection_id;   // X-Connection-Id (sent or received)
};

template <transport::WebSocketConcept WS>
class Connection {
public:
    using context_type = typename WS::context_type;

    explicit Connection(context_type& ctx) noexcept
        : ctx_(ctx)
    {}

    // Ensure transport is closed on destruction.
    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // -------------------------------------------------------------------------
    // Client role
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error open(std::string_view url, const Handshake& handshake = {}) noexcept {
        AW_DEBUG("[CONN] Connecting to: " << url);

        // --- Synchronous preconditions (must succeed before FSM starts) ---

        // 0) PRECONDITION: must be idle or closed
        if (state_ != State::Idle && state_ != State::Closed) {
            AW_WARN("[CONN] open() called while " << to_string(state_) << ". Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl parsed;
        Error err = parse_url(url, parsed);
        if (err != Error::None) {
            AW_ERROR("[CONN] URL parsing failed: " << url);
            last_error_ = err;
            return err;
        }
        url_  = std::string(url);
        role_ = Role::Client;
        identity_ = Identity{};
        identity_.connection_id = handshake.connection_id;
        // 2) Enter FSM: all preconditions satisfied, begin connection attempt
        transition_(Event::OpenRequested);
        // 3) Create a fresh transport instance
        create_transport_();
        // 4) Initiate connection (completion arrives as a transport event)
        err = ws_->connect(parsed.host, parsed.port, handshake::request_target(parsed.target(), handshake), handshake);
        if (err != Error::None) {
            AW_ERROR("[CONN] Connection failed (" << to_string(err) << ")");
            transition_(Event::TransportConnectFailed, err);
            return err;
        }
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Server role
    // -------------------------------------------------------------------------
    // Takes ownership of a transport whose upgrade has already been verified.
    // The transport reports Opened once its upgrade response has been written.
    [[nodiscard]]
    inline Error adopt(std::unique_ptr<WS> ws, Identity identity) noexcept {
        if (state_ != State::Idle && state_ != State::Closed) {
            AW_WARN("[CONN] adopt() called while " << to_string(state_) << ". Ignoring.");
            return Error::InvalidState;
        }
        if (!ws) {
            return Error::InvalidState;
        }
        role_     = Role::Server;
        identity_ = std::move(identity);
        url_      = identity_.remote_address;
        transition_(Event::AdoptRequested);
        ws_ = std::move(ws);
        AW_DEBUG("[CONN] Adopted inbound connection from " << identity_.remote_address);
        return Error::None;
    }

    // Graceful close. Idempotent.
    inline void close() noexcept {
        if (state_ == State::Connecting || state_ == State::Open) {
            transition_(Event::CloseRequested);
        }
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error send(std::string_view bytes, websocket::MessageKind kind = websocket::MessageKind::Text) noexcept {
        if (state_ != State::Open) {
            AW_WARN("[CONN] send() called while " << to_string(state_) << ". Ignoring.");
            return Error::InvalidState;
        }
        const Error err = ws_->send(bytes, kind);
        if (err == Error::None) {
            ++tx_messages_;
        }
        return err;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() noexcept {
        if (!ws_) {
            return;
        }
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            switch (ev.type) {
                case websocket::EventType::Opened:
                    transition_(Event::TransportConnected);
                    break;

                case websocket::EventType::Error:
                    transition_(Event::TransportError, ev.error);
                    break;

                case websocket::EventType::Close:
                    transition_(Event::TransportClosed);
                    break;

                case websocket::EventType::BackpressureDetected:
                    if (state_ == State::Open) emit_(connection::Signal::BackpressureDetected);
                    break;

                case websocket::EventType::BackpressureCleared:
                    if (state_ == State::Open) emit_(connection::Signal::BackpressureCleared);
                    break;
            }
        }
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // -------------------------------------------------------------------------
    // Data-plane
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline websocket::Message* peek_message() noexcept {
        if (!ws_) {
            return nullptr;
        }
        websocket::Message* msg = ws_->peek_message();
        if (msg && !peeked_) {
            ++rx_messages_;
            peeked_ = true;
        }
        return msg;
    }

    inline void release_message() noexcept {
        if (ws_) {
            ws_->release_message();
            peeked_ = false;
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline Role role() const noexcept { return role_; }
    [[nodiscard]] inline bool is_open() const noexcept { return state_ == State::Open; }
    [[nodiscard]] inline bool is_closed() const noexcept { return state_ == State::Closed; }

    // Connecting or Open or Closing
    [[nodiscard]]
    inline bool is_active() const noexcept {
        return state_ == State::Connecting || state_ == State::Open || state_ == State::Closing;
    }

    [[nodiscard]] inline const Identity& identity() const noexcept { return identity_; }
    [[nodiscard]] inline const std::string& url() const noexcept { return url_; }
    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline DisconnectReason disconnect_reason() const noexcept { return disconnect_reason_; }
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_; }

    [[nodiscard]] inline context_type& context() noexcept { return ctx_; }

#ifdef AW_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }
#endif // AW_UNIT_TEST

private:
    context_type& ctx_;
    std::unique_ptr<WS> ws_;            // WebSocket instance (owned by Connection)

    Role role_{Role::Client};
    Identity identity_;
    std::string url_;                   // for logging

    // Current transport epoch (incremented each time Open is reached)
    std::uint64_t epoch_{0};

    // Message activity tracking
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};
    bool peeked_{false};

    Error last_error_{Error::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};

    // State machine
    State state_{State::Idle};
    bool opened_{false};                // reached Open in the current lifetime

    // The pending transition signals
    lcr::local::ring_buffer<connection::Signal, config::signal_ring> signals_;

    inline void emit_(connection::Signal sig) noexcept {
        AW_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        // Opened/Closed edges must not be lost: the consumer is not draining
        AW_FATAL("[CONN] Signal ring full, dropping '" << to_string(sig) << "' and closing connection.");
        close();
    }

    inline void set_state_(State new_state) noexcept {
        AW_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    inline void create_transport_() {
        // If exists, ensure old transport is torn down deterministically
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        peeked_ = false;
        ws_ = std::make_unique<WS>(ctx_);
    }

    // Resolves a finished lifetime into Closed plus the matching signal
    inline void finish_() noexcept {
        set_state_(State::Closed);
        if (opened_) {
            emit_(connection::Signal::Closed);
            AW_INFO("[CONN] Connection closed: " << url_ << " (reason: " << to_string(disconnect_reason_) << ")");
        }
        else {
            if (last_error_ == Error::None) {
                last_error_ = (disconnect_reason_ == DisconnectReason::LocalClose) ? Error::Cancelled : Error::ConnectionFailed;
            }
            emit_(connection::Signal::OpenFailed);
            AW_WARN("[CONN] Connection attempt failed: " << url_ << " (" << to_string(last_error_) << ")");
        }
        opened_ = false;
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        AW_TRACE("[FSM] (" << to_string(state_) << ") --" << to_string(event) << "-->");

        switch (state_) {

        // ================================================================
        case State::Idle:
        case State::Closed:
            switch (event) {
            case Event::OpenRequested:
            case Event::AdoptRequested:
                set_state_(State::Connecting);
                last_error_ = Error::None;
                disconnect_reason_ = DisconnectReason::None;
                opened_ = false;
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Open);
                opened_ = true;
                ++epoch_;
                if (ws_) {
                    identity_.remote_address = std::string(ws_->remote_address());
                    identity_.subprotocol    = std::string(ws_->subprotocol());
                }
                emit_(connection::Signal::Opened);
                AW_INFO("[CONN] Connection open (" << to_string(role_) << "): " << url_);
                break;

            case Event::TransportConnectFailed:
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                finish_();
                break;

            case Event::TransportError:
                last_error_ = error;
                disconnect_reason_ = (error == Error::HandshakeRejected)
                                   ? DisconnectReason::HandshakeRejected
                                   : DisconnectReason::TransportError;
                break;

            case Event::TransportClosed:
                finish_();
                break;

            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                last_error_ = Error::Cancelled;
                set_state_(State::Closing);
                ws_->close();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Open:
            switch (event) {
            case Event::CloseRequested:
                AW_DEBUG("[CONN] Closing: " << url_);
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Closing);
                ws_->close();
                break;

            case Event::TransportError:
                last_error_ = error;
                disconnect_reason_ = (error == Error::RemoteClosed)
                                   ? DisconnectReason::RemoteClose
                                   : DisconnectReason::TransportError;
                AW_WARN("[CONN] Transport error: " << to_string(error));
                break;

            case Event::TransportClosed:
                if (disconnect_reason_ == DisconnectReason::None) {
                    disconnect_reason_ = DisconnectReason::RemoteClose;
                    last_error_ = Error::RemoteClosed;
                }
                finish_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Closing:
            switch (event) {
            case Event::TransportConnected:
                // Upgrade completed after close() was requested: never exposed as Open
                break;

            case Event::TransportClosed:
                finish_();
                break;

            default:
                break;
            }
            break;
        }
    }
};

} // namespace ariwire::core::transport
