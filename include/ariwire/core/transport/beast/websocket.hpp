#pragma once

/*
===============================================================================
 ariwire::core::transport::beast::WebSocket
===============================================================================

Boost.Beast implementation of transport::WebSocketConcept.

Execution model:
  - All I/O runs on a caller-owned boost::asio::io_context
  - No threads are created; poll_event() runs ready completion handlers
    (io_context::poll) and then drains the control-plane event ring
  - Handlers only touch state owned by this transport, so the caller's
    thread is the only thread that ever observes it

Client role:
  connect() resolves, connects and performs the upgrade request with the
  handshake's subprotocol, Authorization header and X-Connection-Id header.
  A declined upgrade (401/403) is reported as Error::HandshakeRejected.

Server role:
  accept() takes a socket plus the HTTP upgrade request already read by the
  Listener and writes the 101 response, echoing the negotiated subprotocol.

Flow control:
  - Inbound messages are stored in a bounded ring. While it is full no read
    is outstanding, so TCP flow control holds the peer back; reading
    resumes once release_message() frees a slot
  - Outbound messages are queued with a single write in flight; a full
    queue refuses send() with Error::Backpressure

Lifetime:
  Internal state is reference counted by pending handlers, so destroying the
  facade while operations are in flight is safe: the socket is closed and the
  handlers complete as aborted on the next poll of the io_context.
===============================================================================
*/

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "ariwire/core/transport/error.hpp"
#include "ariwire/core/transport/handshake.hpp"
#include "ariwire/core/transport/websocket/events.hpp"
#include "ariwire/core/transport/websocket/message.hpp"


namespace ariwire::core::transport::beast {

using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

class WebSocket {
public:
    using context_type = boost::asio::io_context;

    explicit WebSocket(context_type& ioc);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // -----------------------------------------------------------------------------
    // Client role: asynchronous resolve + connect + upgrade
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port,
                  const std::string& target, const Handshake& handshake) noexcept;

    // -----------------------------------------------------------------------------
    // Server role: complete the upgrade on a socket accepted by the Listener
    // -----------------------------------------------------------------------------
    [[nodiscard]]
    Error accept(boost::asio::ip::tcp::socket socket, upgrade_request_type request,
                 std::string subprotocol) noexcept;

    [[nodiscard]]
    Error send(std::string_view bytes, websocket::MessageKind kind) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

    [[nodiscard]]
    websocket::Message* peek_message() noexcept;

    void release_message() noexcept;

    [[nodiscard]]
    std::string_view remote_address() const noexcept;

    [[nodiscard]]
    std::string_view subprotocol() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace ariwire::core::transport::beast
