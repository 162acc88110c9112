#pragma once

/*
===============================================================================
 ariwire::core::transport::beast::Listener
===============================================================================

Server-role entry point: bind, listen and accept TCP connections on a
caller-owned io_context, then read each HTTP upgrade request.

Every complete request becomes an Upgrade (socket + parsed request + a
handshake::UpgradeRequest summary) queued for the owner, which decides:

  - accept: hand socket and request to WebSocket::accept()
  - reject: reject(), which writes an HTTP error response (401 responses
            carry WWW-Authenticate: Basic realm="<realm>") and closes

The listener is restartable: stop() closes the acceptor (pending upgrades
stay queued), listen() may be called again afterwards.
===============================================================================
*/

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "ariwire/core/transport/beast/websocket.hpp"
#include "ariwire/core/transport/error.hpp"
#include "ariwire/core/transport/handshake.hpp"


namespace ariwire::core::transport::beast {

struct Upgrade {
    explicit Upgrade(boost::asio::ip::tcp::socket s)
        : socket(std::move(s))
    {}

    boost::asio::ip::tcp::socket socket;
    upgrade_request_type request;
    handshake::UpgradeRequest summary;
};

class Listener {
public:
    using context_type = boost::asio::io_context;

    explicit Listener(context_type& ioc);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Port 0 binds an ephemeral port (see local_port())
    [[nodiscard]]
    Error listen(const std::string& address, std::uint16_t port) noexcept;

    void stop() noexcept;

    [[nodiscard]]
    bool is_listening() const noexcept;

    [[nodiscard]]
    std::uint16_t local_port() const noexcept;

    // Runs ready I/O handlers
    void poll() noexcept;

    // Next upgrade request awaiting a decision, nullptr when none
    [[nodiscard]]
    std::unique_ptr<Upgrade> pop_upgrade() noexcept;

    // Writes an HTTP error response and closes the socket
    void reject(std::unique_ptr<Upgrade> upgrade, unsigned status, std::string_view realm) noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace ariwire::core::transport::beast
