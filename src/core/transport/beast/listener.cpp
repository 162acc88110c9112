#include "ariwire/core/transport/beast/listener.hpp"

#include <chrono>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include "ariwire/core/config/ring_sizes.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace ariwire::core::transport::beast {

namespace net   = boost::asio;
namespace bb    = boost::beast;
namespace http  = bb::http;
namespace bws   = bb::websocket;
using tcp       = net::ip::tcp;

namespace {

constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(10);

// State of one inbound socket while its upgrade request is read
struct PendingRead {
    explicit PendingRead(tcp::socket s)
        : stream(std::move(s))
    {}

    bb::tcp_stream stream;
    bb::flat_buffer buffer;
    upgrade_request_type request;
    std::string remote;
};

// State of one rejected socket while its HTTP response is written
struct PendingReject {
    explicit PendingReject(tcp::socket s)
        : stream(std::move(s))
    {}

    bb::tcp_stream stream;
    http::response<http::string_body> response;
};

handshake::UpgradeRequest summarize(const upgrade_request_type& req, std::string remote) {
    handshake::UpgradeRequest out;
    out.target         = std::string(req.target());
    out.is_upgrade     = bws::is_upgrade(req);
    out.subprotocols   = std::string(req[http::field::sec_websocket_protocol]);
    out.authorization  = std::string(req[http::field::authorization]);
    out.connection_id  = std::string(req[bb::string_view(handshake::CONNECTION_ID_HEADER.data(), handshake::CONNECTION_ID_HEADER.size())]);
    out.remote_address = std::move(remote);
    return out;
}

} // namespace


struct Listener::Impl : std::enable_shared_from_this<Listener::Impl> {

    explicit Impl(net::io_context& ctx)
        : ioc(ctx)
        , acceptor(ctx)
    {}

    net::io_context& ioc;
    tcp::acceptor acceptor;
    bool listening{false};
    std::uint16_t port{0};
    lcr::local::ring_buffer<std::unique_ptr<Upgrade>, config::upgrade_ring> upgrades;

    Error listen(const std::string& address, std::uint16_t wanted) {
        bb::error_code ec;
        const auto addr = net::ip::make_address(address, ec);
        if (ec) {
            AW_ERROR("[LISTEN] Invalid bind address '" << address << "': " << ec.message());
            return Error::InvalidUrl;
        }
        const tcp::endpoint endpoint{addr, wanted};
        acceptor.open(endpoint.protocol(), ec);
        if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(endpoint, ec);
        if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            AW_ERROR("[LISTEN] Cannot listen on " << address << ":" << wanted << ": " << ec.message());
            bb::error_code ignored;
            acceptor.close(ignored);
            return Error::ConnectionFailed;
        }
        port = acceptor.local_endpoint(ec).port();
        listening = true;
        AW_INFO("[LISTEN] Listening on " << address << ":" << port);
        do_accept();
        return Error::None;
    }

    void stop() {
        if (!listening) {
            return;
        }
        listening = false;
        bb::error_code ec;
        acceptor.close(ec);
        if (ec) {
            AW_WARN("[LISTEN] Acceptor close: " << ec.message());
        }
        AW_INFO("[LISTEN] Stopped listening on port " << port);
    }

    void do_accept() {
        acceptor.async_accept(
            [self = shared_from_this()](const bb::error_code& ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(const bb::error_code& ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !listening) {
            return;
        }
        if (ec) {
            AW_WARN("[LISTEN] Accept failed: " << ec.message());
        }
        else {
            read_request(std::move(socket));
        }
        do_accept();
    }

    void read_request(tcp::socket socket) {
        auto pending = std::make_shared<PendingRead>(std::move(socket));
        pending->remote = [&] {
            bb::error_code ec;
            const auto ep = pending->stream.socket().remote_endpoint(ec);
            return ec ? std::string{} : ep.address().to_string() + ":" + std::to_string(ep.port());
        }();
        pending->stream.expires_after(REQUEST_TIMEOUT);
        http::async_read(pending->stream, pending->buffer, pending->request,
            [self = shared_from_this(), pending](const bb::error_code& ec, std::size_t) {
                self->on_request(ec, pending);
            });
    }

    void on_request(const bb::error_code& ec, const std::shared_ptr<PendingRead>& pending) {
        if (ec) {
            AW_DEBUG("[LISTEN] Upgrade request from " << pending->remote << " not read: " << ec.message());
            return;
        }
        pending->stream.expires_never();
        auto upgrade = std::make_unique<Upgrade>(pending->stream.release_socket());
        upgrade->summary = summarize(pending->request, pending->remote);
        upgrade->request = std::move(pending->request);
        AW_DEBUG("[LISTEN] Upgrade request " << upgrade->summary.target << " from " << upgrade->summary.remote_address);
        if (!upgrades.push(std::move(upgrade))) {
            AW_WARN("[LISTEN] Too many pending upgrades, dropping request from " << pending->remote);
        }
    }

    void reject(std::unique_ptr<Upgrade> upgrade, unsigned status, std::string_view realm) {
        auto pending = std::make_shared<PendingReject>(std::move(upgrade->socket));
        auto& res = pending->response;
        res.version(upgrade->request.version());
        res.result(status);
        res.set(http::field::server, "ariwire");
        res.set(http::field::content_type, "text/plain");
        res.set(http::field::connection, "close");
        if (status == 401) {
            res.set(http::field::www_authenticate, "Basic realm=\"" + std::string(realm) + "\"");
        }
        res.body() = std::string(http::obsolete_reason(res.result())) + "\n";
        res.keep_alive(false);
        res.prepare_payload();
        pending->stream.expires_after(REQUEST_TIMEOUT);
        http::async_write(pending->stream, pending->response,
            [pending](const bb::error_code& ec, std::size_t) {
                if (ec) {
                    AW_DEBUG("[LISTEN] Reject response not written: " << ec.message());
                }
                bb::error_code ignored;
                pending->stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                pending->stream.close();
            });
    }

    void pump() {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.poll();
    }
};


// -----------------------------------------------------------------------------
// Facade
// -----------------------------------------------------------------------------

Listener::Listener(context_type& ioc)
    : impl_(std::make_shared<Impl>(ioc))
{}

Listener::~Listener() {
    impl_->stop();
}

Error Listener::listen(const std::string& address, std::uint16_t port) noexcept {
    if (impl_->listening) {
        return Error::InvalidState;
    }
    try {
        return impl_->listen(address, port);
    }
    catch (const std::exception& e) {
        AW_ERROR("[LISTEN] listen() failed: " << e.what());
        return Error::TransportFailure;
    }
}

void Listener::stop() noexcept {
    impl_->stop();
}

bool Listener::is_listening() const noexcept {
    return impl_->listening;
}

std::uint16_t Listener::local_port() const noexcept {
    return impl_->port;
}

void Listener::poll() noexcept {
    try {
        impl_->pump();
    }
    catch (const std::exception& e) {
        AW_ERROR("[LISTEN] I/O handler failed: " << e.what());
    }
}

std::unique_ptr<Upgrade> Listener::pop_upgrade() noexcept {
    std::unique_ptr<Upgrade> out;
    (void)impl_->upgrades.pop(out);
    return out;
}

void Listener::reject(std::unique_ptr<Upgrade> upgrade, unsigned status, std::string_view realm) noexcept {
    if (!upgrade) {
        return;
    }
    try {
        impl_->reject(std::move(upgrade), status, realm);
    }
    catch (const std::exception& e) {
        AW_ERROR("[LISTEN] reject() failed: " << e.what());
    }
}

} // namespace ariwire::core::transport::beast
