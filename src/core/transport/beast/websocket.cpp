#include "ariwire/core/transport/beast/websocket.hpp"

#include <chrono>
#include <deque>
#include <optional>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

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

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);

std::string endpoint_string(const tcp::socket& s) {
    bb::error_code ec;
    const auto ep = s.remote_endpoint(ec);
    if (ec) {
        return {};
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// Maps an error observed on an established stream
Error classify_stream_error(const bb::error_code& ec) noexcept {
    if (ec == bws::error::closed) {
        return Error::RemoteClosed;
    }
    if (ec == net::error::operation_aborted) {
        return Error::Cancelled;
    }
    if (ec == net::error::connection_reset || ec == net::error::eof ||
        ec == net::error::broken_pipe || ec == bb::error::timeout) {
        return (ec == bb::error::timeout) ? Error::Timeout : Error::ConnectionReset;
    }
    if (ec == bws::error::message_too_big || ec == bws::condition::protocol_violation) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

} // namespace


struct WebSocket::Impl : std::enable_shared_from_this<WebSocket::Impl> {

    enum class Phase { Idle, Connecting, Open, Closing, Closed };

    explicit Impl(net::io_context& ctx)
        : ioc(ctx)
        , resolver(ctx)
    {}

    net::io_context& ioc;
    tcp::resolver resolver;
    std::optional<bws::stream<bb::tcp_stream>> stream;

    bb::flat_buffer rx_buffer;
    lcr::local::ring_buffer<websocket::Message, config::message_ring> rx;
    lcr::local::ring_buffer<websocket::Event, config::transport_event_ring> events;

    struct Outbound {
        std::string data;
        websocket::MessageKind kind;
    };
    std::deque<Outbound> tx;

    Phase phase{Phase::Idle};
    bool writing{false};
    bool close_after_write{false};
    bool backpressured{false};
    bool read_paused{false};

    std::string host;
    std::string target;
    std::string remote;
    std::string negotiated;
    Handshake client_handshake;

    http::response<http::string_body> upgrade_response;
    upgrade_request_type upgrade_request;

    // -------------------------------------------------------------------------

    void push_event(websocket::Event ev) {
        if (!events.push(ev)) [[unlikely]] {
            AW_FATAL("[WS] Event ring full, transport event lost");
        }
    }

    // Terminal path, Close is emitted exactly once
    void finish(Error err) {
        if (phase == Phase::Closed) {
            return;
        }
        if (err != Error::None && err != Error::Cancelled) {
            push_event(websocket::Event::make_error(err));
        }
        phase = Phase::Closed;
        tx.clear();
        writing = false;
        if (stream) {
            bb::error_code ec;
            bb::get_lowest_layer(*stream).socket().close(ec);
            if (ec) {
                AW_TRACE("[WS] Socket close: " << ec.message());
            }
        }
        push_event(websocket::Event::make_close());
        AW_DEBUG("[WS] Transport closed (" << to_string(err) << ")");
    }

    // -------------------------------------------------------------------------
    // Client role
    // -------------------------------------------------------------------------

    void start_connect(const std::string& port) {
        phase = Phase::Connecting;
        stream.emplace(ioc);
        resolver.async_resolve(host, port,
            [self = shared_from_this()](const bb::error_code& ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            });
    }

    void on_resolve(const bb::error_code& ec, tcp::resolver::results_type results) {
        if (phase != Phase::Connecting) {
            return finish(Error::Cancelled);
        }
        if (ec) {
            AW_WARN("[WS] Resolve failed for " << host << ": " << ec.message());
            return finish(Error::ConnectionFailed);
        }
        bb::get_lowest_layer(*stream).expires_after(CONNECT_TIMEOUT);
        bb::get_lowest_layer(*stream).async_connect(results,
            [self = shared_from_this()](const bb::error_code& ec, const tcp::endpoint& ep) {
                self->on_connect(ec, ep);
            });
    }

    void on_connect(const bb::error_code& ec, const tcp::endpoint& ep) {
        if (phase != Phase::Connecting) {
            return finish(Error::Cancelled);
        }
        if (ec) {
            AW_WARN("[WS] Connect to " << host << " failed: " << ec.message());
            return finish(ec == bb::error::timeout ? Error::Timeout : Error::ConnectionFailed);
        }
        remote = ep.address().to_string() + ":" + std::to_string(ep.port());
        bb::get_lowest_layer(*stream).expires_never();
        stream->set_option(bws::stream_base::timeout::suggested(bb::role_type::client));
        stream->read_message_max(config::max_message_size);

        const Handshake hs = client_handshake;
        stream->set_option(bws::stream_base::decorator(
            [hs](bws::request_type& req) {
                req.set(http::field::user_agent, "ariwire");
                if (!hs.subprotocol.empty()) {
                    req.set(http::field::sec_websocket_protocol, hs.subprotocol);
                }
                if (hs.credentials.has() && hs.mode == CredentialMode::BasicAuth) {
                    req.set(http::field::authorization, handshake::basic_auth_header(hs.credentials.value()));
                }
                if (!hs.connection_id.empty()) {
                    req.set(bb::string_view(handshake::CONNECTION_ID_HEADER.data(), handshake::CONNECTION_ID_HEADER.size()), hs.connection_id);
                }
            }));

        const std::string host_header = host + ":" + std::to_string(ep.port());
        stream->async_handshake(upgrade_response, host_header, target,
            [self = shared_from_this()](const bb::error_code& ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(const bb::error_code& ec) {
        if (phase != Phase::Connecting) {
            return finish(Error::Cancelled);
        }
        if (ec) {
            const unsigned status = upgrade_response.result_int();
            AW_WARN("[WS] Upgrade to " << host << target << " failed: " << ec.message() << " (HTTP " << status << ")");
            if (ec == bws::error::upgrade_declined && (status == 401 || status == 403 || status == 400)) {
                return finish(Error::HandshakeRejected);
            }
            return finish(Error::HandshakeFailed);
        }
        negotiated = std::string(upgrade_response[http::field::sec_websocket_protocol]);
        on_open();
    }

    // -------------------------------------------------------------------------
    // Server role
    // -------------------------------------------------------------------------

    void start_accept(tcp::socket socket, upgrade_request_type req, std::string subprotocol) {
        phase = Phase::Connecting;
        remote = endpoint_string(socket);
        negotiated = std::move(subprotocol);
        upgrade_request = std::move(req);
        stream.emplace(std::move(socket));
        stream->set_option(bws::stream_base::timeout::suggested(bb::role_type::server));
        stream->read_message_max(config::max_message_size);
        const std::string sp = negotiated;
        stream->set_option(bws::stream_base::decorator(
            [sp](bws::response_type& res) {
                res.set(http::field::server, "ariwire");
                if (!sp.empty()) {
                    res.set(http::field::sec_websocket_protocol, sp);
                }
            }));
        stream->async_accept(upgrade_request,
            [self = shared_from_this()](const bb::error_code& ec) {
                if (self->phase != Phase::Connecting) {
                    return self->finish(Error::Cancelled);
                }
                if (ec) {
                    AW_WARN("[WS] Accept from " << self->remote << " failed: " << ec.message());
                    return self->finish(Error::HandshakeFailed);
                }
                self->on_open();
            });
    }

    // -------------------------------------------------------------------------
    // Open stream
    // -------------------------------------------------------------------------

    void on_open() {
        phase = Phase::Open;
        push_event(websocket::Event::make_opened());
        AW_DEBUG("[WS] Open: " << remote << " (subprotocol '" << negotiated << "')");
        do_read();
        if (!tx.empty() && !writing) {
            do_write();
        }
    }

    void do_read() {
        stream->async_read(rx_buffer,
            [self = shared_from_this()](const bb::error_code& ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }

    void on_read(const bb::error_code& ec, std::size_t) {
        if (ec) {
            if (phase == Phase::Closing) {
                return finish(Error::None);
            }
            const Error err = classify_stream_error(ec);
            if (err != Error::Cancelled) {
                AW_DEBUG("[WS] Read ended: " << ec.message());
            }
            return finish(err);
        }
        if (phase == Phase::Closed) {
            return;
        }
        websocket::Message msg;
        msg.kind = stream->got_text() ? websocket::MessageKind::Text : websocket::MessageKind::Binary;
        msg.data = bb::buffers_to_string(rx_buffer.data());
        rx_buffer.consume(rx_buffer.size());
        if (!rx.push(std::move(msg))) [[unlikely]] {
            // Unreachable: reads are paused while the ring is full
            AW_ERROR("[WS] Inbound message ring full (" << rx.capacity() << "), closing transport");
            return finish(Error::Backpressure);
        }
        if (rx.full()) {
            // No read in flight until the consumer frees a slot; TCP pushes back on the peer
            AW_DEBUG("[WS] Inbound message ring full (" << rx.capacity() << "), pausing reads");
            read_paused = true;
            return;
        }
        do_read();
    }

    void release() {
        rx.drop_front();
        if (read_paused && phase == Phase::Open) {
            read_paused = false;
            AW_TRACE("[WS] Inbound message ring drained, resuming reads");
            do_read();
        }
    }

    Error send(std::string_view bytes, websocket::MessageKind kind) {
        if (phase != Phase::Open) {
            return Error::InvalidState;
        }
        if (tx.size() >= config::tx_queue_limit) {
            if (!backpressured) {
                backpressured = true;
                push_event(websocket::Event::make_backpressure_detected());
            }
            return Error::Backpressure;
        }
        tx.push_back(Outbound{std::string(bytes), kind});
        if (!writing) {
            do_write();
        }
        return Error::None;
    }

    void do_write() {
        writing = true;
        stream->text(tx.front().kind == websocket::MessageKind::Text);
        stream->async_write(net::buffer(tx.front().data),
            [self = shared_from_this()](const bb::error_code& ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(const bb::error_code& ec) {
        writing = false;
        if (phase == Phase::Closed) {
            return;
        }
        if (ec) {
            return finish(phase == Phase::Closing ? Error::None : classify_stream_error(ec));
        }
        tx.pop_front();
        if (backpressured && tx.size() < config::tx_queue_limit / 2) {
            backpressured = false;
            push_event(websocket::Event::make_backpressure_cleared());
        }
        if (!tx.empty()) {
            return do_write();
        }
        if (close_after_write) {
            close_after_write = false;
            do_close();
        }
    }

    void do_close() {
        stream->async_close(bws::close_code::normal,
            [self = shared_from_this()](const bb::error_code& ec) {
                if (ec && ec != net::error::operation_aborted) {
                    AW_TRACE("[WS] Close handshake: " << ec.message());
                }
                self->finish(Error::None);
            });
    }

    void close() {
        switch (phase) {
        case Phase::Idle:
            phase = Phase::Closed;
            break;

        case Phase::Connecting: {
            phase = Phase::Closing;
            resolver.cancel();
            bb::error_code ec;
            if (stream) {
                bb::get_lowest_layer(*stream).socket().close(ec);
            }
            else {
                finish(Error::None);
            }
            break;
        }

        case Phase::Open:
            phase = Phase::Closing;
            if (writing) {
                // Let queued writes complete before the CLOSE frame
                close_after_write = true;
            }
            else {
                do_close();
            }
            break;

        case Phase::Closing:
        case Phase::Closed:
            break;
        }
    }

    // Facade destroyed: abort everything without emitting further events
    void detach() {
        if (phase == Phase::Closed || phase == Phase::Idle) {
            phase = Phase::Closed;
            return;
        }
        phase = Phase::Closed;
        resolver.cancel();
        if (stream) {
            bb::error_code ec;
            bb::get_lowest_layer(*stream).socket().close(ec);
        }
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

WebSocket::WebSocket(context_type& ioc)
    : impl_(std::make_shared<Impl>(ioc))
{}

WebSocket::~WebSocket() {
    impl_->detach();
}

Error WebSocket::connect(const std::string& host, const std::string& port,
                         const std::string& target, const Handshake& handshake) noexcept {
    if (impl_->phase != Impl::Phase::Idle) {
        return Error::InvalidState;
    }
    try {
        impl_->host      = host;
        impl_->target    = target;
        impl_->client_handshake = handshake;
        impl_->start_connect(port);
    }
    catch (const std::exception& e) {
        AW_ERROR("[WS] connect() failed: " << e.what());
        impl_->phase = Impl::Phase::Closed;
        return Error::TransportFailure;
    }
    AW_DEBUG("[WS] Connecting to " << host << ":" << port << target);
    return Error::None;
}

Error WebSocket::accept(boost::asio::ip::tcp::socket socket, upgrade_request_type request,
                        std::string subprotocol) noexcept {
    if (impl_->phase != Impl::Phase::Idle) {
        return Error::InvalidState;
    }
    try {
        impl_->start_accept(std::move(socket), std::move(request), std::move(subprotocol));
    }
    catch (const std::exception& e) {
        AW_ERROR("[WS] accept() failed: " << e.what());
        impl_->phase = Impl::Phase::Closed;
        return Error::TransportFailure;
    }
    return Error::None;
}

Error WebSocket::send(std::string_view bytes, websocket::MessageKind kind) noexcept {
    try {
        return impl_->send(bytes, kind);
    }
    catch (const std::exception& e) {
        AW_ERROR("[WS] send() failed: " << e.what());
        return Error::TransportFailure;
    }
}

void WebSocket::close() noexcept {
    try {
        impl_->close();
    }
    catch (const std::exception& e) {
        AW_ERROR("[WS] close() failed: " << e.what());
        impl_->finish(Error::TransportFailure);
    }
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    if (impl_->events.empty()) {
        try {
            impl_->pump();
        }
        catch (const std::exception& e) {
            AW_ERROR("[WS] I/O handler failed: " << e.what());
            impl_->finish(Error::TransportFailure);
        }
    }
    return impl_->events.pop(out);
}

websocket::Message* WebSocket::peek_message() noexcept {
    return impl_->rx.front();
}

void WebSocket::release_message() noexcept {
    try {
        impl_->release();
    }
    catch (const std::exception& e) {
        AW_ERROR("[WS] Resuming reads failed: " << e.what());
        impl_->finish(Error::TransportFailure);
    }
}

std::string_view WebSocket::remote_address() const noexcept {
    return impl_->remote;
}

std::string_view WebSocket::subprotocol() const noexcept {
    return impl_->negotiated;
}

} // namespace ariwire::core::transport::beast
