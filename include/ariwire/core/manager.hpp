/*
===============================================================================
ariwire::core::Manager
===============================================================================

Connection Manager: role selection and handshake negotiation.

Owns:
  - the io_context every transport runs on (no threads, poll-driven)
  - the listeners of the server role
  - an indexed table  conn_id -> Entry { role, kind, session }

Exactly one session (control or media) is bound to each connection. The
manager never touches protocol traffic: it creates the connection, hands
it to its session and reports edges as Notices.

Client role:
  dial_control() / dial_media() open a session toward a URL with the given
  handshake (subprotocol, credentials, connection id header).

Server role:
  listen() binds a Listener. Every upgrade request it reads is checked by
  handshake::verify() against the listener configuration:
    - accepted → the socket is upgraded (subprotocol echoed back) and
                 adopted by a fresh session of the configured kind
    - rejected → HTTP 400/401 (WWW-Authenticate: Basic realm=...) and close,
                 reported as a Rejected notice with Error::HandshakeRejected

poll():
  1) runs ready I/O handlers
  2) decides pending upgrades
  3) polls every session and reports Connected / ConnectFailed / Closed
  4) reaps sessions whose Closed notice was emitted by the previous poll()

Sessions therefore stay reachable (frames, completions and errors can be
drained) until the poll() that follows their Closed notice.
===============================================================================
*/

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/io_context.hpp>

#include "ariwire/core/config/listener.hpp"
#include "ariwire/core/config/ring_sizes.hpp"
#include "ariwire/core/protocol/control/session.hpp"
#include "ariwire/core/protocol/media/session.hpp"
#include "ariwire/core/transport/beast/listener.hpp"
#include "ariwire/core/transport/beast/websocket.hpp"
#include "ariwire/core/transport/handshake.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace ariwire::core {

using conn_id_t     = std::uint64_t;
using listener_id_t = std::uint64_t;

inline constexpr conn_id_t     INVALID_CONN_ID     = 0;
inline constexpr listener_id_t INVALID_LISTENER_ID = 0;

using WebSocket      = transport::beast::WebSocket;
using ControlSession = protocol::control::Session<WebSocket>;
using MediaSession   = protocol::media::Session<WebSocket>;

enum class NoticeType : std::uint8_t {
    Accepted,        // upgrade verified, session created (server role)
    Rejected,        // upgrade refused (server role)
    Connected,       // connection reached Open
    ConnectFailed,   // connection closed before reaching Open
    Closed           // open connection closed; reaped on the next poll()
};

[[nodiscard]]
inline constexpr std::string_view to_string(NoticeType t) noexcept {
    switch (t) {
    case NoticeType::Accepted:      return "Accepted";
    case NoticeType::Rejected:      return "Rejected";
    case NoticeType::Connected:     return "Connected";
    case NoticeType::ConnectFailed: return "ConnectFailed";
    case NoticeType::Closed:        return "Closed";
    default:                        return "Unknown";
    }
}

struct Notice {
    NoticeType type{NoticeType::Closed};
    conn_id_t id{INVALID_CONN_ID};                  // INVALID_CONN_ID for Rejected
    listener_id_t listener{INVALID_LISTENER_ID};    // server role only
    config::SessionKind kind{config::SessionKind::Control};
    transport::Role role{transport::Role::Client};
    transport::Error error{transport::Error::None};
    transport::handshake::Reason reason{transport::handshake::Reason::None};
    std::string remote_address;
    std::string principal;
    std::string connection_id;
};


class Manager {
public:
    using context_type = boost::asio::io_context;

    Manager() = default;

    ~Manager() {
        for (auto& [id, entry] : entries_) {
            close_entry_(entry);
        }
        for (auto& [id, l] : listeners_) {
            l.listener->stop();
        }
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    [[nodiscard]] inline context_type& context() noexcept { return ioc_; }

    // -------------------------------------------------------------------------
    // Client role
    // -------------------------------------------------------------------------

    // Returns INVALID_CONN_ID when the dial cannot start (bad URL)
    [[nodiscard]]
    inline conn_id_t dial_control(std::string_view url, const transport::Handshake& handshake = {},
                                  config::Control cfg = {}) {
        Entry entry = make_entry_(config::SessionKind::Control, transport::Role::Client, INVALID_LISTENER_ID);
        entry.control = std::make_unique<ControlSession>(ioc_, std::move(cfg));
        const transport::Error err = entry.control->open(url, handshake);
        return register_dial_(std::move(entry), url, err);
    }

    [[nodiscard]]
    inline conn_id_t dial_media(std::string_view url, const transport::Handshake& handshake = {},
                                config::Media cfg = {}) {
        Entry entry = make_entry_(config::SessionKind::Media, transport::Role::Client, INVALID_LISTENER_ID);
        entry.media = std::make_unique<MediaSession>(ioc_, std::move(cfg));
        const transport::Error err = entry.media->open(url, handshake);
        return register_dial_(std::move(entry), url, err);
    }

    // -------------------------------------------------------------------------
    // Server role
    // -------------------------------------------------------------------------

    // Returns INVALID_LISTENER_ID when the endpoint cannot be bound
    [[nodiscard]]
    inline listener_id_t listen(config::Listener cfg) {
        auto listener = std::make_unique<transport::beast::Listener>(ioc_);
        const transport::Error err = listener->listen(cfg.address, cfg.port);
        if (err != transport::Error::None) {
            AW_ERROR("[MGR] Cannot listen on " << cfg.address << ":" << cfg.port << " (" << transport::to_string(err) << ")");
            return INVALID_LISTENER_ID;
        }
        const listener_id_t id = next_listener_id_++;
        AW_INFO("[MGR] Listener " << id << " (" << config::to_string(cfg.kind) << ", subprotocol '" << cfg.subprotocol
                << "') on port " << listener->local_port());
        listeners_.emplace(id, ListenerEntry{std::move(cfg), std::move(listener)});
        return id;
    }

    // The listener may be restarted with restart_listening()
    inline void stop_listening(listener_id_t id) noexcept {
        auto it = listeners_.find(id);
        if (it != listeners_.end()) {
            it->second.listener->stop();
        }
    }

    [[nodiscard]]
    inline transport::Error restart_listening(listener_id_t id) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            return transport::Error::InvalidState;
        }
        auto& l = it->second;
        return l.listener->listen(l.config.address, l.config.port == 0 ? l.listener->local_port() : l.config.port);
    }

    [[nodiscard]]
    inline std::uint16_t local_port(listener_id_t id) const noexcept {
        auto it = listeners_.find(id);
        return (it == listeners_.end()) ? 0 : it->second.listener->local_port();
    }

    // -------------------------------------------------------------------------
    // Sessions
    // -------------------------------------------------------------------------

    // nullptr when the id is unknown or bound to the other kind
    [[nodiscard]]
    inline ControlSession* control(conn_id_t id) noexcept {
        auto it = entries_.find(id);
        return (it == entries_.end()) ? nullptr : it->second.control.get();
    }

    [[nodiscard]]
    inline MediaSession* media(conn_id_t id) noexcept {
        auto it = entries_.find(id);
        return (it == entries_.end()) ? nullptr : it->second.media.get();
    }

    inline void close(conn_id_t id) noexcept {
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            close_entry_(it->second);
        }
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }

    // -------------------------------------------------------------------------
    // Notices
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool pop_notice(Notice& out) noexcept {
        return notices_.pop(out);
    }

    template<class F>
    inline void drain_notices(F&& f) {
        Notice n;
        while (notices_.pop(n)) {
            std::forward<F>(f)(n);
        }
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() {
        // 4) from the previous cycle
        reap_();

        // 1) I/O
        for (auto& [id, l] : listeners_) {
            l.listener->poll();
        }

        // 2) Upgrades
        for (auto& [lid, l] : listeners_) {
            while (auto upgrade = l.listener->pop_upgrade()) {
                handle_upgrade_(lid, l, std::move(upgrade));
            }
        }

        // 3) Sessions
        for (auto& [id, entry] : entries_) {
            poll_entry_(id, entry);
        }
    }

private:
    struct Entry {
        config::SessionKind kind{config::SessionKind::Control};
        transport::Role role{transport::Role::Client};
        listener_id_t listener{INVALID_LISTENER_ID};
        std::unique_ptr<ControlSession> control;
        std::unique_ptr<MediaSession> media;
        bool connected{false};
        bool finished{false};       // Closed / ConnectFailed notice emitted
    };

    struct ListenerEntry {
        config::Listener config;
        std::unique_ptr<transport::beast::Listener> listener;
    };

    // Declared first: destroyed after every transport bound to it
    context_type ioc_;

    std::map<listener_id_t, ListenerEntry> listeners_;
    std::map<conn_id_t, Entry> entries_;
    conn_id_t next_conn_id_{1};
    listener_id_t next_listener_id_{1};

    lcr::local::ring_buffer<Notice, config::manager_notice_ring> notices_;

private:
    [[nodiscard]]
    static inline Entry make_entry_(config::SessionKind kind, transport::Role role, listener_id_t listener) {
        Entry e;
        e.kind = kind;
        e.role = role;
        e.listener = listener;
        return e;
    }

    [[nodiscard]]
    inline conn_id_t register_dial_(Entry&& entry, std::string_view url, transport::Error err) {
        if (err != transport::Error::None) {
            AW_ERROR("[MGR] Cannot dial " << url << " (" << transport::to_string(err) << ")");
            return INVALID_CONN_ID;
        }
        const conn_id_t id = next_conn_id_++;
        AW_DEBUG("[MGR] Connection " << id << ": dialing " << config::to_string(entry.kind) << " " << url);
        entries_.emplace(id, std::move(entry));
        return id;
    }

    inline void emit_(Notice&& n) {
        AW_TRACE("[MGR] Notice " << to_string(n.type) << " (conn " << n.id << ")");
        if (!notices_.push(std::move(n))) {
            AW_WARN("[MGR] Notice ring full, dropping notice (user not draining notices)");
        }
    }

    inline void handle_upgrade_(listener_id_t lid, ListenerEntry& l, std::unique_ptr<transport::beast::Upgrade> upgrade) {
        using namespace transport;

        handshake::Policy policy;
        policy.subprotocol = l.config.subprotocol;
        policy.credentials = l.config.credentials;
        policy.realm       = l.config.realm;

        const handshake::UpgradeRequest& summary = upgrade->summary;
        const handshake::Verdict verdict = handshake::verify(summary, policy);

        Notice notice;
        notice.listener       = lid;
        notice.kind           = l.config.kind;
        notice.role           = Role::Server;
        notice.remote_address = summary.remote_address;
        notice.connection_id  = summary.connection_id;

        if (!verdict.accepted()) {
            AW_WARN("[MGR] Rejecting upgrade " << summary.target << " from " << summary.remote_address
                    << " (" << handshake::to_string(verdict.reason) << ", HTTP " << verdict.http_status << ")");
            notice.type   = NoticeType::Rejected;
            notice.error  = Error::HandshakeRejected;
            notice.reason = verdict.reason;
            l.listener->reject(std::move(upgrade), verdict.http_status, l.config.realm);
            emit_(std::move(notice));
            return;
        }

        Identity identity;
        identity.remote_address = summary.remote_address;
        identity.subprotocol    = verdict.subprotocol;
        identity.principal      = verdict.principal;
        identity.connection_id  = summary.connection_id;

        auto ws = std::make_unique<WebSocket>(ioc_);
        Error err = ws->accept(std::move(upgrade->socket), std::move(upgrade->request), verdict.subprotocol);

        Entry entry = make_entry_(l.config.kind, Role::Server, lid);
        if (err == Error::None) {
            if (l.config.kind == config::SessionKind::Control) {
                entry.control = std::make_unique<ControlSession>(ioc_, l.config.control);
                err = entry.control->adopt(std::move(ws), identity);
            }
            else {
                entry.media = std::make_unique<MediaSession>(ioc_, l.config.media);
                err = entry.media->adopt(std::move(ws), identity);
            }
        }
        if (err != Error::None) {
            AW_ERROR("[MGR] Upgrade from " << summary.remote_address << " failed (" << to_string(err) << ")");
            notice.type  = NoticeType::Rejected;
            notice.error = err;
            emit_(std::move(notice));
            return;
        }

        const conn_id_t id = next_conn_id_++;
        AW_INFO("[MGR] Connection " << id << ": accepted " << config::to_string(l.config.kind) << " websocket from "
                << summary.remote_address << (verdict.principal.empty() ? "" : " as ") << verdict.principal);
        entries_.emplace(id, std::move(entry));

        notice.type      = NoticeType::Accepted;
        notice.id        = id;
        notice.principal = verdict.principal;
        emit_(std::move(notice));
    }

    inline void poll_entry_(conn_id_t id, Entry& entry) {
        if (entry.finished) {
            return;
        }
        bool open = false;
        bool closed = false;
        transport::Error last_error = transport::Error::None;
        const transport::Identity* identity = nullptr;

        if (entry.control) {
            entry.control->poll();
            open       = entry.control->is_open();
            closed     = entry.control->is_closed();
            last_error = entry.control->connection().last_error();
            identity   = &entry.control->identity();
        }
        else if (entry.media) {
            entry.media->poll();
            open       = entry.media->is_open();
            closed     = entry.media->is_closed();
            last_error = entry.media->connection().last_error();
            identity   = &entry.media->identity();
        }
        else {
            return;
        }

        Notice notice;
        notice.id       = id;
        notice.listener = entry.listener;
        notice.kind     = entry.kind;
        notice.role     = entry.role;
        notice.remote_address = identity->remote_address;
        notice.principal      = identity->principal;
        notice.connection_id  = identity->connection_id;

        if (!entry.connected && open) {
            entry.connected = true;
            notice.type = NoticeType::Connected;
            emit_(Notice{notice});
        }
        if (closed) {
            entry.finished = true;
            notice.type  = entry.connected ? NoticeType::Closed : NoticeType::ConnectFailed;
            notice.error = last_error;
            AW_DEBUG("[MGR] Connection " << id << ": " << to_string(notice.type));
            emit_(std::move(notice));
        }
    }

    inline void reap_() {
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            if (it->second.finished) {
                AW_TRACE("[MGR] Reaping connection " << it->first);
                it = entries_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    static inline void close_entry_(Entry& entry) noexcept {
        if (entry.control) {
            entry.control->close();
        }
        else if (entry.media) {
            entry.media->cancel();
        }
    }
};

} // namespace ariwire::core
