/*
===============================================================================
 Beast loopback - Integration Tests (real sockets on 127.0.0.1)
===============================================================================

Scope:
------
1. Control listener: a dial with the right credentials is accepted and both
   ends report Connected; a wrong password is refused with HTTP 401
2. Server-role control session issuing requests to a connected peer and
   receiving its events
3. Media listener in echo mode: a burst larger than the inbound message
   ring comes back in full without closing either end, the EchoVerifier
   passes and HANGUP drains both ends to Closed
4. A stopped listener refuses dials and accepts again once restarted on the
   same port
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ariwire/core/manager.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace ariwire::core;
using transport::Credentials;
using transport::Handshake;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
static constexpr auto DEADLINE = std::chrono::seconds(5);

// Pumps the manager (and any extra work) until done() or the deadline
template<class Step, class Done>
static bool pump(Manager& m, std::vector<Notice>& notices, Step&& step, Done&& done) {
    const auto deadline = std::chrono::steady_clock::now() + DEADLINE;
    while (std::chrono::steady_clock::now() < deadline) {
        m.poll();
        m.drain_notices([&notices](const Notice& n) { notices.push_back(n); });
        step();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

template<class Done>
static bool pump(Manager& m, std::vector<Notice>& notices, Done&& done) {
    return pump(m, notices, [] {}, std::forward<Done>(done));
}

static const Notice* find_notice(const std::vector<Notice>& notices, NoticeType type, transport::Role role) {
    for (const Notice& n : notices) {
        if (n.type == type && n.role == role) {
            return &n;
        }
    }
    return nullptr;
}

static config::Listener control_listener() {
    config::Listener cfg;
    cfg.address     = "127.0.0.1";
    cfg.port        = 0;
    cfg.subprotocol = "ari";
    cfg.credentials = Credentials{"asterisk", "asterisk"};
    cfg.kind        = config::SessionKind::Control;
    return cfg;
}

static Handshake ari_handshake(std::string password) {
    Handshake hs;
    hs.subprotocol = "ari";
    hs.credentials = Credentials{"asterisk", std::move(password)};
    return hs;
}

static std::string events_url(std::uint16_t port) {
    return "ws://127.0.0.1:" + std::to_string(port) + "/ari/events?app=test";
}

static protocol::control::req_id_t request_id_of(const std::string& wire) {
    constexpr std::string_view key = R"("request_id":")";
    const auto pos = wire.find(key);
    if (pos == std::string::npos) {
        return protocol::control::INVALID_REQ_ID;
    }
    protocol::control::req_id_t id = 0;
    for (std::size_t i = pos + key.size(); i < wire.size() && wire[i] != '"'; ++i) {
        id = id * 10 + static_cast<protocol::control::req_id_t>(wire[i] - '0');
    }
    return id;
}

// -----------------------------------------------------------------------------
// 1: handshake accepted / rejected
// -----------------------------------------------------------------------------
void test_control_handshake() {
    std::cout << "[TEST] Loopback 1: control handshake\n";
    Manager m;
    std::vector<Notice> notices;

    const listener_id_t lid = m.listen(control_listener());
    TEST_CHECK(lid != INVALID_LISTENER_ID);
    const std::uint16_t port = m.local_port(lid);
    TEST_CHECK(port != 0);

    const conn_id_t client = m.dial_control(events_url(port), ari_handshake("asterisk"));
    TEST_CHECK(client != INVALID_CONN_ID);

    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::Connected, transport::Role::Client)
            && find_notice(notices, NoticeType::Connected, transport::Role::Server);
    }));

    const Notice* accepted = find_notice(notices, NoticeType::Accepted, transport::Role::Server);
    TEST_CHECK(accepted != nullptr);
    TEST_CHECK(accepted->listener == lid);
    TEST_CHECK(accepted->principal == "asterisk");
    TEST_CHECK(accepted->kind == config::SessionKind::Control);

    ControlSession* server = m.control(accepted->id);
    TEST_CHECK(server != nullptr);
    TEST_CHECK(server->identity().subprotocol == "ari");
    TEST_CHECK(m.control(client)->connection().identity().subprotocol == "ari");
    TEST_CHECK(m.media(client) == nullptr);

    // Wrong password
    notices.clear();
    const conn_id_t intruder = m.dial_control(events_url(port), ari_handshake("wrong"));
    TEST_CHECK(intruder != INVALID_CONN_ID);
    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::ConnectFailed, transport::Role::Client) != nullptr;
    }));

    const Notice* rejected = find_notice(notices, NoticeType::Rejected, transport::Role::Server);
    TEST_CHECK(rejected != nullptr);
    TEST_CHECK(rejected->id == INVALID_CONN_ID);
    TEST_CHECK(rejected->error == transport::Error::HandshakeRejected);
    TEST_CHECK(rejected->reason == transport::handshake::Reason::BadCredentials);

    const Notice* failed = find_notice(notices, NoticeType::ConnectFailed, transport::Role::Client);
    TEST_CHECK(failed->id == intruder);
    TEST_CHECK(failed->error == transport::Error::HandshakeRejected);

    // Client close reaches both ends
    notices.clear();
    m.close(client);
    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::Closed, transport::Role::Client)
            && find_notice(notices, NoticeType::Closed, transport::Role::Server);
    }));
    m.poll();
    TEST_CHECK(m.size() == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 2: server-role requests and events
// -----------------------------------------------------------------------------
void test_server_role_requests() {
    std::cout << "[TEST] Loopback 2: server-role requests\n";
    Manager m;
    std::vector<Notice> notices;

    const listener_id_t lid = m.listen(control_listener());
    TEST_CHECK(lid != INVALID_LISTENER_ID);

    // The peer plays Asterisk: raw connection answering every RESTRequest
    transport::Connection<WebSocket> peer(m.context());
    TEST_CHECK(peer.open(events_url(m.local_port(lid)), ari_handshake("asterisk")) == transport::Error::None);

    int requests_seen = 0;
    auto answer = [&] {
        peer.poll();
        transport::connection::Signal sig;
        while (peer.poll_signal(sig)) {}
        while (transport::websocket::Message* msg = peer.peek_message()) {
            const auto id = request_id_of(msg->data);
            if (id != protocol::control::INVALID_REQ_ID) {
                ++requests_seen;
                TEST_CHECK(peer.send(json::ari::response(id, 200, "OK", R"([{"id":"c1"}])")) == transport::Error::None);
            }
            peer.release_message();
        }
    };

    TEST_CHECK(pump(m, notices, answer, [&] {
        return peer.is_open() && find_notice(notices, NoticeType::Connected, transport::Role::Server);
    }));
    const Notice* connected = find_notice(notices, NoticeType::Connected, transport::Role::Server);
    ControlSession* server = m.control(connected->id);
    TEST_CHECK(server != nullptr);

    std::vector<std::string> started;
    server->on_event(protocol::control::EventKind::StasisStart,
                     [&started](const protocol::control::Event& e) { started.push_back(e.channel_id); });

    protocol::control::Request req;
    req.method = "GET";
    req.path   = "channels";
    lcr::optional<protocol::control::Completion> result;
    const auto rid = server->request(std::move(req),
                                     [&result](const protocol::control::Completion& c) { result = c; });
    TEST_CHECK(rid != protocol::control::INVALID_REQ_ID);

    TEST_CHECK(pump(m, notices, answer, [&] { return result.has(); }));
    TEST_CHECK(requests_seen == 1);
    TEST_CHECK(result.value().ok());
    TEST_CHECK(result.value().req_id == rid);
    TEST_CHECK(result.value().response.status == 200);
    TEST_CHECK(result.value().response.body == R"([{"id":"c1"}])");

    TEST_CHECK(peer.send(json::event::stasis_start("1700000000.1", "PJSIP/alice-00000001")) == transport::Error::None);
    TEST_CHECK(pump(m, notices, answer, [&] { return !started.empty(); }));
    TEST_CHECK(started.front() == "1700000000.1");

    // Peer hangs up: the pending request resolves with ConnectionClosed
    result.reset();
    protocol::control::Request late;
    late.method = "DELETE";
    late.path   = "channels/1700000000.1";
    (void)server->request(std::move(late), [&result](const protocol::control::Completion& c) { result = c; });
    peer.close();
    TEST_CHECK(pump(m, notices, [&] { peer.poll(); }, [&] { return result.has(); }));
    TEST_CHECK(result.value().error == protocol::control::Error::ConnectionClosed);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 3: media echo
// -----------------------------------------------------------------------------
void test_media_echo() {
    std::cout << "[TEST] Loopback 3: media echo\n";
    Manager m;
    std::vector<Notice> notices;

    config::Listener cfg;
    cfg.address           = "127.0.0.1";
    cfg.subprotocol       = "media";
    cfg.kind              = config::SessionKind::Media;
    cfg.media.echo        = true;
    cfg.media.drain_grace = std::chrono::milliseconds(50);
    const listener_id_t lid = m.listen(cfg);
    TEST_CHECK(lid != INVALID_LISTENER_ID);

    Handshake hs;
    hs.subprotocol   = "media";
    hs.connection_id = "media-7";
    config::Media client_cfg;
    client_cfg.drain_grace = std::chrono::milliseconds(200);
    const conn_id_t client = m.dial_media("ws://127.0.0.1:" + std::to_string(m.local_port(lid)) + "/media/media-7",
                                          hs, client_cfg);
    TEST_CHECK(client != INVALID_CONN_ID);

    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::Connected, transport::Role::Client)
            && find_notice(notices, NoticeType::Connected, transport::Role::Server);
    }));
    const Notice* accepted = find_notice(notices, NoticeType::Accepted, transport::Role::Server);
    TEST_CHECK(accepted != nullptr);
    TEST_CHECK(accepted->connection_id == "media-7");
    TEST_CHECK(accepted->kind == config::SessionKind::Media);

    MediaSession* media = m.media(client);
    TEST_CHECK(media != nullptr);
    protocol::media::EchoVerifier verifier;
    media->attach_verifier(&verifier);

    // More frames than the inbound message ring holds: the receiving end
    // pauses reads instead of dropping the connection
    constexpr std::size_t FRAMES = 1000;
    static_assert(FRAMES > config::message_ring && FRAMES < config::tx_queue_limit);
    std::string audio;
    for (std::size_t i = 0; i < FRAMES * 160; ++i) {
        audio.push_back(static_cast<char>(i % 251));
    }
    TEST_CHECK(media->send_audio(audio) == audio.size());
    TEST_CHECK(media->frames_sent() == FRAMES);

    std::size_t echoed = 0;
    TEST_CHECK(pump(m, notices, [&] {
        media->drain_frames([&echoed](const protocol::media::InboundFrame& f) { echoed += f.payload.size(); });
    }, [&] { return echoed >= audio.size(); }));

    const protocol::media::VerificationReport report = verifier.verify();
    TEST_CHECK(report.passed());

    const MediaSession* server = m.media(accepted->id);
    TEST_CHECK(server != nullptr);
    TEST_CHECK(server->frames_received() == FRAMES);
    TEST_CHECK(server->frames_sent() == FRAMES);
    TEST_CHECK(server->anomalies() == 0);
    TEST_CHECK(server->is_open());
    TEST_CHECK(find_notice(notices, NoticeType::Closed, transport::Role::Server) == nullptr);

    // HANGUP drains the server first, then the client grace elapses
    TEST_CHECK(media->finish() == protocol::media::Error::None);
    notices.clear();
    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::Closed, transport::Role::Client)
            && find_notice(notices, NoticeType::Closed, transport::Role::Server);
    }));
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 4: stop / restart listening
// -----------------------------------------------------------------------------
void test_listener_restart() {
    std::cout << "[TEST] Loopback 4: listener restart\n";
    Manager m;
    std::vector<Notice> notices;

    const listener_id_t lid = m.listen(control_listener());
    TEST_CHECK(lid != INVALID_LISTENER_ID);
    const std::uint16_t port = m.local_port(lid);

    m.stop_listening(lid);
    const conn_id_t refused = m.dial_control(events_url(port), ari_handshake("asterisk"));
    TEST_CHECK(refused != INVALID_CONN_ID);
    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::ConnectFailed, transport::Role::Client) != nullptr;
    }));
    TEST_CHECK(find_notice(notices, NoticeType::ConnectFailed, transport::Role::Client)->error
               == transport::Error::ConnectionFailed);
    TEST_CHECK(find_notice(notices, NoticeType::Accepted, transport::Role::Server) == nullptr);

    TEST_CHECK(m.restart_listening(lid) == transport::Error::None);
    TEST_CHECK(m.local_port(lid) == port);
    TEST_CHECK(m.restart_listening(listener_id_t{99}) == transport::Error::InvalidState);

    notices.clear();
    const conn_id_t client = m.dial_control(events_url(port), ari_handshake("asterisk"));
    TEST_CHECK(pump(m, notices, [&] {
        return find_notice(notices, NoticeType::Connected, transport::Role::Client)
            && find_notice(notices, NoticeType::Connected, transport::Role::Server);
    }));
    TEST_CHECK(find_notice(notices, NoticeType::Connected, transport::Role::Client)->id == client);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_control_handshake();
    test_server_role_requests();
    test_media_echo();
    test_listener_restart();

    std::cout << "\n[LOOPBACK INTEGRATION TESTS PASSED]\n";
    return 0;
}
