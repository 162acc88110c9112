/*
===============================================================================
ariwire_ws_client - ARI and media websockets in the client role
===============================================================================

Connects to Asterisk's ARI websocket and registers a Stasis app. For every
call entering the app with app_data "incoming":

  StasisStart (incoming)  -> POST channels/create  (WebSocket/INCOMING/c(ulaw))
                          -> POST channels/<ws>/dial
  Dial ""  (WebSocket/)   -> open the media websocket /media/<connection id>
  Dial ANSWER             -> bridge both legs, answer the caller
  StasisEnd               -> hang up the other leg, destroy the bridge

The media connection plays echo-announce.ulaw, echoes the caller and hangs
up after zombies.ulaw.
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "ariwire/core/manager.hpp"

#include "common/ari/call_table.hpp"
#include "common/cli/client_params.hpp"
#include "common/loop/helpers.hpp"
#include "common/media/echo_prompts.hpp"

namespace cli = ariwire::examples::cli;
using namespace ariwire;
using namespace ariwire::core;
using examples::ari::CallTable;
using examples::ari::make_request;
using examples::ari::contains;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);

    const auto params = cli::client::configure(argc, argv, "ariwire - ARI websocket client example\n"
        "Creates, dials and bridges a WebSocket channel for every incoming call.\n"
    );
    params.dump("=== ariwire_ws_client Parameters ===", std::cout);

    Manager manager;

    // -------------------------------------------------------------------------
    // ARI control connection
    // -------------------------------------------------------------------------
    transport::Handshake ari_hs;
    ari_hs.credentials = transport::Credentials{params.ari_user, params.ari_password};
    ari_hs.mode        = transport::CredentialMode::ApiKeyQuery;

    const std::string base = "ws://" + params.ari_host + ":" + std::to_string(params.ari_port);
    const conn_id_t ari_id = manager.dial_control(base + "/ari/events?subscribeAll=false&app=" + params.stasis_app, ari_hs);
    if (ari_id == INVALID_CONN_ID) {
        return EXIT_FAILURE;
    }
    ControlSession& ari = *manager.control(ari_id);
    CallTable calls(ari);

    // Media connections opened for dialed WebSocket channels
    std::map<conn_id_t, examples::media::EchoWithPrompts> media;

    ari.on_event(protocol::control::EventKind::StasisStart, [&](const protocol::control::Event& e) {
        if (!contains(e.app_data, "incoming")) {
            return;
        }
        auto call = calls.add_incoming(e);
        AW_INFO("[APP] " << e.channel_name << " entered " << e.application << ", creating websocket channel");
        (void)ari.request(make_request("POST", "channels/create", {
                              {"endpoint", "WebSocket/INCOMING/c(ulaw)"},
                              {"app", params.stasis_app},
                              {"appArgs", "websocket"},
                              {"originator", call->incoming_channel}}),
            [&calls, call](const protocol::control::Completion& c) {
                std::string id;
                std::string name;
                if (!c.ok() || !c.response.success() || !examples::ari::parse_channel(c.response.body, id, name)) {
                    AW_ERROR("[APP] channels/create failed for " << call->incoming_name << " ("
                             << protocol::control::to_string(c.error) << ", status " << c.response.status << ")");
                    return;
                }
                calls.link_websocket(call, id, name);
                AW_INFO("[APP] Dialing " << name);
                calls.send(make_request("POST", "channels/" + id + "/dial", {
                               {"caller", call->incoming_channel},
                               {"timeout", "5"}}));
            });
    });

    ari.on_event(protocol::control::EventKind::Dial, [&](const protocol::control::Event& e) {
        if (!contains(e.channel_name, "WebSocket/")) {
            return;
        }
        AW_INFO("[APP] Dial: " << e.channel_name << " status '" << e.dial_status << "'");
        if (e.dial_status.empty() && !e.media_connection_id.empty()) {
            transport::Handshake media_hs;
            media_hs.subprotocol = "media";
            const conn_id_t mid = manager.dial_media(base + "/media/" + e.media_connection_id, media_hs);
            if (mid != INVALID_CONN_ID) {
                media.emplace(mid, examples::media::EchoWithPrompts("echo-announce.ulaw", "zombies.ulaw",
                                                                    std::chrono::seconds(10)));
            }
        }
        else if (e.dial_status == "ANSWER") {
            if (auto call = calls.by_websocket(e.channel_id)) {
                calls.bridge_and_answer(*call);
            }
        }
    });

    ari.on_event(protocol::control::EventKind::StasisEnd, [&](const protocol::control::Event& e) {
        calls.end(e);
    });

    // -------------------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C or the ARI connection ends)
    // -------------------------------------------------------------------------
    bool ari_done = false;
    bool did_work = false;
    int idle_spins = 0;
    while (running.load() && !ari_done) {
        manager.poll();

        manager.drain_notices([&](const Notice& n) {
            did_work = true;
            examples::loop::log_notice(n);
            if (n.id == ari_id && (n.type == NoticeType::Closed || n.type == NoticeType::ConnectFailed)) {
                ari_done = true;
            }
            if (n.kind == config::SessionKind::Media &&
                (n.type == NoticeType::Closed || n.type == NoticeType::ConnectFailed)) {
                media.erase(n.id);
            }
        });

        if (!ari_done) {
            ari.drain_errors([&](const protocol::control::ErrorReport& r) {
                did_work = true;
                AW_WARN("[APP] ARI " << protocol::control::to_string(r.error) << ": " << r.detail);
            });
        }

        for (auto& [id, call_media] : media) {
            if (MediaSession* session = manager.media(id)) {
                did_work |= call_media.step(*session);
            }
        }

        examples::loop::manage_idle_spins(did_work, idle_spins);
    }

    // -------------------------------------------------------------------------
    // Shutdown: close everything, let the close handshakes complete
    // -------------------------------------------------------------------------
    for (auto& [id, call_media] : media) {
        manager.close(id);
    }
    manager.close(ari_id);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (manager.size() > 0 && std::chrono::steady_clock::now() < deadline) {
        manager.poll();
        manager.drain_notices(examples::loop::log_notice);
    }

    std::cout << "=== Done ===\n";
    return 0;
}
