/*
===============================================================================
ariwire_ws_server - ARI and media websockets in the server role
===============================================================================

Asterisk connects to us (ARI outbound websocket and websocket_client.conf
media connections). For every call entering the app with app_data
"incoming":

  StasisStart (incoming)   -> POST channels/externalMedia (transport websocket)
  StasisStart (websocket)  -> remember the channel name
  Dial ANSWER (WebSocket/) -> bridge both legs, answer the caller
  StasisEnd                -> hang up the other leg, destroy the bridge

Every accepted media connection plays the announcement, echoes the caller
and hangs up after the goodbye prompt.
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

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "ariwire/core/manager.hpp"

#include "common/ari/call_table.hpp"
#include "common/cli/server_params.hpp"
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
// ARI connection: call flow bound to one accepted control session
// -----------------------------------------------------------------------------
static void bind_call_flow(ControlSession& ari, CallTable& calls, const cli::server::Params& params) {
    auto uuid_gen = std::make_shared<boost::uuids::random_generator>();

    ari.on_event(protocol::control::EventKind::StasisStart, [&calls, &params, uuid_gen](const protocol::control::Event& e) {
        if (contains(e.app_data, "incoming")) {
            auto call = calls.add_incoming(e);
            calls.link_websocket(call, boost::uuids::to_string((*uuid_gen)()));
            AW_INFO("[APP] " << e.channel_name << " entered " << e.application << ", creating external media channel");
            calls.send(make_request("POST", "channels/externalMedia", {
                           {"channelId", call->ws_channel},
                           {"app", e.application},
                           {"data", "websocket"},
                           {"external_host", params.media_connection},
                           {"transport", "websocket"},
                           {"encapsulation", "none"},
                           {"format", "ulaw"}}));
        }
        if (contains(e.app_data, "websocket")) {
            if (auto call = calls.by_websocket(e.channel_id)) {
                call->ws_name = e.channel_name;
            }
        }
    });

    ari.on_event(protocol::control::EventKind::Dial, [&calls](const protocol::control::Event& e) {
        if (!contains(e.channel_name, "WebSocket/")) {
            return;
        }
        AW_INFO("[APP] Dial: " << e.channel_name << " status '" << e.dial_status << "'");
        if (e.dial_status == "ANSWER") {
            if (auto call = calls.by_websocket(e.channel_id)) {
                calls.bridge_and_answer(*call);
            }
        }
    });

    ari.on_event(protocol::control::EventKind::StasisEnd, [&calls](const protocol::control::Event& e) {
        calls.end(e);
    });
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);

    const auto params = cli::server::configure(argc, argv, "ariwire - ARI websocket server example\n"
        "Accepts ARI and media websockets from Asterisk and bridges an external media channel into every incoming call.\n"
    );
    params.dump("=== ariwire_ws_server Parameters ===", std::cout);

    Manager manager;

    // -------------------------------------------------------------------------
    // Listeners
    // -------------------------------------------------------------------------
    config::Listener ari_cfg;
    ari_cfg.address     = params.ari_bind_address;
    ari_cfg.port        = params.ari_port;
    ari_cfg.subprotocol = params.ari_protocol;
    ari_cfg.kind        = config::SessionKind::Control;
    if (params.ari_auth()) {
        ari_cfg.credentials = transport::Credentials{params.ari_user, params.ari_password};
    }

    config::Listener media_cfg;
    media_cfg.address     = params.media_bind_address;
    media_cfg.port        = params.media_port;
    media_cfg.subprotocol = params.media_protocol;
    media_cfg.kind        = config::SessionKind::Media;
    if (params.media_auth()) {
        media_cfg.credentials = transport::Credentials{params.media_user, params.media_password};
    }

    if (manager.listen(ari_cfg) == INVALID_LISTENER_ID || manager.listen(media_cfg) == INVALID_LISTENER_ID) {
        return EXIT_FAILURE;
    }

    // One call table per ARI connection, one prompt player per media connection
    std::map<conn_id_t, std::unique_ptr<CallTable>> ari_connections;
    std::map<conn_id_t, examples::media::EchoWithPrompts> media;

    // -------------------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C)
    // -------------------------------------------------------------------------
    bool did_work = false;
    int idle_spins = 0;
    while (running.load()) {
        manager.poll();

        manager.drain_notices([&](const Notice& n) {
            did_work = true;
            examples::loop::log_notice(n);
            const bool ended = (n.type == NoticeType::Closed || n.type == NoticeType::ConnectFailed);

            if (n.kind == config::SessionKind::Control) {
                if (n.type == NoticeType::Accepted) {
                    ControlSession& ari = *manager.control(n.id);
                    auto calls = std::make_unique<CallTable>(ari);
                    bind_call_flow(ari, *calls, params);
                    ari_connections.emplace(n.id, std::move(calls));
                }
                else if (ended) {
                    ari_connections.erase(n.id);
                }
            }
            else {
                if (n.type == NoticeType::Accepted) {
                    media.emplace(n.id, examples::media::EchoWithPrompts(params.announce_file, params.goodbye_file,
                                                                         std::chrono::seconds(params.echo_seconds)));
                }
                else if (ended) {
                    media.erase(n.id);
                }
            }
        });

        for (auto& [id, calls] : ari_connections) {
            calls->session().drain_errors([&](const protocol::control::ErrorReport& r) {
                did_work = true;
                AW_WARN("[APP] ARI connection " << id << " " << protocol::control::to_string(r.error) << ": " << r.detail);
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
    // Shutdown
    // -------------------------------------------------------------------------
    for (auto& [id, calls] : ari_connections) {
        manager.close(id);
    }
    for (auto& [id, call_media] : media) {
        manager.close(id);
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (manager.size() > 0 && std::chrono::steady_clock::now() < deadline) {
        manager.poll();
        manager.drain_notices(examples::loop::log_notice);
    }

    std::cout << "=== Done ===\n";
    return 0;
}
