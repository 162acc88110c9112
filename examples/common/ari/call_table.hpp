#pragma once

/*
===============================================================================
CallTable: ARI call bookkeeping shared by the example orchestrators
===============================================================================

A call pairs the caller's channel (Stasis app_data "incoming") with the
WebSocket channel carrying its media (app_data "websocket"). Both channel
ids index the same Call until StasisEnd of either leg tears the pair down:

  bridge_and_answer():  POST bridges/<uuid>?type=mixing
                        POST bridges/<uuid>/addChannel?channel=<incoming>
                        POST bridges/<uuid>/addChannel?channel=<websocket>
                        POST channels/<incoming>/answer
  end():                DELETE the surviving leg, then the bridge

Requests are fire-and-forget: failures are logged from their completions.
===============================================================================
*/

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "ariwire/core/manager.hpp"
#include "ariwire/core/protocol/control/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace ariwire::examples::ari {

using core::protocol::control::Completion;
using core::protocol::control::Event;
using core::protocol::control::QueryParam;
using core::protocol::control::Request;

[[nodiscard]]
inline Request make_request(std::string method, std::string path, std::vector<QueryParam> query = {}) {
    Request req;
    req.method = std::move(method);
    req.path   = std::move(path);
    req.query  = std::move(query);
    return req;
}

[[nodiscard]]
inline bool contains(std::string_view haystack, std::string_view needle) noexcept {
    return haystack.find(needle) != std::string_view::npos;
}

// Extracts "id" and "name" from a Channel object returned by ARI
[[nodiscard]]
inline bool parse_channel(const std::string& body, std::string& id, std::string& name) {
    using namespace core::protocol::control::parser;
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body).get(root)) {
        return false;
    }
    std::string_view id_sv;
    std::string_view name_sv;
    if (helper::parse_string_required(root, "id", id_sv) != Result::Ok ||
        helper::parse_string_required(root, "name", name_sv) != Result::Ok) {
        return false;
    }
    id.assign(id_sv);
    name.assign(name_sv);
    return true;
}

struct Call {
    std::string incoming_channel;
    std::string incoming_name;
    std::string ws_channel;
    std::string ws_name;
    std::string bridge_id;
};

class CallTable {
public:
    explicit CallTable(core::ControlSession& ari)
        : ari_(ari)
    {}

    CallTable(const CallTable&) = delete;
    CallTable& operator=(const CallTable&) = delete;

    // Registers the caller's leg from its StasisStart
    inline std::shared_ptr<Call> add_incoming(const Event& e) {
        auto call = std::make_shared<Call>();
        call->incoming_channel = e.channel_id;
        call->incoming_name    = e.channel_name;
        by_incoming_[e.channel_id] = call;
        return call;
    }

    inline void link_websocket(const std::shared_ptr<Call>& call, std::string ws_channel, std::string ws_name = {}) {
        call->ws_channel = std::move(ws_channel);
        call->ws_name    = std::move(ws_name);
        by_websocket_[call->ws_channel] = call;
    }

    [[nodiscard]]
    inline std::shared_ptr<Call> by_websocket(const std::string& channel_id) const {
        auto it = by_websocket_.find(channel_id);
        return (it == by_websocket_.end()) ? nullptr : it->second;
    }

    [[nodiscard]]
    inline std::shared_ptr<Call> by_incoming(const std::string& channel_id) const {
        auto it = by_incoming_.find(channel_id);
        return (it == by_incoming_.end()) ? nullptr : it->second;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return by_incoming_.size(); }

    // Issues a request whose failure is only logged
    inline void send(Request req) {
        std::string what = req.method + " " + req.path;
        (void)ari_.request(std::move(req), [what = std::move(what)](const Completion& c) {
            if (!c.ok()) {
                AW_WARN("[CALL] " << what << " failed (" << core::protocol::control::to_string(c.error) << ")");
            }
            else if (!c.response.success()) {
                AW_WARN("[CALL] " << what << " answered " << c.response.status << " " << c.response.reason);
            }
        });
    }

    inline void bridge_and_answer(Call& call) {
        call.bridge_id = boost::uuids::to_string(uuid_gen_());
        AW_INFO("[CALL] Creating bridge " << call.bridge_id);
        send(make_request("POST", "bridges/" + call.bridge_id, {{"type", "mixing"}}));
        send(make_request("POST", "bridges/" + call.bridge_id + "/addChannel", {{"channel", call.incoming_channel}}));
        send(make_request("POST", "bridges/" + call.bridge_id + "/addChannel", {{"channel", call.ws_channel}}));
        AW_INFO("[CALL] Answering " << call.incoming_name);
        send(make_request("POST", "channels/" + call.incoming_channel + "/answer"));
    }

    // StasisEnd of either leg: hang up the other one and drop the bridge
    inline void end(const Event& e) {
        std::shared_ptr<Call> call;
        if (contains(e.app_data, "incoming")) {
            call = by_incoming(e.channel_id);
            if (call) {
                if (!call->ws_channel.empty()) {
                    AW_INFO("[CALL] Hanging up " << (call->ws_name.empty() ? call->ws_channel : call->ws_name));
                    send(make_request("DELETE", "channels/" + call->ws_channel));
                }
                by_incoming_.erase(call->incoming_channel);
                call->incoming_channel.clear();
            }
        }
        if (contains(e.app_data, "websocket")) {
            call = by_websocket(e.channel_id);
            if (call) {
                if (!call->incoming_channel.empty()) {
                    AW_INFO("[CALL] Hanging up " << call->incoming_name);
                    send(make_request("DELETE", "channels/" + call->incoming_channel));
                }
                by_websocket_.erase(call->ws_channel);
                call->ws_channel.clear();
            }
        }
        if (call && !call->bridge_id.empty()) {
            send(make_request("DELETE", "bridges/" + call->bridge_id));
            call->bridge_id.clear();
        }
    }

    [[nodiscard]] inline core::ControlSession& session() noexcept { return ari_; }

private:
    core::ControlSession& ari_;
    std::map<std::string, std::shared_ptr<Call>> by_incoming_;
    std::map<std::string, std::shared_ptr<Call>> by_websocket_;
    boost::uuids::random_generator uuid_gen_;
};

} // namespace ariwire::examples::ari
