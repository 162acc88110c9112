#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "ariwire/core/protocol/control/completion.hpp"
#include "ariwire/core/protocol/control/event.hpp"
#include "ariwire/core/protocol/control/parser/helpers.hpp"
#include "ariwire/core/protocol/control/parser/result.hpp"


namespace ariwire::core::protocol::control::parser {

/*
================================================================================
Control Message Router
================================================================================

Classifies one inbound text message of the control protocol:

  1) {"type":"RESTResponse","request_id":"N","status_code":S,...}  → Response
  2) {"id":N,"status":S,...} or {"id":N,"error":E}                  → Response
  3) {"type":T,...}                                                 → Event
  4) anything else                                                  → InvalidSchema

Both wire dialects are accepted regardless of the dialect used for outbound
requests. A RESTResponse whose request_id is not one of ours (non numeric)
still classifies as a Response carrying INVALID_REQ_ID, so the session reports
it as unmatched instead of dispatching it as an event.

The router owns its simdjson parser (reused across messages) and performs no
logging: the session decides how failures are reported.
================================================================================
*/

struct Inbound {
    enum class Type : std::uint8_t { Response, Event };

    Type type{Type::Event};
    Response response{};
    Event event{};
};


class Router {
public:
    Router() = default;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw, Inbound& out) {
        simdjson::dom::element root;
        if (parser_.parse(raw.data(), raw.size()).get(root)) {
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            return Result::InvalidSchema;
        }

        std::string_view type;
        const bool has_type = (helper::parse_string_required(root, "type", type) == Result::Ok);

        // 1) ARI REST tunnel response
        if (has_type && type == "RESTResponse") {
            return parse_ari_response_(root, out);
        }
        // 2) Generic response
        if (helper::has_field(root, "id") &&
            (helper::has_field(root, "status") || helper::has_field(root, "error"))) {
            return parse_generic_response_(root, out);
        }
        // 3) Event
        if (has_type) {
            return parse_event_(root, type, raw, out);
        }
        return Result::InvalidSchema;
    }

private:
    simdjson::dom::parser parser_;

private:
    [[nodiscard]]
    inline Result parse_ari_response_(const simdjson::dom::element& root, Inbound& out) {
        out.type = Inbound::Type::Response;
        out.response = Response{};
        Response& r = out.response;

        std::string_view request_id;
        if (helper::parse_string_required(root, "request_id", request_id) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (!helper::parse_decimal(request_id, r.req_id)) {
            r.req_id = INVALID_REQ_ID; // not issued by this layer
        }
        std::uint64_t status = 0;
        if (helper::parse_uint64_required(root, "status_code", status) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (status > 999) {
            return Result::InvalidValue;
        }
        r.status = static_cast<unsigned>(status);
        if (helper::parse_string_optional(root, "reason_phrase", r.reason) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (helper::parse_raw_optional(root, "message_body", r.body, true) != Result::Ok) {
            return Result::InvalidSchema;
        }
        return Result::Parsed;
    }

    [[nodiscard]]
    inline Result parse_generic_response_(const simdjson::dom::element& root, Inbound& out) {
        out.type = Inbound::Type::Response;
        out.response = Response{};
        Response& r = out.response;

        if (helper::parse_uint64_required(root, "id", r.req_id) != Result::Ok) {
            return Result::InvalidSchema;
        }
        std::uint64_t status = 0;
        bool has_status = false;
        if (helper::parse_uint64_optional(root, "status", status, has_status) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (has_status) {
            if (status > 999) {
                return Result::InvalidValue;
            }
            r.status = static_cast<unsigned>(status);
        }
        if (helper::parse_string_optional(root, "reason", r.reason) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (helper::parse_raw_optional(root, "body", r.body, false) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (helper::parse_raw_optional(root, "error", r.error, true) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (!has_status && r.error.empty()) {
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }

    [[nodiscard]]
    inline Result parse_event_(const simdjson::dom::element& root, std::string_view type,
                               std::string_view raw, Inbound& out) {
        out.type = Inbound::Type::Event;
        out.event = Event{};
        Event& ev = out.event;

        ev.type.assign(type.data(), type.size());
        ev.kind = to_event_kind(type);
        ev.raw.assign(raw.data(), raw.size());
        (void)helper::parse_string_optional(root, "application", ev.application);
        (void)helper::parse_string_optional(root, "timestamp", ev.timestamp);
        (void)helper::parse_string_optional(root, "dialstatus", ev.dial_status);

        // Channel (or the dialed peer)
        simdjson::dom::element channel;
        bool present = false;
        if (helper::parse_object_optional(root, "channel", channel, present) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (!present && helper::parse_object_optional(root, "peer", channel, present) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (present) {
            (void)helper::parse_string_optional(channel, "id", ev.channel_id);
            (void)helper::parse_string_optional(channel, "name", ev.channel_name);

            simdjson::dom::element nested;
            bool has_nested = false;
            if (helper::parse_object_optional(channel, "dialplan", nested, has_nested) == Result::Ok && has_nested) {
                (void)helper::parse_string_optional(nested, "app_data", ev.app_data);
            }
            if (helper::parse_object_optional(channel, "channelvars", nested, has_nested) == Result::Ok && has_nested) {
                (void)helper::parse_string_optional(nested, "MEDIA_WEBSOCKET_CONNECTION_ID", ev.media_connection_id);
            }
        }

        // Bridge
        simdjson::dom::element bridge;
        if (helper::parse_object_optional(root, "bridge", bridge, present) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (present) {
            (void)helper::parse_string_optional(bridge, "id", ev.bridge_id);
            (void)helper::parse_string_optional(bridge, "name", ev.bridge_name);
        }
        return Result::Parsed;
    }
};

} // namespace ariwire::core::protocol::control::parser
