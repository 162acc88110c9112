#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ariwire/core/config/control.hpp"
#include "ariwire/core/protocol/control/req_id.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace ariwire::core::protocol::control {

struct QueryParam {
    std::string name;
    std::string value;
};

// Outbound REST call tunnelled over the control websocket.
// Path and body are opaque: the body is raw JSON text.
struct Request {
    std::string method;                  // GET, POST, PUT, DELETE
    std::string path;                    // e.g. "channels/create" (may carry its own ?query)
    std::vector<QueryParam> query{};
    lcr::optional<std::string> body{};
    lcr::optional<req_id_t> id{};        // assigned by the session when empty

    // Serializes the request carrying correlation id `id` in the selected dialect.
    //
    // Generic:  {"id":7,"method":"POST","path":"bridges/b1","query":[{"name":"type","value":"mixing"}],"body":{...}}
    // Asterisk: {"type":"RESTRequest","request_id":"7","method":"POST","uri":"bridges/b1",
    //            "query_strings":[{"name":"type","value":"mixing"}],"message_body":"{...}"}
    inline void write_json(std::string& out, req_id_t req_id, config::Dialect dialect) const {
        using namespace lcr::json;
        const bool ari = (dialect == config::Dialect::Asterisk);

        out += '{';
        if (ari) {
            out += "\"type\":\"RESTRequest\",";
            append_key(out, "request_id");
            out += '"';
            append(out, req_id);
            out += '"';
        }
        else {
            append_key(out, "id");
            append(out, req_id);
        }
        out += ',';
        append_key(out, "method");
        append_string(out, method);
        out += ',';
        append_key(out, ari ? "uri" : "path");
        append_string(out, path);

        if (!query.empty()) {
            out += ',';
            append_key(out, ari ? "query_strings" : "query");
            out += '[';
            for (std::size_t i = 0; i < query.size(); ++i) {
                if (i > 0) out += ',';
                out += '{';
                append_key(out, "name");
                append_string(out, query[i].name);
                out += ',';
                append_key(out, "value");
                append_string(out, query[i].value);
                out += '}';
            }
            out += ']';
        }

        if (body.has()) {
            out += ',';
            if (ari) {
                // ARI carries the body as a JSON-encoded string
                append_key(out, "message_body");
                append_string(out, body.value());
            }
            else {
                append_key(out, "body");
                out += body.value();
            }
        }
        out += '}';
    }

    // Convenience method (allocating) for tests / logging.
    [[nodiscard]]
    inline std::string to_json(req_id_t req_id, config::Dialect dialect) const {
        std::string out;
        out.reserve(64 + method.size() + path.size() + (body.has() ? body.value().size() * 2 : 0));
        write_json(out, req_id, dialect);
        return out;
    }
};

} // namespace ariwire::core::protocol::control
