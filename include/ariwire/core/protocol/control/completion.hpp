#pragma once

#include <string>

#include "ariwire/core/protocol/control/error.hpp"
#include "ariwire/core/protocol/control/req_id.hpp"


namespace ariwire::core::protocol::control {

// Correlated answer to a Request
struct Response {
    req_id_t req_id{INVALID_REQ_ID};
    unsigned status{0};         // HTTP-style status (0 when the peer sent an error object)
    std::string reason;         // reason phrase (may be empty)
    std::string body;           // raw JSON text (may be empty)
    std::string error;          // peer error text ({"id":N,"error":...})

    [[nodiscard]]
    inline bool success() const noexcept { return status >= 200 && status < 300; }
};

// Resolution of a pending request. Exactly one per issued request.
struct Completion {
    req_id_t req_id{INVALID_REQ_ID};
    Error error{Error::None};
    Response response{};

    [[nodiscard]]
    inline bool ok() const noexcept { return error == Error::None; }
};

// Report pushed to the session error channel
struct ErrorReport {
    Error error{Error::None};
    req_id_t req_id{INVALID_REQ_ID};   // set for unmatched responses
    std::string detail;
};

} // namespace ariwire::core::protocol::control
