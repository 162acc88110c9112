#pragma once

#include <cstdint>

namespace ariwire::core::protocol::control {

// Correlation id of a request (monotonically assigned per session)
using req_id_t = std::uint64_t;

// Reserved: never assigned, marks "no request"
inline constexpr req_id_t INVALID_REQ_ID = 0;

} // namespace ariwire::core::protocol::control
