#pragma once

#include <thread>

#include "ariwire/core/manager.hpp"
#include "lcr/log/logger.hpp"


namespace ariwire::examples::loop {

// Manages idle spins to avoid busy-waiting.
// If no work was done, it increments idle_spins. Once idle_spins exceeds max_idle_spins, it yields and resets the counter.
// Example usage:
// int idle_spins = 0;
// while (running) {
//     bool did_work = false;
//     manager.poll();
//     // ... drain notices, frames, completions ...
//     manage_idle_spins(did_work, idle_spins);
// }
inline void manage_idle_spins(bool& did_work, int& idle_spins, int max_idle_spins = 100) {
    if (did_work) {
        idle_spins = 0;
        did_work = false;
    } else {
        if (++idle_spins > max_idle_spins) {
            std::this_thread::yield();
            idle_spins = 0;
        }
    }
}

// -----------------------------------------------------------------------------
// One log line per manager notice
// -----------------------------------------------------------------------------
inline void log_notice(const core::Notice& n) {
    using namespace core;
    switch (n.type) {
    case NoticeType::Accepted:
        AW_INFO("[APP] " << config::to_string(n.kind) << " connection " << n.id << " accepted from " << n.remote_address
                << (n.principal.empty() ? "" : " as ") << n.principal
                << (n.connection_id.empty() ? "" : " id ") << n.connection_id);
        break;
    case NoticeType::Rejected:
        AW_WARN("[APP] Upgrade from " << n.remote_address << " rejected (" << transport::handshake::to_string(n.reason) << ")");
        break;
    case NoticeType::Connected:
        AW_INFO("[APP] " << config::to_string(n.kind) << " connection " << n.id << " open");
        break;
    case NoticeType::ConnectFailed:
        AW_ERROR("[APP] " << config::to_string(n.kind) << " connection " << n.id << " failed (" << transport::to_string(n.error) << ")");
        break;
    case NoticeType::Closed:
        AW_INFO("[APP] " << config::to_string(n.kind) << " connection " << n.id << " closed ("
                << transport::to_string(n.error) << ")");
        break;
    default:
        break;
    }
}

} // namespace ariwire::examples::loop
