#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ariwire/core/protocol/control/completion.hpp"
#include "ariwire/core/protocol/control/req_id.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace ariwire::core::protocol::control {

using clock = std::chrono::steady_clock;

// Invoked exactly once per issued request
using CompletionHandler = std::function<void(const Completion&)>;

struct PendingRequest {
    req_id_t id{INVALID_REQ_ID};
    std::string payload;                        // serialized request (for diagnostics)
    clock::time_point created{};
    lcr::optional<clock::time_point> deadline{};
    CompletionHandler handler{};                // empty: completion goes to the session ring
};

/*
===============================================================================
PendingRequests
===============================================================================

Purpose
-------
Tracks requests awaiting a correlated response:

  req_id -> PendingRequest

Core Invariants
---------------
• At most one live entry per req_id (add() refuses a live id).
• An entry leaves the table exactly once: take(), expire() or take_all().
• Not thread-safe (event-loop only).

Design
------
• Policy-neutral: the table never completes anything itself. Callers take
  entries out and resolve them, so a handler that issues new requests never
  observes the table mid-mutation.
• Expired and drained entries are returned in req_id order (issue order).

===============================================================================
*/

class PendingRequests {
public:
    PendingRequests() = default;

    // ------------------------------------------------------------
    // Add a new pending request. Returns false if the id is live.
    // ------------------------------------------------------------
    [[nodiscard]]
    inline bool add(PendingRequest&& req) {
        const req_id_t id = req.id;
        auto [it, inserted] = requests_.try_emplace(id, std::move(req));
        if (!inserted) {
            AW_TRACE("[PENDING] Refusing duplicate req_id=" << id);
            return false;
        }
        return true;
    }

    // ------------------------------------------------------------
    // Remove a specific request. Returns true if removed.
    // ------------------------------------------------------------
    [[nodiscard]]
    inline bool take(req_id_t id, PendingRequest& out) {
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return false;
        }
        out = std::move(it->second);
        requests_.erase(it);
        return true;
    }

    // ------------------------------------------------------------
    // Remove every request whose deadline is <= now
    // ------------------------------------------------------------
    [[nodiscard]]
    inline std::vector<PendingRequest> expire(clock::time_point now) {
        std::vector<PendingRequest> out;
        for (auto it = requests_.begin(); it != requests_.end(); ) {
            const auto& deadline = it->second.deadline;
            if (deadline.has() && deadline.value() <= now) {
                out.push_back(std::move(it->second));
                it = requests_.erase(it);
            }
            else {
                ++it;
            }
        }
        sort_(out);
        return out;
    }

    // ------------------------------------------------------------
    // Remove everything (connection lost)
    // ------------------------------------------------------------
    [[nodiscard]]
    inline std::vector<PendingRequest> take_all() {
        std::vector<PendingRequest> out;
        out.reserve(requests_.size());
        for (auto& [id, req] : requests_) {
            out.push_back(std::move(req));
        }
        requests_.clear();
        sort_(out);
        return out;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]]
    inline bool contains(req_id_t id) const noexcept {
        return requests_.find(id) != requests_.end();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return requests_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return requests_.empty();
    }

    // Earliest deadline among pending requests (empty if none has one)
    [[nodiscard]]
    inline lcr::optional<clock::time_point> next_deadline() const {
        lcr::optional<clock::time_point> out;
        for (const auto& [id, req] : requests_) {
            if (req.deadline.has() && (!out.has() || req.deadline.value() < out.value())) {
                out = req.deadline.value();
            }
        }
        return out;
    }

private:
    std::unordered_map<req_id_t, PendingRequest> requests_;

    static inline void sort_(std::vector<PendingRequest>& v) {
        std::sort(v.begin(), v.end(), [](const PendingRequest& a, const PendingRequest& b) {
            return a.id < b.id;
        });
    }
};

} // namespace ariwire::core::protocol::control
