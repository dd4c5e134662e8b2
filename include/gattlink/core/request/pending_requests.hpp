#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/request/outcome.hpp"
#include "gattlink/core/request/matcher.hpp"
#include "gattlink/core/request/completion.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core::request {

/*
===============================================================================
PendingRequests
===============================================================================

Purpose
-------
Table of outstanding request/response exchanges, keyed by RequestId.

Each entry is the request's subscription to its notifiable endpoint: a value
on that endpoint is offered to every entry registered on it. Removing the
entry releases the subscription.

Core Invariants
---------------
• An entry is removed exactly once (take / take_matching / take_all).
  Whoever removes it owns the only right to complete it.
• Deduplication state (last_seen) is per entry: a value equal to the
  previous value seen by THIS request is suppressed and not evaluated.
• Entries are visited in RequestId order.
• Not thread-safe (Session lock).

===============================================================================
*/

struct PendingRequest {
    RequestId id{INVALID_REQUEST};
    CharacteristicKey endpoint;
    Expectation expected;

    std::optional<Bytes> last_seen;   // dedup state
    std::size_t evaluations{0};       // values actually tested against `expected`
    std::size_t suppressed{0};        // consecutive duplicates dropped

    timer::TimerId timer{timer::INVALID_TIMER};
    std::chrono::steady_clock::time_point deadline{};

    OnceCompletion completion;
};

class PendingRequests {
public:
    PendingRequests() = default;

    [[nodiscard]]
    inline RequestId next_id() noexcept {
        return next_id_++;
    }

    inline void add(PendingRequest request) {
        const RequestId id = request.id;
        GL_TRACE("[PENDING] Adding request #" << id << " on " << request.endpoint);
        requests_.emplace(id, std::move(request));
    }

    inline bool set_timer(RequestId id, timer::TimerId timer) noexcept {
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return false;
        }
        it->second.timer = timer;
        return true;
    }

    // ------------------------------------------------------------
    // Removal
    // ------------------------------------------------------------

    [[nodiscard]]
    inline std::optional<PendingRequest> take(RequestId id) {
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return std::nullopt;
        }
        PendingRequest out = std::move(it->second);
        requests_.erase(it);
        return out;
    }

    // Offers `value` to every request subscribed to `endpoint`.
    // Removes and returns the requests whose expectation matched.
    [[nodiscard]]
    inline std::vector<PendingRequest> take_matching(const CharacteristicKey& endpoint, const Bytes& value) {
        std::vector<PendingRequest> matched;
        for (auto it = requests_.begin(); it != requests_.end(); ) {
            auto& req = it->second;
            if (!(req.endpoint == endpoint)) {
                ++it;
                continue;
            }
            if (req.last_seen && *req.last_seen == value) {
                ++req.suppressed;
                GL_TRACE("[PENDING] Request #" << req.id << ": duplicate value suppressed");
                ++it;
                continue;
            }
            req.last_seen = value;
            ++req.evaluations;
            if (!matches(req.expected, value)) {
                ++it;
                continue;
            }
            matched.push_back(std::move(req));
            it = requests_.erase(it);
        }
        return matched;
    }

    [[nodiscard]]
    inline std::vector<PendingRequest> take_all() {
        std::vector<PendingRequest> out;
        out.reserve(requests_.size());
        for (auto& [_, req] : requests_) {
            out.push_back(std::move(req));
        }
        requests_.clear();
        return out;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]]
    inline bool contains(RequestId id) const noexcept {
        return requests_.find(id) != requests_.end();
    }

    [[nodiscard]]
    inline bool subscribed(const CharacteristicKey& endpoint) const noexcept {
        for (const auto& [_, req] : requests_) {
            if (req.endpoint == endpoint) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline const PendingRequest* find(RequestId id) const noexcept {
        auto it = requests_.find(id);
        return it == requests_.end() ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return requests_.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return requests_.size();
    }

private:
    std::map<RequestId, PendingRequest> requests_;
    RequestId next_id_{INVALID_REQUEST + 1};
};

} // namespace gattlink::core::request
