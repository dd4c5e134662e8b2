#pragma once

/*
===============================================================================
 gattlink::core::request::Correlator
===============================================================================

Turns a notification stream into request/response exchanges.

A request is:
  - a subscription to one notifiable endpoint (an entry in PendingRequests)
  - a deadline timer on the TimerQueue
  - a one-shot completion

The first of { matching value, deadline, cancel, failure } removes the entry
and yields a Resolution. The remaining paths then find nothing to remove and
become no-ops, which is what makes late timers and late values harmless.

-------------------------------------------------------------------------------
 Locking
-------------------------------------------------------------------------------
The Correlator has no lock of its own. Every member is called under the
owning Session's lock, and every member returns Resolutions instead of
running completions: the caller fires them after releasing the lock.

Deadline timers call the expiry handler on the timer thread. The handler is
expected to take the Session lock and call expire(id).
===============================================================================
*/

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/request/outcome.hpp"
#include "gattlink/core/request/matcher.hpp"
#include "gattlink/core/request/completion.hpp"
#include "gattlink/core/request/pending_requests.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/core/telemetry/session.hpp"


namespace gattlink::core::request {

// A completion ready to run, detached from the pending table
struct Resolution {
    OnceCompletion completion;
    Outcome outcome;

    inline void fire() const {
        completion(outcome);
    }
};

class Correlator {
public:
    using ExpiryHandler = std::function<void(RequestId)>;

    Correlator(timer::TimerQueue& timers, telemetry::Session& telemetry) noexcept
        : timers_(timers)
        , telemetry_(telemetry)
    {}

    void set_expiry_handler(ExpiryHandler handler) {
        on_expiry_ = std::move(handler);
    }

    // Registers the subscription and arms the deadline. The request is live
    // when this returns; a value delivered afterwards can resolve it.
    [[nodiscard]]
    RequestId add(const CharacteristicKey& endpoint,
                  Expectation expected,
                  std::chrono::milliseconds timeout,
                  Completion completion);

    // Offers a notified value to every subscriber of `endpoint`
    [[nodiscard]]
    std::vector<Resolution> on_value(const CharacteristicKey& endpoint, const Bytes& value);

    // Deadline path (RequestTimeout). Empty if already resolved.
    [[nodiscard]]
    std::optional<Resolution> expire(RequestId id);

    // Explicit resolution with a failure (Cancelled, TransportError, ...)
    [[nodiscard]]
    std::optional<Resolution> cancel(RequestId id, Error reason);

    [[nodiscard]]
    std::vector<Resolution> fail_all(Error reason);

    [[nodiscard]]
    bool subscribed(const CharacteristicKey& endpoint) const noexcept {
        return pending_.subscribed(endpoint);
    }

    [[nodiscard]]
    std::size_t size() const noexcept {
        return pending_.size();
    }

    [[nodiscard]]
    const PendingRequest* find(RequestId id) const noexcept {
        return pending_.find(id);
    }

private:
    [[nodiscard]]
    Resolution finish_(PendingRequest& request, Outcome outcome);

    timer::TimerQueue& timers_;
    telemetry::Session& telemetry_;
    ExpiryHandler on_expiry_;
    PendingRequests pending_;
};

} // namespace gattlink::core::request
