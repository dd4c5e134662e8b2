#pragma once

#include <atomic>
#include <cassert>
#include <memory>
#include <utility>

#include "gattlink/core/request/outcome.hpp"
#include "gattlink/log/logger.hpp"


namespace gattlink::core::request {

// -----------------------------------------------------------------------------
// OnceCompletion
// -----------------------------------------------------------------------------
//
// Wraps a caller completion so that it can run at most once.
//
// Copies share the fired flag. The pending table already guarantees a single
// resolution (removal happens under the Session lock); a second invocation is
// therefore a programming error: it is logged at FATAL, asserted in debug
// builds, and never forwarded to the caller.
//
// -----------------------------------------------------------------------------
class OnceCompletion {
public:
    OnceCompletion() = default;

    OnceCompletion(RequestId id, Completion completion)
        : id_(id)
        , completion_(std::move(completion))
        , fired_(std::make_shared<std::atomic<bool>>(false))
    {}

    inline void operator()(const Outcome& outcome) const {
        if (!fired_) {
            return;
        }
        if (fired_->exchange(true, std::memory_order_acq_rel)) {
            GL_FATAL("[CORR] Request #" << id_ << " resolved twice (second outcome: " << to_string(outcome.error) << ")");
            assert(false && "request resolved more than once");
            return;
        }
        if (completion_) {
            completion_(outcome);
        }
    }

    [[nodiscard]]
    inline bool fired() const noexcept {
        return fired_ && fired_->load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline RequestId id() const noexcept {
        return id_;
    }

private:
    RequestId id_{INVALID_REQUEST};
    Completion completion_;
    std::shared_ptr<std::atomic<bool>> fired_;
};

} // namespace gattlink::core::request
