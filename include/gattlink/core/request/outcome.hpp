#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"


namespace gattlink::core::request {

// Monotonic per Session, never reused. 0 is never a valid id.
using RequestId = std::uint64_t;
inline constexpr RequestId INVALID_REQUEST = 0;

// Terminal result of a request/response exchange.
//   error == None  -> value holds the matching notification
//   otherwise      -> value is empty
struct Outcome {
    Error error{Error::None};
    Bytes value;

    [[nodiscard]]
    bool ok() const noexcept {
        return error == Error::None;
    }

    [[nodiscard]]
    static Outcome success(Bytes value) {
        return Outcome{Error::None, std::move(value)};
    }

    [[nodiscard]]
    static Outcome failure(Error error) {
        return Outcome{error, {}};
    }
};

// Invoked exactly once, on the central's worker, the timer thread or the
// thread calling disconnect()/cancel(). Must not throw: an exception escaping
// on the timer thread is only logged, and on any other thread it propagates
// into the central or the caller.
using Completion = std::function<void(const Outcome&)>;

} // namespace gattlink::core::request
