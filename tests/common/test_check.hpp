#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Minimal test assertion helper
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                            \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

namespace gattlink::test {

// Polls `pred` until it holds or `timeout` elapses.
// Session callbacks run on the central worker and on the timer thread, so
// tests observe their effects by waiting, never by sleeping a fixed time.
template<typename Pred>
inline bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return pred();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace gattlink::test
