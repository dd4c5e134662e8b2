#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace gattlink {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
//
// Incremented from the transport worker, the timer thread and caller threads,
// so every access is a relaxed atomic. Ordering with respect to session state
// is not guaranteed; counters are for observation only.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    void copy_to(counter& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace metrics
} // namespace gattlink
