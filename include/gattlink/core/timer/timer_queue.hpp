#pragma once

/*
===============================================================================
 gattlink::core::timer::TimerQueue
===============================================================================

One background thread executing delayed tasks in deadline order.

Used for the connection watchdog and for request deadlines. The simulated
central also owns one and uses it as its serial callback worker: because every
task runs on the same thread, callbacks posted through a TimerQueue never
overlap.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- Tasks with equal deadlines run in scheduling order
- Tasks run outside the queue lock; a task may schedule or cancel timers
- cancel() returning true means the task has not started and never will
- cancel() returning false means the task already ran, is running, or the id
  was never valid. Callers that need "stale timer" protection must re-check
  their own state at fire time.
- stop() drops every pending task and joins the worker. A task already running
  completes before stop() returns.

-------------------------------------------------------------------------------
 Constraints
-------------------------------------------------------------------------------
- stop() and the destructor must not be called from a task running on this
  queue (the worker cannot join itself). Such a call is logged and ignored.
- Tasks should not throw. A std::exception escaping a task is logged at ERROR
  and the worker moves on to the next task; anything else terminates.
===============================================================================
*/

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>


namespace gattlink::core::timer {

using TimerId = std::uint64_t;

// Never returned by schedule()
inline constexpr TimerId INVALID_TIMER = 0;

class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Task  = std::function<void()>;

    explicit TimerQueue(std::string name = "timer");
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Runs `task` on the worker once `delay` has elapsed.
    // Returns INVALID_TIMER if the queue is stopped.
    [[nodiscard]]
    TimerId schedule(std::chrono::milliseconds delay, Task task);

    // Runs `task` on the worker as soon as possible, after every task already
    // due. Returns false if the queue is stopped.
    bool post(Task task);

    bool cancel(TimerId id);

    void stop();

    [[nodiscard]]
    std::size_t pending() const;

    [[nodiscard]]
    bool running() const;

    // True when called from a task executing on this queue
    [[nodiscard]]
    bool on_worker() const noexcept;

    [[nodiscard]]
    const std::string& name() const noexcept {
        return name_;
    }

private:
    // Deadline first, id second: ids are monotonic, so ties keep FIFO order
    using Key = std::pair<Clock::time_point, TimerId>;

    void run_();

    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Task> tasks_;
    std::unordered_map<TimerId, Clock::time_point> index_;
    TimerId next_id_{INVALID_TIMER + 1};
    bool stopping_{false};

    std::thread worker_;
    std::thread::id worker_id_;
};

} // namespace gattlink::core::timer
