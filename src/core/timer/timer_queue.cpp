#include "gattlink/core/timer/timer_queue.hpp"

#include <exception>

#include "gattlink/log/logger.hpp"


namespace gattlink::core::timer {

TimerQueue::TimerQueue(std::string name)
    : name_(std::move(name))
{
    std::lock_guard<std::mutex> lock(mutex_);
    worker_ = std::thread([this] { run_(); });
    worker_id_ = worker_.get_id();
}

TimerQueue::~TimerQueue() {
    stop();
}

TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    const auto deadline = Clock::now() + delay;
    TimerId id = INVALID_TIMER;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            GL_WARN("[TIMER] " << name_ << ": schedule() after stop. Ignoring.");
            return INVALID_TIMER;
        }
        id = next_id_++;
        tasks_.emplace(Key{deadline, id}, std::move(task));
        index_.emplace(id, deadline);
    }
    GL_TRACE("[TIMER] " << name_ << ": scheduled #" << id << " in " << delay.count() << " ms");
    cv_.notify_one();
    return id;
}

bool TimerQueue::post(Task task) {
    return schedule(std::chrono::milliseconds(0), std::move(task)) != INVALID_TIMER;
}

bool TimerQueue::cancel(TimerId id) {
    if (id == INVALID_TIMER) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    tasks_.erase(Key{it->second, id});
    index_.erase(it);
    GL_TRACE("[TIMER] " << name_ << ": cancelled #" << id);
    // The worker re-evaluates its wait on the next wake-up; an early wake-up
    // for a cancelled head is harmless.
    return true;
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::this_thread::get_id() == worker_id_) {
            GL_ERROR("[TIMER] " << name_ << ": stop() called from its own worker. Ignoring.");
            return;
        }
        if (!stopping_) {
            stopping_ = true;
            if (!tasks_.empty()) {
                GL_DEBUG("[TIMER] " << name_ << ": dropping " << tasks_.size() << " pending task(s)");
            }
            tasks_.clear();
            index_.clear();
        }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool TimerQueue::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

bool TimerQueue::on_worker() const noexcept {
    return std::this_thread::get_id() == worker_id_;
}

void TimerQueue::run_() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (tasks_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            continue;
        }
        auto head = tasks_.begin();
        const auto deadline = head->first.first;
        if (Clock::now() < deadline) {
            // Woken early by schedule(), cancel() or stop(): loop and re-check the head
            cv_.wait_until(lock, deadline);
            continue;
        }
        const TimerId id = head->first.second;
        Task task = std::move(head->second);
        tasks_.erase(head);
        index_.erase(id);

        lock.unlock();
        GL_TRACE("[TIMER] " << name_ << ": firing #" << id);
        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                GL_ERROR("[TIMER] " << name_ << ": task #" << id << " threw: " << e.what());
            }
        }
        lock.lock();
    }
    GL_TRACE("[TIMER] " << name_ << ": worker exiting");
}

} // namespace gattlink::core::timer
