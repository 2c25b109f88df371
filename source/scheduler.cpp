#include "nzbstream/scheduler.hpp"
#include "nzbstream/logger.hpp"

#include <exception>

namespace nzbstream {

void TaskScheduler::start() {
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
        started_ = true;
    }
    worker_ = std::thread(&TaskScheduler::workerLoop, this);
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) worker_.join();
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
    started_ = false;
}

bool TaskScheduler::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !stopRequested_;
}

TaskScheduler::TaskId TaskScheduler::scheduleAfter(Clock::duration delay, Task fn) {
    return add(delay, Clock::duration::zero(), std::move(fn));
}

TaskScheduler::TaskId TaskScheduler::scheduleEvery(Clock::duration interval, Task fn, Clock::duration firstDelay) {
    if (interval <= Clock::duration::zero()) interval = std::chrono::milliseconds(1);
    return add(firstDelay, interval, std::move(fn));
}

TaskScheduler::TaskId TaskScheduler::add(Clock::duration delay, Clock::duration interval, Task fn) {
    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;
        Entry e;
        e.due = Clock::now() + delay;
        e.interval = interval;
        e.fn = std::move(fn);
        tasks_.emplace(id, std::move(e));
    }
    cv_.notify_one();
    return id;
}

bool TaskScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.erase(id) > 0;
}

size_t TaskScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskScheduler::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        if (tasks_.empty()) {
            cv_.wait(lock, [&] { return stopRequested_ || !tasks_.empty(); });
            continue;
        }

        auto next = tasks_.begin();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->second.due < next->second.due) next = it;
        }
        const auto now = Clock::now();
        const auto due = next->second.due;
        if (due > now) {
            // Woken early by add/cancel/stop: re-evaluate from the top.
            cv_.wait_until(lock, due);
            continue;
        }

        const TaskId id = next->first;
        Task fn = next->second.fn;
        const auto interval = next->second.interval;
        if (interval == Clock::duration::zero()) tasks_.erase(next);

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            logError(std::string("Scheduled task threw: ") + e.what(), "SCHED");
        }
        lock.lock();

        if (interval != Clock::duration::zero()) {
            auto it = tasks_.find(id);
            if (it != tasks_.end()) it->second.due = Clock::now() + interval;
        }
    }
}

} // namespace nzbstream
