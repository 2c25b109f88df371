#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace nzbstream {

// Single worker thread running delayed and periodic tasks.
// - Tasks run one at a time on the worker, in due-time order.
// - A periodic task is rescheduled after it returns, so runs never overlap.
// - cancel() on a task that is currently running only prevents later runs.
class TaskScheduler {
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    TaskScheduler() = default;
    ~TaskScheduler() { stop(); }

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void start();
    // Joins the worker and drops every pending task.
    void stop();
    bool running() const;

    TaskId scheduleAfter(Clock::duration delay, Task fn);
    TaskId scheduleEvery(Clock::duration interval, Task fn, Clock::duration firstDelay);
    bool cancel(TaskId id);
    size_t pendingCount() const;

private:
    struct Entry {
        Clock::time_point due;
        Clock::duration interval{Clock::duration::zero()};
        Task fn;
    };

    TaskId add(Clock::duration delay, Clock::duration interval, Task fn);
    void workerLoop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool stopRequested_{false};
    bool started_{false};
    TaskId nextId_{1};
    std::map<TaskId, Entry> tasks_;
};

} // namespace nzbstream
