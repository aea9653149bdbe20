#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace reprise::events {

// Handle to a scheduled task. cancel() may be called any number of times, from any
// thread, including from inside the task itself.
class TaskHandle {
public:
    TaskHandle() = default;

    void cancel();
    bool active() const;

private:
    friend class Scheduler;

    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
    };

    explicit TaskHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class Scheduler {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;
    using Task = std::function<void()>;
    // Returns true to run again after the interval
    using RepeatingTask = std::function<bool()>;

    Scheduler();
    explicit Scheduler(Clock clock);

    TaskHandle schedule_once(const std::string& name, std::chrono::milliseconds delay, Task task);
    TaskHandle schedule_every(const std::string& name, std::chrono::milliseconds interval, RepeatingTask task);

    // Runs due tasks outside the lock. Returns how many ran.
    size_t process();

    std::optional<TimePoint> next_due() const;
    size_t pending() const;

    // Timer thread body: process() until stop is requested.
    void run(std::stop_token stop_token);

private:
    struct ScheduledTask {
        std::string name;
        RepeatingTask task;
        std::chrono::milliseconds interval;
        TimePoint due;
        bool repeating = false;
        std::shared_ptr<TaskHandle::State> state;
    };

    TaskHandle add(ScheduledTask task);

    Clock clock_;
    mutable std::mutex mutex_;
    std::condition_variable_any wakeup_;
    std::multimap<TimePoint, ScheduledTask> tasks_;
    bool changed_ = false;
};

}  // namespace reprise::events
