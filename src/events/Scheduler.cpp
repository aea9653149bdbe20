#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <vector>

namespace reprise::events {

void TaskHandle::cancel() {
    if (state_) {
        state_->cancelled.store(true);
    }
}

bool TaskHandle::active() const {
    return state_ && !state_->cancelled.load() && !state_->finished.load();
}

Scheduler::Scheduler()
    : clock_([] { return std::chrono::steady_clock::now(); }) {}

Scheduler::Scheduler(Clock clock)
    : clock_(std::move(clock)) {}

TaskHandle Scheduler::schedule_once(const std::string& name, std::chrono::milliseconds delay, Task task) {
    reprise::util::Logger::debug("Scheduler: Scheduling " + name + " in " + std::to_string(delay.count()) + "ms");

    ScheduledTask entry;
    entry.name = name;
    entry.task = [task = std::move(task)] {
        task();
        return false;
    };
    entry.interval = delay;
    entry.repeating = false;
    return add(std::move(entry));
}

TaskHandle Scheduler::schedule_every(const std::string& name, std::chrono::milliseconds interval, RepeatingTask task) {
    reprise::util::Logger::debug("Scheduler: Scheduling " + name + " every " + std::to_string(interval.count()) + "ms");

    ScheduledTask entry;
    entry.name = name;
    entry.task = std::move(task);
    entry.interval = interval;
    entry.repeating = true;
    return add(std::move(entry));
}

TaskHandle Scheduler::add(ScheduledTask task) {
    auto state = std::make_shared<TaskHandle::State>();
    task.state = state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task.due = clock_() + task.interval;
        tasks_.emplace(task.due, std::move(task));
        changed_ = true;
    }
    wakeup_.notify_all();
    return TaskHandle(state);
}

size_t Scheduler::process() {
    std::vector<ScheduledTask> due;
    TimePoint now;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now = clock_();
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->second.state->cancelled.load()) {
                it = tasks_.erase(it);
            } else if (it->first <= now) {
                due.push_back(std::move(it->second));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t ran = 0;
    for (auto& task : due) {
        // Cancelled by an earlier task in this batch
        if (task.state->cancelled.load()) continue;

        bool again = task.task();
        ++ran;

        if (task.repeating && again && !task.state->cancelled.load()) {
            std::lock_guard<std::mutex> lock(mutex_);
            task.due = now + task.interval;
            tasks_.emplace(task.due, std::move(task));
        } else {
            task.state->finished.store(true);
        }
    }

    return ran;
}

std::optional<Scheduler::TimePoint> Scheduler::next_due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [due, task] : tasks_) {
        if (!task.state->cancelled.load()) return due;
    }
    return std::nullopt;
}

size_t Scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [due, task] : tasks_) {
        if (!task.state->cancelled.load()) ++count;
    }
    return count;
}

void Scheduler::run(std::stop_token stop_token) {
    reprise::util::Logger::debug("Scheduler: Timer thread started");

    // Upper bound on a single wait so cancelled tasks are purged regularly
    constexpr auto max_wait = std::chrono::milliseconds(500);

    while (!stop_token.stop_requested()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            changed_ = false;
        }
        process();

        auto deadline = clock_() + max_wait;
        if (auto due = next_due(); due && *due < deadline) {
            deadline = *due;
        }

        // Woken early when a task is added after the reset above
        std::unique_lock<std::mutex> lock(mutex_);
        wakeup_.wait_until(lock, stop_token, deadline, [this] { return changed_; });
    }

    reprise::util::Logger::debug("Scheduler: Timer thread stopped");
}

}  // namespace reprise::events
