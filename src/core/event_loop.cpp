#include "core/event_loop.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace framegov {

EventLoop::EventLoop() : clock_(&nowSteadyNs) {}

EventLoop::EventLoop(Clock clock) : clock_(clock ? std::move(clock) : Clock(&nowSteadyNs)) {}

void EventLoop::post(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }
    wake_.notify_one();
}

EventLoop::TimerId EventLoop::schedulePeriodic(int64_t period_ms, Task task) {
    return addTimer(period_ms, std::move(task), true);
}

EventLoop::TimerId EventLoop::scheduleOnce(int64_t delay_ms, Task task) {
    return addTimer(delay_ms, std::move(task), false);
}

EventLoop::TimerId EventLoop::addTimer(int64_t delay_ms, Task task, bool periodic) {
    if (!task || delay_ms < 0 || (periodic && delay_ms == 0)) {
        return kInvalidTimer;
    }
    TimerId id = kInvalidTimer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        Timer t;
        t.period_ns = msToNs(delay_ms);
        t.due_ns = clock_() + t.period_ns;
        t.periodic = periodic;
        t.task = std::make_shared<Task>(std::move(task));
        timers_.emplace(id, std::move(t));
        timers_dirty_ = true;
    }
    wake_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0U;
}

bool EventLoop::isScheduled(TimerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.find(id) != timers_.end();
}

EventLoop::HandlerId EventLoop::addFailureHandler(FailureHandler handler) {
    if (!handler) {
        return kInvalidHandler;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const HandlerId id = next_handler_id_++;
    failure_handlers_.emplace(id, std::move(handler));
    return id;
}

bool EventLoop::removeFailureHandler(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_handlers_.erase(id) > 0U;
}

std::size_t EventLoop::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posted_.size();
}

std::size_t EventLoop::activeTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

std::size_t EventLoop::runPosted() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(posted_);
    }
    std::size_t ran = 0;
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[loop] posted task failed: " << e.what() << "\n";
        }
        ran++;
    }
    return ran;
}

std::size_t EventLoop::runDueTimers(int64_t now_ns) {
    std::vector<std::pair<int64_t, TimerId>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : timers_) {
            if (kv.second.due_ns <= now_ns) {
                due.emplace_back(kv.second.due_ns, kv.first);
            }
        }
    }
    std::sort(due.begin(), due.end());

    std::size_t ran = 0;
    for (const auto& entry : due) {
        const TimerId id = entry.second;
        std::shared_ptr<Task> task;
        bool periodic = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = timers_.find(id);
            if (it == timers_.end()) {
                // cancelled by an earlier callback in this batch
                continue;
            }
            task = it->second.task;
            periodic = it->second.periodic;
            if (periodic) {
                it->second.due_ns += it->second.period_ns;
                if (it->second.due_ns <= now_ns) {
                    it->second.due_ns = now_ns + it->second.period_ns;
                }
            } else {
                timers_.erase(it);
            }
        }

        try {
            (*task)();
        } catch (const std::exception& e) {
            std::vector<FailureHandler> handlers;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (periodic) {
                    timers_.erase(id);
                }
                for (const auto& kv : failure_handlers_) {
                    handlers.push_back(kv.second);
                }
            }
            std::cerr << "[loop] timer=" << id << " failed, not rescheduled: " << e.what()
                      << " handlers=" << handlers.size() << "\n";
            for (const auto& handler : handlers) {
                handler(id, e.what());
            }
        }
        ran++;
    }
    return ran;
}

std::size_t EventLoop::runOnce() {
    std::size_t ran = runPosted();
    ran += runDueTimers(clock_());
    return ran;
}

int64_t EventLoop::nextDueNs() const {
    int64_t next = -1;
    for (const auto& kv : timers_) {
        if (next < 0 || kv.second.due_ns < next) {
            next = kv.second.due_ns;
        }
    }
    return next;
}

void EventLoop::run() {
    running_.store(true);
    while (!stop_requested_.load()) {
        runOnce();

        std::unique_lock<std::mutex> lock(mutex_);
        if (!posted_.empty() || stop_requested_.load()) {
            continue;
        }
        const int64_t next_due = nextDueNs();
        timers_dirty_ = false;
        auto woken = [this]() { return !posted_.empty() || timers_dirty_ || stop_requested_.load(); };
        if (next_due < 0) {
            wake_.wait(lock, woken);
        } else {
            const int64_t wait_ns = std::max<int64_t>(0, next_due - clock_());
            wake_.wait_for(lock, std::chrono::nanoseconds(wait_ns), woken);
        }
    }
    stop_requested_.store(false);
    running_.store(false);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_.store(true);
    }
    wake_.notify_all();
}

}  // namespace framegov
