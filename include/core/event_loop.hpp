#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace framegov {

// Single cooperative execution context. Tasks and timers run one at a time on
// the thread that calls run()/runOnce(); post() and stop() may be called from
// any thread.
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::function<int64_t()>;
    using TimerId = uint64_t;
    using FailureHandler = std::function<void(TimerId, const std::string&)>;
    using HandlerId = uint64_t;

    static constexpr TimerId kInvalidTimer = 0;
    static constexpr HandlerId kInvalidHandler = 0;

    EventLoop();
    explicit EventLoop(Clock clock);
    ~EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);
    TimerId schedulePeriodic(int64_t period_ms, Task task);
    TimerId scheduleOnce(int64_t delay_ms, Task task);
    bool cancel(TimerId id);
    bool isScheduled(TimerId id) const;

    // Every registered handler is called, in registration order, when a
    // periodic task throws. The task is not rescheduled. Several owners may
    // share one loop; each removes only the handler it added.
    HandlerId addFailureHandler(FailureHandler handler);
    bool removeFailureHandler(HandlerId id);

    // Runs every posted task plus every timer due at now(). Returns the number
    // of callbacks executed.
    std::size_t runOnce();
    void run();
    void stop();
    bool isRunning() const { return running_.load(); }

    int64_t now() const { return clock_(); }
    std::size_t pendingTasks() const;
    std::size_t activeTimers() const;

private:
    struct Timer {
        int64_t due_ns{0};
        int64_t period_ns{0};
        bool periodic{false};
        std::shared_ptr<Task> task;
    };

    TimerId addTimer(int64_t delay_ms, Task task, bool periodic);
    std::size_t runPosted();
    std::size_t runDueTimers(int64_t now_ns);
    int64_t nextDueNs() const;

    Clock clock_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_{1};
    bool timers_dirty_{false};
    std::map<HandlerId, FailureHandler> failure_handlers_;
    HandlerId next_handler_id_{1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace framegov
