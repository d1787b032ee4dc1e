#pragma once

#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"
#include "governor/animation_registry.hpp"
#include "governor/collaborators.hpp"
#include "governor/mode_controller.hpp"
#include "monitor/frame_timing_monitor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace framegov {

// Adaptive performance governor. All state is owned here and mutated only on
// the injected event loop; collaborators are borrowed and must outlive the
// governor. Not copyable or movable: consumers hold a reference.
class PerformanceGovernor {
public:
    using SnapshotCallback = std::function<void(const PerformanceSnapshot&)>;
    using CompletionCallback = std::function<void(bool ok, const std::string& error)>;

    PerformanceGovernor(EventLoop& loop, const GovernorCollaborators& collaborators);
    ~PerformanceGovernor();

    PerformanceGovernor(const PerformanceGovernor&) = delete;
    PerformanceGovernor& operator=(const PerformanceGovernor&) = delete;
    PerformanceGovernor(PerformanceGovernor&&) = delete;
    PerformanceGovernor& operator=(PerformanceGovernor&&) = delete;

    // Starts frame monitoring, the periodic tasks and the lifecycle
    // subscription. On failure everything is rolled back and the reason is
    // returned in `error`. No-op while already initialized.
    bool initialize(const GovernorConfig& cfg, std::string& error);

    // Cancels timers and subscriptions, clears handles and samples. Replies
    // still in flight are dropped when they arrive. Idempotent.
    void dispose();

    bool isInitialized() const { return initialized_; }

    // Delivered on the loop once the memory probe and cache statistics have
    // answered, failed or timed out. Never delivered after dispose().
    void getSnapshot(SnapshotCallback done);

    // Asks the cache collaborator and the host to give memory back. Failures
    // are logged and reported through `done`; nothing is thrown.
    void forceMemoryOptimization(CompletionCallback done = {});

    // Bodies of the periodic tasks. The adaptive check skips a run while the
    // previous one is still waiting on collaborators.
    void runAdaptiveCheck();
    void publishReport();

    AnimationHandle registerAnimation(
        double nominal_duration_ms,
        const std::string& label,
        AnimationRegistry::DurationListener listener = {});
    bool completeAnimation(uint64_t id);
    void recordAnimationFrame(uint64_t id);

    RenderMode renderMode() const { return controller_.renderMode(); }
    CacheMode cacheMode() const { return controller_.cacheMode(); }
    double lastHealthScore() const { return last_health_score_; }
    double currentFps() const { return monitor_.currentFps(); }

    bool adaptiveCheckInFlight() const { return adaptive_in_flight_; }
    uint64_t skippedAdaptiveChecks() const { return skipped_adaptive_checks_; }
    uint64_t schedulingFailures() const { return scheduling_failures_; }
    uint64_t collaboratorFailures() const { return collaborator_failures_; }
    uint64_t memoryOptimizationRequests() const { return memory_optimization_requests_; }

    const GovernorConfig& config() const { return cfg_; }
    const FrameTimingMonitor& monitor() const { return monitor_; }
    FrameTimingMonitor& monitor() { return monitor_; }
    const AnimationRegistry& registry() const { return registry_; }
    const Telemetry& telemetry() const { return telemetry_; }

private:
    template <typename T>
    using Reply = std::function<void(bool ok, const T& value, const std::string& error)>;
    template <typename T>
    using Request = std::function<void(Reply<T>)>;

    template <typename T>
    void awaitCollaborator(const char* what, Request<T> request, Reply<T> finish);

    void teardown();
    void onFpsRecomputed(double fps);
    void applyCacheAxis(double memory_mb);
    void requestCacheOptimization(const char* reason, CompletionCallback done);
    void onSchedulingFailure(EventLoop::TimerId id, const std::string& what);
    PerformanceSnapshot buildSnapshot(uint64_t memory_bytes, bool memory_degraded, double hit_rate, bool cache_degraded);

    EventLoop& loop_;
    GovernorCollaborators collaborators_;
    LogReportingSink default_sink_;
    GovernorConfig cfg_{};

    FrameTimingMonitor monitor_;
    ModeController controller_;
    AnimationRegistry registry_;
    Telemetry telemetry_;

    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
    uint64_t generation_{0};
    bool initialized_{false};

    EventLoop::TimerId adaptive_timer_{EventLoop::kInvalidTimer};
    EventLoop::TimerId report_timer_{EventLoop::kInvalidTimer};
    EventLoop::HandlerId failure_handler_{EventLoop::kInvalidHandler};
    uint64_t lifecycle_token_{0};
    bool lifecycle_subscribed_{false};

    bool adaptive_in_flight_{false};
    double last_health_score_{100.0};
    bool has_memory_reading_{false};
    uint64_t last_memory_bytes_{0};
    bool has_cache_reading_{false};
    double last_cache_hit_rate_{1.0};

    uint64_t skipped_adaptive_checks_{0};
    uint64_t scheduling_failures_{0};
    std::string last_scheduling_error_{};
    uint64_t collaborator_failures_{0};
    uint64_t memory_optimization_requests_{0};
    uint64_t render_transitions_{0};
    uint64_t cache_transitions_{0};
};

}  // namespace framegov
