#include "governor/performance_governor.hpp"

#include "governor/health_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace framegov {

namespace {

AnimationRegistry::Scaling scalingFromConfig(const GovernorConfig& cfg) {
    AnimationRegistry::Scaling s;
    s.new_handle_scale = cfg.low_power_scale_new;
    s.live_handle_scale = cfg.low_power_scale_live;
    s.long_animation_ms = static_cast<double>(cfg.long_animation_ms);
    return s;
}

}  // namespace

PerformanceGovernor::PerformanceGovernor(EventLoop& loop, const GovernorCollaborators& collaborators)
    : loop_(loop), collaborators_(collaborators), controller_(cfg_) {}

PerformanceGovernor::~PerformanceGovernor() {
    dispose();
}

template <typename T>
void PerformanceGovernor::awaitCollaborator(const char* what, Request<T> request, Reply<T> finish) {
    struct Pending {
        bool settled{false};
        EventLoop::TimerId timeout{EventLoop::kInvalidTimer};
    };
    auto pending = std::make_shared<Pending>();
    std::weak_ptr<bool> alive = alive_;
    const uint64_t generation = generation_;
    EventLoop* loop = &loop_;

    // Loop thread only. The first of reply, failure or timeout wins.
    auto settle = [this, alive, generation, pending, loop, finish](bool ok, const T& value, const std::string& error) {
        if (pending->settled) {
            return;
        }
        pending->settled = true;
        if (pending->timeout != EventLoop::kInvalidTimer) {
            loop->cancel(pending->timeout);
        }
        if (alive.expired() || generation != generation_) {
            return;
        }
        finish(ok, value, error);
    };

    if (cfg_.collaborator_timeout_ms > 0) {
        const int timeout_ms = cfg_.collaborator_timeout_ms;
        const std::string label(what);
        pending->timeout = loop_.scheduleOnce(timeout_ms, [settle, label, timeout_ms]() {
            settle(false, T{}, label + " timed out after " + std::to_string(timeout_ms) + " ms");
        });
    }

    Reply<T> reply = [loop, settle](bool ok, const T& value, const std::string& error) {
        loop->post([settle, ok, value, error]() { settle(ok, value, error); });
    };
    try {
        request(reply);
    } catch (const std::exception& e) {
        const std::string error = std::string(what) + " failed: " + e.what();
        loop_.post([settle, error]() { settle(false, T{}, error); });
    }
}

bool PerformanceGovernor::initialize(const GovernorConfig& cfg, std::string& error) {
    if (initialized_) {
        error.clear();
        return true;
    }
    if (!validateGovernorConfig(cfg, error)) {
        std::cerr << "[governor] initialize failed: " << error << "\n";
        return false;
    }
    if (collaborators_.frames == nullptr || collaborators_.cache == nullptr || collaborators_.memory == nullptr) {
        error = "frame source, cache statistics provider and memory probe are required";
        std::cerr << "[governor] initialize failed: " << error << "\n";
        return false;
    }

    cfg_ = cfg;
    generation_++;
    controller_.updateConfig(cfg_);
    controller_.reset();
    registry_.clear();
    registry_.setScaling(scalingFromConfig(cfg_));
    monitor_.reset();
    telemetry_.reset();
    adaptive_in_flight_ = false;
    has_memory_reading_ = false;
    has_cache_reading_ = false;
    last_health_score_ = 100.0;

    EventLoop* loop = &loop_;
    std::weak_ptr<bool> alive = alive_;
    const uint64_t generation = generation_;

    monitor_.setDispatcher([loop, alive](std::function<void()> task) {
        loop->post([alive, task]() {
            if (!alive.expired()) {
                task();
            }
        });
    });
    monitor_.setHealthCheckCallback([this](double fps) { onFpsRecomputed(fps); });

    std::string sub_error;
    if (!monitor_.start(*collaborators_.frames, sub_error)) {
        error = "frame source: " + sub_error;
        teardown();
        std::cerr << "[governor] initialize failed: " << error << "\n";
        return false;
    }

    if (collaborators_.lifecycle != nullptr) {
        auto on_background = [this, loop, alive, generation]() {
            loop->post([this, alive, generation]() {
                if (alive.expired() || generation != generation_ || !initialized_) {
                    return;
                }
                std::cerr << "[governor] host backgrounded, reclaiming memory\n";
                forceMemoryOptimization();
            });
        };
        uint64_t token = 0;
        if (!collaborators_.lifecycle->subscribeBackgrounded(on_background, token, sub_error)) {
            error = "host lifecycle: " + sub_error;
            teardown();
            std::cerr << "[governor] initialize failed: " << error << "\n";
            return false;
        }
        lifecycle_token_ = token;
        lifecycle_subscribed_ = true;
    }

    if (cfg_.adaptive_enable) {
        adaptive_timer_ = loop_.schedulePeriodic(cfg_.adaptive_check_period_ms, [this]() { runAdaptiveCheck(); });
        if (adaptive_timer_ == EventLoop::kInvalidTimer) {
            error = "failed to schedule adaptive check";
            teardown();
            std::cerr << "[governor] initialize failed: " << error << "\n";
            return false;
        }
    }
    if (cfg_.reporting_enable) {
        report_timer_ = loop_.schedulePeriodic(cfg_.report_period_ms, [this]() { publishReport(); });
        if (report_timer_ == EventLoop::kInvalidTimer) {
            error = "failed to schedule performance report";
            teardown();
            std::cerr << "[governor] initialize failed: " << error << "\n";
            return false;
        }
    }
    // the loop may be shared; onSchedulingFailure ignores timers it does not own
    failure_handler_ = loop_.addFailureHandler([this, alive](EventLoop::TimerId id, const std::string& what) {
        if (!alive.expired()) {
            onSchedulingFailure(id, what);
        }
    });

    initialized_ = true;
    telemetry_.setInitialized(true);
    std::cerr << "[governor] initialized"
              << " adaptive=" << (cfg_.adaptive_enable ? 1 : 0)
              << " adaptive_period_ms=" << cfg_.adaptive_check_period_ms
              << " reporting=" << (cfg_.reporting_enable ? 1 : 0)
              << " report_period_ms=" << cfg_.report_period_ms
              << " collaborator_timeout_ms=" << cfg_.collaborator_timeout_ms
              << " lifecycle=" << (lifecycle_subscribed_ ? 1 : 0)
              << "\n";
    error.clear();
    return true;
}

void PerformanceGovernor::teardown() {
    if (adaptive_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel(adaptive_timer_);
        adaptive_timer_ = EventLoop::kInvalidTimer;
    }
    if (report_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel(report_timer_);
        report_timer_ = EventLoop::kInvalidTimer;
    }
    if (lifecycle_subscribed_ && collaborators_.lifecycle != nullptr) {
        collaborators_.lifecycle->unsubscribe(lifecycle_token_);
    }
    lifecycle_subscribed_ = false;
    lifecycle_token_ = 0;
    if (failure_handler_ != EventLoop::kInvalidHandler) {
        loop_.removeFailureHandler(failure_handler_);
        failure_handler_ = EventLoop::kInvalidHandler;
    }

    monitor_.stop();
    monitor_.reset();
    registry_.clear();
    controller_.reset();
    adaptive_in_flight_ = false;
    // in-flight replies carry the old generation and are dropped
    generation_++;
    initialized_ = false;
    telemetry_.reset();
}

void PerformanceGovernor::dispose() {
    if (!initialized_) {
        return;
    }
    teardown();
    std::cerr << "[governor] disposed\n";
}

void PerformanceGovernor::onFpsRecomputed(double fps) {
    telemetry_.setFps(fps);
    telemetry_.setFrames(monitor_.frameCount());

    const ModeTransition t = controller_.evaluateRender(fps);
    if (t == ModeTransition::Entered) {
        render_transitions_++;
        telemetry_.countRenderTransition();
        const std::size_t scaled = registry_.applyLowPowerScaling();
        std::cerr << "[governor] render_mode=low_power fps=" << fps
                  << " scaled_handles=" << scaled << "\n";
    } else if (t == ModeTransition::Exited) {
        render_transitions_++;
        telemetry_.countRenderTransition();
        std::cerr << "[governor] render_mode=normal fps=" << fps << "\n";
    }
    telemetry_.setRenderMode(controller_.renderMode());
}

void PerformanceGovernor::applyCacheAxis(double memory_mb) {
    const ModeTransition t = controller_.evaluateCache(memory_mb);
    if (t == ModeTransition::Entered) {
        cache_transitions_++;
        telemetry_.countCacheTransition();
        std::cerr << "[governor] cache_mode=aggressive memory_mb=" << memory_mb << "\n";
        requestCacheOptimization("aggressive cache mode", {});
    } else if (t == ModeTransition::Exited) {
        cache_transitions_++;
        telemetry_.countCacheTransition();
        std::cerr << "[governor] cache_mode=normal memory_mb=" << memory_mb << "\n";
    }
    telemetry_.setCacheMode(controller_.cacheMode());
}

void PerformanceGovernor::requestCacheOptimization(const char* reason, CompletionCallback done) {
    memory_optimization_requests_++;
    CacheStatisticsProvider* cache = collaborators_.cache;
    const std::string why(reason);
    awaitCollaborator<bool>(
        "cache optimization",
        [cache](Reply<bool> reply) {
            cache->optimizeMemoryUsage([reply](bool ok, const std::string& error) { reply(ok, ok, error); });
        },
        [this, why, done](bool ok, const bool&, const std::string& error) {
            if (ok) {
                std::cerr << "[governor] cache optimization done reason=\"" << why << "\"\n";
            } else {
                collaborator_failures_++;
                std::cerr << "[governor] cache optimization failed reason=\"" << why << "\": " << error << "\n";
            }
            if (done) {
                done(ok, error);
            }
        });
}

void PerformanceGovernor::forceMemoryOptimization(CompletionCallback done) {
    std::cerr << "[governor] force memory optimization triggered\n";
    if (!initialized_) {
        if (done) {
            done(false, "governor not initialized");
        }
        return;
    }
    requestCacheOptimization("forced", [this, done](bool cache_ok, const std::string& cache_error) {
        bool host_ok = true;
        std::string host_error;
        if (collaborators_.reclaimer != nullptr) {
            try {
                host_ok = collaborators_.reclaimer->reclaim(host_error);
            } catch (const std::exception& e) {
                host_ok = false;
                host_error = e.what();
            }
            if (!host_ok) {
                std::cerr << "[governor] host reclaim hint failed: " << host_error << "\n";
            }
        }
        std::cerr << "[governor] memory optimization completed"
                  << " cache_ok=" << (cache_ok ? 1 : 0)
                  << " host_ok=" << (host_ok ? 1 : 0) << "\n";
        if (done) {
            std::string error = cache_error;
            if (!host_ok) {
                error += (error.empty() ? "" : "; ") + host_error;
            }
            done(cache_ok && host_ok, error);
        }
    });
}

PerformanceSnapshot PerformanceGovernor::buildSnapshot(
    uint64_t memory_bytes,
    bool memory_degraded,
    double hit_rate,
    bool cache_degraded) {
    PerformanceSnapshot s;
    s.current_fps = monitor_.currentFps();
    s.average_frame_time_ms = monitor_.averageFrameTimeMs();
    s.render_mode = controller_.renderMode();
    s.cache_mode = controller_.cacheMode();
    s.active_handle_count = static_cast<int>(registry_.count());
    s.memory_usage_bytes = memory_bytes;
    s.cache_hit_rate = hit_rate;
    s.memory_probe_degraded = memory_degraded;
    s.cache_stats_degraded = cache_degraded;
    s.captured_at_ns = loop_.now();

    HealthInputs in;
    in.fps = s.current_fps;
    in.memory_usage_bytes = memory_bytes;
    in.cache_hit_rate = hit_rate;
    in.active_handle_count = s.active_handle_count;
    HealthReport health = evaluateHealth(in);
    s.health_score = health.score;
    s.health_status = healthStatus(health.score);
    s.recommendations = std::move(health.recommendations);

    if (initialized_) {
        last_health_score_ = s.health_score;
        telemetry_.setHealthScore(s.health_score);
        telemetry_.setActiveHandles(s.active_handle_count);
        telemetry_.setMemoryUsageBytes(memory_bytes);
        telemetry_.setCacheHitRate(hit_rate);
    }
    return s;
}

void PerformanceGovernor::getSnapshot(SnapshotCallback done) {
    if (!done) {
        return;
    }
    if (!initialized_) {
        const PerformanceSnapshot s = buildSnapshot(last_memory_bytes_, true, last_cache_hit_rate_, true);
        loop_.post([done, s]() { done(s); });
        return;
    }

    MemoryProbe* memory = collaborators_.memory;
    CacheStatisticsProvider* cache = collaborators_.cache;
    awaitCollaborator<uint64_t>(
        "memory probe",
        [memory](Reply<uint64_t> reply) { memory->currentUsageBytes(reply); },
        [this, cache, done](bool ok, const uint64_t& bytes, const std::string& error) {
            bool memory_degraded = false;
            if (ok) {
                has_memory_reading_ = true;
                last_memory_bytes_ = bytes;
            } else {
                memory_degraded = true;
                collaborator_failures_++;
                std::cerr << "[governor] memory probe unavailable, using "
                          << (has_memory_reading_ ? "last reading" : "default") << ": " << error << "\n";
            }
            const uint64_t memory_bytes = has_memory_reading_ ? last_memory_bytes_ : 0U;

            awaitCollaborator<CacheStatistics>(
                "cache statistics",
                [cache](Reply<CacheStatistics> reply) { cache->getStatistics(reply); },
                [this, done, memory_bytes, memory_degraded](
                    bool stats_ok, const CacheStatistics& stats, const std::string& stats_error) {
                    bool cache_degraded = false;
                    if (stats_ok) {
                        has_cache_reading_ = true;
                        last_cache_hit_rate_ = std::clamp(stats.overallHitRate(), 0.0, 1.0);
                    } else {
                        cache_degraded = true;
                        collaborator_failures_++;
                        std::cerr << "[governor] cache statistics unavailable, using "
                                  << (has_cache_reading_ ? "last reading" : "default") << ": " << stats_error << "\n";
                    }
                    const double hit_rate = has_cache_reading_ ? last_cache_hit_rate_ : 1.0;
                    done(buildSnapshot(memory_bytes, memory_degraded, hit_rate, cache_degraded));
                });
        });
}

void PerformanceGovernor::runAdaptiveCheck() {
    if (!initialized_) {
        return;
    }
    if (adaptive_in_flight_) {
        skipped_adaptive_checks_++;
        std::cerr << "[governor] adaptive check skipped, previous run still waiting on collaborators\n";
        return;
    }
    adaptive_in_flight_ = true;
    getSnapshot([this](const PerformanceSnapshot& s) {
        adaptive_in_flight_ = false;
        applyCacheAxis(s.memoryUsageMb());
    });
}

void PerformanceGovernor::publishReport() {
    if (!initialized_) {
        return;
    }
    getSnapshot([this](const PerformanceSnapshot& s) {
        PerformanceReport report;
        report.snapshot = s;
        report.scheduling_failures = scheduling_failures_;
        report.last_scheduling_error = last_scheduling_error_;
        report.collaborator_failures = collaborator_failures_;
        report.render_transitions = render_transitions_;
        report.cache_transitions = cache_transitions_;
        ReportingSink* sink = (collaborators_.sink != nullptr) ? collaborators_.sink : &default_sink_;
        try {
            sink->publish(report);
        } catch (const std::exception& e) {
            std::cerr << "[governor] reporting sink failed: " << e.what() << "\n";
        }
    });
}

void PerformanceGovernor::onSchedulingFailure(EventLoop::TimerId id, const std::string& what) {
    const char* task = nullptr;
    if (id == adaptive_timer_) {
        task = "adaptive_check";
        adaptive_timer_ = EventLoop::kInvalidTimer;
        adaptive_in_flight_ = false;
    } else if (id == report_timer_) {
        task = "report";
        report_timer_ = EventLoop::kInvalidTimer;
    } else {
        return;
    }
    scheduling_failures_++;
    last_scheduling_error_ = std::string(task) + ": " + what;
    std::cerr << "[governor] periodic task=" << task << " stopped after failure: " << what << "\n";
}

AnimationHandle PerformanceGovernor::registerAnimation(
    double nominal_duration_ms,
    const std::string& label,
    AnimationRegistry::DurationListener listener) {
    const AnimationHandle h = registry_.registerHandle(
        nominal_duration_ms, label, controller_.renderMode(), std::move(listener));
    if (!h.valid()) {
        std::cerr << "[governor] rejected animation label=\"" << label
                  << "\" duration_ms=" << nominal_duration_ms << "\n";
    }
    telemetry_.setActiveHandles(static_cast<int>(registry_.count()));
    return h;
}

bool PerformanceGovernor::completeAnimation(uint64_t id) {
    const bool removed = registry_.remove(id);
    telemetry_.setActiveHandles(static_cast<int>(registry_.count()));
    return removed;
}

void PerformanceGovernor::recordAnimationFrame(uint64_t id) {
    registry_.recordFrame(id);
}

}  // namespace framegov
