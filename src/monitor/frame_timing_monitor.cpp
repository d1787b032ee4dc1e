#include "monitor/frame_timing_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace framegov {

FrameTimingMonitor::FrameTimingMonitor() = default;

FrameTimingMonitor::~FrameTimingMonitor() {
    stop();
}

void FrameTimingMonitor::setHealthCheckCallback(HealthCheckCallback callback) {
    health_check_ = std::move(callback);
}

void FrameTimingMonitor::setDispatcher(Dispatcher dispatcher) {
    dispatcher_ = std::move(dispatcher);
}

bool FrameTimingMonitor::start(FrameLatencySource& source, std::string& error) {
    if (running_) {
        error.clear();
        return true;
    }
    const uint64_t generation = ++generation_;
    auto on_latency = [this, generation](double latency_ms) {
        if (!dispatcher_) {
            onFrame(latency_ms);
            return;
        }
        dispatcher_([this, generation, latency_ms]() {
            // frames queued before stop() are dropped
            if (running_ && generation == generation_) {
                onFrame(latency_ms);
            }
        });
    };
    uint64_t token = 0;
    if (!source.subscribe(on_latency, token, error)) {
        if (error.empty()) {
            error = "frame latency source refused subscription";
        }
        return false;
    }
    source_ = &source;
    token_ = token;
    running_ = true;
    error.clear();
    return true;
}

void FrameTimingMonitor::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    generation_++;
    if (source_ != nullptr) {
        source_->unsubscribe(token_);
    }
    source_ = nullptr;
    token_ = 0;
}

void FrameTimingMonitor::reset() {
    window_.clear();
    frame_count_ = 0;
    rejected_ = 0;
    evicted_ = 0;
    current_fps_ = kDefaultFps;
}

void FrameTimingMonitor::onFrame(double latency_ms) {
    if (!std::isfinite(latency_ms) || latency_ms < 0.0) {
        rejected_++;
        return;
    }
    if (window_.pushDropOldest(latency_ms) == PushResult::DroppedOldest) {
        evicted_++;
    }
    frame_count_++;

    if ((frame_count_ % static_cast<uint64_t>(kFpsSampleSize)) == 0U) {
        recomputeFps();
        if (health_check_) {
            health_check_(current_fps_);
        }
    }
}

double FrameTimingMonitor::fpsFromMeanFrameTime(double mean_ms) {
    if (!(mean_ms > 0.0)) {
        // zero-latency frames would be infinitely fast
        return kMaxFps;
    }
    return std::clamp(1000.0 / mean_ms, 0.0, kMaxFps);
}

void FrameTimingMonitor::recomputeFps() {
    if (window_.empty()) {
        current_fps_ = kDefaultFps;
        return;
    }
    current_fps_ = fpsFromMeanFrameTime(window_.mean(kDefaultFrameTimeMs));
}

}  // namespace framegov
