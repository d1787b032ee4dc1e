#pragma once

#include "core/config.hpp"
#include "governor/collaborators.hpp"
#include "monitor/sliding_window.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace framegov {

class FrameTimingMonitor {
public:
    using HealthCheckCallback = std::function<void(double fps)>;
    // Moves a frame event onto the owning execution context. Frames are
    // handled inline when no dispatcher is set.
    using Dispatcher = std::function<void(std::function<void()>)>;

    static constexpr double kDefaultFps = 60.0;
    static constexpr double kMaxFps = 120.0;
    static constexpr double kDefaultFrameTimeMs = 16.67;

    FrameTimingMonitor();
    ~FrameTimingMonitor();

    FrameTimingMonitor(const FrameTimingMonitor&) = delete;
    FrameTimingMonitor& operator=(const FrameTimingMonitor&) = delete;

    void setHealthCheckCallback(HealthCheckCallback callback);
    void setDispatcher(Dispatcher dispatcher);

    // Subscribes to the source; a second call while running is a no-op.
    bool start(FrameLatencySource& source, std::string& error);
    void stop();
    void reset();

    void onFrame(double latency_ms);

    bool isRunning() const { return running_; }
    double currentFps() const { return current_fps_; }
    double averageFrameTimeMs() const { return window_.mean(kDefaultFrameTimeMs); }
    std::size_t windowSize() const { return window_.size(); }
    uint64_t frameCount() const { return frame_count_; }
    uint64_t rejectedSamples() const { return rejected_; }
    // Samples pushed out of the full window since the last reset().
    uint64_t evictedSamples() const { return evicted_; }

    static double fpsFromMeanFrameTime(double mean_ms);

private:
    void recomputeFps();

    SlidingWindow<double> window_{static_cast<std::size_t>(kFpsSampleSize)};
    HealthCheckCallback health_check_{};
    Dispatcher dispatcher_{};
    FrameLatencySource* source_{nullptr};
    uint64_t token_{0};
    bool running_{false};
    uint64_t generation_{0};
    uint64_t frame_count_{0};
    uint64_t rejected_{0};
    uint64_t evicted_{0};
    double current_fps_{kDefaultFps};
};

}  // namespace framegov
