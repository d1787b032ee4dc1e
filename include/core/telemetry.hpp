#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstdint>

namespace framegov {

struct TelemetrySnapshot {
    bool initialized{false};
    double fps{60.0};
    double health_score{100.0};
    RenderMode render_mode{RenderMode::Normal};
    CacheMode cache_mode{CacheMode::Normal};
    int active_handles{0};
    uint64_t memory_usage_bytes{0};
    double cache_hit_rate{1.0};
    uint64_t frames{0};
    uint64_t render_transitions{0};
    uint64_t cache_transitions{0};
};

// Written on the governor's loop, readable from any thread.
class Telemetry {
public:
    void setInitialized(bool value);
    void setFps(double value);
    void setHealthScore(double value);
    void setRenderMode(RenderMode mode);
    void setCacheMode(CacheMode mode);
    void setActiveHandles(int value);
    void setMemoryUsageBytes(uint64_t value);
    void setCacheHitRate(double value);
    void setFrames(uint64_t value);
    void countRenderTransition();
    void countCacheTransition();
    void reset();

    TelemetrySnapshot snapshot() const;

private:
    std::atomic<bool> initialized_{false};
    std::atomic<double> fps_{60.0};
    std::atomic<double> health_score_{100.0};
    std::atomic<int> render_mode_{0};
    std::atomic<int> cache_mode_{0};
    std::atomic<int> active_handles_{0};
    std::atomic<uint64_t> memory_usage_bytes_{0};
    std::atomic<double> cache_hit_rate_{1.0};
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> render_transitions_{0};
    std::atomic<uint64_t> cache_transitions_{0};
};

}  // namespace framegov
