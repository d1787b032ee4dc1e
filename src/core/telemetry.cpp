#include "core/telemetry.hpp"

namespace framegov {

void Telemetry::setInitialized(bool value) { initialized_.store(value); }
void Telemetry::setFps(double value) { fps_.store(value); }
void Telemetry::setHealthScore(double value) { health_score_.store(value); }
void Telemetry::setRenderMode(RenderMode mode) { render_mode_.store(static_cast<int>(mode)); }
void Telemetry::setCacheMode(CacheMode mode) { cache_mode_.store(static_cast<int>(mode)); }
void Telemetry::setActiveHandles(int value) { active_handles_.store(value); }
void Telemetry::setMemoryUsageBytes(uint64_t value) { memory_usage_bytes_.store(value); }
void Telemetry::setCacheHitRate(double value) { cache_hit_rate_.store(value); }
void Telemetry::setFrames(uint64_t value) { frames_.store(value); }
void Telemetry::countRenderTransition() { render_transitions_.fetch_add(1); }
void Telemetry::countCacheTransition() { cache_transitions_.fetch_add(1); }

void Telemetry::reset() {
    initialized_.store(false);
    fps_.store(60.0);
    health_score_.store(100.0);
    render_mode_.store(0);
    cache_mode_.store(0);
    active_handles_.store(0);
    memory_usage_bytes_.store(0);
    cache_hit_rate_.store(1.0);
    frames_.store(0);
}

TelemetrySnapshot Telemetry::snapshot() const {
    TelemetrySnapshot s;
    s.initialized = initialized_.load();
    s.fps = fps_.load();
    s.health_score = health_score_.load();
    s.render_mode = static_cast<RenderMode>(render_mode_.load());
    s.cache_mode = static_cast<CacheMode>(cache_mode_.load());
    s.active_handles = active_handles_.load();
    s.memory_usage_bytes = memory_usage_bytes_.load();
    s.cache_hit_rate = cache_hit_rate_.load();
    s.frames = frames_.load();
    s.render_transitions = render_transitions_.load();
    s.cache_transitions = cache_transitions_.load();
    return s;
}

}  // namespace framegov
