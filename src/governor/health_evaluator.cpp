#include "governor/health_evaluator.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace framegov {

namespace {

constexpr double kTargetFps = 60.0;
constexpr double kMemoryCeilingMb = 200.0;
constexpr double kFpsWeight = 40.0;
constexpr double kMemoryWeight = 30.0;
constexpr double kCacheWeight = 30.0;

constexpr double kLowFps = 45.0;
constexpr double kHighMemoryMb = 100.0;
constexpr double kLowHitRate = 0.7;
constexpr int kManyAnimations = 5;

double unit(double v) {
    if (std::isnan(v)) {
        return 0.0;
    }
    return std::clamp(v, 0.0, 1.0);
}

}  // namespace

double healthScore(double fps, double memory_mb, double cache_hit_rate) {
    const double fps_score = unit(fps / kTargetFps) * kFpsWeight;
    const double memory_score = (1.0 - unit(memory_mb / kMemoryCeilingMb)) * kMemoryWeight;
    const double cache_score = unit(cache_hit_rate) * kCacheWeight;
    return std::clamp(fps_score + memory_score + cache_score, 0.0, 100.0);
}

const char* healthStatus(double score) {
    if (score >= 85.0) return "Excellent";
    if (score >= 70.0) return "Good";
    if (score >= 50.0) return "Fair";
    return "Poor";
}

HealthReport evaluateHealth(const HealthInputs& in) {
    const double memory_mb = bytesToMb(in.memory_usage_bytes);

    HealthReport out;
    out.score = healthScore(in.fps, memory_mb, in.cache_hit_rate);

    if (in.fps < kLowFps) {
        out.recommendations.emplace_back("Consider reducing animation complexity or duration");
    }
    if (memory_mb > kHighMemoryMb) {
        out.recommendations.emplace_back("Memory usage is high, consider clearing caches");
    }
    if (in.cache_hit_rate < kLowHitRate) {
        out.recommendations.emplace_back("Cache hit rate is low, review caching strategy");
    }
    out.has_performance_issues = !out.recommendations.empty();
    if (in.active_handle_count > kManyAnimations) {
        out.recommendations.emplace_back("Multiple animations active, consider staggering them");
    }
    return out;
}

}  // namespace framegov
