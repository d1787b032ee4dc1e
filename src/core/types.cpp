#include "core/types.hpp"

namespace framegov {

const char* renderModeName(RenderMode mode) {
    return mode == RenderMode::LowPower ? "low_power" : "normal";
}

const char* cacheModeName(CacheMode mode) {
    return mode == CacheMode::Aggressive ? "aggressive" : "normal";
}

double CacheStatistics::overallHitRate() const {
    if (tiers.empty()) {
        return 1.0;
    }
    double sum = 0.0;
    for (const auto& t : tiers) {
        sum += t.hit_rate;
    }
    return sum / static_cast<double>(tiers.size());
}

uint64_t CacheStatistics::totalEntries() const {
    uint64_t total = 0;
    for (const auto& t : tiers) {
        total += t.entries;
    }
    return total;
}

double PerformanceSnapshot::memoryUsageMb() const {
    return bytesToMb(memory_usage_bytes);
}

}  // namespace framegov
