#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace framegov {

enum class RenderMode {
    Normal = 0,
    LowPower = 1,
};

enum class CacheMode {
    Normal = 0,
    Aggressive = 1,
};

const char* renderModeName(RenderMode mode);
const char* cacheModeName(CacheMode mode);

struct CacheTierStats {
    std::string name;
    uint64_t entries{0};
    double hit_rate{0.0};
};

// Supplied by the cache collaborator; read-only for the governor.
struct CacheStatistics {
    std::vector<CacheTierStats> tiers;

    // Mean of the tier hit rates, 1.0 when nothing is reported.
    double overallHitRate() const;
    uint64_t totalEntries() const;
};

struct PerformanceSnapshot {
    double current_fps{60.0};
    double average_frame_time_ms{16.67};
    RenderMode render_mode{RenderMode::Normal};
    CacheMode cache_mode{CacheMode::Normal};
    int active_handle_count{0};
    uint64_t memory_usage_bytes{0};
    double cache_hit_rate{1.0};
    double health_score{100.0};
    std::string health_status{"Excellent"};
    std::vector<std::string> recommendations;
    bool memory_probe_degraded{false};
    bool cache_stats_degraded{false};
    int64_t captured_at_ns{0};

    double memoryUsageMb() const;
};

struct PerformanceReport {
    PerformanceSnapshot snapshot;
    uint64_t scheduling_failures{0};
    std::string last_scheduling_error;
    uint64_t collaborator_failures{0};
    uint64_t render_transitions{0};
    uint64_t cache_transitions{0};
};

constexpr double kBytesPerMb = 1024.0 * 1024.0;

inline double bytesToMb(uint64_t bytes) { return static_cast<double>(bytes) / kBytesPerMb; }

}  // namespace framegov
