#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace framegov {

struct HealthInputs {
    double fps{60.0};
    uint64_t memory_usage_bytes{0};
    double cache_hit_rate{1.0};
    int active_handle_count{0};
};

struct HealthReport {
    double score{100.0};
    std::vector<std::string> recommendations;
    bool has_performance_issues{false};
};

// Weighted 0-100 score: rendering 40, memory 30, cache 30.
double healthScore(double fps, double memory_mb, double cache_hit_rate);

// Excellent >= 85, Good >= 70, Fair >= 50, otherwise Poor.
const char* healthStatus(double score);

HealthReport evaluateHealth(const HealthInputs& in);

}  // namespace framegov
