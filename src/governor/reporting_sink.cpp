#include "governor/collaborators.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace framegov {

void LogReportingSink::publish(const PerformanceReport& report) {
    const PerformanceSnapshot& s = report.snapshot;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "[report] health=" << s.health_score << "/100"
        << " status=" << s.health_status
        << " fps=" << s.current_fps
        << " frame_ms=" << s.average_frame_time_ms
        << " memory_mb=" << s.memoryUsageMb()
        << " cache_hit_pct=" << (s.cache_hit_rate * 100.0)
        << " animations=" << s.active_handle_count
        << " render_mode=" << renderModeName(s.render_mode)
        << " cache_mode=" << cacheModeName(s.cache_mode)
        << " render_transitions=" << report.render_transitions
        << " cache_transitions=" << report.cache_transitions
        << " collaborator_failures=" << report.collaborator_failures
        << " scheduling_failures=" << report.scheduling_failures;
    if (s.memory_probe_degraded || s.cache_stats_degraded) {
        oss << " degraded=" << (s.memory_probe_degraded ? "memory" : "")
            << (s.memory_probe_degraded && s.cache_stats_degraded ? "," : "")
            << (s.cache_stats_degraded ? "cache" : "");
    }
    oss << "\n";
    if (!report.last_scheduling_error.empty()) {
        oss << "[report]   last scheduling error: " << report.last_scheduling_error << "\n";
    }
    for (const auto& rec : s.recommendations) {
        oss << "[report]   - " << rec << "\n";
    }
    std::cerr << oss.str();
}

}  // namespace framegov
