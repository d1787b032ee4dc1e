#pragma once

#include <string>

namespace framegov {

// Number of frame samples kept in the sliding window; FPS is recomputed once
// per this many frames.
constexpr int kFpsSampleSize = 60;

struct GovernorConfig {
    bool adaptive_enable{true};
    int adaptive_check_period_ms{30000};
    bool reporting_enable{true};
    int report_period_ms{300000};
    int collaborator_timeout_ms{5000}; // 0 disables the timeout
    double target_fps{60.0};
    double min_acceptable_fps{45.0};
    double recovery_fraction{0.9};    // exit low power above target_fps * fraction
    double memory_critical_mb{150.0};
    double memory_warning_mb{100.0};
    double low_power_scale_new{0.8};  // applied to handles created in low power
    double low_power_scale_live{0.7}; // applied to live handles on low power entry
    int long_animation_ms{500};

    double lowPowerExitFps() const { return target_fps * recovery_fraction; }
};

struct HostConfig {
    std::string frame_source{"synthetic"};
    double synthetic_frame_ms{16.667};
    double synthetic_jitter_ms{1.0};
    int cache_capacity{200};
    int cache_ttl_ms{7200000};
};

struct ControlConfig {
    bool enable{true};
    std::string socket_path{"/tmp/framegov.sock"};
};

struct AppConfig {
    GovernorConfig governor;
    HostConfig host;
    ControlConfig control;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);
bool validateGovernorConfig(const GovernorConfig& cfg, std::string& error);

}  // namespace framegov
