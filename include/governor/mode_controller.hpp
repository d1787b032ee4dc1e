#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

namespace framegov {

enum class ModeTransition {
    None,
    Entered,
    Exited,
};

// Two independent hysteresis axes. Each axis has distinct enter and exit
// thresholds; inputs inside the band between them never change state.
class ModeController {
public:
    explicit ModeController(const GovernorConfig& cfg);

    void reset();
    void updateConfig(const GovernorConfig& cfg);

    // Render axis: enter low power below min_acceptable_fps, leave above
    // target_fps * recovery_fraction.
    ModeTransition evaluateRender(double fps);

    // Cache axis: enter aggressive above memory_critical_mb, leave below
    // memory_warning_mb.
    ModeTransition evaluateCache(double memory_mb);

    RenderMode renderMode() const { return render_mode_; }
    CacheMode cacheMode() const { return cache_mode_; }

    double renderEnterFps() const { return render_enter_fps_; }
    double renderExitFps() const { return render_exit_fps_; }
    double cacheEnterMb() const { return cache_enter_mb_; }
    double cacheExitMb() const { return cache_exit_mb_; }

private:
    double render_enter_fps_{45.0};
    double render_exit_fps_{54.0};
    double cache_enter_mb_{150.0};
    double cache_exit_mb_{100.0};
    RenderMode render_mode_{RenderMode::Normal};
    CacheMode cache_mode_{CacheMode::Normal};
};

}  // namespace framegov
