#include "governor/mode_controller.hpp"

#include <algorithm>
#include <cmath>

namespace framegov {

ModeController::ModeController(const GovernorConfig& cfg) {
    updateConfig(cfg);
    reset();
}

void ModeController::updateConfig(const GovernorConfig& cfg) {
    render_enter_fps_ = std::max(0.0, cfg.min_acceptable_fps);
    render_exit_fps_ = std::max(render_enter_fps_, cfg.lowPowerExitFps());
    cache_enter_mb_ = std::max(0.0, cfg.memory_critical_mb);
    cache_exit_mb_ = std::min(cache_enter_mb_, std::max(0.0, cfg.memory_warning_mb));
}

void ModeController::reset() {
    render_mode_ = RenderMode::Normal;
    cache_mode_ = CacheMode::Normal;
}

ModeTransition ModeController::evaluateRender(double fps) {
    if (std::isnan(fps)) {
        return ModeTransition::None;
    }
    if (render_mode_ == RenderMode::Normal) {
        if (fps < render_enter_fps_) {
            render_mode_ = RenderMode::LowPower;
            return ModeTransition::Entered;
        }
        return ModeTransition::None;
    }
    if (fps > render_exit_fps_) {
        render_mode_ = RenderMode::Normal;
        return ModeTransition::Exited;
    }
    return ModeTransition::None;
}

ModeTransition ModeController::evaluateCache(double memory_mb) {
    if (std::isnan(memory_mb)) {
        return ModeTransition::None;
    }
    if (cache_mode_ == CacheMode::Normal) {
        if (memory_mb > cache_enter_mb_) {
            cache_mode_ = CacheMode::Aggressive;
            return ModeTransition::Entered;
        }
        return ModeTransition::None;
    }
    if (memory_mb < cache_exit_mb_) {
        cache_mode_ = CacheMode::Normal;
        return ModeTransition::Exited;
    }
    return ModeTransition::None;
}

}  // namespace framegov
