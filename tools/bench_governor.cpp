#include "core/time_utils.hpp"
#include "governor/animation_registry.hpp"
#include "governor/mode_controller.hpp"
#include "monitor/frame_timing_monitor.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

namespace {

int64_t pct(std::vector<int64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}

}  // namespace

int main() {
    constexpr int kFrames = 600000;
    constexpr int kHandles = 2000;

    framegov::GovernorConfig cfg;
    framegov::ModeController controller(cfg);
    framegov::AnimationRegistry registry;
    framegov::FrameTimingMonitor monitor;
    uint64_t transitions = 0;
    monitor.setHealthCheckCallback([&](double fps) {
        const auto t = controller.evaluateRender(fps);
        if (t == framegov::ModeTransition::Entered) {
            (void)registry.applyLowPowerScaling();
        }
        if (t != framegov::ModeTransition::None) {
            transitions++;
        }
    });

    std::mt19937 rng(42U);
    std::uniform_real_distribution<double> fast(14.0, 19.0);
    std::uniform_real_distribution<double> slow(25.0, 45.0);
    for (int i = 0; i < kHandles; ++i) {
        (void)registry.registerHandle(static_cast<double>(100 + (i % 20) * 100), "bench", controller.renderMode());
    }

    std::vector<int64_t> frame_ns;
    frame_ns.reserve(kFrames);
    const int64_t t_start = framegov::nowSteadyNs();
    for (int i = 0; i < kFrames; ++i) {
        // alternate healthy and degraded phases of 6000 frames
        const bool degraded = ((i / 6000) % 2) == 1;
        const double latency = degraded ? slow(rng) : fast(rng);
        const int64_t a = framegov::nowSteadyNs();
        monitor.onFrame(latency);
        frame_ns.push_back(framegov::nowSteadyNs() - a);
    }
    const int64_t t_end = framegov::nowSteadyNs();
    const double elapsed_s = framegov::nsToMs(t_end - t_start) / 1000.0;

    std::vector<int64_t> scale_ns;
    for (int i = 0; i < 200; ++i) {
        const int64_t a = framegov::nowSteadyNs();
        (void)registry.applyLowPowerScaling();
        scale_ns.push_back(framegov::nowSteadyNs() - a);
    }

    std::cout << "benchmark frame_timing_monitor\n";
    std::cout << "frames " << kFrames << "\n";
    std::cout << "frames_per_s " << (elapsed_s > 0.0 ? static_cast<double>(kFrames) / elapsed_s : 0.0) << "\n";
    std::cout << "on_frame_ns_p50 " << pct(frame_ns, 0.50) << "\n";
    std::cout << "on_frame_ns_p99 " << pct(frame_ns, 0.99) << "\n";
    std::cout << "on_frame_ns_max " << pct(frame_ns, 1.0) << "\n";
    std::cout << "render_transitions " << transitions << "\n";
    std::cout << "handles " << registry.count() << "\n";
    std::cout << "apply_low_power_ns_p50 " << pct(scale_ns, 0.50) << "\n";
    std::cout << "apply_low_power_ns_p99 " << pct(scale_ns, 0.99) << "\n";
    return 0;
}
