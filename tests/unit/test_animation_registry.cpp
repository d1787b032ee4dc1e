#include "governor/animation_registry.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <map>

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

}  // namespace

int main() {
    framegov::AnimationRegistry reg;

    const framegov::AnimationHandle normal = reg.registerHandle(1000.0, "fade", framegov::RenderMode::Normal);
    if (!normal.valid() || !near(normal.effective_duration_ms, 1000.0)) {
        std::cerr << "normal mode should keep the nominal duration\n";
        return 1;
    }
    const framegov::AnimationHandle low = reg.registerHandle(1000.0, "slide", framegov::RenderMode::LowPower);
    if (!low.valid() || !near(low.effective_duration_ms, 800.0)) {
        std::cerr << "low power mode should scale new handles to 0.8x\n";
        return 1;
    }
    if (low.id == normal.id || reg.count() != 2U) {
        std::cerr << "handles should get distinct ids\n";
        return 1;
    }

    if (reg.registerHandle(-5.0, "bad", framegov::RenderMode::Normal).valid() ||
        reg.registerHandle(std::numeric_limits<double>::infinity(), "bad", framegov::RenderMode::Normal).valid() ||
        reg.registerHandle(std::numeric_limits<double>::quiet_NaN(), "bad", framegov::RenderMode::Normal).valid()) {
        std::cerr << "invalid durations should be rejected\n";
        return 1;
    }
    if (reg.count() != 2U) {
        std::cerr << "rejected handles must not be tracked\n";
        return 1;
    }
    const framegov::AnimationHandle zero = reg.registerHandle(0.0, "instant", framegov::RenderMode::Normal);
    if (!zero.valid()) {
        std::cerr << "zero duration is valid\n";
        return 1;
    }

    std::map<uint64_t, double> rewritten;
    const framegov::AnimationHandle short_one = reg.registerHandle(
        400.0, "tap", framegov::RenderMode::Normal,
        [&](uint64_t id, double ms) { rewritten[id] = ms; });
    const framegov::AnimationHandle long_one = reg.registerHandle(
        1200.0, "spin", framegov::RenderMode::Normal,
        [&](uint64_t id, double ms) { rewritten[id] = ms; });
    const framegov::AnimationHandle edge = reg.registerHandle(
        500.0, "edge", framegov::RenderMode::Normal,
        [&](uint64_t id, double ms) { rewritten[id] = ms; });

    const std::size_t scaled = reg.applyLowPowerScaling();
    if (scaled != 3U) {
        std::cerr << "expected 3 long handles rescaled, got " << scaled << "\n";
        return 1;
    }
    if (!near(*reg.effectiveDurationMs(long_one.id), 840.0) ||
        !near(*reg.effectiveDurationMs(normal.id), 700.0) ||
        !near(*reg.effectiveDurationMs(low.id), 700.0)) {
        std::cerr << "live long handles should become nominal * 0.7\n";
        return 1;
    }
    if (!near(*reg.effectiveDurationMs(short_one.id), 400.0) || !near(*reg.effectiveDurationMs(edge.id), 500.0)) {
        std::cerr << "handles at or below 500 ms should be untouched\n";
        return 1;
    }
    if (rewritten.size() != 1U || !near(rewritten[long_one.id], 840.0)) {
        std::cerr << "only rewritten handles should notify their listener\n";
        return 1;
    }

    // Repeated entries never compound.
    rewritten.clear();
    if (reg.applyLowPowerScaling() != 0U || !near(*reg.effectiveDurationMs(long_one.id), 840.0) || !rewritten.empty()) {
        std::cerr << "second scaling pass should be a no-op\n";
        return 1;
    }
    if (!near(*reg.nominalDurationMs(long_one.id), 1200.0)) {
        std::cerr << "nominal duration must never change\n";
        return 1;
    }

    reg.recordFrame(long_one.id);
    reg.recordFrame(long_one.id);
    if (*reg.frameCount(long_one.id) != 2U || *reg.label(long_one.id) != "spin") {
        std::cerr << "frame count or label mismatch\n";
        return 1;
    }

    if (!reg.remove(long_one.id) || reg.remove(long_one.id) || reg.contains(long_one.id)) {
        std::cerr << "remove should be a no-op the second time\n";
        return 1;
    }
    if (reg.effectiveDurationMs(long_one.id).has_value()) {
        std::cerr << "removed handle should not be queryable\n";
        return 1;
    }
    reg.recordFrame(long_one.id);

    // A listener may remove its own handle while being notified.
    framegov::AnimationRegistry self_removing;
    uint64_t victim = 0;
    const framegov::AnimationHandle h = self_removing.registerHandle(
        900.0, "victim", framegov::RenderMode::Normal,
        [&](uint64_t id, double) { victim = id; (void)self_removing.remove(id); });
    if (self_removing.applyLowPowerScaling() != 1U || victim != h.id || self_removing.count() != 0U) {
        std::cerr << "listener removal during scaling should be safe\n";
        return 1;
    }

    const uint64_t last_id = zero.id;
    reg.clear();
    const framegov::AnimationHandle after = reg.registerHandle(100.0, "next", framegov::RenderMode::Normal);
    if (reg.count() != 1U || after.id <= last_id) {
        std::cerr << "ids should never be reused after clear\n";
        return 1;
    }

    framegov::AnimationRegistry::Scaling custom;
    custom.new_handle_scale = 0.5;
    custom.live_handle_scale = 0.25;
    custom.long_animation_ms = 100.0;
    framegov::AnimationRegistry tuned(custom);
    const framegov::AnimationHandle t = tuned.registerHandle(200.0, "tuned", framegov::RenderMode::LowPower);
    if (!near(t.effective_duration_ms, 100.0) || tuned.applyLowPowerScaling() != 1U ||
        !near(*tuned.effectiveDurationMs(t.id), 50.0)) {
        std::cerr << "custom scaling factors should apply\n";
        return 1;
    }
    return 0;
}
