#include "governor/performance_governor.hpp"

#include "support/governor_harness.hpp"

#include <iostream>
#include <memory>
#include <string>

using framegov::testing::GovernorHarness;
using framegov::testing::ReplyMode;

namespace {

framegov::GovernorConfig adaptiveOnly(int timeout_ms) {
    framegov::GovernorConfig cfg;
    cfg.adaptive_enable = true;
    cfg.adaptive_check_period_ms = 30000;
    cfg.reporting_enable = false;
    cfg.collaborator_timeout_ms = timeout_ms;
    return cfg;
}

int cacheAxisHysteresis() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(5000))) {
        std::cerr << "initialize failed\n";
        return 1;
    }
    h.memory.setMb(160.0);
    h.run(30000);
    if (h.governor.cacheMode() != framegov::CacheMode::Aggressive || h.cache.optimize_calls != 1 ||
        h.governor.memoryOptimizationRequests() != 1U) {
        std::cerr << "160 MB should enter aggressive mode and optimize once\n";
        return 1;
    }

    h.memory.setMb(170.0);
    h.run(30000);
    if (h.cache.optimize_calls != 1) {
        std::cerr << "staying above the threshold should not optimize again\n";
        return 1;
    }

    h.memory.setMb(120.0);
    h.run(30000);
    if (h.governor.cacheMode() != framegov::CacheMode::Aggressive) {
        std::cerr << "120 MB is inside the band and must not leave aggressive mode\n";
        return 1;
    }

    h.memory.setMb(90.0);
    h.run(30000);
    if (h.governor.cacheMode() != framegov::CacheMode::Normal || h.memory.calls != 4) {
        std::cerr << "90 MB should leave aggressive mode\n";
        return 1;
    }
    if (h.governor.telemetry().snapshot().cache_transitions != 2U || h.governor.collaboratorFailures() != 0U) {
        std::cerr << "expected two cache transitions and no failures\n";
        return 1;
    }
    if (h.loop.activeTimers() != 1U) {
        std::cerr << "settled requests should leave only the periodic timer, got " << h.loop.activeTimers() << "\n";
        return 1;
    }
    return 0;
}

int busyGuard() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(0))) {
        std::cerr << "initialize failed\n";
        return 1;
    }
    h.memory.mode = ReplyMode::Deferred;
    h.run(30000);
    if (!h.governor.adaptiveCheckInFlight() || h.memory.pendingCount() != 1U) {
        std::cerr << "adaptive check should be waiting on the memory probe\n";
        return 1;
    }
    h.run(60000);
    if (h.governor.skippedAdaptiveChecks() != 2U || h.memory.calls != 1) {
        std::cerr << "overlapping checks should be skipped, skipped=" << h.governor.skippedAdaptiveChecks() << "\n";
        return 1;
    }

    h.memory.setMb(200.0);
    h.memory.release();
    framegov::testing::drain(h.loop);
    if (h.governor.adaptiveCheckInFlight() || h.governor.cacheMode() != framegov::CacheMode::Aggressive) {
        std::cerr << "released reply should complete the check\n";
        return 1;
    }

    h.memory.mode = ReplyMode::Immediate;
    h.run(30000);
    if (h.memory.calls != 2 || h.governor.skippedAdaptiveChecks() != 2U) {
        std::cerr << "next tick should run normally\n";
        return 1;
    }
    return 0;
}

int timeoutAndLateReply() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(5000))) {
        std::cerr << "initialize failed\n";
        return 1;
    }
    h.memory.mode = ReplyMode::Deferred;
    h.run(30000);
    h.run(4000);
    if (!h.governor.adaptiveCheckInFlight()) {
        std::cerr << "check should still be waiting before the timeout\n";
        return 1;
    }
    h.run(1000);
    if (h.governor.adaptiveCheckInFlight() || h.governor.collaboratorFailures() != 1U) {
        std::cerr << "timeout should settle the request as unavailable\n";
        return 1;
    }
    if (h.cache.stats_calls != 1 || h.governor.cacheMode() != framegov::CacheMode::Normal) {
        std::cerr << "check should continue with the default memory reading\n";
        return 1;
    }

    // The reply arriving after the timeout is dropped.
    h.memory.setMb(400.0);
    h.memory.release();
    framegov::testing::drain(h.loop);
    if (h.governor.cacheMode() != framegov::CacheMode::Normal || h.cache.stats_calls != 1 ||
        h.governor.collaboratorFailures() != 1U) {
        std::cerr << "late reply must not be applied\n";
        return 1;
    }
    return 0;
}

int degradedReadings() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(5000))) {
        std::cerr << "initialize failed\n";
        return 1;
    }

    framegov::PerformanceSnapshot s;
    bool delivered = false;
    auto capture = [&](const framegov::PerformanceSnapshot& snap) {
        s = snap;
        delivered = true;
    };

    // No reading yet: defaults.
    h.memory.mode = ReplyMode::Fail;
    h.cache.stats_mode = ReplyMode::Fail;
    h.governor.getSnapshot(capture);
    framegov::testing::drain(h.loop);
    if (!delivered || !s.memory_probe_degraded || !s.cache_stats_degraded ||
        s.memory_usage_bytes != 0U || s.cache_hit_rate != 1.0) {
        std::cerr << "failed collaborators without history should fall back to defaults\n";
        return 1;
    }

    h.memory.mode = ReplyMode::Immediate;
    h.cache.stats_mode = ReplyMode::Immediate;
    h.memory.setMb(160.0);
    h.cache.setHitRate(0.4);
    delivered = false;
    h.governor.getSnapshot(capture);
    framegov::testing::drain(h.loop);
    if (!delivered || s.memory_probe_degraded || s.cache_stats_degraded || s.cache_hit_rate != 0.4) {
        std::cerr << "healthy collaborators should not be degraded\n";
        return 1;
    }
    if (s.recommendations.size() != 2U || s.health_status != "Fair") {
        std::cerr << "expected memory and cache recommendations, status=" << s.health_status << "\n";
        return 1;
    }

    // With history: last-known values.
    h.memory.mode = ReplyMode::Throw;
    h.cache.stats_mode = ReplyMode::Fail;
    delivered = false;
    h.governor.getSnapshot(capture);
    framegov::testing::drain(h.loop);
    if (!delivered || !s.memory_probe_degraded || !s.cache_stats_degraded ||
        s.memory_usage_bytes != h.memory.bytes || s.cache_hit_rate != 0.4) {
        std::cerr << "failed collaborators should fall back to the last readings\n";
        return 1;
    }
    if (h.governor.lastHealthScore() != s.health_score) {
        std::cerr << "last health score should follow the latest snapshot\n";
        return 1;
    }

    // The adaptive check still runs its cache axis on the last reading.
    h.run(30000);
    if (h.governor.cacheMode() != framegov::CacheMode::Aggressive) {
        std::cerr << "last known 160 MB should drive the cache axis\n";
        return 1;
    }
    return 0;
}

int repliesAfterDispose() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(0))) {
        std::cerr << "initialize failed\n";
        return 1;
    }
    h.memory.mode = ReplyMode::Deferred;
    bool delivered = false;
    h.governor.getSnapshot([&](const framegov::PerformanceSnapshot&) { delivered = true; });
    h.run(30000);
    h.governor.dispose();
    h.memory.setMb(500.0);
    h.memory.release();
    framegov::testing::drain(h.loop);
    if (delivered || h.cache.stats_calls != 0 || h.cache.optimize_calls != 0) {
        std::cerr << "replies after dispose must be dropped\n";
        return 1;
    }

    // Destroyed governor: the pending reply must not touch it.
    framegov::testing::ManualClock clock;
    framegov::EventLoop loop(clock.fn());
    framegov::testing::FakeFrameSource frames;
    framegov::testing::FakeMemoryProbe memory;
    framegov::testing::FakeCacheProvider cache;
    memory.mode = ReplyMode::Deferred;
    framegov::GovernorCollaborators deps;
    deps.frames = &frames;
    deps.cache = &cache;
    deps.memory = &memory;
    {
        auto g = std::make_unique<framegov::PerformanceGovernor>(loop, deps);
        std::string error;
        if (!g->initialize(adaptiveOnly(5000), error)) {
            std::cerr << "initialize failed: " << error << "\n";
            return 1;
        }
        g->runAdaptiveCheck();
    }
    memory.release();
    framegov::testing::advance(loop, clock, 10000);
    if (cache.stats_calls != 0) {
        std::cerr << "reply after destruction must be dropped\n";
        return 1;
    }
    return 0;
}

int forcedOptimization() {
    GovernorHarness h;
    if (!h.start(adaptiveOnly(5000))) {
        std::cerr << "initialize failed\n";
        return 1;
    }

    h.lifecycle.background();
    if (h.cache.optimize_calls != 0) {
        std::cerr << "backgrounded signal should be handled on the loop\n";
        return 1;
    }
    framegov::testing::drain(h.loop);
    if (h.cache.optimize_calls != 1 || h.reclaimer.calls != 1) {
        std::cerr << "backgrounded host should trigger cache and host reclaim\n";
        return 1;
    }

    bool ok = false;
    std::string err;
    h.governor.forceMemoryOptimization([&](bool result, const std::string& e) {
        ok = result;
        err = e;
    });
    framegov::testing::drain(h.loop);
    if (!ok || !err.empty() || h.cache.optimize_calls != 2) {
        std::cerr << "forced optimization should succeed\n";
        return 1;
    }

    h.reclaimer.fail = true;
    h.governor.forceMemoryOptimization([&](bool result, const std::string& e) {
        ok = result;
        err = e;
    });
    framegov::testing::drain(h.loop);
    if (ok || err.find("host refused") == std::string::npos) {
        std::cerr << "host reclaim failure should be reported, got: " << err << "\n";
        return 1;
    }

    h.reclaimer.fail = false;
    h.cache.optimize_mode = ReplyMode::Throw;
    h.governor.forceMemoryOptimization([&](bool result, const std::string& e) {
        ok = result;
        err = e;
    });
    framegov::testing::drain(h.loop);
    if (ok || err.find("eviction exploded") == std::string::npos || h.governor.collaboratorFailures() != 1U) {
        std::cerr << "throwing cache collaborator should be contained, got: " << err << "\n";
        return 1;
    }

    // A signal queued before dispose does nothing.
    h.cache.optimize_mode = ReplyMode::Immediate;
    const int before = h.cache.optimize_calls;
    h.lifecycle.background();
    h.governor.dispose();
    framegov::testing::drain(h.loop);
    if (h.cache.optimize_calls != before) {
        std::cerr << "backgrounded signal after dispose must be ignored\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main() {
    if (cacheAxisHysteresis() != 0) return 1;
    if (busyGuard() != 0) return 1;
    if (timeoutAndLateReply() != 0) return 1;
    if (degradedReadings() != 0) return 1;
    if (repliesAfterDispose() != 0) return 1;
    if (forcedOptimization() != 0) return 1;
    return 0;
}
