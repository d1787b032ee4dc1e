#include "cache/tiered_cache_provider.hpp"
#include "cache/tracked_cache.hpp"

#include "support/fake_collaborators.hpp"

#include <iostream>
#include <string>

int main() {
    const int64_t ttl_ns = framegov::msToNs(1000);
    framegov::TrackedLruCache<int, std::string> cache(4, ttl_ns);

    if (cache.hitRate() != 1.0) {
        std::cerr << "cache with no traffic should report a perfect hit rate\n";
        return 1;
    }

    int64_t now = 0;
    for (int i = 0; i < 4; ++i) {
        cache.put(i, "v" + std::to_string(i), now);
    }
    if (!cache.get(0, now)) {
        std::cerr << "expected hit for key 0\n";
        return 1;
    }
    // key 1 is now least recently used
    cache.put(4, "v4", now);
    if (cache.entries() != 4U || cache.get(1, now)) {
        std::cerr << "LRU entry should be evicted at capacity\n";
        return 1;
    }
    if (cache.hits() != 1U || cache.misses() != 1U || cache.hitRate() != 0.5) {
        std::cerr << "hit/miss accounting mismatch\n";
        return 1;
    }

    now += framegov::msToNs(1500);
    if (cache.get(0, now)) {
        std::cerr << "expired entry should miss\n";
        return 1;
    }
    cache.put(5, "v5", now);
    const std::size_t freed = cache.reclaim(now, false);
    if (freed != 3U || cache.entries() != 1U) {
        std::cerr << "reclaim should drop every expired entry, freed " << freed << "\n";
        return 1;
    }

    for (int i = 10; i < 14; ++i) {
        cache.put(i, "x", now);
    }
    if (cache.reclaim(now, true) != 2U || cache.entries() != 2U) {
        std::cerr << "aggressive reclaim should trim to half capacity\n";
        return 1;
    }
    if (!cache.erase(13) || cache.erase(13)) {
        std::cerr << "erase should succeed once\n";
        return 1;
    }

    // Provider answers on the loop with one entry per tier.
    framegov::testing::ManualClock clock;
    framegov::EventLoop loop(clock.fn());
    framegov::TieredCacheProvider provider(loop);
    framegov::TrackedLruCache<int, int> a(10, 0);
    framegov::TrackedLruCache<int, int> b(10, 0);
    provider.addTier("a", &a);
    provider.addTier("b", &b);
    provider.addTier("null", nullptr);
    for (int i = 0; i < 8; ++i) {
        a.put(i, i, clock.now());
        b.put(i, i, clock.now());
    }
    (void)a.get(0, clock.now());
    (void)a.get(99, clock.now());

    bool answered = false;
    framegov::CacheStatistics got;
    provider.getStatistics([&](bool ok, const framegov::CacheStatistics& stats, const std::string&) {
        answered = ok;
        got = stats;
    });
    if (answered) {
        std::cerr << "statistics should be answered on the loop, not inline\n";
        return 1;
    }
    framegov::testing::drain(loop);
    if (!answered || got.tiers.size() != 2U || got.totalEntries() != 16U) {
        std::cerr << "statistics should list both tiers\n";
        return 1;
    }
    if (got.overallHitRate() != 0.75) {
        std::cerr << "overall hit rate should average the tiers, got " << got.overallHitRate() << "\n";
        return 1;
    }

    bool optimized = false;
    provider.optimizeMemoryUsage([&](bool ok, const std::string&) { optimized = ok; });
    framegov::testing::drain(loop);
    if (!optimized || provider.optimizations() != 1U || a.entries() != 5U || b.entries() != 5U) {
        std::cerr << "optimization should trim every tier to half capacity\n";
        return 1;
    }

    if (framegov::CacheStatistics{}.overallHitRate() != 1.0) {
        std::cerr << "no tiers should report a perfect hit rate\n";
        return 1;
    }
    return 0;
}
