#include "cache/tiered_cache_provider.hpp"

#include <iostream>

namespace framegov {

void TieredCacheProvider::addTier(const std::string& name, CacheTier* tier) {
    if (tier != nullptr) {
        tiers_.emplace_back(name, tier);
    }
}

CacheStatistics TieredCacheProvider::collect() const {
    CacheStatistics stats;
    stats.tiers.reserve(tiers_.size());
    for (const auto& t : tiers_) {
        CacheTierStats s;
        s.name = t.first;
        s.entries = static_cast<uint64_t>(t.second->entries());
        s.hit_rate = t.second->hitRate();
        stats.tiers.push_back(s);
    }
    return stats;
}

void TieredCacheProvider::getStatistics(StatisticsCallback done) {
    loop_.post([this, done]() {
        if (done) {
            done(true, collect(), std::string());
        }
    });
}

void TieredCacheProvider::optimizeMemoryUsage(CompletionCallback done) {
    loop_.post([this, done]() {
        const int64_t now_ns = loop_.now();
        std::size_t freed = 0;
        for (const auto& t : tiers_) {
            freed += t.second->reclaim(now_ns, true);
        }
        optimizations_++;
        std::cerr << "[cache] optimization freed_entries=" << freed << " tiers=" << tiers_.size() << "\n";
        if (done) {
            done(true, std::string());
        }
    });
}

}  // namespace framegov
