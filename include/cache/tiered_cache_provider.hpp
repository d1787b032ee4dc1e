#pragma once

#include "cache/tracked_cache.hpp"
#include "core/event_loop.hpp"
#include "governor/collaborators.hpp"

#include <string>
#include <utility>
#include <vector>

namespace framegov {

// Exposes a set of named cache tiers to the governor. Tiers are borrowed and
// must only be touched on the given loop; requests are answered there.
class TieredCacheProvider : public CacheStatisticsProvider {
public:
    explicit TieredCacheProvider(EventLoop& loop) : loop_(loop) {}

    void addTier(const std::string& name, CacheTier* tier);

    void getStatistics(StatisticsCallback done) override;
    void optimizeMemoryUsage(CompletionCallback done) override;

    CacheStatistics collect() const;
    uint64_t optimizations() const { return optimizations_; }

private:
    EventLoop& loop_;
    std::vector<std::pair<std::string, CacheTier*>> tiers_;
    uint64_t optimizations_{0};
};

}  // namespace framegov
