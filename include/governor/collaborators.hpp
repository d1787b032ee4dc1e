#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace framegov {

// Interfaces the governor consumes but does not own. Completion callbacks may
// be invoked synchronously or later from any thread; the governor marshals
// them back onto its event loop.

class FrameLatencySource {
public:
    using FrameCallback = std::function<void(double latency_ms)>;

    virtual ~FrameLatencySource() = default;
    virtual bool subscribe(FrameCallback callback, uint64_t& token, std::string& error) = 0;
    virtual void unsubscribe(uint64_t token) = 0;
};

class CacheStatisticsProvider {
public:
    using StatisticsCallback = std::function<void(bool ok, const CacheStatistics& stats, const std::string& error)>;
    using CompletionCallback = std::function<void(bool ok, const std::string& error)>;

    virtual ~CacheStatisticsProvider() = default;
    virtual void getStatistics(StatisticsCallback done) = 0;
    virtual void optimizeMemoryUsage(CompletionCallback done) = 0;
};

class MemoryProbe {
public:
    using UsageCallback = std::function<void(bool ok, uint64_t bytes, const std::string& error)>;

    virtual ~MemoryProbe() = default;
    virtual void currentUsageBytes(UsageCallback done) = 0;
};

class HostLifecycle {
public:
    using SignalCallback = std::function<void()>;

    virtual ~HostLifecycle() = default;
    virtual bool subscribeBackgrounded(SignalCallback callback, uint64_t& token, std::string& error) = 0;
    virtual void unsubscribe(uint64_t token) = 0;
};

// Host-level hint that the process should hand free memory back.
class MemoryReclaimer {
public:
    virtual ~MemoryReclaimer() = default;
    virtual bool reclaim(std::string& error) = 0;
};

class ReportingSink {
public:
    virtual ~ReportingSink() = default;
    virtual void publish(const PerformanceReport& report) = 0;
};

// Writes reports to stderr in the same key=value form as the rest of the logs.
class LogReportingSink : public ReportingSink {
public:
    void publish(const PerformanceReport& report) override;
};

struct GovernorCollaborators {
    FrameLatencySource* frames{nullptr};
    CacheStatisticsProvider* cache{nullptr};
    MemoryProbe* memory{nullptr};
    HostLifecycle* lifecycle{nullptr}; // optional
    MemoryReclaimer* reclaimer{nullptr}; // optional
    ReportingSink* sink{nullptr}; // optional, defaults to LogReportingSink
};

}  // namespace framegov
