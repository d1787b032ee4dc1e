#include "cache/tiered_cache_provider.hpp"
#include "cache/tracked_cache.hpp"
#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "core/time_utils.hpp"
#include "governor/performance_governor.hpp"
#include "host/process_memory_probe.hpp"
#include "host/synthetic_frame_source.hpp"
#include "ipc/control_plane.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>

namespace {

std::atomic<bool> g_running{true};
std::atomic<bool> g_backgrounded{false};

constexpr int kHousekeepingPeriodMs = 100;
constexpr int kWorkloadPeriodMs = 50;
constexpr int kControlReplyTimeoutMs = 2000;

void onSigInt(int) {
    g_running.store(false);
}

void onSigUsr1(int) {
    g_backgrounded.store(true);
}

std::string formatSnapshot(const framegov::PerformanceSnapshot& s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "OK snapshot health=" << s.health_score
        << " status=" << s.health_status
        << " fps=" << s.current_fps
        << " frame_ms=" << s.average_frame_time_ms
        << " memory_mb=" << s.memoryUsageMb()
        << " cache_hit_pct=" << (s.cache_hit_rate * 100.0)
        << " animations=" << s.active_handle_count
        << " render_mode=" << framegov::renderModeName(s.render_mode)
        << " cache_mode=" << framegov::cacheModeName(s.cache_mode)
        << " degraded_memory=" << (s.memory_probe_degraded ? 1 : 0)
        << " degraded_cache=" << (s.cache_stats_degraded ? 1 : 0)
        << "\n";
    for (const auto& rec : s.recommendations) {
        oss << "  - " << rec << "\n";
    }
    return oss.str();
}

// Simulated application traffic: cache lookups and short-lived animations.
class DemoWorkload {
public:
    DemoWorkload(framegov::EventLoop& loop, framegov::PerformanceGovernor& governor, const framegov::HostConfig& cfg)
        : loop_(loop),
          governor_(governor),
          contexts_(static_cast<std::size_t>(cfg.cache_capacity), framegov::msToNs(cfg.cache_ttl_ms)),
          analyses_(static_cast<std::size_t>(cfg.cache_capacity) * 4U, framegov::msToNs(cfg.cache_ttl_ms)) {}

    void attach(framegov::TieredCacheProvider& provider) {
        provider.addTier("context", &contexts_);
        provider.addTier("analysis", &analyses_);
    }

    void tick() {
        const int64_t now = loop_.now();
        std::uniform_int_distribution<int> key_dist(0, 299);
        for (int i = 0; i < 8; ++i) {
            const int key = key_dist(rng_);
            if (!contexts_.get(key, now)) {
                contexts_.put(key, std::string(256, 'c'), now);
            }
            if (!analyses_.get(key * 7, now)) {
                analyses_.put(key * 7, std::string(64, 'a'), now);
            }
        }

        std::uniform_int_distribution<int> spawn_dist(0, 9);
        if (spawn_dist(rng_) == 0) {
            std::uniform_int_distribution<int> duration_dist(200, 1500);
            const double nominal_ms = static_cast<double>(duration_dist(rng_));
            const framegov::AnimationHandle h = governor_.registerAnimation(nominal_ms, "demo");
            if (h.valid()) {
                const uint64_t id = h.id;
                framegov::PerformanceGovernor* gov = &governor_;
                loop_.scheduleOnce(static_cast<int64_t>(h.effective_duration_ms), [gov, id]() {
                    gov->completeAnimation(id);
                });
            }
        }
    }

private:
    framegov::EventLoop& loop_;
    framegov::PerformanceGovernor& governor_;
    framegov::TrackedLruCache<int, std::string> contexts_;
    framegov::TrackedLruCache<int, std::string> analyses_;
    std::mt19937 rng_{0xC0FFEEU};
};

template <typename T>
bool waitReply(std::future<T>& f, T& out) {
    if (f.wait_for(std::chrono::milliseconds(kControlReplyTimeoutMs)) != std::future_status::ready) {
        return false;
    }
    out = f.get();
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, onSigInt);
    std::signal(SIGTERM, onSigInt);
    std::signal(SIGUSR1, onSigUsr1);

    framegov::AppConfig config;
    std::string error;
    if (argc > 1) {
        if (!framegov::loadConfig(argv[1], config, error)) {
            std::cerr << "Config load failed: " << error << '\n';
            return 1;
        }
    } else if (!framegov::validateConfig(config, error)) {
        std::cerr << "Default config invalid: " << error << '\n';
        return 1;
    }

    framegov::EventLoop loop;
    framegov::SyntheticFrameSource frames;
    framegov::ProcessMemoryProbe memory;
    framegov::MallocTrimReclaimer reclaimer;
    framegov::ManualHostLifecycle lifecycle;
    framegov::TieredCacheProvider cache(loop);

    framegov::GovernorCollaborators deps;
    deps.frames = &frames;
    deps.cache = &cache;
    deps.memory = &memory;
    deps.lifecycle = &lifecycle;
    deps.reclaimer = &reclaimer;

    framegov::PerformanceGovernor governor(loop, deps);
    DemoWorkload workload(loop, governor, config.host);
    workload.attach(cache);

    if (!governor.initialize(config.governor, error)) {
        std::cerr << "Governor initialize failed: " << error << '\n';
        return 1;
    }

    if (config.host.frame_source == "synthetic") {
        if (!frames.start(config.host.synthetic_frame_ms, config.host.synthetic_jitter_ms, error)) {
            std::cerr << "Synthetic frame source failed: " << error << '\n';
            return 1;
        }
    }

    framegov::ipc::UnixControlServer control;
    if (config.control.enable) {
        auto handler = [&](const std::string& request) -> std::string {
            const framegov::ipc::ControlCommand cmd = framegov::ipc::parseControlCommand(request);
            switch (cmd) {
                case framegov::ipc::ControlCommand::Status:
                    return framegov::ipc::formatStatus(governor.telemetry().snapshot());
                case framegov::ipc::ControlCommand::Snapshot: {
                    auto promise = std::make_shared<std::promise<std::string>>();
                    std::future<std::string> reply = promise->get_future();
                    loop.post([&governor, promise]() {
                        governor.getSnapshot([promise](const framegov::PerformanceSnapshot& s) {
                            promise->set_value(formatSnapshot(s));
                        });
                    });
                    std::string text;
                    return waitReply(reply, text) ? text : std::string("ERR snapshot timed out\n");
                }
                case framegov::ipc::ControlCommand::Reclaim: {
                    auto promise = std::make_shared<std::promise<std::string>>();
                    std::future<std::string> reply = promise->get_future();
                    loop.post([&governor, promise]() {
                        governor.forceMemoryOptimization([promise](bool ok, const std::string& err) {
                            promise->set_value(ok ? std::string("OK reclaim\n") : "ERR reclaim " + err + "\n");
                        });
                    });
                    std::string text;
                    return waitReply(reply, text) ? text : std::string("ERR reclaim timed out\n");
                }
                case framegov::ipc::ControlCommand::Background:
                    lifecycle.notifyBackgrounded();
                    return "OK background\n";
                case framegov::ipc::ControlCommand::Load: {
                    double frame_ms = 0.0;
                    if (!framegov::ipc::parseCommandArgument(request, frame_ms) || !(frame_ms > 0.0)) {
                        return "ERR load expects a frame time in ms\n";
                    }
                    frames.setFrameTimeMs(frame_ms);
                    return "OK load frame_ms=" + std::to_string(frame_ms) + "\n";
                }
                case framegov::ipc::ControlCommand::Quit:
                    g_running.store(false);
                    loop.stop();
                    return "OK quit\n";
                case framegov::ipc::ControlCommand::Unknown:
                    break;
            }
            return "ERR unknown command\n";
        };
        if (!control.start(config.control.socket_path, handler, error)) {
            std::cerr << "Control socket failed, continuing without it: " << error << '\n';
        }
    }

    loop.schedulePeriodic(kWorkloadPeriodMs, [&workload]() { workload.tick(); });
    loop.schedulePeriodic(kHousekeepingPeriodMs, [&loop, &lifecycle]() {
        if (!g_running.load()) {
            loop.stop();
            return;
        }
        if (g_backgrounded.exchange(false)) {
            lifecycle.notifyBackgrounded();
        }
    });

    std::cout << "framegov running, frame source: " << config.host.frame_source << "\n";
    if (control.isRunning()) {
        std::cout << "Control socket on " << config.control.socket_path << "\n";
    }
    std::cout << "Press Ctrl+C to stop.\n";

    loop.run();

    control.stop();
    frames.stop();
    governor.dispose();
    return 0;
}
