#pragma once

#include "governor/collaborators.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace framegov {

// Stands in for a renderer: emits one latency sample per simulated frame from
// its own thread. The frame time can be changed at runtime to simulate load.
class SyntheticFrameSource : public FrameLatencySource {
public:
    SyntheticFrameSource() = default;
    ~SyntheticFrameSource() override;

    bool subscribe(FrameCallback callback, uint64_t& token, std::string& error) override;
    // Does not return while another thread is still delivering a frame, so the
    // subscriber may be destroyed right after. Safe to call from a callback.
    void unsubscribe(uint64_t token) override;

    bool start(double frame_ms, double jitter_ms, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }

    void setFrameTimeMs(double frame_ms);
    double frameTimeMs() const { return frame_ms_.load(); }

    // Delivers one sample to every subscriber on the calling thread.
    void emit(double latency_ms);

    std::size_t subscriberCount() const;
    uint64_t emitted() const { return emitted_.load(); }

private:
    void renderLoop();

    mutable std::mutex mutex_;
    std::map<uint64_t, FrameCallback> subscribers_;
    uint64_t next_token_{1};
    // held for the whole of emit(); unsubscribe() waits on it
    std::mutex delivery_mutex_;
    std::atomic<std::thread::id> delivering_thread_{};
    std::atomic<bool> running_{false};
    std::atomic<double> frame_ms_{16.667};
    std::atomic<double> jitter_ms_{0.0};
    std::atomic<uint64_t> emitted_{0};
    std::thread thread_{};
};

// Host lifecycle driven explicitly by the embedding application (control
// socket command, signal handler flag, tests).
class ManualHostLifecycle : public HostLifecycle {
public:
    bool subscribeBackgrounded(SignalCallback callback, uint64_t& token, std::string& error) override;
    void unsubscribe(uint64_t token) override;

    void notifyBackgrounded();
    std::size_t subscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, SignalCallback> subscribers_;
    uint64_t next_token_{1};
};

}  // namespace framegov
