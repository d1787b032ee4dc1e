#include "host/process_memory_probe.hpp"
#include "host/synthetic_frame_source.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main() {
#ifdef __linux__
    framegov::ProcessMemoryProbe probe;
    bool answered = false;
    uint64_t rss = 0;
    probe.currentUsageBytes([&](bool ok, uint64_t bytes, const std::string& error) {
        if (!ok) {
            std::cerr << "probe failed: " << error << "\n";
        }
        answered = ok;
        rss = bytes;
    });
    if (!answered || rss == 0U) {
        std::cerr << "resident set size should be readable\n";
        return 1;
    }

    framegov::MallocTrimReclaimer reclaimer;
    std::string reclaim_error;
    (void)reclaimer.reclaim(reclaim_error);
    if (reclaimer.invocations() != 1U) {
        std::cerr << "reclaimer should count invocations\n";
        return 1;
    }
#endif

    framegov::SyntheticFrameSource frames;
    std::string err;
    uint64_t token = 0;
    if (frames.subscribe(framegov::FrameLatencySource::FrameCallback{}, token, err)) {
        std::cerr << "empty callback should be refused\n";
        return 1;
    }
    std::atomic<int> received{0};
    std::atomic<double> last_latency{0.0};
    if (!frames.subscribe([&](double ms) { received++; last_latency.store(ms); }, token, err)) {
        std::cerr << "subscribe failed: " << err << "\n";
        return 1;
    }
    frames.emit(25.0);
    if (received.load() != 1 || last_latency.load() != 25.0) {
        std::cerr << "emit should deliver synchronously\n";
        return 1;
    }

    if (frames.start(5.0, 6.0, err)) {
        std::cerr << "jitter above the frame time should be refused\n";
        return 1;
    }
    if (!frames.start(2.0, 0.5, err)) {
        std::cerr << "start failed: " << err << "\n";
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    frames.setFrameTimeMs(-3.0);
    if (frames.frameTimeMs() != 2.0) {
        std::cerr << "non-positive frame time should be ignored\n";
        return 1;
    }
    frames.stop();
    frames.stop();
    const int after_stop = received.load();
    if (after_stop < 5) {
        std::cerr << "render thread should have produced frames, got " << after_stop << "\n";
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    if (received.load() != after_stop) {
        std::cerr << "no frames should arrive after stop\n";
        return 1;
    }
    frames.unsubscribe(token);
    if (frames.subscriberCount() != 0U) {
        std::cerr << "unsubscribe should remove the subscriber\n";
        return 1;
    }

    // unsubscribe() from another thread waits for a delivery in progress.
    {
        framegov::SyntheticFrameSource slow;
        std::atomic<bool> entered{false};
        std::atomic<bool> finished{false};
        uint64_t slow_token = 0;
        if (!slow.subscribe([&](double) {
                entered.store(true);
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                finished.store(true);
            }, slow_token, err)) {
            std::cerr << "subscribe failed: " << err << "\n";
            return 1;
        }
        std::thread render([&]() { slow.emit(16.0); });
        while (!entered.load()) {
            std::this_thread::yield();
        }
        slow.unsubscribe(slow_token);
        const bool done_on_return = finished.load();
        render.join();
        if (!done_on_return || slow.subscriberCount() != 0U) {
            std::cerr << "unsubscribe returned while a callback was still running\n";
            return 1;
        }
    }

    // unsubscribe() from inside the callback does not deadlock.
    {
        framegov::SyntheticFrameSource self;
        uint64_t self_token = 0;
        int calls = 0;
        if (!self.subscribe([&](double) {
                calls++;
                self.unsubscribe(self_token);
            }, self_token, err)) {
            std::cerr << "subscribe failed: " << err << "\n";
            return 1;
        }
        self.emit(16.0);
        self.emit(16.0);
        if (calls != 1 || self.subscriberCount() != 0U) {
            std::cerr << "callback should be able to unsubscribe itself\n";
            return 1;
        }
    }

    framegov::ManualHostLifecycle lifecycle;
    int backgrounded = 0;
    uint64_t lt = 0;
    if (!lifecycle.subscribeBackgrounded([&]() { backgrounded++; }, lt, err)) {
        std::cerr << "lifecycle subscribe failed: " << err << "\n";
        return 1;
    }
    lifecycle.notifyBackgrounded();
    lifecycle.unsubscribe(lt);
    lifecycle.notifyBackgrounded();
    if (backgrounded != 1 || lifecycle.subscriberCount() != 0U) {
        std::cerr << "lifecycle should notify only live subscribers\n";
        return 1;
    }
    return 0;
}
