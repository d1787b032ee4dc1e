#include "host/synthetic_frame_source.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>
#include <utility>
#include <vector>

namespace framegov {

SyntheticFrameSource::~SyntheticFrameSource() {
    stop();
}

bool SyntheticFrameSource::subscribe(FrameCallback callback, uint64_t& token, std::string& error) {
    if (!callback) {
        error = "empty frame callback";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    token = next_token_++;
    subscribers_.emplace(token, std::move(callback));
    error.clear();
    return true;
}

void SyntheticFrameSource::unsubscribe(uint64_t token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(token);
    }
    if (delivering_thread_.load() == std::this_thread::get_id()) {
        return;
    }
    // wait out a delivery that copied the callback before the erase
    std::lock_guard<std::mutex> wait(delivery_mutex_);
}

std::size_t SyntheticFrameSource::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

bool SyntheticFrameSource::start(double frame_ms, double jitter_ms, std::string& error) {
    if (!(frame_ms > 0.0) || jitter_ms < 0.0 || jitter_ms >= frame_ms) {
        error = "synthetic frame source needs frame_ms > 0 and 0 <= jitter_ms < frame_ms";
        return false;
    }
    stop();
    frame_ms_.store(frame_ms);
    jitter_ms_.store(jitter_ms);
    running_.store(true);
    thread_ = std::thread(&SyntheticFrameSource::renderLoop, this);
    error.clear();
    return true;
}

void SyntheticFrameSource::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SyntheticFrameSource::setFrameTimeMs(double frame_ms) {
    if (frame_ms > 0.0) {
        frame_ms_.store(frame_ms);
    }
}

void SyntheticFrameSource::emit(double latency_ms) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    delivering_thread_.store(std::this_thread::get_id());
    std::vector<FrameCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& kv : subscribers_) {
            targets.push_back(kv.second);
        }
    }
    for (const auto& cb : targets) {
        cb(latency_ms);
    }
    delivering_thread_.store(std::thread::id());
    emitted_.fetch_add(1);
}

void SyntheticFrameSource::renderLoop() {
    std::mt19937 rng(0x5eedU);
    while (running_.load()) {
        const double base = frame_ms_.load();
        const double jitter = jitter_ms_.load();
        std::uniform_real_distribution<double> dist(-jitter, jitter);
        const double latency = std::max(0.1, base + (jitter > 0.0 ? dist(rng) : 0.0));
        std::this_thread::sleep_for(std::chrono::microseconds(static_cast<int64_t>(latency * 1000.0)));
        emit(latency);
    }
}

bool ManualHostLifecycle::subscribeBackgrounded(SignalCallback callback, uint64_t& token, std::string& error) {
    if (!callback) {
        error = "empty lifecycle callback";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    token = next_token_++;
    subscribers_.emplace(token, std::move(callback));
    error.clear();
    return true;
}

void ManualHostLifecycle::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(token);
}

std::size_t ManualHostLifecycle::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void ManualHostLifecycle::notifyBackgrounded() {
    std::vector<SignalCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : subscribers_) {
            targets.push_back(kv.second);
        }
    }
    for (const auto& cb : targets) {
        cb();
    }
}

}  // namespace framegov
