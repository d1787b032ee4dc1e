#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace framegov {

enum class PushResult {
    Ok,
    DroppedOldest,
};

// Fixed-capacity FIFO that evicts the oldest sample when full. Owned by a
// single execution context, no internal synchronization.
template <typename T>
class SlidingWindow {
    static_assert(std::is_arithmetic<T>::value, "SlidingWindow requires an arithmetic sample type");

public:
    explicit SlidingWindow(std::size_t capacity)
        : capacity_(capacity), buffer_(capacity) {}

    bool valid() const { return capacity_ >= 1; }
    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return static_cast<std::size_t>(head_ - tail_); }
    bool empty() const { return head_ == tail_; }
    bool full() const { return size() >= capacity_; }

    PushResult pushDropOldest(const T& value) {
        if (!valid()) {
            dropped_++;
            return PushResult::DroppedOldest;
        }
        bool dropped = false;
        if ((head_ - tail_) >= capacity_) {
            tail_++;
            dropped = true;
            dropped_++;
        }
        buffer_[head_ % capacity_] = value;
        head_++;
        sum_ = recomputeSum();
        return dropped ? PushResult::DroppedOldest : PushResult::Ok;
    }

    // Oldest first.
    T at(std::size_t i) const { return buffer_[(tail_ + i) % capacity_]; }
    T latest() const { return buffer_[(head_ - 1) % capacity_]; }

    double sum() const { return sum_; }
    double mean(double fallback) const {
        if (empty()) {
            return fallback;
        }
        return sum_ / static_cast<double>(size());
    }

    void clear() {
        head_ = 0;
        tail_ = 0;
        sum_ = 0.0;
    }

    uint64_t dropCount() const { return dropped_; }

private:
    // Summed in arrival order each push so the mean never drifts from the
    // samples actually held.
    double recomputeSum() const {
        double s = 0.0;
        for (uint64_t i = tail_; i < head_; ++i) {
            s += static_cast<double>(buffer_[i % capacity_]);
        }
        return s;
    }

    std::size_t capacity_{0};
    std::vector<T> buffer_{};
    uint64_t head_{0};
    uint64_t tail_{0};
    uint64_t dropped_{0};
    double sum_{0.0};
};

}  // namespace framegov
