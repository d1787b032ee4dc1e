#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace framegov {

struct AnimationHandle {
    uint64_t id{0};
    double effective_duration_ms{0.0};

    bool valid() const { return id != 0U; }
};

class AnimationRegistry {
public:
    // Invoked with the new effective duration whenever the registry rewrites it.
    using DurationListener = std::function<void(uint64_t id, double effective_duration_ms)>;

    struct Scaling {
        double new_handle_scale{0.8};
        double live_handle_scale{0.7};
        double long_animation_ms{500.0};
    };

    AnimationRegistry() = default;
    explicit AnimationRegistry(const Scaling& scaling) : scaling_(scaling) {}

    void setScaling(const Scaling& scaling) { scaling_ = scaling; }

    // Returns an invalid handle for negative or non-finite durations.
    AnimationHandle registerHandle(
        double nominal_duration_ms,
        const std::string& label,
        RenderMode mode,
        DurationListener listener = {});

    // Rewrites effective = nominal * live_handle_scale for every live handle
    // longer than long_animation_ms. Returns the number of handles rewritten.
    std::size_t applyLowPowerScaling();

    // No-op for unknown or already removed handles.
    bool remove(uint64_t id);
    void clear();

    void recordFrame(uint64_t id);

    std::size_t count() const { return entries_.size(); }
    bool contains(uint64_t id) const { return entries_.find(id) != entries_.end(); }
    std::optional<double> effectiveDurationMs(uint64_t id) const;
    std::optional<double> nominalDurationMs(uint64_t id) const;
    std::optional<std::string> label(uint64_t id) const;
    std::optional<uint64_t> frameCount(uint64_t id) const;

private:
    struct Entry {
        double nominal_ms{0.0};
        double effective_ms{0.0};
        std::string label;
        uint64_t frames{0};
        DurationListener listener;
    };

    Scaling scaling_{};
    std::unordered_map<uint64_t, Entry> entries_{};
    uint64_t next_id_{1};
};

}  // namespace framegov
