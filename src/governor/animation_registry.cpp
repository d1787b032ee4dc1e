#include "governor/animation_registry.hpp"

#include <cmath>
#include <utility>
#include <vector>

namespace framegov {

AnimationHandle AnimationRegistry::registerHandle(
    double nominal_duration_ms,
    const std::string& label,
    RenderMode mode,
    DurationListener listener) {
    if (!std::isfinite(nominal_duration_ms) || nominal_duration_ms < 0.0) {
        return AnimationHandle{};
    }
    Entry e;
    e.nominal_ms = nominal_duration_ms;
    e.effective_ms = (mode == RenderMode::LowPower)
        ? nominal_duration_ms * scaling_.new_handle_scale
        : nominal_duration_ms;
    e.label = label;
    e.listener = std::move(listener);

    const uint64_t id = next_id_++;
    const double effective = e.effective_ms;
    entries_.emplace(id, std::move(e));
    return AnimationHandle{id, effective};
}

std::size_t AnimationRegistry::applyLowPowerScaling() {
    std::vector<std::pair<uint64_t, double>> changed;
    for (auto& kv : entries_) {
        Entry& e = kv.second;
        if (e.nominal_ms <= scaling_.long_animation_ms) {
            continue;
        }
        // derived from the nominal value so repeated entries never compound
        const double scaled = e.nominal_ms * scaling_.live_handle_scale;
        if (scaled != e.effective_ms) {
            e.effective_ms = scaled;
            changed.emplace_back(kv.first, scaled);
        }
    }
    // Listeners may remove handles, so they run after the table walk.
    for (const auto& c : changed) {
        auto it = entries_.find(c.first);
        if (it != entries_.end() && it->second.listener) {
            DurationListener listener = it->second.listener;
            listener(c.first, c.second);
        }
    }
    return changed.size();
}

bool AnimationRegistry::remove(uint64_t id) {
    return entries_.erase(id) > 0U;
}

void AnimationRegistry::clear() {
    entries_.clear();
}

void AnimationRegistry::recordFrame(uint64_t id) {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        it->second.frames++;
    }
}

std::optional<double> AnimationRegistry::effectiveDurationMs(uint64_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.effective_ms;
}

std::optional<double> AnimationRegistry::nominalDurationMs(uint64_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.nominal_ms;
}

std::optional<std::string> AnimationRegistry::label(uint64_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.label;
}

std::optional<uint64_t> AnimationRegistry::frameCount(uint64_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.frames;
}

}  // namespace framegov
