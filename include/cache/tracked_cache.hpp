#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace framegov {

class CacheTier {
public:
    virtual ~CacheTier() = default;
    virtual std::size_t entries() const = 0;
    virtual double hitRate() const = 0;
    // Drops expired entries; when `aggressive`, also trims to half capacity.
    // Returns the number of entries freed.
    virtual std::size_t reclaim(int64_t now_ns, bool aggressive) = 0;
};

// LRU cache with per-entry expiry and hit/miss accounting. Single-threaded.
template <typename K, typename V>
class TrackedLruCache : public CacheTier {
public:
    TrackedLruCache(std::size_t capacity, int64_t ttl_ns)
        : capacity_(capacity), ttl_ns_(ttl_ns) {}

    std::optional<V> get(const K& key, int64_t now_ns) {
        auto it = index_.find(key);
        if (it == index_.end() || isExpired(*it->second, now_ns)) {
            misses_++;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        hits_++;
        return it->second->value;
    }

    void put(const K& key, V value, int64_t now_ns) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->stored_at_ns = now_ns;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (capacity_ == 0U) {
            return;
        }
        order_.push_front(Node{key, std::move(value), now_ns});
        index_[key] = order_.begin();
        trimTo(capacity_);
    }

    bool erase(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    std::size_t entries() const override { return index_.size(); }
    std::size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

    double hitRate() const override {
        const uint64_t total = hits_ + misses_;
        if (total == 0U) {
            return 1.0;
        }
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    std::size_t reclaim(int64_t now_ns, bool aggressive) override {
        const std::size_t before = index_.size();
        for (auto it = order_.begin(); it != order_.end();) {
            if (isExpired(*it, now_ns)) {
                index_.erase(it->key);
                it = order_.erase(it);
            } else {
                ++it;
            }
        }
        if (aggressive) {
            trimTo(capacity_ / 2U);
        }
        return before - index_.size();
    }

private:
    struct Node {
        K key;
        V value;
        int64_t stored_at_ns{0};
    };

    bool isExpired(const Node& n, int64_t now_ns) const {
        return ttl_ns_ > 0 && (now_ns - n.stored_at_ns) > ttl_ns_;
    }

    void trimTo(std::size_t limit) {
        while (index_.size() > limit && !order_.empty()) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
    }

    std::size_t capacity_{0};
    int64_t ttl_ns_{0};
    std::list<Node> order_{};
    std::unordered_map<K, typename std::list<Node>::iterator> index_{};
    uint64_t hits_{0};
    uint64_t misses_{0};
};

}  // namespace framegov
