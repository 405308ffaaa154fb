#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/cache.h — Bounded response cache (LRU + TTL)
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto cache = std::make_shared<cache::LRUCache<cache::CachedResponse>>(
//        cache::CacheOptions{.maxEntries = 100, .ttlMs = 60 * 60 * 1000});
//    cache->set(key, {body, "application/json"});
//    if (auto hit = cache->get(key)) { ... }
//
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <cstddef>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pqcache::cache {

inline constexpr std::size_t kDefaultMaxEntries = 100;
inline constexpr int kDefaultTtlMs = 60 * 60 * 1000;

struct CacheOptions {
    std::size_t maxEntries = kDefaultMaxEntries;
    int ttlMs = kDefaultTtlMs;          // <= 0 disables expiry
};

// ── A successful (2xx) response captured after execution ──
struct CachedResponse {
    std::string body;
    std::string contentType;
    int status = 200;

    bool operator==(const CachedResponse& other) const {
        return body == other.body && contentType == other.contentType && status == other.status;
    }
};

// ═══════════════════════════════════════════
//  KeyValueCache — what the pipeline needs from a store
//  Implementations must serialize concurrent callers themselves.
// ═══════════════════════════════════════════
template <typename Value>
class KeyValueCache {
public:
    virtual ~KeyValueCache() = default;

    virtual std::optional<Value> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const Value& value) = 0;
    virtual bool has(const std::string& key) = 0;
};

using ResponseCache = KeyValueCache<CachedResponse>;

// ═══════════════════════════════════════════
//  LRUCache — O(1) get/set, TTL from insertion time
// ═══════════════════════════════════════════
template <typename Value = std::string>
class LRUCache : public KeyValueCache<Value> {
public:
    using Clock = std::chrono::steady_clock;

    explicit LRUCache(CacheOptions options = {})
        : maxSize_(options.maxEntries), defaultTtlMs_(options.ttlMs) {}

    LRUCache(std::size_t maxSize, int defaultTtlMs)
        : LRUCache(CacheOptions{maxSize, defaultTtlMs}) {}

    bool set(const std::string& key, const Value& value) override {
        return set(key, value, defaultTtlMs_);
    }

    bool set(const std::string& key, const Value& value, int ttlMs) {
        if (maxSize_ == 0) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            list_.erase(it->second);
            map_.erase(it);
        }
        auto expiry = ttlMs > 0
            ? Clock::now() + std::chrono::milliseconds(ttlMs)
            : Clock::time_point::max();

        list_.push_front({key, value, expiry});
        map_[key] = list_.begin();
        evict();
        return true;
    }

    // Marks the entry most recently used.
    std::optional<Value> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;

        if (expired(*it->second, Clock::now())) {
            list_.erase(it->second);
            map_.erase(it);
            return std::nullopt;
        }

        list_.splice(list_.begin(), list_, it->second);
        return it->second->value;
    }

    // Does not touch recency.
    bool has(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;

        if (expired(*it->second, Clock::now())) {
            list_.erase(it->second);
            map_.erase(it);
            return false;
        }
        return true;
    }

    void del(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            list_.erase(it->second);
            map_.erase(it);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        list_.clear();
        map_.clear();
    }

    // Drops every expired entry, returns how many went.
    std::size_t prune() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pruneLocked(Clock::now());
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked(Clock::now());
        return map_.size();
    }

    std::size_t capacity() const { return maxSize_; }

private:
    struct Entry {
        std::string key;
        Value value;
        Clock::time_point expiry;
    };

    std::size_t maxSize_;
    int defaultTtlMs_;
    std::list<Entry> list_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> map_;
    std::mutex mutex_;

    static bool expired(const Entry& entry, Clock::time_point now) {
        return entry.expiry != Clock::time_point::max() && now >= entry.expiry;
    }

    std::size_t pruneLocked(Clock::time_point now) {
        std::size_t removed = 0;
        for (auto it = list_.begin(); it != list_.end();) {
            if (expired(*it, now)) {
                map_.erase(it->key);
                it = list_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void evict() {
        while (map_.size() > maxSize_) {
            auto last = std::prev(list_.end());
            map_.erase(last->key);
            list_.pop_back();
        }
    }
};

} // namespace pqcache::cache
