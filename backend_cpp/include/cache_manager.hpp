#pragma once

#include <atomic>
#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace doc_qa {

// Thread-safe LRU cache whose entries also expire after a fixed TTL.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            recency_.erase(it->second.recency_it);
            entries_.erase(it);
            ++misses_;
            return std::nullopt;
        }

        recency_.splice(recency_.begin(), recency_, it->second.recency_it);
        ++hits_;
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            recency_.splice(recency_.begin(), recency_, it->second.recency_it);
            return;
        }

        if (max_size_ == 0) return;
        if (entries_.size() >= max_size_) {
            entries_.erase(recency_.back());
            recency_.pop_back();
        }
        recency_.push_front(key);
        entries_.emplace(key, Entry{value, recency_.begin(), expiry});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        recency_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

private:
    struct Entry {
        Value value;
        typename std::list<Key>::iterator recency_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> recency_;
    std::unordered_map<Key, Entry> entries_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    mutable std::mutex mutex_;
};

using EmbeddingCache = LRUCache<std::string, std::vector<float>>;

} // namespace doc_qa
