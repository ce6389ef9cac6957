#pragma once

#include "utils/logging.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fastnet {
namespace cache {

/**
 * Thread-safe key/value cache bounded by the total byte size of its entries.
 *
 * Every hit and every write stamps the entry with the next value of a
 * logical clock; when room is needed the entry with the lowest stamp goes
 * first. The sum of entry sizes never exceeds the capacity once an
 * operation returns.
 */
template<typename Value>
class LruCache {
public:
    struct CacheStatistics {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t insertions = 0;
        uint64_t evictions = 0;
        uint64_t rejections = 0;
    };

    using EvictionListener = std::function<void(const std::string& key, size_t sizeBytes)>;

    explicit LruCache(size_t capacityBytes)
        : capacity_(capacityBytes), totalSize_(0), clock_(0) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    /**
     * Look up a key. A hit makes the entry the most recently used.
     */
    std::optional<Value> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses++;
            return std::nullopt;
        }

        touch(it->second);
        stats_.hits++;
        return it->second->value;
    }

    /**
     * Insert or replace an entry.
     * @return false if sizeBytes alone exceeds the capacity; the cache is
     *         left untouched in that case
     */
    bool put(const std::string& key, Value value, size_t sizeBytes) {
        std::vector<std::pair<std::string, size_t>> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (sizeBytes > capacity_) {
                stats_.rejections++;
                utils::Logger::debug("Cache rejected '" + key + "': " + std::to_string(sizeBytes) +
                                     " bytes exceeds capacity " + std::to_string(capacity_));
                return false;
            }

            auto existing = index_.find(key);
            if (existing != index_.end()) {
                totalSize_ -= existing->second->sizeBytes;
                entries_.erase(existing->second);
                index_.erase(existing);
            }

            while (totalSize_ + sizeBytes > capacity_ && !entries_.empty()) {
                // back() holds the lowest recency
                Entry& victim = entries_.back();
                evicted.emplace_back(victim.key, victim.sizeBytes);
                totalSize_ -= victim.sizeBytes;
                index_.erase(victim.key);
                entries_.pop_back();
                stats_.evictions++;
            }

            entries_.push_front(Entry{key, std::move(value), sizeBytes, ++clock_});
            index_[key] = entries_.begin();
            totalSize_ += sizeBytes;
            stats_.insertions++;
        }

        notifyEvicted(evicted);
        return true;
    }

    /**
     * Remove one entry; no-op if absent.
     */
    void evict(const std::string& key) {
        std::vector<std::pair<std::string, size_t>> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it == index_.end()) {
                return;
            }
            evicted.emplace_back(key, it->second->sizeBytes);
            totalSize_ -= it->second->sizeBytes;
            entries_.erase(it->second);
            index_.erase(it);
        }
        notifyEvicted(evicted);
    }

    void evictAll() {
        std::vector<std::pair<std::string, size_t>> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            evicted.reserve(entries_.size());
            for (const auto& entry : entries_) {
                evicted.emplace_back(entry.key, entry.sizeBytes);
            }
            entries_.clear();
            index_.clear();
            totalSize_ = 0;
        }
        notifyEvicted(evicted);
    }

    /**
     * Membership test that does not count as an access.
     */
    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /**
     * Recency stamp of an entry, 0 if absent. Does not count as an access.
     */
    uint64_t recencyOf(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        return it == index_.end() ? 0 : it->second->recency;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalSize_;
    }

    size_t entryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const { return capacity_; }

    CacheStatistics getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    void setEvictionListener(EvictionListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        evictionListener_ = std::move(listener);
    }

private:
    struct Entry {
        std::string key;
        Value value;
        size_t sizeBytes;
        uint64_t recency;
    };

    using EntryList = std::list<Entry>;

    void touch(typename EntryList::iterator it) {
        it->recency = ++clock_;
        entries_.splice(entries_.begin(), entries_, it);
    }

    void notifyEvicted(const std::vector<std::pair<std::string, size_t>>& evicted) {
        if (evicted.empty()) {
            return;
        }

        EvictionListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = evictionListener_;
        }
        if (!listener) {
            return;
        }
        for (const auto& item : evicted) {
            listener(item.first, item.second);
        }
    }

    const size_t capacity_;
    size_t totalSize_;
    uint64_t clock_;
    EntryList entries_;   // most recently used first
    std::unordered_map<std::string, typename EntryList::iterator> index_;
    CacheStatistics stats_;
    EvictionListener evictionListener_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace fastnet
