#ifndef __LRU_CACHE
#define __LRU_CACHE

#include <list>
#include <memory>
#include <utility>
#include <unordered_map>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>
#include "errors.h"

/*!
 * Bounded map with least-recently-used eviction.
 *
 * Get and Put reorder the recency list and take the lock exclusively,
 * Contains and Size only read and share it, so batch workers may hit the
 * cache from several threads.
 */
template <class TKey, class TValue>
class LRUCache {
public:
    typedef std::pair<TKey, TValue> Entry;

    explicit LRUCache(size_t capacity) : capacity_(capacity), hits_(0), misses_(0) {
        if (capacity == 0)
            throw InvalidArgument("LRUCache capacity must be positive");
    }

    // Returns the cached value and marks it most recent, or computes it
    // with `compute(key)`, stores it and evicts the oldest entry if full.
    template <class TCompute>
    TValue GetOrCompute(const TKey &key, TCompute compute) {
        {
            boost::unique_lock<boost::shared_mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                entries_.splice(entries_.begin(), entries_, it->second);
                hits_++;
                return it->second->second;
            }
            misses_++;
        }
        // compute outside the lock, the function is pure
        TValue value = compute(key);
        Put(key, value);
        return value;
    }

    void Put(const TKey &key, const TValue &value) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = value;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(key, value);
        index_[key] = entries_.begin();
        if (index_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    bool Contains(const TKey &key) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    size_t Size() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return index_.size();
    }

    size_t Capacity() const { return capacity_; }

    size_t Hits() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return hits_;
    }

    size_t Misses() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return misses_;
    }

    void Clear() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
    }

private:
    size_t capacity_;
    size_t hits_, misses_;
    std::list<Entry> entries_;
    std::unordered_map<TKey, typename std::list<Entry>::iterator> index_;
    boost::shared_mutex mutex_;
};

#endif
