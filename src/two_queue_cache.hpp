#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "simple_lru.hpp"

// Ratio of the 2Q cache dedicated to recently added entries that have only
// been accessed once.
constexpr double kDefault2QRecentRatio = 0.25;

// Default ratio of ghost entries kept to track entries recently evicted.
constexpr double kDefault2QGhostEntries = 0.50;

/**
 * @brief Thread-safe, fixed-size 2Q cache.
 *
 * 2Q is an enhancement over the standard LRU cache in that it tracks both
 * frequently and recently used entries separately. This keeps a burst of
 * accesses to new entries from evicting frequently used entries. It costs
 * roughly twice as much per operation as a plain LRU.
 *
 * The cache is split into three pools:
 *  - recent:       keys seen once
 *  - frequent:     keys seen at least twice
 *  - recent_evict: ghost keys recently evicted from 'recent' (no value kept)
 *
 * A key lives in at most one pool. 'recent' and 'frequent' are both sized to
 * the full capacity; the balance between them is enforced by ensureSpace().
 *
 * All operations hold one mutex for their whole duration.
 *
 * @tparam K Key type. Hashable with std::hash, equality comparable and copy
 *           constructible; it need not be default constructible.
 * @tparam V Value type. Copy constructible.
 */
template <typename K, typename V>
class TwoQueueCache
{
private:
    // Payload of a ghost entry: membership is all that is recorded.
    struct Ghost
    {
    };

    // Target number of entries across 'recent' and 'frequent'.
    size_t total_size;

    // Target number of entries in 'recent'.
    size_t recent_size;

    // Capacity of the ghost pool, 0 disables ghost tracking.
    size_t evict_size;

    SimpleLRU<K, V> recent;
    SimpleLRU<K, V> frequent;

    // Null when evict_size is 0.
    std::unique_ptr<SimpleLRU<K, Ghost>> recent_evict;

    mutable std::mutex mtx;

public:
    /**
     * @brief Creates a 2Q cache with the default recent and ghost ratios.
     * @param size Total number of entries the cache can hold.
     * @throws std::invalid_argument if size is 0.
     */
    explicit TwoQueueCache(size_t size)
        : TwoQueueCache(size, kDefault2QRecentRatio, kDefault2QGhostEntries) {}

    /**
     * @brief Creates a 2Q cache with explicit tuning parameters.
     *
     * @param size Total number of entries the cache can hold.
     * @param recent_ratio Share of 'size' targeted for the recent pool, in [0, 1].
     * @param ghost_ratio Share of 'size' used for ghost entries, in [0, 1].
     * @throws std::invalid_argument on a zero size or an out-of-range ratio.
     */
    TwoQueueCache(size_t size, double recent_ratio, double ghost_ratio)
        : total_size(checkSize(size)),
          recent_size(subSize(size, checkRatio(recent_ratio, "invalid recent ratio"))),
          evict_size(subSize(size, checkRatio(ghost_ratio, "invalid ghost ratio"))),
          recent(size),
          frequent(size)
    {
        if (evict_size > 0)
            recent_evict = std::make_unique<SimpleLRU<K, Ghost>>(evict_size);
    }

    TwoQueueCache(const TwoQueueCache &) = delete;
    TwoQueueCache &operator=(const TwoQueueCache &) = delete;

    /**
     * @brief Looks up a key's value.
     *
     * A hit in 'recent' promotes the key to 'frequent'.
     *
     * @param key The key to look up.
     * @param value Output parameter, written only on a hit.
     * @return true on a hit.
     */
    bool get(const K &key, V &value)
    {
        std::lock_guard<std::mutex> lock(mtx);

        // 1. Frequent hit: plain LRU touch.
        if (frequent.get(key, value))
            return true;

        // 2. Recent hit: second access, move to frequent.
        if (recent.peek(key, value))
        {
            recent.remove(key);
            frequent.add(key, value);
            return true;
        }

        return false;
    }

    /**
     * @brief Adds or updates a value.
     */
    void add(const K &key, const V &value)
    {
        std::lock_guard<std::mutex> lock(mtx);

        // Already frequent: just update the value.
        if (frequent.contains(key))
        {
            frequent.add(key, value);
            return;
        }

        // Recently used: a second touch promotes to frequent.
        if (recent.contains(key))
        {
            recent.remove(key);
            frequent.add(key, value);
            return;
        }

        // Recently evicted from 'recent': treat it as frequently used.
        if (recent_evict && recent_evict->contains(key))
        {
            ensureSpace(true);
            recent_evict->remove(key);
            frequent.add(key, value);
            return;
        }

        ensureSpace(false);
        recent.add(key, value);
    }

    /**
     * @brief Removes a key from whichever pool holds it, ghosts included.
     */
    void remove(const K &key)
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (frequent.remove(key))
            return;
        if (recent.remove(key))
            return;
        if (recent_evict)
            recent_evict->remove(key);
    }

    /**
     * @brief Checks for a cached key without updating recency or frequency.
     *
     * Ghost entries do not count.
     */
    bool contains(const K &key) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return frequent.contains(key) || recent.contains(key);
    }

    /**
     * @brief Reads a value without updating recency or frequency.
     */
    bool peek(const K &key, V &value) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (frequent.peek(key, value))
            return true;
        return recent.peek(key, value);
    }

    /**
     * @brief Snapshot of the cached keys: frequent keys first, then recent
     * keys, each group from oldest to newest.
     */
    std::vector<K> keys() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<K> result = frequent.keys();
        std::vector<K> recent_keys = recent.keys();
        result.insert(result.end(), recent_keys.begin(), recent_keys.end());
        return result;
    }

    // Number of cached entries, ghosts excluded.
    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return recent.size() + frequent.size();
    }

    /**
     * @brief Clears all three pools.
     */
    void purge()
    {
        std::lock_guard<std::mutex> lock(mtx);
        recent.purge();
        frequent.purge();
        if (recent_evict)
            recent_evict->purge();
    }

    size_t capacity() const { return total_size; }

    size_t recentCapacity() const { return recent_size; }

    size_t ghostCapacity() const { return evict_size; }

private:
    static size_t checkSize(size_t size)
    {
        if (size == 0)
            throw std::invalid_argument("invalid size");
        return size;
    }

    static double checkRatio(double ratio, const char *message)
    {
        // Written so that NaN is rejected too.
        if (!(ratio >= 0.0 && ratio <= 1.0))
            throw std::invalid_argument(message);
        return ratio;
    }

    static size_t subSize(size_t size, double ratio)
    {
        // Near SIZE_MAX the product can round up past the range of size_t.
        double scaled = static_cast<double>(size) * ratio;
        if (scaled >= static_cast<double>(std::numeric_limits<size_t>::max()))
            return size;
        return std::min(size, static_cast<size_t>(scaled));
    }

    /**
     * @brief Makes room for one more entry in 'recent' + 'frequent'.
     *
     * Must be called with the lock held, before the insertion.
     *
     * @param recent_evict_hit true when the caller is re-admitting a ghost key.
     */
    void ensureSpace(bool recent_evict_hit)
    {
        // If we have space, nothing to do.
        size_t recent_len = recent.size();
        size_t freq_len = frequent.size();
        if (recent_len + freq_len < total_size)
            return;

        // If the recent buffer is larger than the target, evict from there
        // and remember the key as a ghost.
        if (recent_len > 0 &&
            (recent_len > recent_size || (recent_len == recent_size && !recent_evict_hit)))
        {
            if (recent_evict)
                recent_evict->add(recent.oldestKey(), Ghost());
            recent.removeOldest();
            return;
        }

        // Remove from the frequent list otherwise. No ghost is recorded.
        // With recent_size == total_size this can find 'frequent' empty, and
        // the pending insertion then grows the cache one past total_size.
        frequent.removeOldest();
    }
};
