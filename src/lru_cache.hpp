#pragma once // Ensures this header file is included only once during compilation.

#include <cstddef>
#include <mutex>  // For thread safety
#include <utility>
#include <vector>
#include "simple_lru.hpp"

/**
 * @brief Represents a thread-safe, fixed-size Least Recently Used (LRU) cache.
 * * An LRU cache stores key-value pairs and, when full, removes the item
 * that hasn't been accessed for the longest time to make space for new items.
 * * Every public operation holds a single mutex for its whole duration, so
 * concurrent callers observe one total order of operations. The eviction
 * callback runs inside that lock and must not call back into the cache.
 */
template <typename K, typename V>
class LRUCache
{
public:
    using EvictCallback = typename SimpleLRU<K, V>::EvictCallback;

private:
    // The underlying non thread-safe cache.
    SimpleLRU<K, V> lru;

    // A Mutex to protect 'lru' from simultaneous access by multiple threads.
    mutable std::mutex mtx;

public:
    /**
     * @brief Constructor for the LRUCache.
     * @param capacity The maximum number of items the cache can hold.
     * @param on_evict Optional callback fired for every entry leaving the cache.
     * @throws std::invalid_argument if capacity is 0.
     */
    explicit LRUCache(size_t capacity, EvictCallback on_evict = nullptr)
        : lru(capacity, std::move(on_evict)) {}

    LRUCache(const LRUCache &) = delete;
    LRUCache &operator=(const LRUCache &) = delete;

    /**
     * @brief Inserts or updates a key-value pair in the cache.
     * * If the key already exists, its value is updated and it becomes MRU.
     * If the key is new and the cache is full, the Least Recently Used (LRU) item is evicted.
     * @return true if an eviction occurred.
     */
    bool add(const K &key, const V &value)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.add(key, value);
    }

    /**
     * @brief Retrieves the value associated with the given key.
     * * If found, the item is moved to the Most Recently Used (MRU) position.
     * @param key The key to look up.
     * @param value Output parameter for the value, written only on a hit.
     * @return true if the key was found.
     */
    bool get(const K &key, V &value)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.get(key, value);
    }

    bool peek(const K &key, V &value) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.peek(key, value);
    }

    bool contains(const K &key) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.contains(key);
    }

    /**
     * @brief Adds the value only if the key is absent, without touching the
     * recency of an existing key.
     * @param evicted Output parameter, true if adding caused an eviction.
     * @return true if the key was already present.
     */
    bool containsOrAdd(const K &key, const V &value, bool &evicted)
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (lru.contains(key))
        {
            evicted = false;
            return true;
        }
        evicted = lru.add(key, value);
        return false;
    }

    /**
     * @brief Like containsOrAdd(), but also returns the current value of an
     * existing key through 'previous'.
     */
    bool peekOrAdd(const K &key, const V &value, V &previous, bool &evicted)
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (lru.peek(key, previous))
        {
            evicted = false;
            return true;
        }
        evicted = lru.add(key, value);
        return false;
    }

    /**
     * @brief Explicitly removes a key-value pair from the cache.
     * @return true if the key was present.
     */
    bool remove(const K &key)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.remove(key);
    }

    bool removeOldest(K &key, V &value)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.removeOldest(key, value);
    }

    bool getOldest(K &key, V &value) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.getOldest(key, value);
    }

    // Keys from oldest to newest.
    std::vector<K> keys() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.keys();
    }

    std::vector<V> values() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.values();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.size();
    }

    size_t capacity() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.capacity();
    }

    /**
     * @brief Changes the capacity of the cache.
     * @return The number of entries evicted to fit the new capacity.
     */
    size_t resize(size_t new_capacity)
    {
        std::lock_guard<std::mutex> lock(mtx);
        return lru.resize(new_capacity);
    }

    void purge()
    {
        std::lock_guard<std::mutex> lock(mtx);
        lru.purge();
    }
};
