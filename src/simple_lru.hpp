#pragma once // Ensures this header file is included only once during compilation.

#include <cstddef>       // For size_t
#include <functional>    // For std::function, used by the eviction callback
#include <iterator>      // For std::prev
#include <list>          // For O(1) insertion/deletion at both ends, and efficient splicing
#include <stdexcept>     // For std::invalid_argument and std::out_of_range
#include <unordered_map> // For O(1) average time complexity key lookup
#include <utility>       // For std::pair and std::move
#include <vector>        // For key/value snapshots

/**
 * @brief A fixed-size Least Recently Used (LRU) cache that is NOT thread-safe.
 *
 * SimpleLRU is the building block for the thread-safe caches (LRUCache and
 * TwoQueueCache). It keeps its entries in a doubly linked list ordered by
 * recency and indexes them with a hash map, so every single-entry operation
 * is O(1).
 *
 * The caller owns synchronization: a SimpleLRU must only be touched by one
 * thread at a time.
 *
 * @tparam K Key type. Must be hashable with std::hash and equality comparable.
 * @tparam V Value type. Must be copy constructible.
 */
template <typename K, typename V>
class SimpleLRU
{
public:
    /**
     * @brief Callback invoked with the last known (key, value) of every entry
     * that leaves the cache.
     *
     * The callback runs synchronously on the caller's thread, after the entry
     * has been unlinked. It must not call back into the same cache.
     */
    using EvictCallback = std::function<void(const K &, const V &)>;

private:
    // A Doubly Linked List to maintain the usage order.
    // The front of the list (begin()) is the Most Recently Used (MRU) item.
    // The back of the list (end()) is the Least Recently Used (LRU) item.
    using ItemList = std::list<std::pair<K, V>>;

    // Stores the maximum number of key-value pairs the cache can hold.
    size_t max_entries;

    ItemList item_list;

    // Maps each key to its node in 'item_list'.
    // The iterator stays valid across splice(), so promotion never touches the map.
    std::unordered_map<K, typename ItemList::iterator> item_map;

    // Optional eviction notification, may be empty.
    EvictCallback on_evict;

public:
    /**
     * @brief Constructs an LRU of the given capacity.
     *
     * @param capacity The maximum number of items the cache can hold.
     * @param callback Optional eviction notification.
     * @throws std::invalid_argument if capacity is 0.
     */
    explicit SimpleLRU(size_t capacity, EvictCallback callback = nullptr)
        : max_entries(capacity), on_evict(std::move(callback))
    {
        if (capacity == 0)
            throw std::invalid_argument("must provide a positive size");
    }

    // 'item_map' holds iterators into 'item_list', so a member-wise copy
    // would alias the source's nodes. Moving keeps the iterators valid.
    SimpleLRU(const SimpleLRU &) = delete;
    SimpleLRU &operator=(const SimpleLRU &) = delete;
    SimpleLRU(SimpleLRU &&) = default;
    SimpleLRU &operator=(SimpleLRU &&) = default;

    /**
     * @brief Inserts or updates a key-value pair.
     *
     * If the key already exists, it is moved to the MRU position and its value
     * is overwritten. If the key is new it is inserted at the MRU position and,
     * when that grows the cache past its capacity, the LRU item is evicted.
     *
     * @return true if an eviction occurred.
     */
    bool add(const K &key, const V &value)
    {
        // 1. Update case: mark as MRU, then overwrite the value.
        auto it = item_map.find(key);
        if (it != item_map.end())
        {
            item_list.splice(item_list.begin(), item_list, it->second);
            it->second->second = value;
            return false;
        }

        // 2. New insertion at the MRU position.
        item_list.emplace_front(key, value);
        item_map[key] = item_list.begin();

        // 3. At most one entry can be over capacity here.
        if (item_list.size() > max_entries)
        {
            removeOldestEntry();
            return true;
        }
        return false;
    }

    /**
     * @brief Looks up a key and marks it as MRU on a hit.
     *
     * @param key The key to look up.
     * @param value Output parameter, written only on a hit.
     * @return true if the key was found.
     */
    bool get(const K &key, V &value)
    {
        auto it = item_map.find(key);
        if (it == item_map.end())
            return false;

        item_list.splice(item_list.begin(), item_list, it->second);
        value = it->second->second;
        return true;
    }

    /**
     * @brief Looks up a key without updating its recency.
     */
    bool peek(const K &key, V &value) const
    {
        auto it = item_map.find(key);
        if (it == item_map.end())
            return false;

        value = it->second->second;
        return true;
    }

    // Membership test, recency is left untouched.
    bool contains(const K &key) const
    {
        return item_map.find(key) != item_map.end();
    }

    /**
     * @brief Removes a key, firing the eviction callback if it was present.
     *
     * @return true if the key was present.
     */
    bool remove(const K &key)
    {
        auto it = item_map.find(key);
        if (it == item_map.end())
            return false;

        removeElement(it->second);
        return true;
    }

    /**
     * @brief Removes the LRU entry and hands it back to the caller.
     *
     * @param key Output parameter for the removed key.
     * @param value Output parameter for the removed value.
     * @return false if the cache was empty.
     */
    bool removeOldest(K &key, V &value)
    {
        if (item_list.empty())
            return false;

        auto last = std::prev(item_list.end());
        key = last->first;
        value = last->second;
        removeElement(last);
        return true;
    }

    bool removeOldest()
    {
        return removeOldestEntry();
    }

    /**
     * @brief Returns the LRU entry without removing it or changing its recency.
     */
    bool getOldest(K &key, V &value) const
    {
        if (item_list.empty())
            return false;

        const auto &last = item_list.back();
        key = last.first;
        value = last.second;
        return true;
    }

    /**
     * @brief Key of the LRU entry, without copying its value.
     * @throws std::out_of_range if the cache is empty.
     */
    const K &oldestKey() const
    {
        if (item_list.empty())
            throw std::out_of_range("cache is empty");
        return item_list.back().first;
    }

    /**
     * @brief Snapshot of the keys, from oldest to newest.
     */
    std::vector<K> keys() const
    {
        std::vector<K> result;
        result.reserve(item_list.size());
        for (auto it = item_list.rbegin(); it != item_list.rend(); ++it)
            result.push_back(it->first);
        return result;
    }

    /**
     * @brief Snapshot of the values, from oldest to newest.
     */
    std::vector<V> values() const
    {
        std::vector<V> result;
        result.reserve(item_list.size());
        for (auto it = item_list.rbegin(); it != item_list.rend(); ++it)
            result.push_back(it->second);
        return result;
    }

    size_t size() const { return item_list.size(); }

    size_t capacity() const { return max_entries; }

    /**
     * @brief Changes the capacity, evicting LRU entries until the cache fits.
     *
     * @param new_capacity The new maximum number of items.
     * @return The number of entries evicted.
     * @throws std::invalid_argument if new_capacity is 0.
     */
    size_t resize(size_t new_capacity)
    {
        if (new_capacity == 0)
            throw std::invalid_argument("must provide a positive size");

        size_t evicted = 0;
        while (item_list.size() > new_capacity)
        {
            removeOldestEntry();
            ++evicted;
        }
        max_entries = new_capacity;
        return evicted;
    }

    /**
     * @brief Removes every entry, firing the eviction callback once per entry.
     */
    void purge()
    {
        // Detach everything first so the callbacks observe an empty cache.
        ItemList purged;
        purged.swap(item_list);
        item_map.clear();

        if (!on_evict)
            return;
        for (auto it = purged.rbegin(); it != purged.rend(); ++it)
            on_evict(it->first, it->second);
    }

private:
    bool removeOldestEntry()
    {
        if (item_list.empty())
            return false;

        removeElement(std::prev(item_list.end()));
        return true;
    }

    // Unlinks a node from both structures, then notifies.
    void removeElement(typename ItemList::iterator node)
    {
        item_map.erase(node->first);
        std::pair<K, V> entry = std::move(*node);
        item_list.erase(node);

        if (on_evict)
            on_evict(entry.first, entry.second);
    }
};
