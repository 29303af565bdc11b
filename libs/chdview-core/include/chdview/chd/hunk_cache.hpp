#pragma once

/**
@file
@brief Bounded LRU cache of decompressed hunks.
*/

#include <chdview/core/types.hpp>

#include <list>
#include <unordered_map>
#include <vector>

namespace chdview::chd {

/// @brief Keeps the most recently used decompressed hunks in memory.
///
/// Eviction only affects decode latency: every hunk returned by the cache is exactly what was inserted for that index.
///
/// Not thread-safe; `Image` guards its cache with its own mutex.
class HunkCache {
public:
    /// @brief Creates a cache that holds up to `capacity` hunks (at least 1).
    explicit HunkCache(uint32 capacity);

    /// @brief Looks up a hunk and marks it as the most recently used.
    /// @return a pointer to the hunk data, or `nullptr` if the hunk is not cached. The pointer is valid until the next
    /// call to a non-const method.
    const std::vector<uint8> *Find(uint32 index);

    /// @brief Inserts or replaces a hunk, evicting the least recently used hunks if the cache is full.
    void Insert(uint32 index, std::vector<uint8> data);

    /// @brief Removes a hunk from the cache if present.
    void Erase(uint32 index);

    /// @brief Removes all hunks.
    void Clear();

    /// @brief Changes the capacity, evicting hunks immediately if the cache shrinks below its current size.
    void SetCapacity(uint32 capacity);

    uint32 Capacity() const {
        return m_capacity;
    }

    uint32 Size() const {
        return static_cast<uint32>(m_entries.size());
    }

    bool Contains(uint32 index) const {
        return m_index.contains(index);
    }

    uint64 Hits() const {
        return m_hits;
    }

    uint64 Misses() const {
        return m_misses;
    }

private:
    struct Entry {
        uint32 index;
        std::vector<uint8> data;
    };

    // Most recently used entries are at the front
    std::list<Entry> m_entries;
    std::unordered_map<uint32, std::list<Entry>::iterator> m_index;
    uint32 m_capacity;

    uint64 m_hits = 0;
    uint64 m_misses = 0;

    void EvictToCapacity();
};

} // namespace chdview::chd
