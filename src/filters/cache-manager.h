// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_CACHE_MANAGER_H
#define SEEN_SVGFX_CACHE_MANAGER_H

/*
 * Process-wide cache of filter execution results
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include "filters/filter-result.h"

namespace Svgfx {
namespace Filters {

using CacheKey = std::size_t;

struct CacheOptions
{
    using Clock = std::chrono::steady_clock;

    std::size_t capacity_entries = 1024;
    std::size_t capacity_bytes = 64 * 1024 * 1024;
    std::chrono::milliseconds ttl = std::chrono::seconds(300);
    std::chrono::milliseconds sweep_interval = std::chrono::seconds(30);
    bool background_sweep = true;

    /// Time source; replaceable for tests.
    std::function<Clock::time_point()> now = [] { return Clock::now(); };
};

struct CacheStats
{
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;
    std::size_t expirations = 0;
    std::size_t corruptions = 0;
    std::size_t entries = 0;
    std::size_t bytes = 0;
};

/**
 * Thread-safe LRU cache with per-entry TTL.
 *
 * Entries are bounded by count and by summed size estimate; the least recently used entries go
 * first. Expired entries are dropped when read and by a background sweeper, which runs until
 * shutdown() or destruction. Values are immutable once stored and are handed out as shared
 * pointers, so readers never observe later evictions.
 */
class CacheManager final
{
public:
    using Clock = CacheOptions::Clock;
    using Value = std::shared_ptr<FilterExecutionResult const>;

    explicit CacheManager(CacheOptions options = {});
    ~CacheManager();

    CacheManager(CacheManager const &) = delete;
    CacheManager &operator=(CacheManager const &) = delete;

    /// The value for \a key, or nullptr on a miss. A corrupted entry is flushed and reported as a miss.
    Value get(CacheKey key);

    /**
     * Like get(), but reports a corrupted entry by throwing CacheCorruptionError after flushing it.
     */
    Value lookup(CacheKey key);

    /**
     * Store \a value under \a key. A size hint of zero means the value's own size estimate.
     * A value larger than the byte capacity is not stored.
     */
    void put(CacheKey key, FilterExecutionResult value, std::size_t size_hint = 0,
             std::optional<std::chrono::milliseconds> ttl = {});

    /// Like put(), remembering the primitive kind that produced \a value for invalidate().
    void put(CacheKey key, PrimitiveKind kind, FilterExecutionResult value, std::size_t size_hint = 0,
             std::optional<std::chrono::milliseconds> ttl = {});

    bool contains(CacheKey key) const;

    void flush();
    void flush(CacheKey key);

    /// Drop every entry produced by \a kind, e.g. after its native-effect table entry changed.
    /// Returns how many were removed.
    std::size_t invalidate(PrimitiveKind kind);

    /// Remove expired entries now. Returns how many were removed.
    std::size_t sweep_expired();

    /// Stop the background sweeper. The cache remains usable.
    void shutdown();

    CacheStats stats() const;
    CacheOptions const &options() const { return _options; }

private:
    struct Entry
    {
        CacheKey key;
        std::optional<PrimitiveKind> kind;
        Value value;
        std::size_t size;
        std::size_t checksum;
        Clock::time_point inserted;
        Clock::duration ttl;

        bool expired(Clock::time_point now) const { return ttl.count() > 0 && now - inserted >= ttl; }
    };

    using List = std::list<Entry>;

    CacheOptions _options;
    mutable std::mutex _mutex;
    List _lru; ///< Most recently used first.
    std::unordered_map<CacheKey, List::iterator> _index;
    CacheStats _stats;

    std::condition_variable _sweep_cond;
    bool _stopping = false;
    std::thread _sweeper;

    void store(CacheKey key, std::optional<PrimitiveKind> kind, FilterExecutionResult value,
               std::size_t size_hint, std::optional<std::chrono::milliseconds> ttl);
    void erase(List::iterator it);
    void evict_to_fit(std::size_t incoming);
    void sweep_loop();
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_CACHE_MANAGER_H
