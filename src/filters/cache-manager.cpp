// SPDX-License-Identifier: GPL-2.0-or-later
#include "cache-manager.h"

#include <glib.h>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {

CacheManager::CacheManager(CacheOptions options)
    : _options(std::move(options))
{
    if (!_options.now) {
        _options.now = [] { return Clock::now(); };
    }
    if (_options.background_sweep && _options.sweep_interval.count() > 0) {
        _sweeper = std::thread([this] { sweep_loop(); });
    }
}

CacheManager::~CacheManager()
{
    shutdown();
}

void CacheManager::shutdown()
{
    {
        auto g = std::lock_guard(_mutex);
        _stopping = true;
    }
    _sweep_cond.notify_all();
    if (_sweeper.joinable()) {
        _sweeper.join();
    }
}

void CacheManager::sweep_loop()
{
    auto lock = std::unique_lock(_mutex);
    while (!_stopping) {
        _sweep_cond.wait_for(lock, _options.sweep_interval, [this] { return _stopping; });
        if (_stopping) {
            break;
        }
        auto const now = _options.now();
        for (auto it = _lru.begin(); it != _lru.end(); ) {
            auto next = std::next(it);
            if (it->expired(now)) {
                erase(it);
                _stats.expirations++;
            }
            it = next;
        }
    }
}

CacheManager::Value CacheManager::get(CacheKey key)
{
    try {
        return lookup(key);
    } catch (CacheCorruptionError const &e) {
        g_warning("%s", e.what());
        return nullptr;
    }
}

CacheManager::Value CacheManager::lookup(CacheKey key)
{
    auto g = std::lock_guard(_mutex);

    auto found = _index.find(key);
    if (found == _index.end()) {
        _stats.misses++;
        return nullptr;
    }

    auto it = found->second;
    if (it->expired(_options.now())) {
        erase(it);
        _stats.expirations++;
        _stats.misses++;
        return nullptr;
    }

    if (it->value->checksum() != it->checksum) {
        erase(it);
        _stats.corruptions++;
        _stats.misses++;
        throw CacheCorruptionError(key);
    }

    _lru.splice(_lru.begin(), _lru, it);
    _stats.hits++;
    return it->value;
}

void CacheManager::put(CacheKey key, FilterExecutionResult value, std::size_t size_hint,
                       std::optional<std::chrono::milliseconds> ttl)
{
    store(key, {}, std::move(value), size_hint, ttl);
}

void CacheManager::put(CacheKey key, PrimitiveKind kind, FilterExecutionResult value, std::size_t size_hint,
                       std::optional<std::chrono::milliseconds> ttl)
{
    store(key, kind, std::move(value), size_hint, ttl);
}

void CacheManager::store(CacheKey key, std::optional<PrimitiveKind> kind, FilterExecutionResult value,
                         std::size_t size_hint, std::optional<std::chrono::milliseconds> ttl)
{
    auto const size = size_hint ? size_hint : value.size_estimate();
    if (_options.capacity_entries == 0 || size > _options.capacity_bytes) {
        return;
    }

    auto stored = std::make_shared<FilterExecutionResult>(std::move(value));
    auto const checksum = stored->checksum();

    auto g = std::lock_guard(_mutex);

    if (auto found = _index.find(key); found != _index.end()) {
        erase(found->second);
    }
    evict_to_fit(size);

    _lru.push_front(Entry{key, kind, std::move(stored), size, checksum, _options.now(), ttl.value_or(_options.ttl)});
    _index[key] = _lru.begin();
    _stats.entries = _lru.size();
    _stats.bytes += size;
}

bool CacheManager::contains(CacheKey key) const
{
    auto g = std::lock_guard(_mutex);
    return _index.count(key) > 0;
}

void CacheManager::flush()
{
    auto g = std::lock_guard(_mutex);
    _lru.clear();
    _index.clear();
    _stats.entries = 0;
    _stats.bytes = 0;
}

void CacheManager::flush(CacheKey key)
{
    auto g = std::lock_guard(_mutex);
    if (auto found = _index.find(key); found != _index.end()) {
        erase(found->second);
    }
}

std::size_t CacheManager::invalidate(PrimitiveKind kind)
{
    auto g = std::lock_guard(_mutex);
    std::size_t removed = 0;
    for (auto it = _lru.begin(); it != _lru.end(); ) {
        auto next = std::next(it);
        if (it->kind == kind) {
            erase(it);
            removed++;
        }
        it = next;
    }
    return removed;
}

std::size_t CacheManager::sweep_expired()
{
    auto g = std::lock_guard(_mutex);
    auto const now = _options.now();
    std::size_t removed = 0;
    for (auto it = _lru.begin(); it != _lru.end(); ) {
        auto next = std::next(it);
        if (it->expired(now)) {
            erase(it);
            removed++;
        }
        it = next;
    }
    _stats.expirations += removed;
    return removed;
}

CacheStats CacheManager::stats() const
{
    auto g = std::lock_guard(_mutex);
    return _stats;
}

// Called with the mutex held.
void CacheManager::erase(List::iterator it)
{
    _stats.bytes -= it->size;
    _index.erase(it->key);
    _lru.erase(it);
    _stats.entries = _lru.size();
}

// Called with the mutex held.
void CacheManager::evict_to_fit(std::size_t incoming)
{
    while (!_lru.empty() && (_lru.size() + 1 > _options.capacity_entries || _stats.bytes + incoming > _options.capacity_bytes)) {
        erase(std::prev(_lru.end()));
        _stats.evictions++;
    }
}

} // namespace Filters
} // namespace Svgfx
