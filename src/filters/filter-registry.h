// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_REGISTRY_H
#define SEEN_SVGFX_FILTER_REGISTRY_H

/*
 * Registry of filter primitive implementations
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "filters/filter-primitive.h"
#include "filters/filter-types.h"

namespace Svgfx {
namespace Filters {

/**
 * Maps each primitive kind to its implementation.
 *
 * Registration is expected at start-up but is safe at any time: it takes a write lock, while
 * concurrent resolve() calls share a read lock and never block each other. Registering a kind
 * again replaces its factory; chains that already resolved the old implementation keep it alive.
 */
class FilterRegistry final
{
public:
    using Factory = std::function<std::unique_ptr<FilterPrimitive>()>;

    FilterRegistry() = default;
    FilterRegistry(FilterRegistry const &) = delete;
    FilterRegistry &operator=(FilterRegistry const &) = delete;

    /// Register \a factory for \a kind, replacing any earlier registration.
    void add(PrimitiveKind kind, Factory factory);

    /// The implementation for \a kind. Throws FilterNotFoundError if none is registered.
    std::shared_ptr<FilterPrimitive const> resolve(PrimitiveKind kind) const;

    bool contains(PrimitiveKind kind) const;
    std::vector<PrimitiveKind> kinds() const;
    void remove(PrimitiveKind kind);
    void clear();

private:
    mutable std::shared_mutex _mutex;
    std::map<PrimitiveKind, std::shared_ptr<FilterPrimitive const>> _entries;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_REGISTRY_H
