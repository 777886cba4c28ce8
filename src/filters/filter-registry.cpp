// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-registry.h"

#include <mutex>
#include <stdexcept>
#include <glib.h>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {

void FilterRegistry::add(PrimitiveKind kind, Factory factory)
{
    if (!factory) {
        throw std::invalid_argument("FilterRegistry::add: empty factory");
    }

    // Primitives are stateless, so one instance per registration serves every chain.
    std::shared_ptr<FilterPrimitive const> instance = factory();
    if (!instance) {
        throw std::invalid_argument("FilterRegistry::add: factory returned nothing");
    }
    if (instance->kind() != kind) {
        g_warning("FilterRegistry: %s registered under kind %s", instance->name().c_str(), kind_name(kind));
    }

    auto lock = std::unique_lock(_mutex);
    _entries[kind] = std::move(instance);
}

std::shared_ptr<FilterPrimitive const> FilterRegistry::resolve(PrimitiveKind kind) const
{
    auto lock = std::shared_lock(_mutex);
    auto it = _entries.find(kind);
    if (it == _entries.end()) {
        throw FilterNotFoundError(kind);
    }
    return it->second;
}

bool FilterRegistry::contains(PrimitiveKind kind) const
{
    auto lock = std::shared_lock(_mutex);
    return _entries.count(kind) > 0;
}

std::vector<PrimitiveKind> FilterRegistry::kinds() const
{
    auto lock = std::shared_lock(_mutex);
    std::vector<PrimitiveKind> result;
    for (auto const &[kind, instance] : _entries) {
        result.push_back(kind);
    }
    return result;
}

void FilterRegistry::remove(PrimitiveKind kind)
{
    auto lock = std::unique_lock(_mutex);
    _entries.erase(kind);
}

void FilterRegistry::clear()
{
    auto lock = std::unique_lock(_mutex);
    _entries.clear();
}

} // namespace Filters
} // namespace Svgfx
