// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_NATIVE_EFFECT_TABLE_H
#define SEEN_SVGFX_NATIVE_EFFECT_TABLE_H

/*
 * Which primitives, with which parameters, the target renderer supports natively
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <map>
#include <optional>
#include <set>
#include <string>
#include "filters/filter-params.h"
#include "filters/filter-types.h"

namespace Glib {
class KeyFile;
} // namespace Glib

namespace Svgfx {
namespace Filters {

struct NumericRange
{
    double min;
    double max;
    bool contains(double v) const { return v >= min && v <= max; }
};

struct NativeEffectEntry
{
    bool native = false;
    std::map<std::string, NumericRange> ranges;          ///< range.<param>=min;max
    std::map<std::string, std::set<std::string>> values; ///< values.<param>=a;b;c
    ParamMap defaults;                                   ///< default.<param>=value
    std::optional<double> max_complexity;
    std::optional<double> vector_max_complexity;

    /**
     * Whether every constrained parameter lies within its range or value set. An absent parameter
     * is checked with its default from the table; without one it is assumed supported.
     */
    bool supports(ParamMap const &params) const;
};

/**
 * The native-effect compatibility table, one entry per primitive kind.
 *
 * Loaded from a key file with a [meta] group holding the table version and one group per kind,
 * named by kind_name(). Kinds without a group have no native equivalent.
 */
class NativeEffectTable
{
public:
    NativeEffectTable() = default;

    /// @throws ConfigError if the file cannot be read or is malformed.
    static NativeEffectTable load_from_file(std::string const &path);
    static NativeEffectTable load_from_data(std::string const &data);

    NativeEffectEntry const *find(PrimitiveKind kind) const;
    void set(PrimitiveKind kind, NativeEffectEntry entry);

    int version() const { return _version; }
    void set_version(int version) { _version = version; }

    /// Hash of the version and every entry. Part of every cache key.
    std::size_t fingerprint() const;

private:
    int _version = 0;
    std::map<PrimitiveKind, NativeEffectEntry> _entries;

    static NativeEffectTable read(Glib::KeyFile &file);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_NATIVE_EFFECT_TABLE_H
