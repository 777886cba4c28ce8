// SPDX-License-Identifier: GPL-2.0-or-later
#include "native-effect-table.h"

#include <vector>
#include <glib.h>
#include <glibmm/keyfile.h>
#include <boost/functional/hash.hpp>
#include "filters/filter-errors.h"
#include "settings.h"

namespace Svgfx {
namespace Filters {
namespace {

bool starts_with(std::string const &s, char const *prefix)
{
    return s.rfind(prefix, 0) == 0;
}

} // namespace

bool NativeEffectEntry::supports(ParamMap const &params) const
{
    auto const source = [&] (std::string const &param) -> ParamMap const * {
        if (params.has(param)) {
            return &params;
        }
        return defaults.has(param) ? &defaults : nullptr;
    };

    for (auto const &[param, range] : ranges) {
        auto const from = source(param);
        if (!from) {
            continue;
        }
        std::vector<double> numbers;
        try {
            numbers = from->numbers(param);
        } catch (ParameterError const &) {
            // Not numeric, so certainly not in the numeric range.
            return false;
        }
        for (auto v : numbers) {
            if (!range.contains(v)) {
                return false;
            }
        }
    }

    for (auto const &[param, allowed] : values) {
        auto const from = source(param);
        if (!from) {
            continue;
        }
        auto s = std::get_if<std::string>(from->find(param));
        if (!s || !allowed.count(*s)) {
            return false;
        }
    }

    return true;
}

NativeEffectTable NativeEffectTable::load_from_file(std::string const &path)
{
    Glib::KeyFile file;
    try {
        file.load_from_file(path);
        return read(file);
    } catch (Glib::Error const &e) {
        std::string const what = e.what();
        throw ConfigError("Cannot read native-effect table " + path + ": " + what);
    }
}

NativeEffectTable NativeEffectTable::load_from_data(std::string const &data)
{
    Glib::KeyFile file;
    try {
        file.load_from_data(data);
        return read(file);
    } catch (Glib::Error const &e) {
        std::string const what = e.what();
        throw ConfigError("Cannot parse native-effect table: " + what);
    }
}

NativeEffectTable NativeEffectTable::read(Glib::KeyFile &file)
{
    NativeEffectTable table;

    if (file.has_group("meta") && file.has_key("meta", "version")) {
        table._version = file.get_integer("meta", "version");
    }

    for (auto const &group : file.get_groups()) {
        if (group == "meta") {
            continue;
        }
        auto kind = kind_from_name(group.raw());
        if (!kind) {
            g_warning("Native-effect table: unknown primitive kind [%s]", group.c_str());
            continue;
        }

        NativeEffectEntry entry;
        for (auto const &key_ : file.get_keys(group)) {
            std::string const key = key_.raw();
            if (key == "native") {
                entry.native = file.get_boolean(group, key);
            } else if (key == "max-complexity") {
                entry.max_complexity = file.get_double(group, key);
            } else if (key == "vector-max-complexity") {
                entry.vector_max_complexity = file.get_double(group, key);
            } else if (starts_with(key, "range.")) {
                std::vector<double> bounds = file.get_double_list(group, key);
                if (bounds.size() != 2 || bounds[0] > bounds[1]) {
                    throw ConfigError("Native-effect table: [" + group.raw() + "] " + key + " must be min;max");
                }
                entry.ranges[key.substr(6)] = NumericRange{bounds[0], bounds[1]};
            } else if (starts_with(key, "values.")) {
                std::set<std::string> allowed;
                for (auto const &v : file.get_string_list(group, key)) {
                    allowed.insert(v.raw());
                }
                entry.values[key.substr(7)] = std::move(allowed);
            } else if (starts_with(key, "default.")) {
                entry.defaults.set(key.substr(8), file.get_string(group, key).raw());
            } else {
                g_warning("Native-effect table: ignoring [%s] %s", group.c_str(), key.c_str());
            }
        }
        table._entries[*kind] = std::move(entry);
    }

    return table;
}

NativeEffectEntry const *NativeEffectTable::find(PrimitiveKind kind) const
{
    auto it = _entries.find(kind);
    return it == _entries.end() ? nullptr : &it->second;
}

void NativeEffectTable::set(PrimitiveKind kind, NativeEffectEntry entry)
{
    _entries[kind] = std::move(entry);
}

std::size_t NativeEffectTable::fingerprint() const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, _version);
    for (auto const &[kind, entry] : _entries) {
        boost::hash_combine(seed, static_cast<int>(kind));
        boost::hash_combine(seed, entry.native);
        for (auto const &[param, range] : entry.ranges) {
            boost::hash_combine(seed, param);
            boost::hash_combine(seed, range.min);
            boost::hash_combine(seed, range.max);
        }
        for (auto const &[param, allowed] : entry.values) {
            boost::hash_combine(seed, param);
            boost::hash_range(seed, allowed.begin(), allowed.end());
        }
        boost::hash_combine(seed, entry.defaults.hash());
        boost::hash_combine(seed, entry.max_complexity.value_or(-1.0));
        boost::hash_combine(seed, entry.vector_max_complexity.value_or(-1.0));
    }
    return seed;
}

} // namespace Filters
} // namespace Svgfx
