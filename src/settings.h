// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Tunables of the filter pipeline, with defaults, ranges and key-file loading.
 */
#ifndef SVGFX_SETTINGS_H
#define SVGFX_SETTINGS_H

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace Glib {
class KeyFile;
} // namespace Glib

namespace Svgfx {

/// Raised when a settings or table file cannot be read or has the wrong type for a key.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * One tunable stored under [group] key in a key file.
 *
 * Numeric settings carry a range; values assigned from outside it are clamped with a warning.
 */
template <typename T>
class Setting
{
public:
    Setting(char const *group, char const *key, T def, T min, T max)
        : _group(group), _key(key), _value(def), _def(def), _min(min), _max(max) {}

    Setting(char const *group, char const *key, T def = T())
        : _group(group), _key(key), _value(def), _def(def), _min(def), _max(def), _ranged(false) {}

    operator T const &() const { return _value; }
    T const &get() const { return _value; }
    T const &def() const { return _def; }
    char const *group() const { return _group; }
    char const *key() const { return _key; }

    /// Assign, clamping numeric values into range. Returns whether clamping happened.
    bool set(T value)
    {
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            if (_ranged && (value < _min || value > _max)) {
                _value = value < _min ? _min : _max;
                return true;
            }
        }
        _value = std::move(value);
        return false;
    }

    void reset() { _value = _def; }

private:
    char const *_group;
    char const *_key;
    T _value;
    T _def;
    T _min;
    T _max;
    bool _ranged = true;
};

class Settings
{
public:
    // Metafile encoding
    Setting<std::int64_t> emf_size_cap          = { "emf", "size-cap", 8388608, 1024, 1073741824 };
    Setting<int>          emf_dpi               = { "emf", "dpi", 96, 1, 2400 };

    // Raster fallback
    Setting<int>          raster_max_dimension  = { "raster", "max-dimension", 2048, 1, 16384 };

    // Threading
    Setting<int>          worker_threads        = { "threading", "worker-threads", 0, 0, 256 };

    // Result cache
    Setting<std::int64_t> cache_capacity_entries = { "cache", "capacity-entries", 1024, 0, 1000000 };
    Setting<std::int64_t> cache_capacity_bytes  = { "cache", "capacity-bytes", 67108864, 0, 4294967296 };
    Setting<int>          cache_ttl_seconds     = { "cache", "ttl-seconds", 300, 0, 86400 };
    Setting<int>          cache_sweep_seconds   = { "cache", "sweep-seconds", 30, 1, 3600 };

    // Chain execution
    Setting<bool>         fail_fast             = { "chain", "fail-fast", false };
    Setting<int>          primitive_timeout_ms  = { "chain", "primitive-timeout-ms", 2000, 1, 600000 };
    Setting<int>          chain_timeout_ms      = { "chain", "timeout-ms", 30000, 1, 3600000 };

    // Units
    Setting<double>       emu_per_px            = { "units", "emu-per-px", 9525.0, 1.0, 1000000.0 };

    // Policy
    Setting<std::string>  native_table          = { "policy", "native-table", default_native_table() };

    /// Read settings from a key file on disk. Missing keys keep their current value.
    void load_from_file(std::string const &path);

    /// Read settings from key file text. Missing keys keep their current value.
    void load_from_data(std::string const &data);

    std::chrono::milliseconds primitive_timeout() const { return std::chrono::milliseconds(primitive_timeout_ms.get()); }
    std::chrono::milliseconds chain_timeout() const { return std::chrono::milliseconds(chain_timeout_ms.get()); }

    static std::string default_native_table();

private:
    void read(Glib::KeyFile &file);
};

} // namespace Svgfx

#endif // SVGFX_SETTINGS_H
