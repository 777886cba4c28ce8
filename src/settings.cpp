// SPDX-License-Identifier: GPL-2.0-or-later
#include "settings.h"

#include <glib.h>
#include <glibmm/keyfile.h>
#include <glibmm/miscutils.h>

namespace Svgfx {
namespace {

void warn_clamped(char const *group, char const *key)
{
    g_warning("Setting [%s] %s out of range, clamped", group, key);
}

void read_setting(Glib::KeyFile &file, Setting<int> &setting)
{
    if (setting.set(file.get_integer(setting.group(), setting.key()))) {
        warn_clamped(setting.group(), setting.key());
    }
}

void read_setting(Glib::KeyFile &file, Setting<std::int64_t> &setting)
{
    if (setting.set(file.get_int64(setting.group(), setting.key()))) {
        warn_clamped(setting.group(), setting.key());
    }
}

void read_setting(Glib::KeyFile &file, Setting<double> &setting)
{
    if (setting.set(file.get_double(setting.group(), setting.key()))) {
        warn_clamped(setting.group(), setting.key());
    }
}

void read_setting(Glib::KeyFile &file, Setting<bool> &setting)
{
    setting.set(file.get_boolean(setting.group(), setting.key()));
}

void read_setting(Glib::KeyFile &file, Setting<std::string> &setting)
{
    setting.set(file.get_string(setting.group(), setting.key()).raw());
}

template <typename T>
void read_if_present(Glib::KeyFile &file, Setting<T> &setting)
{
    if (!file.has_group(setting.group()) || !file.has_key(setting.group(), setting.key())) {
        return;
    }
    read_setting(file, setting);
}

} // namespace

std::string Settings::default_native_table()
{
    return Glib::build_filename(SVGFX_DATA_DIR, "native-effects.ini");
}

void Settings::load_from_file(std::string const &path)
{
    Glib::KeyFile file;
    try {
        file.load_from_file(path);
        read(file);
    } catch (Glib::Error const &e) {
        std::string const what = e.what();
        throw ConfigError("Cannot read settings from " + path + ": " + what);
    }
}

void Settings::load_from_data(std::string const &data)
{
    Glib::KeyFile file;
    try {
        file.load_from_data(data);
        read(file);
    } catch (Glib::Error const &e) {
        std::string const what = e.what();
        throw ConfigError("Cannot parse settings: " + what);
    }
}

void Settings::read(Glib::KeyFile &file)
{
    read_if_present(file, emf_size_cap);
    read_if_present(file, emf_dpi);
    read_if_present(file, raster_max_dimension);
    read_if_present(file, worker_threads);
    read_if_present(file, cache_capacity_entries);
    read_if_present(file, cache_capacity_bytes);
    read_if_present(file, cache_ttl_seconds);
    read_if_present(file, cache_sweep_seconds);
    read_if_present(file, fail_fast);
    read_if_present(file, primitive_timeout_ms);
    read_if_present(file, chain_timeout_ms);
    read_if_present(file, emu_per_px);
    read_if_present(file, native_table);
}

} // namespace Svgfx
