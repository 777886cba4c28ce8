// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-params.h"

#include <cctype>
#include <cmath>
#include <glib.h>
#include <boost/functional/hash.hpp>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

struct ParamHasher
{
    std::size_t operator()(double v) const
    {
        // Make -0.0 and 0.0 hash alike, as they compare alike.
        return boost::hash<double>()(v == 0.0 ? 0.0 : v);
    }

    std::size_t operator()(std::string const &s) const
    {
        return boost::hash<std::string>()(s);
    }

    std::size_t operator()(std::vector<double> const &list) const
    {
        std::size_t seed = list.size();
        for (auto v : list) {
            boost::hash_combine(seed, (*this)(v));
        }
        return seed;
    }
};

int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::vector<double> parse_number_list(std::string const &param, std::string const &text)
{
    std::vector<double> result;
    char const *p = text.c_str();
    while (*p) {
        if (std::isspace(static_cast<unsigned char>(*p)) || *p == ',') {
            ++p;
            continue;
        }
        char *end = nullptr;
        double v = g_ascii_strtod(p, &end);
        if (end == p) {
            throw ParameterError(param, "'" + text + "' is not a list of numbers");
        }
        result.push_back(v);
        p = end;
    }
    return result;
}

ParamMap::ParamMap(std::initializer_list<std::pair<std::string const, ParamValue>> init)
    : _values(init)
{}

void ParamMap::set(std::string const &name, ParamValue value)
{
    _values[name] = std::move(value);
}

bool ParamMap::erase(std::string const &name)
{
    return _values.erase(name) > 0;
}

bool ParamMap::has(std::string const &name) const
{
    return _values.count(name) > 0;
}

ParamValue const *ParamMap::find(std::string const &name) const
{
    auto it = _values.find(name);
    return it == _values.end() ? nullptr : &it->second;
}

double ParamMap::number(std::string const &name) const
{
    auto value = find(name);
    if (!value) {
        throw ParameterError(name, "missing");
    }
    if (auto d = std::get_if<double>(value)) {
        return *d;
    }
    auto list = numbers(name);
    if (list.size() != 1) {
        throw ParameterError(name, "expected a single number");
    }
    return list.front();
}

double ParamMap::number_or(std::string const &name, double def) const
{
    return has(name) ? number(name) : def;
}

std::string const &ParamMap::string(std::string const &name) const
{
    auto value = find(name);
    if (!value) {
        throw ParameterError(name, "missing");
    }
    auto s = std::get_if<std::string>(value);
    if (!s) {
        throw ParameterError(name, "expected a string");
    }
    return *s;
}

std::string ParamMap::string_or(std::string const &name, std::string const &def) const
{
    return has(name) ? string(name) : def;
}

std::vector<double> ParamMap::numbers(std::string const &name) const
{
    auto value = find(name);
    if (!value) {
        throw ParameterError(name, "missing");
    }
    if (auto d = std::get_if<double>(value)) {
        return { *d };
    } else if (auto list = std::get_if<std::vector<double>>(value)) {
        return *list;
    } else {
        return parse_number_list(name, std::get<std::string>(*value));
    }
}

std::vector<double> ParamMap::numbers_or(std::string const &name, std::vector<double> def) const
{
    return has(name) ? numbers(name) : std::move(def);
}

std::pair<double, double> ParamMap::number_pair_or(std::string const &name, double def) const
{
    if (!has(name)) {
        return { def, def };
    }
    auto list = numbers(name);
    switch (list.size()) {
        case 1: return { list[0], list[0] };
        case 2: return { list[0], list[1] };
        default:
            throw ParameterError(name, "expected one or two numbers");
    }
}

std::uint32_t ParamMap::color_or(std::string const &name, std::uint32_t def) const
{
    if (!has(name)) {
        return def;
    }
    auto value = find(name);
    if (auto d = std::get_if<double>(value)) {
        if (!std::isfinite(*d) || *d < 0 || *d > 0xffffff) {
            throw ParameterError(name, "a numeric colour must lie in 0..0xffffff");
        }
        return static_cast<std::uint32_t>(*d);
    }

    auto const &s = string(name);
    if (s == "black") return 0x000000;
    if (s == "white") return 0xffffff;
    if (s == "red")   return 0xff0000;
    if (s == "green") return 0x008000;
    if (s == "blue")  return 0x0000ff;
    if (s == "grey" || s == "gray") return 0x808080;

    if (!s.empty() && s[0] == '#' && (s.size() == 7 || s.size() == 4)) {
        std::uint32_t rgb = 0;
        bool const shorthand = s.size() == 4;
        for (std::size_t i = 1; i < s.size(); i++) {
            int d = hex_digit(s[i]);
            if (d < 0) {
                throw ParameterError(name, "'" + s + "' is not a colour");
            }
            rgb = (rgb << 4) | d;
            if (shorthand) {
                rgb = (rgb << 4) | d;
            }
        }
        return rgb;
    }

    throw ParameterError(name, "'" + s + "' is not a colour");
}

std::size_t ParamMap::hash() const
{
    std::size_t seed = 0;
    for (auto const &[name, value] : _values) {
        boost::hash_combine(seed, name);
        boost::hash_combine(seed, value.index());
        boost::hash_combine(seed, std::visit(ParamHasher(), value));
    }
    return seed;
}

} // namespace Filters
} // namespace Svgfx
