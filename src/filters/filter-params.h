// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_PARAMS_H
#define SEEN_SVGFX_FILTER_PARAMS_H

/*
 * Typed primitive parameters
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Svgfx {
namespace Filters {

using ParamValue = std::variant<double, std::string, std::vector<double>>;

/**
 * Parameters of one primitive, keyed by attribute name.
 *
 * Values arrive unit-normalised from the graph builder. Keys are kept sorted, so two maps built
 * in different attribute orders compare and hash equal.
 *
 * Accessors that take no default throw ParameterError when the parameter is missing or cannot be
 * read as the requested type. Strings holding numbers ("2", "1 0.5", "0,1") are accepted wherever
 * numbers are expected.
 */
class ParamMap
{
public:
    using const_iterator = std::map<std::string, ParamValue>::const_iterator;

    ParamMap() = default;
    ParamMap(std::initializer_list<std::pair<std::string const, ParamValue>> init);

    void set(std::string const &name, ParamValue value);
    bool erase(std::string const &name);
    bool has(std::string const &name) const;
    ParamValue const *find(std::string const &name) const;

    double number(std::string const &name) const;
    double number_or(std::string const &name, double def) const;

    std::string const &string(std::string const &name) const;
    std::string string_or(std::string const &name, std::string const &def) const;

    /// A list; a single number yields a list of one.
    std::vector<double> numbers(std::string const &name) const;
    std::vector<double> numbers_or(std::string const &name, std::vector<double> def) const;

    /// "a" means (a, a); "a b" means (a, b).
    std::pair<double, double> number_pair_or(std::string const &name, double def) const;

    /// A colour as 0xRRGGBB from "#RRGGBB", "#RGB", or a handful of keywords.
    std::uint32_t color_or(std::string const &name, std::uint32_t def) const;

    const_iterator begin() const { return _values.begin(); }
    const_iterator end() const { return _values.end(); }
    std::size_t size() const { return _values.size(); }
    bool empty() const { return _values.empty(); }

    /// Structural hash of names and values, independent of insertion order.
    std::size_t hash() const;

    bool operator==(ParamMap const &other) const { return _values == other._values; }
    bool operator!=(ParamMap const &other) const { return _values != other._values; }

private:
    std::map<std::string, ParamValue> _values;
};

/// Parse a whitespace- or comma-separated list of numbers. Throws ParameterError naming \a param.
std::vector<double> parse_number_list(std::string const &param, std::string const &text);

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_PARAMS_H
