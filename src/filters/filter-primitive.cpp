// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Filter primitive base
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-primitive.h"

#include <algorithm>
#include <cmath>
#include <ios>
#include <iomanip>

namespace Svgfx {
namespace Filters {

std::vector<std::string> FilterPrimitiveSpec::inputs() const
{
    std::vector<std::string> result{in};
    if (!in2.empty()) {
        result.push_back(in2);
    }
    result.insert(result.end(), more_inputs.begin(), more_inputs.end());
    return result;
}

long PrimitiveContext::emu(double px) const
{
    return std::lround(px * emu_per_px);
}

FilterPrimitive::FilterPrimitive() = default;

FilterPrimitive::~FilterPrimitive() = default;

double FilterPrimitive::complexity(ParamMap const &) const
{
    return 1.0;
}

bool FilterPrimitive::vector_approximable(ParamMap const &) const
{
    return false;
}

Geom::OptRect FilterPrimitive::primary_bounds(PrimitiveInputs const &inputs)
{
    if (inputs.empty()) {
        return {};
    }
    return inputs.front().result->bounds;
}

Geom::OptRect FilterPrimitive::effect_area(PrimitiveInputs const &inputs, PrimitiveContext const &ctx)
{
    if (ctx.region) {
        return ctx.region;
    }
    if (auto bounds = primary_bounds(inputs)) {
        return bounds;
    }
    return ctx.source_bounds;
}

std::string FilterPrimitive::input_markup(PrimitiveInputs const &inputs, std::size_t i)
{
    if (i >= inputs.size()) {
        return {};
    }
    if (auto xml = inputs[i].result->markup()) {
        return *xml;
    }
    return {};
}

std::vector<Geom::Point> FilterPrimitive::rect_points(Geom::Rect const &rect)
{
    return { rect.corner(0), rect.corner(1), rect.corner(2), rect.corner(3) };
}

std::string FilterPrimitive::hex_color(std::uint32_t rgb)
{
    return Glib::ustring::format(std::hex, std::uppercase, std::setfill(L'0'), std::setw(6), rgb & 0xffffff).raw();
}

long FilterPrimitive::percentage(double fraction)
{
    return std::lround(std::clamp(fraction, 0.0, 1.0) * 100000);
}

long FilterPrimitive::angle(double degrees)
{
    double d = std::fmod(degrees, 360.0);
    if (d < 0) {
        d += 360.0;
    }
    return std::lround(d * 60000) % 21600000;
}

} // namespace Filters
} // namespace Svgfx

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
