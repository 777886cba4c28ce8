// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Displacement map primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-displacement-map.h"

#include <cmath>
#include <2geom/math-utils.h>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

/// Phase offset of a channel selector, in turns.
double channel_phase(ParamMap const &params, char const *param)
{
    auto const channel = params.string_or(param, "A");
    if (channel == "R") return 0.0;
    if (channel == "G") return 0.25;
    if (channel == "B") return 0.5;
    if (channel == "A") return 0.75;
    throw ParameterError(param, "must be R, G, B or A, not '" + channel + "'");
}

double checked_scale(double scale)
{
    if (!std::isfinite(scale) || std::abs(scale) > FilterDisplacementMap::MAX_SCALE) {
        throw ParameterError("scale", "must be finite and at most 10000 in magnitude");
    }
    return scale;
}

} // namespace

FilterDisplacementMap::FilterDisplacementMap() = default;

FilterDisplacementMap::~FilterDisplacementMap() = default;

double FilterDisplacementMap::scale(ParamMap const &params)
{
    return checked_scale(params.number_or("scale", 0.0));
}

int FilterDisplacementMap::control_points(double scale)
{
    return 4 * static_cast<int>(std::ceil(8 + 2 * std::abs(checked_scale(scale))));
}

double FilterDisplacementMap::complexity(ParamMap const &params) const
{
    return std::abs(scale(params)) / 10.0 + 1.0;
}

bool FilterDisplacementMap::vector_approximable(ParamMap const &params) const
{
    return control_points(scale(params)) <= MAX_CONTROL_POINTS;
}

std::vector<Geom::Point> FilterDisplacementMap::displaced_outline(Geom::Rect const &rect, ParamMap const &params)
{
    double const scale = FilterDisplacementMap::scale(params);
    double const phase_x = channel_phase(params, "xChannelSelector");
    double const phase_y = channel_phase(params, "yChannelSelector");
    int const n = control_points(scale);
    int const per_side = n / 4;

    std::vector<Geom::Point> points;
    points.reserve(n);
    for (int side = 0; side < 4; side++) {
        Geom::Point const from = rect.corner(side);
        Geom::Point const to = rect.corner((side + 1) % 4);
        for (int i = 0; i < per_side; i++) {
            double const t = double(i) / per_side;
            double const turn = 2 * M_PI * double(side * per_side + i) / n * 4;
            Geom::Point const shift(0.5 * scale * std::sin(turn + 2 * M_PI * phase_x),
                                    0.5 * scale * std::sin(turn + 2 * M_PI * phase_y));
            points.push_back(Geom::lerp(t, from, to) + shift);
        }
    }
    return points;
}

PrimitiveOutput FilterDisplacementMap::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    double const scale = FilterDisplacementMap::scale(params);

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);
    if (out.bounds) {
        out.bounds->expandBy(std::abs(scale) / 2);
    }

    auto area = effect_area(inputs, ctx);
    if (!area) {
        out.markup = input_markup(inputs, 0);
        return out;
    }

    auto const points = displaced_outline(*area, params);
    ctx.progress.report_or_throw(0.5);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        Geom::Point const origin = area->min();
        auto pt = [&] (Geom::Point const &p) {
            return Glib::ustring::compose("<a:pt x=\"%1\" y=\"%2\"/>", ctx.emu(p.x() - origin.x()), ctx.emu(p.y() - origin.y())).raw();
        };

        std::string path = "<a:moveTo>" + pt(points.front()) + "</a:moveTo>";
        for (std::size_t i = 1; i < points.size(); i++) {
            path += "<a:lnTo>" + pt(points[i]) + "</a:lnTo>";
        }
        path += "<a:close/>";

        out.markup = input_markup(inputs, 0);
        out.markup += Glib::ustring::compose(
            "<a:custGeom><a:pathLst><a:path w=\"%1\" h=\"%2\">%3</a:path></a:pathLst></a:custGeom>",
            ctx.emu(area->width()), ctx.emu(area->height()), path).raw();
        return out;
    }

    Emf::Polyline polyline;
    polyline.points = points;
    polyline.points.push_back(points.front());
    out.commands.emplace_back(std::move(polyline));
    return out;
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
