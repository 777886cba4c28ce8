// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Morphology primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-morphology.h"

#include <algorithm>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {

FilterMorphology::FilterMorphology() = default;

FilterMorphology::~FilterMorphology() = default;

bool FilterMorphology::dilate(ParamMap const &params)
{
    auto const op = params.string_or("operator", "erode");
    if (op != "erode" && op != "dilate") {
        throw ParameterError("operator", "must be erode or dilate, not '" + op + "'");
    }
    return op == "dilate";
}

std::pair<double, double> FilterMorphology::radius(ParamMap const &params)
{
    auto const r = params.number_pair_or("radius", 0.0);
    if (r.first < 0 || r.second < 0) {
        throw ParameterError("radius", "must not be negative");
    }
    return r;
}

double FilterMorphology::complexity(ParamMap const &params) const
{
    auto const [rx, ry] = radius(params);
    auto const r = std::max(rx, ry);
    if (r == 0) {
        return 0.0;
    }

    double c = 0.5;
    if (r > 10) {
        c += 1.0;
    } else if (r > 5) {
        c += 0.5;
    }
    if (rx != ry) {
        c += 0.3;
    }
    return c;
}

bool FilterMorphology::vector_approximable(ParamMap const &params) const
{
    auto const [rx, ry] = radius(params);
    return std::max(rx, ry) <= MAX_VECTOR_RADIUS;
}

PrimitiveOutput FilterMorphology::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    bool const grow = dilate(params);
    auto const [rx, ry] = radius(params);
    auto const r = std::max(rx, ry);

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);

    if (r == 0) {
        out.markup = input_markup(inputs, 0);
        return out;
    }

    if (out.bounds) {
        if (grow) {
            out.bounds->expandBy(rx, ry);
        } else {
            out.bounds->expandBy(-rx, -ry);
        }
    }

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        if (grow) {
            out.markup += Glib::ustring::compose(
                "<a:ln w=\"%1\"><a:solidFill><a:srgbClr val=\"000000\"/></a:solidFill></a:ln>",
                ctx.emu(2 * r)).raw();
        } else {
            out.markup += Glib::ustring::compose(
                "<a:innerShdw blurRad=\"0\" dist=\"%1\" dir=\"0\"><a:srgbClr val=\"000000\"/></a:innerShdw>",
                ctx.emu(r)).raw();
        }
        return out;
    }

    auto area = effect_area(inputs, ctx);
    if (!area) {
        return out;
    }
    Geom::Rect outline = *area;
    if (grow) {
        outline.expandBy(rx, ry);
    } else {
        outline.expandBy(-rx, -ry);
    }

    Emf::Polygon polygon;
    polygon.points = rect_points(outline);
    polygon.fill.color = 0x808080;
    polygon.stroke = Emf::Stroke{0x000000, 1.0};
    out.commands.emplace_back(std::move(polygon));
    return out;
}

} // namespace Filters
} // namespace Svgfx
