// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Gaussian blur primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-gaussian.h"

#include <algorithm>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {

FilterGaussian::FilterGaussian() = default;

FilterGaussian::~FilterGaussian() = default;

std::pair<double, double> FilterGaussian::deviation(ParamMap const &params)
{
    auto const d = params.number_pair_or("stdDeviation", 0.0);
    if (d.first < 0 || d.second < 0) {
        throw ParameterError("stdDeviation", "must not be negative");
    }
    return d;
}

double FilterGaussian::complexity(ParamMap const &params) const
{
    auto const [sx, sy] = deviation(params);
    double c = std::max(sx, sy) / 5.0;
    if (sx != sy) {
        c += 5.0;
    }
    return c;
}

PrimitiveOutput FilterGaussian::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const [sx, sy] = deviation(params);
    auto const sigma = std::max(sx, sy);

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);
    if (out.bounds) {
        out.bounds->expandBy(3 * sx, 3 * sy);
    }

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        if (sigma > 0) {
            out.markup += Glib::ustring::compose("<a:blur rad=\"%1\" grow=\"1\"/>", ctx.emu(sigma)).raw();
        }
        return out;
    }

    auto area = effect_area(inputs, ctx);
    if (!area) {
        return out;
    }

    // Outermost polygon first, so that the more opaque inner ones are drawn on top.
    for (int i = 0; i < FALLOFF_STEPS; i++) {
        double const t = 1.0 - double(i) / FALLOFF_STEPS;
        Geom::Rect r = *area;
        r.expandBy(3 * sx * t, 3 * sy * t);

        Emf::Polygon polygon;
        polygon.points = rect_points(r);
        polygon.fill.color = 0x808080;
        polygon.fill.opacity = double(i + 1) / (FALLOFF_STEPS + 1);
        out.commands.emplace_back(std::move(polygon));

        ctx.progress.report_or_throw(double(i + 1) / FALLOFF_STEPS);
    }

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
