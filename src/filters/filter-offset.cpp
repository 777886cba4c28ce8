// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Offset primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-offset.h"

#include <cmath>
#include <2geom/angle.h>

namespace Svgfx {
namespace Filters {

FilterOffset::FilterOffset() = default;

FilterOffset::~FilterOffset() = default;

PrimitiveOutput FilterOffset::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    Geom::Point const d(params.number_or("dx", 0.0), params.number_or("dy", 0.0));

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);
    if (out.bounds) {
        *out.bounds += d;
    }

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        if (!d.isZero()) {
            auto const dir = angle(Geom::deg_from_rad(std::atan2(d.y(), d.x())));
            out.markup += Glib::ustring::compose(
                "<a:outerShdw dist=\"%1\" dir=\"%2\" algn=\"ctr\" rotWithShape=\"0\">"
                "<a:srgbClr val=\"000000\"/></a:outerShdw>",
                ctx.emu(Geom::L2(d)), dir).raw();
        }
        return out;
    }

    if (auto area = effect_area(inputs, ctx)) {
        Emf::Rectangle rect;
        rect.rect = *area + d;
        rect.fill.color = 0x808080;
        out.commands.emplace_back(std::move(rect));
    }
    return out;
}

} // namespace Filters
} // namespace Svgfx
