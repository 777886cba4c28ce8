// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Flood primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-flood.h"

#include <algorithm>

namespace Svgfx {
namespace Filters {

FilterFlood::FilterFlood() = default;

FilterFlood::~FilterFlood() = default;

PrimitiveOutput FilterFlood::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const color = params.color_or("flood-color", 0x000000);
    auto const opacity = std::clamp(params.number_or("flood-opacity", 1.0), 0.0, 1.0);

    PrimitiveOutput out;
    out.bounds = effect_area(inputs, ctx);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = Glib::ustring::compose(
            "<a:solidFill><a:srgbClr val=\"%1\"><a:alpha val=\"%2\"/></a:srgbClr></a:solidFill>",
            hex_color(color), percentage(opacity)).raw();
        return out;
    }

    if (out.bounds) {
        Emf::Rectangle rect;
        rect.rect = *out.bounds;
        rect.fill.color = color;
        rect.fill.opacity = opacity;
        out.commands.emplace_back(std::move(rect));
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
