// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tile primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-tile.h"

#include <cmath>
#include "emf/emf-patterns.h"
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {

FilterTile::FilterTile() = default;

FilterTile::~FilterTile() = default;

Emf::FillSemantics FilterTile::pattern(ParamMap const &params)
{
    auto const name = params.string_or("pattern", "auto");
    if (name != "auto") {
        auto semantics = Emf::pattern_from_name(name);
        if (!semantics || *semantics == Emf::FillSemantics::Solid) {
            throw ParameterError("pattern", "unknown tile pattern '" + name + "'");
        }
        return *semantics;
    }

    double const w = params.number_or("width", 1.0);
    double const h = params.number_or("height", 1.0);
    if (w <= 0 || h <= 0) {
        throw ParameterError(w <= 0 ? "width" : "height", "must be positive");
    }

    double const ratio = w / h;
    if (std::abs(ratio - 1.0) < 0.1) {
        return Emf::FillSemantics::Hexagonal;
    }
    if (ratio >= 2.0) {
        return Emf::FillSemantics::Hatch;
    }
    if (ratio <= 0.5) {
        return Emf::FillSemantics::HatchVertical;
    }
    return Emf::FillSemantics::Grid;
}

double FilterTile::complexity(ParamMap const &params) const
{
    return Emf::pattern_for(pattern(params)).preset ? 1.0 : 5.0;
}

bool FilterTile::vector_approximable(ParamMap const &params) const
{
    return Emf::pattern_for(pattern(params)).preset != nullptr;
}

PrimitiveOutput FilterTile::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const &entry = Emf::pattern_for(pattern(params));
    auto const fg = params.color_or("color", 0x000000);
    auto const bg = params.color_or("background", 0xffffff);

    PrimitiveOutput out;
    out.bounds = effect_area(inputs, ctx);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        if (!entry.preset) {
            throw ParameterError("pattern", std::string(entry.name) + " tiling has no preset pattern");
        }
        out.markup = Glib::ustring::compose(
            "<a:pattFill prst=\"%1\"><a:fgClr><a:srgbClr val=\"%2\"/></a:fgClr>"
            "<a:bgClr><a:srgbClr val=\"%3\"/></a:bgClr></a:pattFill>",
            entry.preset, hex_color(fg), hex_color(bg)).raw();
        return out;
    }

    if (out.bounds) {
        Emf::Rectangle rect;
        rect.rect = *out.bounds;
        rect.fill = Emf::Fill{entry.semantics, fg, bg, 1.0};
        out.commands.emplace_back(std::move(rect));
    }
    return out;
}

} // namespace Filters
} // namespace Svgfx
