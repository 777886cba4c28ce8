// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_TILE_H
#define SEEN_SVGFX_FILTER_TILE_H

/*
 * Tile primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "emf/emf-types.h"
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: pattern (auto, hatch, hatch-vertical, crosshatch, grid, hexagonal, brick),
 * width and height of the tile, color and background.
 *
 * Patterns with a DrawingML preset become a pattern fill; hexagonal tiling is metafile only.
 */
class FilterTile : public FilterPrimitive
{
public:
    FilterTile();
    ~FilterTile() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Tile; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Tile"); }

    /// The pattern to draw, with "auto" resolved from the tile's aspect ratio.
    static Emf::FillSemantics pattern(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_TILE_H
