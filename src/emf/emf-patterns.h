// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Fixed table of procedural pattern fills.
 */
#ifndef SVGFX_EMF_PATTERNS_H
#define SVGFX_EMF_PATTERNS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "emf/emf-types.h"

namespace Svgfx {
namespace Emf {

// Brush styles and hatch styles (MS-WMF 2.1.1.4, 2.1.1.12).
enum BrushStyle : std::uint32_t
{
    BS_SOLID = 0,
    BS_HATCHED = 2
};

enum HatchStyle : std::uint32_t
{
    HS_HORIZONTAL = 0,
    HS_VERTICAL = 1,
    HS_FDIAGONAL = 2,
    HS_BDIAGONAL = 3,
    HS_CROSS = 4,
    HS_DIAGCROSS = 5
};

/**
 * One pattern fill.
 *
 * Stock hatches are encoded with EMR_CREATEBRUSHINDIRECT; the rest carry their own 8x8 bitmap
 * and are encoded with EMR_CREATEMONOBRUSH. Every entry carries bits, so the rasteriser can
 * draw any of them. Row 0 is the top row; bit 7 is the leftmost pixel; a set bit is foreground.
 */
struct PatternEntry
{
    FillSemantics semantics;
    char const *name;        ///< Name used by primitive parameters.
    bool stock;              ///< Whether a stock brush style exists.
    std::uint32_t brush_style;
    std::uint32_t hatch;
    std::array<std::uint8_t, 8> bits;
    char const *preset;      ///< DrawingML pattern preset, or nullptr if none.
};

PatternEntry const &pattern_for(FillSemantics semantics);
std::optional<FillSemantics> pattern_from_name(std::string const &name);

/// Whether pixel (x, y) of the repeating pattern is foreground.
bool pattern_bit(PatternEntry const &entry, int x, int y);

} // namespace Emf
} // namespace Svgfx

#endif // SVGFX_EMF_PATTERNS_H
