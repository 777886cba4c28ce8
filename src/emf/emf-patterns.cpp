// SPDX-License-Identifier: GPL-2.0-or-later
#include "emf-patterns.h"

namespace Svgfx {
namespace Emf {
namespace {

PatternEntry const pattern_table[] = {
    { FillSemantics::Solid,         "solid",          true,  BS_SOLID,   0,
      {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}, "solid" },
    { FillSemantics::Hatch,         "hatch",          true,  BS_HATCHED, HS_HORIZONTAL,
      {0xff, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}, "horz" },
    { FillSemantics::HatchVertical, "hatch-vertical", true,  BS_HATCHED, HS_VERTICAL,
      {0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80}, "vert" },
    { FillSemantics::Crosshatch,    "crosshatch",     true,  BS_HATCHED, HS_DIAGCROSS,
      {0x81, 0x42, 0x24, 0x18, 0x18, 0x24, 0x42, 0x81}, "diagCross" },
    { FillSemantics::Grid,          "grid",           true,  BS_HATCHED, HS_CROSS,
      {0xff, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80}, "smGrid" },
    { FillSemantics::Hexagonal,     "hexagonal",      false, 0,          0,
      {0x1c, 0x22, 0x41, 0x41, 0x41, 0x22, 0x1c, 0x08}, nullptr },
    { FillSemantics::Brick,         "brick",          false, 0,          0,
      {0xff, 0x80, 0x80, 0x80, 0xff, 0x08, 0x08, 0x08}, "horzBrick" },
};

} // namespace

PatternEntry const &pattern_for(FillSemantics semantics)
{
    for (auto const &entry : pattern_table) {
        if (entry.semantics == semantics) {
            return entry;
        }
    }
    return pattern_table[0];
}

std::optional<FillSemantics> pattern_from_name(std::string const &name)
{
    for (auto const &entry : pattern_table) {
        if (name == entry.name) {
            return entry.semantics;
        }
    }
    return {};
}

bool pattern_bit(PatternEntry const &entry, int x, int y)
{
    x = ((x % 8) + 8) % 8;
    y = ((y % 8) + 8) % 8;
    return entry.bits[y] & (0x80 >> x);
}

} // namespace Emf
} // namespace Svgfx
