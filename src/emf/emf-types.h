// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Abstract drawing commands accepted by the metafile encoder and the rasteriser.
 *
 * Geometry is in user pixels. Colours are 0xRRGGBB.
 */
#ifndef SVGFX_EMF_TYPES_H
#define SVGFX_EMF_TYPES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <2geom/point.h>
#include <2geom/rect.h>

namespace Svgfx {
namespace Emf {

/// Procedural fill requested by a primitive. Each maps to one row of the pattern table.
enum class FillSemantics
{
    Solid,
    Hatch,
    HatchVertical,
    Crosshatch,
    Grid,
    Hexagonal,
    Brick
};

struct Fill
{
    FillSemantics semantics = FillSemantics::Solid;
    std::uint32_t color = 0x000000;
    std::uint32_t background = 0xffffff;
    double opacity = 1.0; ///< Honoured by the rasteriser only; metafile brushes are opaque.
};

struct Stroke
{
    std::uint32_t color = 0x000000;
    double width = 1.0;
};

enum class FillRule
{
    EvenOdd,
    NonZero
};

struct Polygon
{
    std::vector<Geom::Point> points;
    Fill fill;
    std::optional<Stroke> stroke;
};

struct Polyline
{
    std::vector<Geom::Point> points;
    Stroke stroke;
};

struct Rectangle
{
    Geom::Rect rect;
    Fill fill;
    std::optional<Stroke> stroke;
};

/// Several closed contours filled together as one path.
struct FillPath
{
    std::vector<std::vector<Geom::Point>> contours;
    Fill fill;
    FillRule rule = FillRule::NonZero;
};

/**
 * Per-pixel composition of two layers. Metafiles cannot express this; the encoder rejects it so
 * that the caller renders a raster instead.
 *
 * The core never sees the layers' pixels, so the raster is a placeholder: inside the rectangle a
 * mid grey at half opacity stands for the destination, and a dark grey source is combined with it
 * through the cairo operator matching \a op, at an alpha of k1+k2+k3+k4 (clamped to 0..1) for
 * "arithmetic" and 0.75 otherwise. An embedder that needs the real composition must render it
 * from the source images itself.
 */
struct PixelComposite
{
    Geom::Rect rect;
    std::string op; ///< Porter-Duff operator or blend mode name, or "arithmetic".
    std::array<double, 4> k = {0, 0, 0, 0};
};

using Command = std::variant<Polygon, Polyline, Rectangle, FillPath, PixelComposite>;

/// Record types used by the encoder (MS-EMF 2.1.1).
enum RecordType : std::uint32_t
{
    EMR_HEADER = 1,
    EMR_POLYGON = 3,
    EMR_POLYLINE = 4,
    EMR_EOF = 14,
    EMR_SETPOLYFILLMODE = 19,
    EMR_SELECTOBJECT = 37,
    EMR_CREATEPEN = 38,
    EMR_CREATEBRUSHINDIRECT = 39,
    EMR_DELETEOBJECT = 40,
    EMR_RECTANGLE = 43,
    EMR_BEGINPATH = 59,
    EMR_ENDPATH = 60,
    EMR_FILLPATH = 62,
    EMR_CREATEMONOBRUSH = 93
};

char const *record_name(std::uint32_t type);

} // namespace Emf
} // namespace Svgfx

#endif // SVGFX_EMF_TYPES_H
