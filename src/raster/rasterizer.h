// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Raster fallback: renders drawing commands with cairo and serialises them as PNG.
 */
#ifndef SVGFX_RASTER_RASTERIZER_H
#define SVGFX_RASTER_RASTERIZER_H

#include <cstdint>
#include <stdexcept>
#include <vector>
#include <2geom/rect.h>
#include "emf/emf-types.h"

namespace Svgfx {
namespace Raster {

struct RasterImage
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> png;
};

class RasterError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class Rasterizer final
{
public:
    explicit Rasterizer(int max_dimension = 2048);

    /**
     * Render \a commands clipped to \a bounds (user pixels). The image is scaled down uniformly
     * so that neither side exceeds the maximum dimension. Without bounds, the bounds of the
     * commands are used; if those are empty too, a 1x1 transparent image results.
     *
     * @throws RasterError if cairo fails to create the surface or to write the PNG.
     */
    RasterImage rasterize(std::vector<Emf::Command> const &commands, Geom::OptRect const &bounds) const;

    int max_dimension() const { return _max_dimension; }

private:
    int _max_dimension;
};

} // namespace Raster
} // namespace Svgfx

#endif // SVGFX_RASTER_RASTERIZER_H
