// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_RESULT_H
#define SEEN_SVGFX_FILTER_RESULT_H

/*
 * Output of one executed filter primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <2geom/rect.h>
#include "emf/emf-document.h"
#include "filters/filter-types.h"
#include "raster/rasterizer.h"

namespace Svgfx {
namespace Filters {

/// Inline DrawingML to attach to the target shape's properties.
struct MarkupFragment
{
    std::string xml;
};

using Payload = std::variant<MarkupFragment, Emf::EmfDocument, Raster::RasterImage>;

/**
 * The representation chosen for one node and its payload.
 *
 * Markup results come from NativeEffect and VectorApprox, metafiles from EMFFallback, PNG images
 * from RasterFallback. The embedder registers binary payloads as package parts itself.
 */
struct FilterExecutionResult
{
    RenderStrategy strategy = RenderStrategy::NativeEffect;
    Payload payload = MarkupFragment{};
    Geom::OptRect bounds;
    std::size_t cache_key = 0;
    bool passthrough = false; ///< Stands in for a failed node.

    /// The markup, or nullptr for binary payloads.
    std::string const *markup() const;

    /// Metafile or PNG bytes, or nullptr for markup payloads.
    std::vector<std::uint8_t> const *blob() const;

    /// MIME type of the payload.
    char const *content_type() const;

    /// Approximate heap footprint, used for cache accounting.
    std::size_t size_estimate() const;

    /// Hash of strategy, bounds and payload contents.
    std::size_t checksum() const;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_RESULT_H
