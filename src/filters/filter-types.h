// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_TYPES_H
#define SEEN_SVGFX_FILTER_TYPES_H

/*
 * Enumerations shared by the filter pipeline
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <optional>
#include <string>

namespace Svgfx {
namespace Filters {

/// Closed set of primitive kinds. Implementations are looked up through FilterRegistry.
enum class PrimitiveKind
{
    Blur,
    Offset,
    Flood,
    Merge,
    ColorMatrix,
    ComponentTransfer,
    Composite,
    ConvolveMatrix,
    Morphology,
    DiffuseLighting,
    SpecularLighting,
    DisplacementMap,
    Tile
};

inline constexpr PrimitiveKind ALL_PRIMITIVE_KINDS[] = {
    PrimitiveKind::Blur,
    PrimitiveKind::Offset,
    PrimitiveKind::Flood,
    PrimitiveKind::Merge,
    PrimitiveKind::ColorMatrix,
    PrimitiveKind::ComponentTransfer,
    PrimitiveKind::Composite,
    PrimitiveKind::ConvolveMatrix,
    PrimitiveKind::Morphology,
    PrimitiveKind::DiffuseLighting,
    PrimitiveKind::SpecularLighting,
    PrimitiveKind::DisplacementMap,
    PrimitiveKind::Tile
};

/// Canonical kebab-case name, as used in the native-effect table.
char const *kind_name(PrimitiveKind kind);
std::optional<PrimitiveKind> kind_from_name(std::string const &name);

/**
 * How a primitive's output is represented, from most to least native.
 * RasterFallback is never chosen by the policy; it is an escalation of a failed EMF encode.
 */
enum class RenderStrategy
{
    NativeEffect,
    VectorApprox,
    EMFFallback,
    RasterFallback
};

char const *strategy_name(RenderStrategy strategy);

/// 0 for NativeEffect up to 3 for RasterFallback.
int strategy_rank(RenderStrategy strategy);

/**
 * Input slots. Non-negative values are node indices within a graph; negative values name the
 * well-known sources.
 */
enum FilterSlotType
{
    FILTER_SLOT_NOT_SET = -1,
    FILTER_SOURCEGRAPHIC = -2,
    FILTER_SOURCEALPHA = -3,
    FILTER_BACKGROUNDIMAGE = -4,
    FILTER_BACKGROUNDALPHA = -5,
    FILTER_FILLPAINT = -6,
    FILTER_STROKEPAINT = -7
};

/// Name of a well-known source slot, or nullptr for node slots.
char const *source_slot_name(int slot);

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_TYPES_H
