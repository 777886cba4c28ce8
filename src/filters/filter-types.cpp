// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-types.h"

namespace Svgfx {
namespace Filters {

char const *kind_name(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Blur:              return "blur";
        case PrimitiveKind::Offset:            return "offset";
        case PrimitiveKind::Flood:             return "flood";
        case PrimitiveKind::Merge:             return "merge";
        case PrimitiveKind::ColorMatrix:       return "color-matrix";
        case PrimitiveKind::ComponentTransfer: return "component-transfer";
        case PrimitiveKind::Composite:         return "composite";
        case PrimitiveKind::ConvolveMatrix:    return "convolve-matrix";
        case PrimitiveKind::Morphology:        return "morphology";
        case PrimitiveKind::DiffuseLighting:   return "diffuse-lighting";
        case PrimitiveKind::SpecularLighting:  return "specular-lighting";
        case PrimitiveKind::DisplacementMap:   return "displacement-map";
        case PrimitiveKind::Tile:              return "tile";
    }
    return "unknown";
}

std::optional<PrimitiveKind> kind_from_name(std::string const &name)
{
    for (auto kind : ALL_PRIMITIVE_KINDS) {
        if (name == kind_name(kind)) {
            return kind;
        }
    }
    return {};
}

char const *strategy_name(RenderStrategy strategy)
{
    switch (strategy) {
        case RenderStrategy::NativeEffect:   return "native";
        case RenderStrategy::VectorApprox:   return "vector";
        case RenderStrategy::EMFFallback:    return "emf";
        case RenderStrategy::RasterFallback: return "raster";
    }
    return "unknown";
}

int strategy_rank(RenderStrategy strategy)
{
    return static_cast<int>(strategy);
}

char const *source_slot_name(int slot)
{
    switch (slot) {
        case FILTER_SOURCEGRAPHIC:   return "SourceGraphic";
        case FILTER_SOURCEALPHA:     return "SourceAlpha";
        case FILTER_BACKGROUNDIMAGE: return "BackgroundImage";
        case FILTER_BACKGROUNDALPHA: return "BackgroundAlpha";
        case FILTER_FILLPAINT:       return "FillPaint";
        case FILTER_STROKEPAINT:     return "StrokePaint";
        default:                     return nullptr;
    }
}

} // namespace Filters
} // namespace Svgfx
