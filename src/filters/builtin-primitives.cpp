// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Registration of the primitives shipped with the library
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/builtin-primitives.h"

#include <memory>
#include "filters/fallback-policy.h"
#include "filters/filter-colormatrix.h"
#include "filters/filter-component-transfer.h"
#include "filters/filter-composite.h"
#include "filters/filter-convolve-matrix.h"
#include "filters/filter-displacement-map.h"
#include "filters/filter-flood.h"
#include "filters/filter-gaussian.h"
#include "filters/filter-lighting.h"
#include "filters/filter-merge.h"
#include "filters/filter-morphology.h"
#include "filters/filter-offset.h"
#include "filters/filter-registry.h"
#include "filters/filter-tile.h"

namespace Svgfx {
namespace Filters {
namespace {

template <typename T>
void install(FilterRegistry &registry, FallbackPolicyEngine &policy, PrimitiveKind kind)
{
    registry.add(kind, [] { return std::make_unique<T>(); });

    // The predicate keeps the registered instance alive for as long as the policy uses it.
    std::shared_ptr<FilterPrimitive const> primitive = registry.resolve(kind);
    VectorApproximation approximation;
    approximation.max_complexity = default_vector_bound(kind);
    approximation.within_bound = [primitive] (ParamMap const &params) {
        return primitive->vector_approximable(params);
    };
    policy.set_vector_approximation(kind, std::move(approximation));
}

} // namespace

double default_vector_bound(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Blur:
            return 11.0;
        case PrimitiveKind::Offset:
        case PrimitiveKind::Flood:
        case PrimitiveKind::Merge:
            return 10.0;
        case PrimitiveKind::ColorMatrix:
        case PrimitiveKind::ComponentTransfer:
        case PrimitiveKind::Morphology:
            return 4.0;
        case PrimitiveKind::DisplacementMap:
            return 8.0;
        default:
            return 3.0;
    }
}

void register_builtin_primitives(FilterRegistry &registry, FallbackPolicyEngine &policy)
{
    install<FilterGaussian>(registry, policy, PrimitiveKind::Blur);
    install<FilterOffset>(registry, policy, PrimitiveKind::Offset);
    install<FilterFlood>(registry, policy, PrimitiveKind::Flood);
    install<FilterMerge>(registry, policy, PrimitiveKind::Merge);
    install<FilterColorMatrix>(registry, policy, PrimitiveKind::ColorMatrix);
    install<FilterComponentTransfer>(registry, policy, PrimitiveKind::ComponentTransfer);
    install<FilterComposite>(registry, policy, PrimitiveKind::Composite);
    install<FilterConvolveMatrix>(registry, policy, PrimitiveKind::ConvolveMatrix);
    install<FilterMorphology>(registry, policy, PrimitiveKind::Morphology);
    install<FilterDiffuseLighting>(registry, policy, PrimitiveKind::DiffuseLighting);
    install<FilterSpecularLighting>(registry, policy, PrimitiveKind::SpecularLighting);
    install<FilterDisplacementMap>(registry, policy, PrimitiveKind::DisplacementMap);
    install<FilterTile>(registry, policy, PrimitiveKind::Tile);
}

} // namespace Filters
} // namespace Svgfx
