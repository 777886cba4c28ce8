// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_MORPHOLOGY_H
#define SEEN_SVGFX_FILTER_MORPHOLOGY_H

/*
 * Morphology primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <utility>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: operator (erode or dilate), radius ("r" or "rx ry").
 *
 * Dilation becomes an outline stroke of twice the radius, erosion an inner shadow of the
 * radius. A zero radius passes the input through unchanged.
 */
class FilterMorphology : public FilterPrimitive
{
public:
    FilterMorphology();
    ~FilterMorphology() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Morphology; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Morphology"); }

    static constexpr double MAX_VECTOR_RADIUS = 50.0;

private:
    static bool dilate(ParamMap const &params);
    static std::pair<double, double> radius(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_MORPHOLOGY_H
