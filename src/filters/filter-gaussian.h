// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_GAUSSIAN_H
#define SEEN_SVGFX_FILTER_GAUSSIAN_H

/*
 * Gaussian blur primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <utility>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: stdDeviation, one number or "x y".
 *
 * Rendered natively as a soft-edge blur of the larger deviation. The metafile fallback draws
 * the blurred region as nested translucent polygons.
 */
class FilterGaussian : public FilterPrimitive
{
public:
    FilterGaussian();
    ~FilterGaussian() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Blur; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &) const override { return true; }

    Glib::ustring name() const override { return Glib::ustring("Gaussian Blur"); }

    static constexpr int FALLOFF_STEPS = 4;

private:
    static std::pair<double, double> deviation(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_GAUSSIAN_H
/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
