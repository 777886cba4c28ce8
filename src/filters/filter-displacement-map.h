// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_DISPLACEMENT_MAP_H
#define SEEN_SVGFX_FILTER_DISPLACEMENT_MAP_H

/*
 * Displacement map primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <vector>
#include <2geom/point.h>
#include <2geom/rect.h>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: scale, xChannelSelector, yChannelSelector (R, G, B or A).
 *
 * The outline of the effect region is sampled and each sample pushed along a wave whose
 * amplitude is half the scale; the selectors pick the phase of each axis. The result is a
 * custom geometry path, or a polyline in the metafile.
 */
class FilterDisplacementMap : public FilterPrimitive
{
public:
    FilterDisplacementMap();
    ~FilterDisplacementMap() override;

    PrimitiveKind kind() const override { return PrimitiveKind::DisplacementMap; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Displacement Map"); }

    static constexpr int MAX_CONTROL_POINTS = 256;
    static constexpr double MAX_SCALE = 10000.0;

    /// The \c scale parameter. Throws ParameterError unless it is finite and at most MAX_SCALE in magnitude.
    static double scale(ParamMap const &params);

    /// Number of outline samples needed for \a scale. Throws ParameterError like scale().
    static int control_points(double scale);

    static std::vector<Geom::Point> displaced_outline(Geom::Rect const &rect, ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_DISPLACEMENT_MAP_H
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
