// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_FLOOD_H
#define SEEN_SVGFX_FILTER_FLOOD_H

/*
 * Flood primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/// Parameters: flood-color, flood-opacity. Fills the effect region; ignores its input.
class FilterFlood : public FilterPrimitive
{
public:
    FilterFlood();
    ~FilterFlood() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Flood; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &) const override { return 0.05; }
    bool vector_approximable(ParamMap const &) const override { return true; }

    Glib::ustring name() const override { return Glib::ustring("Flood"); }
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_FLOOD_H
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
