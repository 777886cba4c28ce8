// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_COMPOSITE_H
#define SEEN_SVGFX_FILTER_COMPOSITE_H

/*
 * Composite and blend primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <array>
#include <optional>
#include <string>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: operator (over, in, out, atop, xor, arithmetic), mode (a blend mode, which
 * takes precedence over the operator), k1 to k4 for arithmetic.
 *
 * The first input is the top layer, the second the backdrop.
 */
class FilterComposite : public FilterPrimitive
{
public:
    FilterComposite();
    ~FilterComposite() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Composite; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Composite"); }

    /// The operator or blend mode in effect.
    static std::string effective_operator(ParamMap const &params);

    /// The DrawingML blend value for an operator or mode, if there is one.
    static std::optional<std::string> blend_for(std::string const &op);

    static bool is_porter_duff(std::string const &op);

private:
    static std::array<double, 4> coefficients(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_COMPOSITE_H
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
