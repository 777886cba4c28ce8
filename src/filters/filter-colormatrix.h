// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_COLORMATRIX_H
#define SEEN_SVGFX_FILTER_COLORMATRIX_H

/*
 * Color matrix primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <array>
#include <cstdint>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters: type (matrix, saturate, hueRotate, luminanceToAlpha) and values.
 *
 * Saturation and hue rotation map to a native HSL adjustment, a greyscale matrix to a
 * greyscale effect. Anything else is drawn in the metafile as the effect region tinted with the
 * matrix applied to mid grey.
 */
class FilterColorMatrix : public FilterPrimitive
{
public:
    using Matrix = std::array<double, 20>;

    enum class Shape
    {
        Saturate,
        HueRotate,
        LuminanceToAlpha,
        Identity,
        Greyscale,
        General
    };

    FilterColorMatrix();
    ~FilterColorMatrix() override;

    PrimitiveKind kind() const override { return PrimitiveKind::ColorMatrix; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Color Matrix"); }

    static Shape classify(ParamMap const &params);

    /// The 5x4 matrix equivalent to any of the types.
    static Matrix matrix(ParamMap const &params);

    /// Apply \a m to an opaque RGB colour. Returns the colour and the resulting alpha.
    static std::uint32_t transform(Matrix const &m, std::uint32_t rgb, double *alpha = nullptr);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_COLORMATRIX_H
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
