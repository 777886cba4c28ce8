// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_CONVOLVE_MATRIX_H
#define SEEN_SVGFX_FILTER_CONVOLVE_MATRIX_H

/*
 * Convolve matrix primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <vector>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

enum class KnownKernel
{
    None,
    Identity,
    SobelHorizontal,
    SobelVertical,
    Laplacian4,
    Laplacian8
};

/**
 * Parameters: order ("n" or "x y"), kernelMatrix, divisor, bias.
 *
 * Identity, Sobel and Laplacian 3x3 kernels (and their negations) are recognised by their
 * coefficients and drawn as outline markup. Any other kernel is drawn in the metafile as a
 * patterned region whose pattern follows the kernel's character.
 */
class FilterConvolveMatrix : public FilterPrimitive
{
public:
    FilterConvolveMatrix();
    ~FilterConvolveMatrix() override;

    PrimitiveKind kind() const override { return PrimitiveKind::ConvolveMatrix; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Convolution Matrix"); }

    static KnownKernel recognise(ParamMap const &params);
    static Emf::FillSemantics fallback_fill(std::vector<double> const &kernel);

private:
    struct Kernel
    {
        int order_x;
        int order_y;
        std::vector<double> values;
    };

    static Kernel kernel(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_CONVOLVE_MATRIX_H
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
