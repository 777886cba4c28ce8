// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Convolve matrix primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-convolve-matrix.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <numeric>
#include <utility>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

constexpr double EPSILON = 1e-6;

using Kernel3 = std::array<double, 9>;

std::pair<KnownKernel, Kernel3> const KNOWN_KERNELS[] = {
    { KnownKernel::Identity,        { 0, 0, 0,   0, 1, 0,   0, 0, 0 } },
    { KnownKernel::SobelHorizontal, { -1, 0, 1,  -2, 0, 2,  -1, 0, 1 } },
    { KnownKernel::SobelVertical,   { -1, -2, -1, 0, 0, 0,   1, 2, 1 } },
    { KnownKernel::Laplacian4,      { 0, -1, 0,  -1, 4, -1,  0, -1, 0 } },
    { KnownKernel::Laplacian8,      { -1, -1, -1, -1, 8, -1, -1, -1, -1 } }
};

bool matches(std::vector<double> const &values, Kernel3 const &known, double sign)
{
    for (std::size_t i = 0; i < known.size(); i++) {
        if (std::abs(values[i] - sign * known[i]) > EPSILON) {
            return false;
        }
    }
    return true;
}

} // namespace

FilterConvolveMatrix::FilterConvolveMatrix() = default;

FilterConvolveMatrix::~FilterConvolveMatrix() = default;

FilterConvolveMatrix::Kernel FilterConvolveMatrix::kernel(ParamMap const &params)
{
    auto const [ox, oy] = params.number_pair_or("order", 3.0);
    if (ox < 1 || oy < 1 || ox != std::floor(ox) || oy != std::floor(oy)) {
        throw ParameterError("order", "must be a positive integer");
    }

    Kernel k{ static_cast<int>(ox), static_cast<int>(oy), params.numbers("kernelMatrix") };
    if (k.values.size() != static_cast<std::size_t>(k.order_x * k.order_y)) {
        throw ParameterError("kernelMatrix", Glib::ustring::compose("expected %1 values, got %2",
                                                                    k.order_x * k.order_y, k.values.size()).raw());
    }
    return k;
}

KnownKernel FilterConvolveMatrix::recognise(ParamMap const &params)
{
    auto const k = kernel(params);
    if (k.order_x != 3 || k.order_y != 3) {
        return KnownKernel::None;
    }
    for (auto const &[known, coefficients] : KNOWN_KERNELS) {
        if (matches(k.values, coefficients, 1.0)
            || (known != KnownKernel::Identity && matches(k.values, coefficients, -1.0)))
        {
            return known;
        }
    }
    return KnownKernel::None;
}

Emf::FillSemantics FilterConvolveMatrix::fallback_fill(std::vector<double> const &kernel)
{
    if (std::all_of(kernel.begin(), kernel.end(), [] (double v) { return v >= 0; })) {
        return Emf::FillSemantics::Solid;
    }
    // Emboss kernels are not symmetric under a half turn.
    for (std::size_t i = 0, j = kernel.size() - 1; i < j; i++, j--) {
        if (std::abs(kernel[i] - kernel[j]) > EPSILON) {
            return Emf::FillSemantics::Hatch;
        }
    }
    return Emf::FillSemantics::Crosshatch;
}

double FilterConvolveMatrix::complexity(ParamMap const &params) const
{
    auto const k = kernel(params);

    std::vector<double> nonzero;
    std::copy_if(k.values.begin(), k.values.end(), std::back_inserter(nonzero),
                 [] (double v) { return std::abs(v) > EPSILON; });
    double const nonzero_ratio = double(nonzero.size()) / k.values.size();

    double variation = 0.0;
    if (!nonzero.empty()) {
        double const mean = std::accumulate(nonzero.begin(), nonzero.end(), 0.0) / nonzero.size();
        for (auto v : nonzero) {
            variation += std::abs(v - mean);
        }
        variation /= nonzero.size();
    }

    double const order = std::min(std::max(k.order_x, k.order_y) / 5.0, 1.0);

    return std::min(0.3 * nonzero_ratio + 0.4 * std::min(variation / 10.0, 1.0) + 0.3 * order, 1.0);
}

bool FilterConvolveMatrix::vector_approximable(ParamMap const &params) const
{
    return recognise(params) != KnownKernel::None;
}

PrimitiveOutput FilterConvolveMatrix::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const k = kernel(params);
    if (auto divisor = params.number_or("divisor", 1.0); divisor == 0) {
        throw ParameterError("divisor", "must not be zero");
    }

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        char const *dash = nullptr;
        switch (recognise(params)) {
            case KnownKernel::Identity:
                return out;
            case KnownKernel::SobelHorizontal:
                dash = "dash";
                break;
            case KnownKernel::SobelVertical:
                dash = "sysDash";
                break;
            case KnownKernel::Laplacian4:
            case KnownKernel::Laplacian8:
                dash = "solid";
                break;
            default:
                throw ParameterError("kernelMatrix", "kernel has no outline equivalent");
        }
        out.markup += Glib::ustring::compose(
            "<a:ln w=\"12700\"><a:solidFill><a:srgbClr val=\"000000\"/></a:solidFill>"
            "<a:prstDash val=\"%1\"/></a:ln>", dash).raw();
        return out;
    }

    if (auto area = effect_area(inputs, ctx)) {
        Emf::Rectangle rect;
        rect.rect = *area;
        rect.fill.semantics = fallback_fill(k.values);
        rect.fill.color = 0x000000;
        if (rect.fill.semantics == Emf::FillSemantics::Solid) {
            rect.fill.color = 0x808080;
            rect.fill.opacity = 0.5;
        }
        out.commands.emplace_back(std::move(rect));
    }
    return out;
}

} // namespace Filters
} // namespace Svgfx

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
