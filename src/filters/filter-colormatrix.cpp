// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Color matrix primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-colormatrix.h"

#include <algorithm>
#include <cmath>
#include <2geom/angle.h>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

constexpr double EPSILON = 1e-3;

bool near(double a, double b)
{
    return std::abs(a - b) < EPSILON;
}

FilterColorMatrix::Matrix identity_matrix()
{
    return { 1, 0, 0, 0, 0,
             0, 1, 0, 0, 0,
             0, 0, 1, 0, 0,
             0, 0, 0, 1, 0 };
}

} // namespace

FilterColorMatrix::FilterColorMatrix() = default;

FilterColorMatrix::~FilterColorMatrix() = default;

FilterColorMatrix::Matrix FilterColorMatrix::matrix(ParamMap const &params)
{
    auto const type = params.string_or("type", "matrix");

    if (type == "matrix") {
        auto const values = params.numbers_or("values", {});
        if (values.empty()) {
            return identity_matrix();
        }
        if (values.size() != 20) {
            throw ParameterError("values", "a color matrix needs 20 values");
        }
        Matrix m;
        std::copy(values.begin(), values.end(), m.begin());
        return m;
    }

    if (type == "saturate") {
        double const s = std::clamp(params.number_or("values", 1.0), 0.0, 1.0);
        return { 0.213 + 0.787 * s, 0.715 - 0.715 * s, 0.072 - 0.072 * s, 0, 0,
                 0.213 - 0.213 * s, 0.715 + 0.285 * s, 0.072 - 0.072 * s, 0, 0,
                 0.213 - 0.213 * s, 0.715 - 0.715 * s, 0.072 + 0.928 * s, 0, 0,
                 0, 0, 0, 1, 0 };
    }

    if (type == "hueRotate") {
        double const a = Geom::rad_from_deg(params.number_or("values", 0.0));
        double const c = std::cos(a);
        double const s = std::sin(a);
        return { 0.213 + c * 0.787 - s * 0.213, 0.715 - c * 0.715 - s * 0.715, 0.072 - c * 0.072 + s * 0.928, 0, 0,
                 0.213 - c * 0.213 + s * 0.143, 0.715 + c * 0.285 + s * 0.140, 0.072 - c * 0.072 - s * 0.283, 0, 0,
                 0.213 - c * 0.213 - s * 0.787, 0.715 - c * 0.715 + s * 0.715, 0.072 + c * 0.928 + s * 0.072, 0, 0,
                 0, 0, 0, 1, 0 };
    }

    if (type == "luminanceToAlpha") {
        return { 0, 0, 0, 0, 0,
                 0, 0, 0, 0, 0,
                 0, 0, 0, 0, 0,
                 0.2125, 0.7154, 0.0721, 0, 0 };
    }

    throw ParameterError("type", "unknown color matrix type '" + type + "'");
}

FilterColorMatrix::Shape FilterColorMatrix::classify(ParamMap const &params)
{
    auto const type = params.string_or("type", "matrix");
    if (type == "saturate") {
        return Shape::Saturate;
    }
    if (type == "hueRotate") {
        return Shape::HueRotate;
    }
    if (type == "luminanceToAlpha") {
        return Shape::LuminanceToAlpha;
    }

    auto const m = matrix(params);
    auto const identity = identity_matrix();
    if (std::equal(m.begin(), m.end(), identity.begin(), near)) {
        return Shape::Identity;
    }

    // Greyscale: the three colour rows are equal, carry no alpha or offset term, and alpha passes
    // through unchanged.
    bool grey = true;
    for (int row = 1; row < 3 && grey; row++) {
        for (int col = 0; col < 5; col++) {
            grey = grey && near(m[row * 5 + col], m[col]);
        }
    }
    grey = grey && near(m[3], 0) && near(m[4], 0);
    grey = grey && near(m[15], 0) && near(m[16], 0) && near(m[17], 0) && near(m[18], 1) && near(m[19], 0);
    return grey ? Shape::Greyscale : Shape::General;
}

double FilterColorMatrix::complexity(ParamMap const &params) const
{
    switch (classify(params)) {
        case Shape::Saturate:
        case Shape::HueRotate:
            return 0.5;
        case Shape::Identity:
        case Shape::Greyscale:
            return 2.0;
        case Shape::LuminanceToAlpha:
            return 3.0;
        default:
            return 4.0;
    }
}

bool FilterColorMatrix::vector_approximable(ParamMap const &params) const
{
    auto const shape = classify(params);
    return shape != Shape::LuminanceToAlpha && shape != Shape::General;
}

std::uint32_t FilterColorMatrix::transform(Matrix const &m, std::uint32_t rgb, double *alpha)
{
    double const in[4] = {
        ((rgb >> 16) & 0xff) / 255.0,
        ((rgb >> 8) & 0xff) / 255.0,
        (rgb & 0xff) / 255.0,
        1.0
    };
    double out[4];
    for (int row = 0; row < 4; row++) {
        double v = m[row * 5 + 4];
        for (int col = 0; col < 4; col++) {
            v += m[row * 5 + col] * in[col];
        }
        out[row] = std::clamp(v, 0.0, 1.0);
    }
    if (alpha) {
        *alpha = out[3];
    }
    auto channel = [] (double v) { return static_cast<std::uint32_t>(std::lround(v * 255)); };
    return (channel(out[0]) << 16) | (channel(out[1]) << 8) | channel(out[2]);
}

PrimitiveOutput FilterColorMatrix::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);
    auto const shape = classify(params);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        switch (shape) {
            case Shape::Saturate: {
                double const s = std::clamp(params.number_or("values", 1.0), 0.0, 1.0);
                out.markup += Glib::ustring::compose("<a:hsl hue=\"0\" sat=\"%1\" lum=\"0\"/>",
                                                     std::lround((s - 1.0) * 100000)).raw();
                break;
            }
            case Shape::HueRotate:
                out.markup += Glib::ustring::compose("<a:hsl hue=\"%1\" sat=\"0\" lum=\"0\"/>",
                                                     angle(params.number_or("values", 0.0))).raw();
                break;
            case Shape::Greyscale:
                out.markup += "<a:grayscl/>";
                break;
            case Shape::Identity:
                break;
            default:
                throw ParameterError("type", "this color matrix has no markup equivalent");
        }
        return out;
    }

    if (auto area = effect_area(inputs, ctx)) {
        double alpha = 1.0;
        Emf::Rectangle rect;
        rect.rect = *area;
        rect.fill.color = transform(matrix(params), 0x808080, &alpha);
        rect.fill.opacity = alpha;
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
