// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Composite and blend primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-composite.h"

#include <map>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

std::map<std::string, char const *> const BLEND_MODES = {
    { "over",     "over" },
    { "normal",   "over" },
    { "multiply", "mult" },
    { "screen",   "screen" },
    { "darken",   "darken" },
    { "lighten",  "lighten" }
};

char const *const KNOWN_OPERATORS[] = {
    "over", "in", "out", "atop", "xor", "arithmetic",
    "normal", "multiply", "screen", "darken", "lighten", "overlay", "color-dodge", "color-burn",
    "hard-light", "soft-light", "difference", "exclusion", "hue", "saturation", "color", "luminosity"
};

} // namespace

FilterComposite::FilterComposite() = default;

FilterComposite::~FilterComposite() = default;

std::string FilterComposite::effective_operator(ParamMap const &params)
{
    auto op = params.string_or("mode", "");
    char const *param = "mode";
    if (op.empty()) {
        op = params.string_or("operator", "over");
        param = "operator";
    }
    for (auto known : KNOWN_OPERATORS) {
        if (op == known) {
            return op;
        }
    }
    throw ParameterError(param, "unknown operator '" + op + "'");
}

std::optional<std::string> FilterComposite::blend_for(std::string const &op)
{
    auto it = BLEND_MODES.find(op);
    if (it == BLEND_MODES.end()) {
        return {};
    }
    return std::string(it->second);
}

bool FilterComposite::is_porter_duff(std::string const &op)
{
    return op == "over" || op == "in" || op == "out" || op == "atop" || op == "xor";
}

std::array<double, 4> FilterComposite::coefficients(ParamMap const &params)
{
    return { params.number_or("k1", 0.0), params.number_or("k2", 0.0),
             params.number_or("k3", 0.0), params.number_or("k4", 0.0) };
}

double FilterComposite::complexity(ParamMap const &params) const
{
    auto const op = effective_operator(params);
    if (blend_for(op)) {
        return 0.5;
    }
    if (op == "arithmetic") {
        return 4.0;
    }
    return 2.5;
}

bool FilterComposite::vector_approximable(ParamMap const &params) const
{
    return blend_for(effective_operator(params)).has_value();
}

PrimitiveOutput FilterComposite::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const op = effective_operator(params);

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);
    if (inputs.size() > 1) {
        if (op == "in") {
            out.bounds.intersectWith(inputs[1].result->bounds);
        } else if (op != "out") {
            out.bounds.unionWith(inputs[1].result->bounds);
        }
    }

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        auto blend = blend_for(op);
        if (!blend) {
            throw ParameterError("operator", "'" + op + "' has no blend-mode equivalent");
        }
        out.markup = input_markup(inputs, 0);
        out.markup += Glib::ustring::compose("<a:blend blend=\"%1\"><a:cont>%2</a:cont></a:blend>",
                                             *blend, input_markup(inputs, 1)).raw();
        return out;
    }

    // No metafile record blends pixels; the encoder turns this down and the caller rasterises.
    auto area = out.bounds ? out.bounds : effect_area(inputs, ctx);
    Emf::PixelComposite composite;
    composite.rect = area ? *area : Geom::Rect();
    composite.op = op;
    composite.k = coefficients(params);
    out.commands.emplace_back(std::move(composite));
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
