// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Component transfer primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-component-transfer.h"

#include <algorithm>
#include <cmath>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

using Channel = FilterComponentTransfer::Channel;
using Function = FilterComponentTransfer::Function;
using Pattern = FilterComponentTransfer::Pattern;

constexpr double EPSILON = 1e-6;
constexpr double LUMINANCE_TOLERANCE = 0.05;

char const *prefix(Channel channel)
{
    switch (channel) {
        case Channel::R: return "funcR.";
        case Channel::G: return "funcG.";
        case Channel::B: return "funcB.";
        default:         return "funcA.";
    }
}

std::array<Function, 4> all_functions(ParamMap const &params)
{
    return {
        FilterComponentTransfer::function(params, Channel::R),
        FilterComponentTransfer::function(params, Channel::G),
        FilterComponentTransfer::function(params, Channel::B),
        FilterComponentTransfer::function(params, Channel::A)
    };
}

bool same(Function const &a, Function const &b)
{
    return a.type == b.type && a.table == b.table && a.slope == b.slope && a.intercept == b.intercept
        && a.amplitude == b.amplitude && a.exponent == b.exponent && a.offset == b.offset;
}

std::uint32_t rgb(double r, double g, double b)
{
    auto channel = [] (double v) { return static_cast<std::uint32_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255)); };
    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

} // namespace

bool FilterComponentTransfer::Function::is_identity() const
{
    if (type == "identity") {
        return true;
    }
    if (type == "linear") {
        return std::abs(slope - 1) < EPSILON && std::abs(intercept) < EPSILON;
    }
    if (type == "gamma") {
        return std::abs(amplitude - 1) < EPSILON && std::abs(exponent - 1) < EPSILON && std::abs(offset) < EPSILON;
    }
    if (type == "table") {
        return table.empty() || table == std::vector<double>{0, 1};
    }
    if (type == "discrete") {
        return table.empty();
    }
    return false;
}

double FilterComponentTransfer::Function::operator()(double c) const
{
    double v = c;
    if (type == "table" && !table.empty()) {
        auto const n = table.size() - 1;
        if (n == 0) {
            v = table[0];
        } else {
            auto const k = std::min<std::size_t>(static_cast<std::size_t>(c * n), n - 1);
            v = table[k] + (c - double(k) / n) * n * (table[k + 1] - table[k]);
        }
    } else if (type == "discrete" && !table.empty()) {
        auto const n = table.size();
        auto const k = std::min<std::size_t>(static_cast<std::size_t>(c * n), n - 1);
        v = table[k];
    } else if (type == "linear") {
        v = slope * c + intercept;
    } else if (type == "gamma") {
        v = amplitude * std::pow(c, exponent) + offset;
    }
    return std::clamp(v, 0.0, 1.0);
}

FilterComponentTransfer::FilterComponentTransfer() = default;

FilterComponentTransfer::~FilterComponentTransfer() = default;

FilterComponentTransfer::Function FilterComponentTransfer::function(ParamMap const &params, Channel channel)
{
    std::string const p = prefix(channel);

    Function f;
    f.type = params.string_or(p + "type", "identity");
    if (f.type != "identity" && f.type != "table" && f.type != "discrete" && f.type != "linear" && f.type != "gamma") {
        throw ParameterError(p + "type", "unknown transfer function '" + f.type + "'");
    }
    f.table = params.numbers_or(p + "tableValues", {});
    f.slope = params.number_or(p + "slope", 1.0);
    f.intercept = params.number_or(p + "intercept", 0.0);
    f.amplitude = params.number_or(p + "amplitude", 1.0);
    f.exponent = params.number_or(p + "exponent", 1.0);
    f.offset = params.number_or(p + "offset", 0.0);
    return f;
}

FilterComponentTransfer::Pattern FilterComponentTransfer::recognise(std::array<Function, 4> const &funcs)
{
    auto const &r = funcs[0];
    auto const &g = funcs[1];
    auto const &b = funcs[2];
    auto const &a = funcs[3];

    bool const colour_identity = r.is_identity() && g.is_identity() && b.is_identity();

    if (colour_identity) {
        if (a.is_identity()) {
            return Pattern::Identity;
        }
        if (a.type == "linear" && std::abs(a.intercept) < EPSILON) {
            return Pattern::AlphaScale;
        }
        return Pattern::Heterogeneous;
    }

    if (!a.is_identity()) {
        return Pattern::Heterogeneous;
    }

    if (r.type == "discrete" && same(r, g) && same(r, b) && r.table.size() == 2) {
        return Pattern::BiLevel;
    }

    if (r.type == "table" && g.type == "table" && b.type == "table"
        && r.table.size() == 2 && g.table.size() == 2 && b.table.size() == 2)
    {
        return Pattern::Duotone;
    }

    if (r.type == "linear" && g.type == "linear" && b.type == "linear"
        && std::abs(r.intercept) < EPSILON && std::abs(g.intercept) < EPSILON && std::abs(b.intercept) < EPSILON)
    {
        // Luminance weights, or a single channel kept while the others are zeroed.
        auto weight = [] (double slope, double w) { return std::abs(slope - w) < LUMINANCE_TOLERANCE; };
        if (weight(r.slope, 0.2126) && weight(g.slope, 0.7152) && weight(b.slope, 0.0722)) {
            return Pattern::Greyscale;
        }
        int kept = 0;
        int zeroed = 0;
        for (auto const *f : {&r, &g, &b}) {
            kept += f->slope >= 0.8;
            zeroed += std::abs(f->slope) < 0.1;
        }
        if (kept == 1 && zeroed == 2) {
            return Pattern::Greyscale;
        }
    }

    if (r.type == "gamma" && same(r, g) && same(r, b)
        && std::abs(r.amplitude - 1) < EPSILON && std::abs(r.offset) < EPSILON)
    {
        return r.exponent > 1 ? Pattern::Gamma : Pattern::InvGamma;
    }

    return Pattern::Heterogeneous;
}

FilterComponentTransfer::Pattern FilterComponentTransfer::recognise(ParamMap const &params)
{
    return recognise(all_functions(params));
}

double FilterComponentTransfer::complexity(ParamMap const &params) const
{
    auto const funcs = all_functions(params);
    if (recognise(funcs) != Pattern::Heterogeneous) {
        return 1.0;
    }
    double c = 2.0;
    for (auto const &f : funcs) {
        if (!f.is_identity()) {
            c += 0.5;
        }
    }
    return c;
}

bool FilterComponentTransfer::vector_approximable(ParamMap const &params) const
{
    return recognise(params) != Pattern::Heterogeneous;
}

PrimitiveOutput FilterComponentTransfer::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const funcs = all_functions(params);

    PrimitiveOutput out;
    out.bounds = primary_bounds(inputs);

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        out.markup = input_markup(inputs, 0);
        auto const &r = funcs[0];
        auto const &g = funcs[1];
        auto const &b = funcs[2];
        switch (recognise(funcs)) {
            case Pattern::Identity:
                break;
            case Pattern::BiLevel:
                out.markup += "<a:biLevel thresh=\"50000\"/>";
                break;
            case Pattern::Greyscale:
                out.markup += "<a:grayscl/>";
                break;
            case Pattern::Duotone:
                out.markup += Glib::ustring::compose(
                    "<a:duotone><a:srgbClr val=\"%1\"/><a:srgbClr val=\"%2\"/></a:duotone>",
                    hex_color(rgb(r.table[0], g.table[0], b.table[0])),
                    hex_color(rgb(r.table[1], g.table[1], b.table[1]))).raw();
                break;
            case Pattern::Gamma:
                out.markup += "<a:gamma/>";
                break;
            case Pattern::InvGamma:
                out.markup += "<a:invGamma/>";
                break;
            case Pattern::AlphaScale:
                out.markup += Glib::ustring::compose("<a:alphaModFix amt=\"%1\"/>", percentage(funcs[3].slope)).raw();
                break;
            default:
                throw ParameterError("type", "these transfer functions have no markup equivalent");
        }
        return out;
    }

    if (auto area = effect_area(inputs, ctx)) {
        Emf::Rectangle rect;
        rect.rect = *area;
        rect.fill.color = rgb(funcs[0](0.5), funcs[1](0.5), funcs[2](0.5));
        rect.fill.opacity = funcs[3](1.0);
        out.commands.emplace_back(std::move(rect));
    }
    return out;
}

} // namespace Filters
} // namespace Svgfx
