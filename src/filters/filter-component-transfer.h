// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_COMPONENT_TRANSFER_H
#define SEEN_SVGFX_FILTER_COMPONENT_TRANSFER_H

/*
 * Component transfer primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Parameters per channel, prefixed funcR., funcG., funcB. or funcA.: type (identity, table,
 * discrete, linear, gamma), tableValues, slope, intercept, amplitude, exponent, offset.
 *
 * A handful of channel combinations have DrawingML counterparts: a two-level threshold, a
 * two-colour table (duotone), linear luminance weights (greyscale), a uniform gamma curve, and a
 * linear scale of alpha alone. Everything else is drawn in the metafile.
 */
class FilterComponentTransfer : public FilterPrimitive
{
public:
    enum class Channel
    {
        R,
        G,
        B,
        A
    };

    struct Function
    {
        std::string type = "identity";
        std::vector<double> table;
        double slope = 1.0;
        double intercept = 0.0;
        double amplitude = 1.0;
        double exponent = 1.0;
        double offset = 0.0;

        bool is_identity() const;

        /// Transfer one channel value in 0..1.
        double operator()(double c) const;
    };

    enum class Pattern
    {
        Identity,
        BiLevel,
        Greyscale,
        Duotone,
        Gamma,
        InvGamma,
        AlphaScale,
        Heterogeneous
    };

    FilterComponentTransfer();
    ~FilterComponentTransfer() override;

    PrimitiveKind kind() const override { return PrimitiveKind::ComponentTransfer; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &params) const override;

    Glib::ustring name() const override { return Glib::ustring("Component Transfer"); }

    static Function function(ParamMap const &params, Channel channel);
    static Pattern recognise(std::array<Function, 4> const &funcs);
    static Pattern recognise(ParamMap const &params);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_COMPONENT_TRANSFER_H
