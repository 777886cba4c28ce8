// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_MERGE_H
#define SEEN_SVGFX_FILTER_MERGE_H

/*
 * Merge primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/**
 * Layers all of its inputs, first input at the bottom. The markup is the concatenation of the
 * inputs' fragments and the bounds are their union.
 */
class FilterMerge : public FilterPrimitive
{
public:
    FilterMerge();
    ~FilterMerge() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Merge; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &) const override { return 0.5; }
    bool vector_approximable(ParamMap const &) const override { return true; }

    Glib::ustring name() const override { return Glib::ustring("Merge"); }
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_MERGE_H
