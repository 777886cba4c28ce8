// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_OFFSET_H
#define SEEN_SVGFX_FILTER_OFFSET_H

/*
 * Offset primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

/// Parameters: dx, dy. Rendered natively as an outer shadow at the given distance and direction.
class FilterOffset : public FilterPrimitive
{
public:
    FilterOffset();
    ~FilterOffset() override;

    PrimitiveKind kind() const override { return PrimitiveKind::Offset; }
    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &) const override { return 0.1; }
    bool vector_approximable(ParamMap const &) const override { return true; }

    Glib::ustring name() const override { return Glib::ustring("Offset"); }
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_OFFSET_H
