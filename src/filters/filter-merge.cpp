// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Merge primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-merge.h"

namespace Svgfx {
namespace Filters {

FilterMerge::FilterMerge() = default;

FilterMerge::~FilterMerge() = default;

PrimitiveOutput FilterMerge::apply(ParamMap const &, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    PrimitiveOutput out;
    for (auto const &input : inputs) {
        out.bounds.unionWith(input.result->bounds);
    }

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        for (std::size_t i = 0; i < inputs.size(); i++) {
            out.markup += input_markup(inputs, i);
        }
        return out;
    }

    for (auto const &input : inputs) {
        if (!input.result->bounds) {
            continue;
        }
        Emf::Rectangle rect;
        rect.rect = *input.result->bounds;
        rect.fill.color = 0x808080;
        rect.fill.opacity = 1.0 / inputs.size();
        out.commands.emplace_back(std::move(rect));
    }
    return out;
}

} // namespace Filters
} // namespace Svgfx
