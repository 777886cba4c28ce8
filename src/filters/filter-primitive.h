// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_PRIMITIVE_H
#define SEEN_SVGFX_FILTER_PRIMITIVE_H

/*
 * Common contract of filter primitive implementations
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <string>
#include <vector>
#include <2geom/point.h>
#include <2geom/rect.h>
#include <glibmm/ustring.h>
#include "async/progress.h"
#include "emf/emf-types.h"
#include "filters/filter-params.h"
#include "filters/filter-result.h"
#include "filters/filter-types.h"

namespace Svgfx {
namespace Filters {

/**
 * One node of a filter graph, as handed over by the graph builder.
 *
 * An empty \a in means the result of the previous node (SourceGraphic for the first node). An
 * empty \a in2 means the node has no second input. Merge nodes list their third and later inputs
 * in \a more_inputs.
 */
struct FilterPrimitiveSpec
{
    std::string id;
    PrimitiveKind kind = PrimitiveKind::Offset;
    ParamMap params;
    std::string in;
    std::string in2;
    std::vector<std::string> more_inputs;
    std::string result;
    Geom::OptRect region;

    /// All input references in order: in (possibly empty), then in2 and the rest if set.
    std::vector<std::string> inputs() const;
};

struct PrimitiveInput
{
    std::string name;                     ///< Reference as written, or the source name.
    FilterExecutionResult const *result;  ///< Never null.
};

using PrimitiveInputs = std::vector<PrimitiveInput>;

/**
 * What a primitive produces. Markup is used for NativeEffect and VectorApprox, drawing commands
 * for EMFFallback. Both may be filled; the chain uses the one matching the strategy.
 */
struct PrimitiveOutput
{
    std::string markup;
    std::vector<Emf::Command> commands;
    Geom::OptRect bounds;
};

/**
 * Per-call context. Primitives call progress.report_or_throw() between internal sub-steps; this
 * throws CancelledException (or TimeoutException) once the chain is cancelled or the node's
 * deadline has passed.
 */
class PrimitiveContext
{
public:
    PrimitiveContext(RenderStrategy strategy_, Async::Progress<double> &progress_)
        : strategy(strategy_), progress(progress_) {}

    RenderStrategy strategy;
    Async::Progress<double> &progress;
    Geom::OptRect source_bounds;  ///< Bounds of the filtered element.
    Geom::OptRect region;         ///< The node's effect region, if it declares one.
    double emu_per_px = 9525.0;

    /// Pixels to EMU, rounded to nearest.
    long emu(double px) const;
};

class FilterPrimitive
{
public:
    FilterPrimitive();
    virtual ~FilterPrimitive();

    FilterPrimitive(FilterPrimitive const &) = delete;
    FilterPrimitive &operator=(FilterPrimitive const &) = delete;

    virtual PrimitiveKind kind() const = 0;

    /**
     * Compute the output for the strategy in \a ctx.
     *
     * Must be a pure function of its arguments: results are cached by parameter and input hash.
     * Throws ParameterError for invalid parameters.
     */
    virtual PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const = 0;

    /**
     * Cost of representing the effect natively; higher means harder. Used only by the policy.
     */
    virtual double complexity(ParamMap const &params) const;

    /**
     * Whether a vector approximation within the primitive's error bound exists for these
     * parameters.
     */
    virtual bool vector_approximable(ParamMap const &params) const;

    virtual Glib::ustring name() const = 0;

protected:
    /// Bounds of the first input, or nothing.
    static Geom::OptRect primary_bounds(PrimitiveInputs const &inputs);

    /// The node region, else the first input's bounds, else the source bounds.
    static Geom::OptRect effect_area(PrimitiveInputs const &inputs, PrimitiveContext const &ctx);

    /// Markup of input \a i, or empty if it has none.
    static std::string input_markup(PrimitiveInputs const &inputs, std::size_t i);

    static std::vector<Geom::Point> rect_points(Geom::Rect const &rect);

    /// "RRGGBB".
    static std::string hex_color(std::uint32_t rgb);

    /// Fraction 0..1 to DrawingML thousandths of a percent, clamped.
    static long percentage(double fraction);

    /// Degrees to DrawingML 60000ths of a degree, normalised to [0, 360).
    static long angle(double degrees);
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_PRIMITIVE_H
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
