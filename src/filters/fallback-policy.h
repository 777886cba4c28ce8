// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FALLBACK_POLICY_H
#define SEEN_SVGFX_FALLBACK_POLICY_H

/*
 * Selection of the render strategy of each primitive
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include "filters/filter-params.h"
#include "filters/filter-types.h"
#include "filters/native-effect-table.h"

namespace Svgfx {
namespace Filters {

/**
 * A registered vector approximation for one kind: a predicate on the parameters (the
 * primitive-specific error bound, such as a maximum kernel size or control-point count) and the
 * highest complexity it accepts.
 */
struct VectorApproximation
{
    std::function<bool(ParamMap const &)> within_bound;
    double max_complexity = 10.0;
};

/// Decision counters, by strategy.
struct PolicyStats
{
    std::size_t decisions = 0;
    std::size_t native = 0;
    std::size_t vector = 0;
    std::size_t emf = 0;
    std::size_t raster_escalations = 0; ///< EMF decisions the encoder turned into raster.
};

/**
 * Decides how each primitive is represented:
 *
 *  1. NativeEffect if the table marks the kind native, the parameters are within the table's
 *     ranges, and the complexity does not exceed the table's max-complexity.
 *  2. Otherwise VectorApprox if a vector approximation is registered, its predicate holds, and
 *     the complexity does not exceed its bound (the table's vector-max-complexity, if present,
 *     overrides the registered bound).
 *  3. Otherwise EMFFallback.
 *
 * Only the complexity thresholds depend on the score, so raising the score can only move the
 * decision further down that list. The result of decide() depends on its arguments and the
 * configuration only; it also counts the decision in stats(). Configuration (the table and the
 * vector approximations) must be complete before the engine is shared between threads.
 */
class FallbackPolicyEngine final
{
public:
    FallbackPolicyEngine() = default;
    explicit FallbackPolicyEngine(NativeEffectTable table);

    FallbackPolicyEngine(FallbackPolicyEngine const &) = delete;
    FallbackPolicyEngine &operator=(FallbackPolicyEngine const &) = delete;

    RenderStrategy decide(PrimitiveKind kind, ParamMap const &params, double complexity) const;

    /// Count an EMF decision whose encoding failed and went to raster instead.
    void record_raster_escalation() const;

    PolicyStats stats() const;
    void reset_stats();

    void set_table(NativeEffectTable table);
    NativeEffectTable const &table() const { return _table; }

    void set_vector_approximation(PrimitiveKind kind, VectorApproximation approximation);
    void clear_vector_approximation(PrimitiveKind kind);
    bool has_vector_approximation(PrimitiveKind kind) const;

    /// Changes whenever the decision inputs change. Part of every cache key.
    std::size_t fingerprint() const;

private:
    NativeEffectTable _table;
    std::map<PrimitiveKind, VectorApproximation> _approximations;
    std::size_t _generation = 0;

    // Indexed by strategy_rank().
    mutable std::array<std::atomic<std::size_t>, 4> _counts{};

    RenderStrategy choose(PrimitiveKind kind, ParamMap const &params, double complexity) const;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FALLBACK_POLICY_H
