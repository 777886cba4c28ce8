// SPDX-License-Identifier: GPL-2.0-or-later
#include "fallback-policy.h"

#include <boost/functional/hash.hpp>

namespace Svgfx {
namespace Filters {

FallbackPolicyEngine::FallbackPolicyEngine(NativeEffectTable table)
    : _table(std::move(table))
{}

RenderStrategy FallbackPolicyEngine::decide(PrimitiveKind kind, ParamMap const &params, double complexity) const
{
    auto const strategy = choose(kind, params, complexity);
    _counts[strategy_rank(strategy)].fetch_add(1, std::memory_order_relaxed);
    return strategy;
}

RenderStrategy FallbackPolicyEngine::choose(PrimitiveKind kind, ParamMap const &params, double complexity) const
{
    auto const entry = _table.find(kind);

    if (entry && entry->native && entry->supports(params)) {
        if (!entry->max_complexity || complexity <= *entry->max_complexity) {
            return RenderStrategy::NativeEffect;
        }
    }

    if (auto it = _approximations.find(kind); it != _approximations.end()) {
        auto const &approximation = it->second;
        double bound = approximation.max_complexity;
        if (entry && entry->vector_max_complexity) {
            bound = *entry->vector_max_complexity;
        }
        if (complexity <= bound && (!approximation.within_bound || approximation.within_bound(params))) {
            return RenderStrategy::VectorApprox;
        }
    }

    return RenderStrategy::EMFFallback;
}

void FallbackPolicyEngine::record_raster_escalation() const
{
    _counts[strategy_rank(RenderStrategy::RasterFallback)].fetch_add(1, std::memory_order_relaxed);
}

PolicyStats FallbackPolicyEngine::stats() const
{
    PolicyStats stats;
    stats.native = _counts[strategy_rank(RenderStrategy::NativeEffect)].load();
    stats.vector = _counts[strategy_rank(RenderStrategy::VectorApprox)].load();
    stats.emf = _counts[strategy_rank(RenderStrategy::EMFFallback)].load();
    stats.raster_escalations = _counts[strategy_rank(RenderStrategy::RasterFallback)].load();
    stats.decisions = stats.native + stats.vector + stats.emf;
    return stats;
}

void FallbackPolicyEngine::reset_stats()
{
    for (auto &count : _counts) {
        count.store(0);
    }
}

void FallbackPolicyEngine::set_table(NativeEffectTable table)
{
    _table = std::move(table);
}

void FallbackPolicyEngine::set_vector_approximation(PrimitiveKind kind, VectorApproximation approximation)
{
    _approximations[kind] = std::move(approximation);
    _generation++;
}

void FallbackPolicyEngine::clear_vector_approximation(PrimitiveKind kind)
{
    if (_approximations.erase(kind)) {
        _generation++;
    }
}

bool FallbackPolicyEngine::has_vector_approximation(PrimitiveKind kind) const
{
    return _approximations.count(kind) > 0;
}

std::size_t FallbackPolicyEngine::fingerprint() const
{
    std::size_t seed = _table.fingerprint();
    boost::hash_combine(seed, _generation);
    for (auto const &[kind, approximation] : _approximations) {
        boost::hash_combine(seed, static_cast<int>(kind));
        boost::hash_combine(seed, approximation.max_complexity);
    }
    return seed;
}

} // namespace Filters
} // namespace Svgfx
