// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_CHAIN_H
#define SEEN_SVGFX_FILTER_CHAIN_H

/*
 * Execution of one filter graph
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <2geom/rect.h>
#include "debug/diagnostics.h"
#include "filters/filter-result.h"

namespace Svgfx {

class Settings;

namespace Async {
class WorkerPool;
} // namespace Async

namespace Filters {

class CacheManager;
class FallbackPolicyEngine;
class FilterGraph;
class FilterRegistry;

enum class ExecutionMode
{
    Sequential, ///< One node at a time, in topological order.
    Parallel,   ///< The nodes of a level run concurrently on the worker pool.
    Lazy        ///< One level per LevelStream::next().
};

enum class ChainState
{
    Pending,
    Resolving,
    Executing,
    Completed,
    Failed
};

char const *state_name(ChainState state);

/// What the chain knows about the filtered element.
struct ChainInput
{
    Geom::OptRect source_bounds;
    std::size_t fingerprint = 0; ///< Hash of the source geometry, supplied by the caller.
};

struct ChainOptions
{
    ExecutionMode mode = ExecutionMode::Sequential;
    bool fail_fast = false;
    std::chrono::milliseconds primitive_timeout = std::chrono::milliseconds(2000);
    std::chrono::milliseconds chain_timeout = std::chrono::milliseconds(30000);
    double emu_per_px = 9525.0;
    std::size_t emf_size_cap = 8 * 1024 * 1024;
    int emf_dpi = 96;
    int raster_max_dimension = 2048;
    ChainInput input;

    static ChainOptions from_settings(Settings const &settings);

    /// Hash of the options that shape a node's output. Part of every cache key.
    std::size_t fingerprint() const;
};

/**
 * The shared services a chain works with. Only the registry and the policy are required; without
 * a cache nothing is cached, without a pool Parallel mode runs sequentially, and without a sink
 * diagnostics are only returned in the result.
 */
struct ChainServices
{
    FilterRegistry const &registry;
    FallbackPolicyEngine const &policy;
    CacheManager *cache = nullptr;
    Async::WorkerPool *pool = nullptr;
    Debug::DiagnosticsSink *sink = nullptr;
};

struct NodeResult
{
    std::size_t index = 0;
    std::string id;  ///< The node's label.
    std::shared_ptr<FilterExecutionResult const> result;
    bool from_cache = false;
    bool failed = false; ///< The result is a pass-through of the primary input.
};

struct LevelResult
{
    std::size_t level = 0;
    std::vector<NodeResult> nodes;
};

struct ChainResult
{
    FilterExecutionResult output;
    std::vector<NodeResult> nodes; ///< In graph order.
    std::vector<Debug::Diagnostic> diagnostics;
    std::size_t cache_hits = 0;
    ChainState state = ChainState::Pending;
};

class FilterChain;

/**
 * Level-by-level execution of a chain. Each call to next() runs one dependency level and returns
 * its results; callers may stop early. The stream shares the chain's execution state, so it stays
 * valid if the chain object goes away.
 */
class LevelStream final
{
public:
    /// The next level, or nothing once all levels have run.
    std::optional<LevelResult> next();

    /// Run the remaining levels and return the complete result.
    ChainResult finish();

    bool done() const;

private:
    friend class FilterChain;
    class Execution;

    explicit LevelStream(std::shared_ptr<Execution> exec);
    std::shared_ptr<Execution> _exec;
};

/**
 * Runs one filter graph for one filtered element.
 *
 * The chain resolves the graph (structural errors are raised before any primitive runs), then
 * executes it level by level. Each node is looked up in the cache; otherwise the policy picks a
 * strategy, the primitive runs with a deadline, and metafile output is encoded, falling back to a
 * raster image when encoding fails. A failing node is replaced by a pass-through of its primary
 * input and reported as a diagnostic, unless fail-fast is set, in which case the chain aborts with
 * FilterChainError.
 *
 * A chain executes once. cancel() may be called from any thread.
 */
class FilterChain final
{
public:
    FilterChain(std::shared_ptr<FilterGraph const> graph, ChainServices services, ChainOptions options = {});
    ~FilterChain();

    FilterChain(FilterChain const &) = delete;
    FilterChain &operator=(FilterChain const &) = delete;

    /**
     * Execute the whole graph.
     *
     * @throws FilterGraphError for a malformed graph.
     * @throws FilterChainError on fail-fast, on chain timeout, or if the chain already ran.
     * @throws Async::CancelledException if cancel() was called.
     */
    ChainResult execute();

    /// Resolve the graph and return a stream over its levels. Throws like execute().
    LevelStream stream();

    void cancel();
    ChainState state() const;

private:
    std::shared_ptr<LevelStream::Execution> _exec;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_CHAIN_H
