// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Execution of one filter graph
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-chain.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <glib.h>
#include <boost/functional/hash.hpp>
#include "async/channel.h"
#include "async/progress.h"
#include "async/worker-pool.h"
#include "emf/emf-encoder.h"
#include "filters/cache-key.h"
#include "filters/cache-manager.h"
#include "filters/fallback-policy.h"
#include "filters/filter-errors.h"
#include "filters/filter-graph.h"
#include "filters/filter-registry.h"
#include "raster/rasterizer.h"
#include "settings.h"

namespace Svgfx {
namespace Filters {

using Debug::Diagnostic;
using Debug::DiagnosticCode;
using Debug::Severity;

char const *state_name(ChainState state)
{
    switch (state) {
        case ChainState::Pending:   return "pending";
        case ChainState::Resolving: return "resolving";
        case ChainState::Executing: return "executing";
        case ChainState::Completed: return "completed";
        case ChainState::Failed:    return "failed";
    }
    return "unknown";
}

ChainOptions ChainOptions::from_settings(Settings const &settings)
{
    ChainOptions options;
    options.fail_fast = settings.fail_fast;
    options.primitive_timeout = settings.primitive_timeout();
    options.chain_timeout = settings.chain_timeout();
    options.emu_per_px = settings.emu_per_px;
    options.emf_size_cap = settings.emf_size_cap.get();
    options.emf_dpi = settings.emf_dpi;
    options.raster_max_dimension = settings.raster_max_dimension;
    return options;
}

std::size_t ChainOptions::fingerprint() const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, emu_per_px);
    boost::hash_combine(seed, emf_size_cap);
    boost::hash_combine(seed, emf_dpi);
    boost::hash_combine(seed, raster_max_dimension);
    return seed;
}

/*
 * State of one execution, shared between the chain, its stream, and the tasks in flight on the
 * worker pool.
 */
class LevelStream::Execution final
    : public std::enable_shared_from_this<LevelStream::Execution>
{
public:
    using Clock = std::chrono::steady_clock;

    Execution(std::shared_ptr<FilterGraph const> graph, ChainServices services, ChainOptions options)
        : graph(std::move(graph))
        , services(services)
        , options(std::move(options))
        , encoder(this->options.emf_size_cap, this->options.emf_dpi)
        , rasterizer(this->options.raster_max_dimension)
    {}

    std::shared_ptr<FilterGraph const> graph;
    ChainServices services;
    ChainOptions options;
    Emf::EmfEncoder encoder;
    Raster::Rasterizer rasterizer;

    std::atomic<ChainState> state{ChainState::Pending};
    Async::CancellationToken token;
    std::atomic<bool> cancel_requested{false};
    Clock::time_point deadline;

    ResolvedGraph resolved;
    std::vector<CacheKey> keys;
    std::map<int, std::shared_ptr<FilterExecutionResult const>> sources;
    std::vector<NodeResult> nodes;
    std::size_t next_level = 0;
    std::atomic<std::size_t> cache_hits{0};

    void prepare();
    LevelResult run_level(std::size_t level);
    NodeResult run_node(std::size_t i);
    ChainResult result() const;

    void cancel()
    {
        cancel_requested = true;
        token.cancel();
    }

    void report(Diagnostic diagnostic);

private:
    mutable std::mutex _diagnostics_mutex;
    std::vector<Diagnostic> _diagnostics;

    void run_level_sequential(std::vector<std::size_t> const &level, LevelResult &out);
    void run_level_parallel(std::vector<std::size_t> const &level, LevelResult &out);
    void check_barrier() const;

    NodeResult fail(std::size_t i, DiagnosticCode code, std::string const &cause);
    FilterExecutionResult encode(std::size_t i, RenderStrategy strategy, PrimitiveOutput output);
    FilterExecutionResult const &slot_result(int slot) const;
};

void LevelStream::Execution::prepare()
{
    auto expected = ChainState::Pending;
    if (!state.compare_exchange_strong(expected, ChainState::Resolving)) {
        throw FilterChainError("", "a filter chain can only be executed once");
    }

    try {
        resolved = graph->resolve();
    } catch (FilterGraphError const &) {
        state = ChainState::Failed;
        throw;
    }

    keys = compute_node_keys(*graph, resolved, options.input.fingerprint, services.policy.fingerprint(),
                             options.fingerprint());

    for (auto const &node : resolved.nodes) {
        for (int slot : node.inputs) {
            if (slot < 0 && !sources.count(slot)) {
                FilterExecutionResult source;
                source.strategy = RenderStrategy::NativeEffect;
                source.bounds = options.input.source_bounds;
                sources[slot] = std::make_shared<FilterExecutionResult const>(std::move(source));
            }
        }
    }

    nodes.resize(graph->size());
    deadline = Clock::now() + options.chain_timeout;
    state = ChainState::Executing;

    if (graph->empty()) {
        report({Severity::Info, DiagnosticCode::EmptyGraph, "", "filter has no primitives"});
        state = ChainState::Completed;
    }
}

void LevelStream::Execution::report(Diagnostic diagnostic)
{
    {
        auto g = std::lock_guard(_diagnostics_mutex);
        _diagnostics.push_back(diagnostic);
    }
    if (services.sink) {
        services.sink->report(diagnostic);
    }
}

FilterExecutionResult const &LevelStream::Execution::slot_result(int slot) const
{
    if (slot < 0) {
        return *sources.at(slot);
    }
    return *nodes[slot].result;
}

void LevelStream::Execution::check_barrier() const
{
    if (cancel_requested) {
        throw Async::CancelledException();
    }
    if (Clock::now() >= deadline) {
        throw FilterChainError("", "filter chain exceeded its time limit");
    }
}

LevelResult LevelStream::Execution::run_level(std::size_t level)
{
    LevelResult out;
    out.level = level;

    try {
        check_barrier();
        auto const &indices = resolved.levels[level];
        if (options.mode == ExecutionMode::Parallel && services.pool && indices.size() > 1) {
            run_level_parallel(indices, out);
        } else {
            run_level_sequential(indices, out);
        }
        check_barrier();
    } catch (...) {
        state = ChainState::Failed;
        throw;
    }

    next_level = level + 1;
    if (next_level == resolved.levels.size()) {
        state = ChainState::Completed;
    }
    return out;
}

void LevelStream::Execution::run_level_sequential(std::vector<std::size_t> const &level, LevelResult &out)
{
    for (auto i : level) {
        nodes[i] = run_node(i);
        out.nodes.push_back(nodes[i]);
    }
}

void LevelStream::Execution::run_level_parallel(std::vector<std::size_t> const &level, LevelResult &out)
{
    struct Outcome
    {
        std::size_t index;
        NodeResult node;
        std::exception_ptr error;
        bool cancelled = false;
    };

    auto channel = Async::Channel::create<Outcome>();
    auto src = std::move(channel.first);
    auto dst = std::move(channel.second);
    auto self = shared_from_this();

    for (auto i : level) {
        services.pool->post([self, src, i] {
            try {
                src.send({i, self->run_node(i), nullptr});
            } catch (Async::CancelledException const &) {
                src.send({i, {}, std::current_exception(), true});
            } catch (std::exception const &) {
                src.send({i, {}, std::current_exception()});
            }
        });
    }
    src.close();

    std::exception_ptr error;
    bool error_is_cancellation = false;
    std::map<std::size_t, NodeResult> done;

    for (std::size_t received = 0; received < level.size(); received++) {
        auto outcome = dst.receive_until(deadline);
        if (!outcome) {
            token.cancel();
            throw FilterChainError("", "filter chain exceeded its time limit");
        }
        if (outcome->error) {
            // Stop the rest of the level, but keep draining so no task outlives the barrier.
            if (!error || (error_is_cancellation && !outcome->cancelled)) {
                error = outcome->error;
                error_is_cancellation = outcome->cancelled;
            }
            token.cancel();
            continue;
        }
        done[outcome->index] = std::move(outcome->node);
    }

    if (error) {
        std::rethrow_exception(error);
    }

    for (auto i : level) {
        nodes[i] = std::move(done[i]);
        out.nodes.push_back(nodes[i]);
    }
}

NodeResult LevelStream::Execution::run_node(std::size_t i)
{
    auto const &spec = (*graph)[i];
    auto const label = graph->label(i);

    if (token.cancelled()) {
        throw Async::CancelledException();
    }

    NodeResult node;
    node.index = i;
    node.id = label;

    if (services.cache) {
        try {
            if (auto hit = services.cache->lookup(keys[i])) {
                node.result = std::move(hit);
                node.from_cache = true;
                cache_hits++;
                return node;
            }
        } catch (CacheCorruptionError const &e) {
            g_warning("%s", e.what());
            report({Severity::Warning, DiagnosticCode::CacheCorruption, label, e.what()});
        }
    }

    PrimitiveInputs inputs;
    auto const names = spec.inputs();
    auto const &slots = resolved.nodes[i].inputs;
    for (std::size_t k = 0; k < slots.size(); k++) {
        auto name = names[k];
        if (name.empty()) {
            auto source = source_slot_name(slots[k]);
            name = source ? source : graph->label(slots[k]);
        }
        inputs.push_back({name, &slot_result(slots[k])});
    }

    auto const node_deadline = std::min(Clock::now() + options.primitive_timeout, deadline);
    Async::DeadlineProgress<double> progress(token, node_deadline);

    try {
        auto primitive = services.registry.resolve(spec.kind);
        double const score = primitive->complexity(spec.params);
        auto const strategy = services.policy.decide(spec.kind, spec.params, score);
        g_debug("%s: %s, complexity %.2f, strategy %s", label.c_str(), kind_name(spec.kind), score,
                strategy_name(strategy));

        PrimitiveContext ctx(strategy, progress);
        ctx.source_bounds = options.input.source_bounds;
        ctx.region = spec.region;
        ctx.emu_per_px = options.emu_per_px;

        auto output = primitive->apply(spec.params, inputs, ctx);
        // A primitive that never polled still must not overrun unnoticed.
        progress.throw_if_cancelled();

        auto result = encode(i, strategy, std::move(output));
        progress.throw_if_cancelled();

        if (services.cache) {
            services.cache->put(keys[i], spec.kind, result);
        }
        node.result = std::make_shared<FilterExecutionResult const>(std::move(result));
        return node;
    } catch (FilterNotFoundError const &e) {
        return fail(i, DiagnosticCode::FilterNotFound, e.what());
    } catch (Async::TimeoutException const &) {
        return fail(i, DiagnosticCode::PrimitiveTimeout, "primitive exceeded its time limit");
    } catch (Async::CancelledException const &) {
        throw;
    } catch (std::exception const &e) {
        return fail(i, DiagnosticCode::PrimitiveFailed, e.what());
    }
}

FilterExecutionResult LevelStream::Execution::encode(std::size_t i, RenderStrategy strategy, PrimitiveOutput output)
{
    FilterExecutionResult result;
    result.strategy = strategy;
    result.bounds = output.bounds;
    result.cache_key = keys[i];

    if (strategy != RenderStrategy::EMFFallback) {
        result.payload = MarkupFragment{std::move(output.markup)};
        return result;
    }

    try {
        result.payload = encoder.encode(output.commands);
    } catch (Emf::EmfEncodingError const &e) {
        auto const code = e.reason() == Emf::EmfEncodingError::Reason::SizeExceeded
                        ? DiagnosticCode::EmfSizeExceeded
                        : DiagnosticCode::EmfUnsupportedRecord;
        auto const label = graph->label(i);
        g_warning("%s: metafile encoding failed (%s), rendering a raster image", label.c_str(), e.what());
        report({Severity::Warning, code, label, e.what()});

        auto area = output.bounds;
        if (!area) {
            area = (*graph)[i].region ? (*graph)[i].region : options.input.source_bounds;
        }
        result.strategy = RenderStrategy::RasterFallback;
        result.payload = rasterizer.rasterize(output.commands, area);
        services.policy.record_raster_escalation();
    }
    return result;
}

NodeResult LevelStream::Execution::fail(std::size_t i, DiagnosticCode code, std::string const &cause)
{
    auto const label = graph->label(i);
    auto const error = FilterPrimitiveError(label, cause);

    if (options.fail_fast) {
        report({Severity::Error, code, label, cause});
        token.cancel();
        throw FilterChainError(label, cause);
    }

    g_warning("%s", error.what());
    report({Severity::Warning, code, label, cause});

    // Identity of the primary input.
    auto const &primary = slot_result(resolved.nodes[i].inputs.front());
    FilterExecutionResult passthrough = primary;
    passthrough.cache_key = keys[i];
    passthrough.passthrough = true;

    NodeResult node;
    node.index = i;
    node.id = label;
    node.failed = true;
    node.result = std::make_shared<FilterExecutionResult const>(std::move(passthrough));
    return node;
}

ChainResult LevelStream::Execution::result() const
{
    ChainResult out;
    out.state = state;
    out.cache_hits = cache_hits;
    out.nodes = nodes;
    {
        auto g = std::lock_guard(_diagnostics_mutex);
        out.diagnostics = _diagnostics;
    }
    if (!graph->empty() && nodes[resolved.output].result) {
        out.output = *nodes[resolved.output].result;
    }
    return out;
}

LevelStream::LevelStream(std::shared_ptr<Execution> exec)
    : _exec(std::move(exec))
{}

bool LevelStream::done() const
{
    return _exec->state != ChainState::Executing;
}

std::optional<LevelResult> LevelStream::next()
{
    if (done()) {
        return {};
    }
    return _exec->run_level(_exec->next_level);
}

ChainResult LevelStream::finish()
{
    while (next()) {
    }
    return _exec->result();
}

FilterChain::FilterChain(std::shared_ptr<FilterGraph const> graph, ChainServices services, ChainOptions options)
    : _exec(std::make_shared<LevelStream::Execution>(std::move(graph), services, std::move(options)))
{
    if (!_exec->graph) {
        throw std::invalid_argument("FilterChain needs a graph");
    }
}

FilterChain::~FilterChain() = default;

ChainResult FilterChain::execute()
{
    return stream().finish();
}

LevelStream FilterChain::stream()
{
    _exec->prepare();
    return LevelStream(_exec);
}

void FilterChain::cancel()
{
    _exec->cancel();
}

ChainState FilterChain::state() const
{
    return _exec->state;
}

} // namespace Filters
} // namespace Svgfx
