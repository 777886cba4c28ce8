// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for filter chain execution
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "async/worker-pool.h"
#include "debug/diagnostics.h"
#include "filters/builtin-primitives.h"
#include "filters/cache-manager.h"
#include "filters/fallback-policy.h"
#include "filters/filter-chain.h"
#include "filters/filter-errors.h"
#include "filters/filter-graph.h"
#include "filters/filter-offset.h"
#include "filters/filter-registry.h"
#include "settings.h"

using namespace std::chrono_literals;
using namespace Svgfx;
using namespace Svgfx::Filters;
using Debug::DiagnosticCode;

namespace {

/// A node whose result is named after its id.
FilterPrimitiveSpec node(std::string id, PrimitiveKind kind, ParamMap params = {},
                         std::string in = {}, std::string in2 = {})
{
    FilterPrimitiveSpec spec;
    spec.id = std::move(id);
    spec.kind = kind;
    spec.params = std::move(params);
    spec.in = std::move(in);
    spec.in2 = std::move(in2);
    spec.result = spec.id;
    return spec;
}

std::shared_ptr<FilterGraph const> graph(std::vector<FilterPrimitiveSpec> nodes)
{
    return std::make_shared<FilterGraph const>(std::move(nodes));
}

bool contains(std::string const &haystack, std::string const &needle)
{
    return haystack.find(needle) != std::string::npos;
}

class FailingPrimitive : public FilterPrimitive
{
public:
    PrimitiveKind kind() const override { return PrimitiveKind::Tile; }
    Glib::ustring name() const override { return "Failing"; }

    PrimitiveOutput apply(ParamMap const &, PrimitiveInputs const &, PrimitiveContext &) const override
    {
        throw std::runtime_error("boom");
    }
};

/// Polls its progress until told to stop.
class StallingPrimitive : public FilterPrimitive
{
public:
    PrimitiveKind kind() const override { return PrimitiveKind::Tile; }
    Glib::ustring name() const override { return "Stalling"; }

    PrimitiveOutput apply(ParamMap const &, PrimitiveInputs const &, PrimitiveContext &ctx) const override
    {
        for (;;) {
            ctx.progress.report_or_throw(0.0);
            std::this_thread::sleep_for(1ms);
        }
    }
};

class CountingOffset : public FilterOffset
{
public:
    explicit CountingOffset(std::shared_ptr<std::atomic<int>> count) : _count(std::move(count)) {}

    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override
    {
        (*_count)++;
        return FilterOffset::apply(params, inputs, ctx);
    }

private:
    std::shared_ptr<std::atomic<int>> _count;
};

struct Rendezvous
{
    std::mutex mutex;
    std::condition_variable cond;
    int arrived = 0;
};

/// An offset that only succeeds if \a expected nodes are inside apply() at the same time.
class RendezvousOffset : public FilterOffset
{
public:
    RendezvousOffset(std::shared_ptr<Rendezvous> rendezvous, int expected, std::chrono::milliseconds patience)
        : _rendezvous(std::move(rendezvous))
        , _expected(expected)
        , _patience(patience)
    {}

    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override
    {
        {
            auto lock = std::unique_lock(_rendezvous->mutex);
            _rendezvous->arrived++;
            _rendezvous->cond.notify_all();
            if (!_rendezvous->cond.wait_for(lock, _patience, [this] { return _rendezvous->arrived >= _expected; })) {
                throw std::runtime_error("no other node arrived");
            }
        }
        return FilterOffset::apply(params, inputs, ctx);
    }

private:
    std::shared_ptr<Rendezvous> _rendezvous;
    int _expected;
    std::chrono::milliseconds _patience;
};

class FilterChainTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        policy.set_table(NativeEffectTable::load_from_file(Settings::default_native_table()));
        register_builtin_primitives(registry, policy);
        options.input.source_bounds = Geom::Rect(0, 0, 100, 80);
        options.input.fingerprint = 42;
    }

    ChainServices services(CacheManager *cache = nullptr, Async::WorkerPool *pool = nullptr)
    {
        return ChainServices{registry, policy, cache, pool, &sink};
    }

    template <typename T, typename... Args>
    void install(Args... args)
    {
        auto factory = [args...] { return std::make_unique<T>(args...); };
        auto const kind = factory()->kind();
        registry.add(kind, factory);
    }

    std::shared_ptr<std::atomic<int>> count_offsets()
    {
        auto count = std::make_shared<std::atomic<int>>(0);
        install<CountingOffset>(count);
        return count;
    }

    static CacheOptions cache_options()
    {
        CacheOptions opts;
        opts.background_sweep = false;
        return opts;
    }

    FilterRegistry registry;
    FallbackPolicyEngine policy;
    Debug::CollectingDiagnosticsSink sink;
    ChainOptions options;
};

} // namespace

TEST_F(FilterChainTest, SequentialShadowChain)
{
    FilterChain chain(graph({
        node("blur", PrimitiveKind::Blur, { {"stdDeviation", 2.0} }, "SourceAlpha"),
        node("shadow", PrimitiveKind::Offset, { {"dx", 3.0}, {"dy", 4.0} })
    }), services(), options);

    EXPECT_EQ(chain.state(), ChainState::Pending);
    auto result = chain.execute();

    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_EQ(chain.state(), ChainState::Completed);
    EXPECT_TRUE(result.diagnostics.empty());
    ASSERT_EQ(result.nodes.size(), 2u);
    EXPECT_EQ(result.nodes[0].id, "blur");
    EXPECT_EQ(result.nodes[1].id, "shadow");

    EXPECT_EQ(result.output.strategy, RenderStrategy::NativeEffect);
    ASSERT_TRUE(result.output.markup());
    auto const &markup = *result.output.markup();
    EXPECT_TRUE(contains(markup, "<a:blur rad=\"19050\" grow=\"1\"/>"));
    EXPECT_TRUE(contains(markup, "<a:outerShdw dist=\"47625\""));
    EXPECT_LT(markup.find("<a:blur"), markup.find("<a:outerShdw"));
    EXPECT_EQ(result.output.content_type(), std::string("application/xml"));

    ASSERT_TRUE(result.output.bounds);
    EXPECT_EQ(*result.output.bounds, Geom::Rect(-3, -2, 109, 90));
}

TEST_F(FilterChainTest, ParallelLevelRunsConcurrently)
{
    auto rendezvous = std::make_shared<Rendezvous>();
    install<RendezvousOffset>(rendezvous, 2, std::chrono::milliseconds(5000));

    Async::WorkerPool pool(2);
    options.mode = ExecutionMode::Parallel;
    FilterChain chain(graph({
        node("right", PrimitiveKind::Offset, { {"dx", 1.0} }, "SourceGraphic"),
        node("down", PrimitiveKind::Offset, { {"dy", 1.0} }, "SourceGraphic"),
        node("both", PrimitiveKind::Merge, {}, "right", "down")
    }), services(nullptr, &pool), options);

    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_TRUE(result.diagnostics.empty());
    for (auto const &n : result.nodes) {
        EXPECT_FALSE(n.failed) << n.id;
    }

    auto const &markup = *result.output.markup();
    EXPECT_TRUE(contains(markup, "dir=\"0\""));
    EXPECT_TRUE(contains(markup, "dir=\"5400000\""));
    EXPECT_EQ(*result.output.bounds, Geom::Rect(0, 0, 101, 81));
}

TEST_F(FilterChainTest, SequentialModeRunsOneNodeAtATime)
{
    auto rendezvous = std::make_shared<Rendezvous>();
    install<RendezvousOffset>(rendezvous, 2, std::chrono::milliseconds(100));

    // With a pool but in sequential mode, the first node waits alone and gives up.
    Async::WorkerPool pool(2);
    FilterChain chain(graph({
        node("right", PrimitiveKind::Offset, { {"dx", 1.0} }, "SourceGraphic"),
        node("down", PrimitiveKind::Offset, { {"dy", 1.0} }, "SourceGraphic")
    }), services(nullptr, &pool), options);

    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_TRUE(result.nodes[0].failed);
    EXPECT_FALSE(result.nodes[1].failed);
    EXPECT_EQ(sink.count(DiagnosticCode::PrimitiveFailed), 1u);
}

TEST_F(FilterChainTest, LazyStream)
{
    auto count = count_offsets();
    options.mode = ExecutionMode::Lazy;
    FilterChain chain(graph({
        node("blur", PrimitiveKind::Blur, { {"stdDeviation", 1.0} }),
        node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} }),
        node("fill", PrimitiveKind::Flood, { {"flood-color", "#00ff00"} })
    }), services(), options);

    auto stream = chain.stream();
    EXPECT_FALSE(stream.done());
    EXPECT_EQ(chain.state(), ChainState::Executing);

    auto first = stream.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->level, 0u);
    ASSERT_EQ(first->nodes.size(), 1u);
    EXPECT_EQ(first->nodes[0].id, "blur");
    EXPECT_EQ(*count, 0);

    auto second = stream.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->nodes[0].id, "shadow");
    EXPECT_EQ(*count, 1);

    auto result = stream.finish();
    EXPECT_TRUE(stream.done());
    EXPECT_FALSE(stream.next());
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_EQ(result.nodes.size(), 3u);
    EXPECT_TRUE(contains(*result.output.markup(), "<a:srgbClr val=\"00FF00\">"));
}

TEST_F(FilterChainTest, StreamMayStopEarly)
{
    auto count = count_offsets();
    auto chain = std::make_unique<FilterChain>(graph({
        node("blur", PrimitiveKind::Blur, { {"stdDeviation", 1.0} }),
        node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} })
    }), services(), options);

    auto stream = chain->stream();
    chain.reset();
    EXPECT_TRUE(stream.next());
    EXPECT_FALSE(stream.done());
    EXPECT_EQ(*count, 0);
}

TEST_F(FilterChainTest, FailingNodePassesItsInputThrough)
{
    install<FailingPrimitive>();
    FilterChain chain(graph({
        node("blur", PrimitiveKind::Blur, { {"stdDeviation", 2.0} }),
        node("bad", PrimitiveKind::Tile),
        node("shadow", PrimitiveKind::Offset, { {"dx", 3.0} })
    }), services(), options);

    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);

    ASSERT_EQ(result.diagnostics.size(), 1u);
    auto const &diagnostic = result.diagnostics[0];
    EXPECT_EQ(diagnostic.code, DiagnosticCode::PrimitiveFailed);
    EXPECT_EQ(diagnostic.severity, Debug::Severity::Warning);
    EXPECT_EQ(diagnostic.node_id, "bad");
    EXPECT_EQ(diagnostic.message, "boom");

    auto const &bad = result.nodes[1];
    EXPECT_TRUE(bad.failed);
    EXPECT_TRUE(bad.result->passthrough);
    EXPECT_EQ(*bad.result->markup(), *result.nodes[0].result->markup());
    EXPECT_EQ(bad.result->bounds, result.nodes[0].result->bounds);

    auto const &markup = *result.output.markup();
    EXPECT_TRUE(contains(markup, "<a:blur"));
    EXPECT_TRUE(contains(markup, "<a:outerShdw"));
    EXPECT_FALSE(result.output.passthrough);

    // The sink saw the same diagnostics.
    EXPECT_EQ(sink.diagnostics().size(), 1u);
    EXPECT_EQ(sink.count(DiagnosticCode::PrimitiveFailed), 1u);
}

TEST_F(FilterChainTest, FailFastAbortsWithNodeId)
{
    install<FailingPrimitive>();
    options.fail_fast = true;
    FilterChain chain(graph({
        node("blur", PrimitiveKind::Blur, { {"stdDeviation", 2.0} }),
        node("bad", PrimitiveKind::Tile),
        node("shadow", PrimitiveKind::Offset, { {"dx", 3.0} })
    }), services(), options);

    try {
        chain.execute();
        FAIL() << "execute() should throw";
    } catch (FilterChainError const &e) {
        EXPECT_EQ(e.node_id(), "bad");
        EXPECT_EQ(e.cause(), "boom");
    }
    EXPECT_EQ(chain.state(), ChainState::Failed);

    auto const reported = sink.diagnostics();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].severity, Debug::Severity::Error);
}

TEST_F(FilterChainTest, MissingImplementationIsReported)
{
    registry.remove(PrimitiveKind::Tile);
    FilterChain chain(graph({
        node("tile", PrimitiveKind::Tile, { {"pattern", "grid"} })
    }), services(), options);

    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_TRUE(result.nodes[0].failed);
    EXPECT_EQ(sink.count(DiagnosticCode::FilterNotFound), 1u);
    EXPECT_EQ(result.output.bounds, options.input.source_bounds);
}

TEST_F(FilterChainTest, PrimitiveTimeout)
{
    install<StallingPrimitive>();
    options.primitive_timeout = 50ms;
    FilterChain chain(graph({
        node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} }),
        node("stall", PrimitiveKind::Tile)
    }), services(), options);

    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::PrimitiveTimeout);
    EXPECT_EQ(result.diagnostics[0].node_id, "stall");
    EXPECT_TRUE(result.output.passthrough);
    EXPECT_TRUE(contains(*result.output.markup(), "<a:outerShdw"));
}

TEST_F(FilterChainTest, ChainTimeout)
{
    install<StallingPrimitive>();
    options.primitive_timeout = 10s;
    options.chain_timeout = 50ms;
    FilterChain chain(graph({
        node("stall", PrimitiveKind::Tile),
        node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} })
    }), services(), options);

    EXPECT_THROW(chain.execute(), FilterChainError);
    EXPECT_EQ(chain.state(), ChainState::Failed);
}

TEST_F(FilterChainTest, CancelFromAnotherThread)
{
    install<StallingPrimitive>();
    options.primitive_timeout = 10s;
    FilterChain chain(graph({
        node("stall", PrimitiveKind::Tile)
    }), services(), options);

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        chain.cancel();
    });
    EXPECT_THROW(chain.execute(), Async::CancelledException);
    canceller.join();
    EXPECT_EQ(chain.state(), ChainState::Failed);
    EXPECT_EQ(sink.count(DiagnosticCode::PrimitiveTimeout), 0u);
}

TEST_F(FilterChainTest, CancelBeforeExecute)
{
    auto count = count_offsets();
    FilterChain chain(graph({ node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} }) }), services(), options);
    chain.cancel();
    EXPECT_THROW(chain.execute(), Async::CancelledException);
    EXPECT_EQ(*count, 0);
}

TEST_F(FilterChainTest, ExecutesOnlyOnce)
{
    FilterChain chain(graph({ node("shadow", PrimitiveKind::Offset, { {"dx", 2.0} }) }), services(), options);
    chain.execute();
    EXPECT_THROW(chain.execute(), FilterChainError);
    EXPECT_THROW(chain.stream(), FilterChainError);
}

TEST_F(FilterChainTest, EmptyGraph)
{
    FilterChain chain(std::make_shared<FilterGraph const>(), services(), options);
    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_TRUE(result.nodes.empty());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::EmptyGraph);
    EXPECT_EQ(result.diagnostics[0].severity, Debug::Severity::Info);
}

TEST_F(FilterChainTest, NullGraph)
{
    EXPECT_THROW(FilterChain(nullptr, services(), options), std::invalid_argument);
}

TEST_F(FilterChainTest, StructuralErrorsComeFirst)
{
    auto count = count_offsets();

    FilterChain cyclic(graph({
        node("a", PrimitiveKind::Offset, { {"dx", 1.0} }, "b"),
        node("b", PrimitiveKind::Offset, { {"dx", 1.0} }, "a")
    }), services(), options);
    EXPECT_THROW(cyclic.execute(), CyclicFilterGraphError);
    EXPECT_EQ(cyclic.state(), ChainState::Failed);

    FilterChain unresolved(graph({
        node("a", PrimitiveKind::Offset, { {"dx", 1.0} }),
        node("b", PrimitiveKind::Offset, { {"dx", 1.0} }, "nowhere")
    }), services(), options);
    EXPECT_THROW(unresolved.execute(), UnresolvedReferenceError);

    EXPECT_EQ(*count, 0);
}

TEST_F(FilterChainTest, ResultsAreCachedAcrossChains)
{
    auto count = count_offsets();
    CacheManager cache(cache_options());

    auto first = FilterChain(graph({
        node("shadow", PrimitiveKind::Offset, { {"dx", 3.0}, {"dy", 4.0} })
    }), services(&cache), options).execute();
    EXPECT_EQ(*count, 1);
    EXPECT_EQ(first.cache_hits, 0u);
    EXPECT_FALSE(first.nodes[0].from_cache);

    // The same parameters given in another order.
    ParamMap reordered;
    reordered.set("dy", 4.0);
    reordered.set("dx", 3.0);
    auto second = FilterChain(graph({ node("shadow", PrimitiveKind::Offset, reordered) }), services(&cache), options).execute();
    EXPECT_EQ(*count, 1);
    EXPECT_EQ(second.cache_hits, 1u);
    EXPECT_TRUE(second.nodes[0].from_cache);
    EXPECT_EQ(*second.output.markup(), *first.output.markup());

    // Another source element.
    options.input.fingerprint = 43;
    auto third = FilterChain(graph({ node("shadow", PrimitiveKind::Offset, reordered) }), services(&cache), options).execute();
    EXPECT_EQ(*count, 2);
    EXPECT_EQ(third.cache_hits, 0u);

    // Results are filed under the kind that produced them.
    EXPECT_EQ(cache.invalidate(PrimitiveKind::Blur), 0u);
    EXPECT_EQ(cache.invalidate(PrimitiveKind::Offset), 2u);
    auto fourth = FilterChain(graph({ node("shadow", PrimitiveKind::Offset, reordered) }), services(&cache), options).execute();
    EXPECT_EQ(*count, 3);
    EXPECT_EQ(fourth.cache_hits, 0u);
}

TEST_F(FilterChainTest, FailedResultsAreNotCached)
{
    install<FailingPrimitive>();
    CacheManager cache(cache_options());
    for (int i = 0; i < 2; i++) {
        auto result = FilterChain(graph({ node("bad", PrimitiveKind::Tile) }), services(&cache), options).execute();
        EXPECT_EQ(result.cache_hits, 0u);
    }
    EXPECT_EQ(sink.count(DiagnosticCode::PrimitiveFailed), 2u);
    EXPECT_EQ(cache.stats().entries, 0u);
}

TEST_F(FilterChainTest, UnencodableMetafileFallsBackToRaster)
{
    FilterChain chain(graph({
        node("combine", PrimitiveKind::Composite,
             { {"operator", "arithmetic"}, {"k1", 0.0}, {"k2", 0.5}, {"k3", 0.5}, {"k4", 0.0} },
             "SourceGraphic", "SourceAlpha")
    }), services(), options);

    policy.reset_stats();
    auto result = chain.execute();
    EXPECT_EQ(result.state, ChainState::Completed);
    EXPECT_FALSE(result.nodes[0].failed);
    EXPECT_EQ(result.output.strategy, RenderStrategy::RasterFallback);
    EXPECT_EQ(policy.stats().emf, 1u);
    EXPECT_EQ(policy.stats().raster_escalations, 1u);
    EXPECT_EQ(result.output.content_type(), std::string("image/png"));

    auto image = std::get_if<Raster::RasterImage>(&result.output.payload);
    ASSERT_TRUE(image);
    EXPECT_EQ(image->width, 100);
    EXPECT_EQ(image->height, 80);

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagnosticCode::EmfUnsupportedRecord);
    EXPECT_EQ(result.diagnostics[0].node_id, "combine");
}

TEST_F(FilterChainTest, MetafileFallback)
{
    FilterChain chain(graph({
        node("edges", PrimitiveKind::ConvolveMatrix,
             { {"order", 3.0}, {"kernelMatrix", std::vector<double>{ 1, 2, 1, 2, 4, 2, 1, 2, 1 }} })
    }), services(), options);

    auto result = chain.execute();
    EXPECT_EQ(result.output.strategy, RenderStrategy::EMFFallback);
    EXPECT_EQ(result.output.content_type(), std::string("image/x-emf"));
    ASSERT_TRUE(result.output.blob());
    EXPECT_GT(result.output.blob()->size(), 108u);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(FilterChainTest, OptionsFromSettings)
{
    Settings settings;
    settings.fail_fast.set(true);
    settings.emf_dpi.set(192);
    auto const from = ChainOptions::from_settings(settings);
    EXPECT_TRUE(from.fail_fast);
    EXPECT_EQ(from.emf_dpi, 192);
    EXPECT_NE(from.fingerprint(), ChainOptions().fingerprint());
    EXPECT_STREQ(state_name(ChainState::Completed), "completed");
}
