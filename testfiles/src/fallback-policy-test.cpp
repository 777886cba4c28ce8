// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for strategy selection
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "emf/emf-encoder.h"
#include "filters/builtin-primitives.h"
#include "filters/fallback-policy.h"
#include "filters/filter-registry.h"
#include "settings.h"

using namespace Svgfx;
using namespace Svgfx::Filters;

namespace {

class FallbackPolicyTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        policy.set_table(NativeEffectTable::load_from_file(Settings::default_native_table()));
        register_builtin_primitives(registry, policy);
    }

    RenderStrategy decide(PrimitiveKind kind, ParamMap const &params)
    {
        return policy.decide(kind, params, registry.resolve(kind)->complexity(params));
    }

    PrimitiveOutput apply(PrimitiveKind kind, ParamMap const &params, RenderStrategy strategy)
    {
        FilterExecutionResult source;
        source.bounds = Geom::Rect(0, 0, 100, 80);
        PrimitiveInputs inputs{ {"SourceGraphic", &source} };

        Async::ProgressAlways<double> progress;
        PrimitiveContext ctx(strategy, progress);
        ctx.source_bounds = source.bounds;
        return registry.resolve(kind)->apply(params, inputs, ctx);
    }

    FilterRegistry registry;
    FallbackPolicyEngine policy;
};

ParamMap kernel(std::vector<double> values, double order)
{
    return ParamMap{ {"order", order}, {"kernelMatrix", std::move(values)} };
}

NativeEffectTable single_entry_table(PrimitiveKind kind, NativeEffectEntry entry)
{
    NativeEffectTable table;
    table.set_version(7);
    table.set(kind, std::move(entry));
    return table;
}

} // namespace

TEST_F(FallbackPolicyTest, SmallBlurIsNative)
{
    ParamMap params{ {"stdDeviation", 2.0} };
    auto const strategy = decide(PrimitiveKind::Blur, params);
    EXPECT_EQ(strategy, RenderStrategy::NativeEffect);

    auto out = apply(PrimitiveKind::Blur, params, strategy);
    EXPECT_EQ(out.markup, "<a:blur rad=\"19050\" grow=\"1\"/>");
    EXPECT_TRUE(out.commands.empty());
}

TEST_F(FallbackPolicyTest, AnisotropicBlurIsApproximated)
{
    ParamMap params{ {"stdDeviation", std::vector<double>{2.0, 6.0}} };
    EXPECT_EQ(decide(PrimitiveKind::Blur, params), RenderStrategy::VectorApprox);
}

TEST_F(FallbackPolicyTest, HugeBlurFallsBackToMetafile)
{
    ParamMap params{ {"stdDeviation", 80.0} };
    EXPECT_EQ(decide(PrimitiveKind::Blur, params), RenderStrategy::EMFFallback);
}

TEST_F(FallbackPolicyTest, SobelKernelIsApproximated)
{
    auto params = kernel({ -1, 0, 1, -2, 0, 2, -1, 0, 1 }, 3);
    EXPECT_EQ(decide(PrimitiveKind::ConvolveMatrix, params), RenderStrategy::VectorApprox);

    auto vertical = kernel({ 1, 2, 1, 0, 0, 0, -1, -2, -1 }, 3);
    EXPECT_EQ(decide(PrimitiveKind::ConvolveMatrix, vertical), RenderStrategy::VectorApprox);
}

TEST_F(FallbackPolicyTest, ArbitraryKernelGoesToMetafile)
{
    auto params = kernel({ 1, 0, 2, 0, 1,
                           0, 3, 0, 1, 0,
                           2, 0, -5, 0, 2,
                           0, 1, 0, 3, 0,
                           1, 0, 2, 0, 1 }, 5);
    auto const strategy = decide(PrimitiveKind::ConvolveMatrix, params);
    ASSERT_EQ(strategy, RenderStrategy::EMFFallback);

    Emf::EmfEncoder encoder;
    auto first = encoder.encode(apply(PrimitiveKind::ConvolveMatrix, params, strategy).commands);
    auto second = encoder.encode(apply(PrimitiveKind::ConvolveMatrix, params, strategy).commands);
    EXPECT_EQ(first.bytes(), second.bytes());
    EXPECT_GT(first.records().size(), 2u);
}

TEST_F(FallbackPolicyTest, MorphologyIsNativeOrApproximated)
{
    EXPECT_EQ(decide(PrimitiveKind::Morphology, ParamMap{ {"operator", "dilate"}, {"radius", 3.0} }),
              RenderStrategy::NativeEffect);
    EXPECT_EQ(decide(PrimitiveKind::Morphology, ParamMap{ {"operator", "erode"}, {"radius", 3.0} }),
              RenderStrategy::VectorApprox);
    EXPECT_EQ(decide(PrimitiveKind::Morphology, ParamMap{ {"operator", "dilate"}, {"radius", 30.0} }),
              RenderStrategy::VectorApprox);
}

TEST_F(FallbackPolicyTest, AbsentOperatorMeansErode)
{
    ParamMap const params{ {"radius", 3.0} };
    EXPECT_EQ(decide(PrimitiveKind::Morphology, params), RenderStrategy::VectorApprox);
    EXPECT_EQ(decide(PrimitiveKind::Morphology, params),
              decide(PrimitiveKind::Morphology, ParamMap{ {"operator", "erode"}, {"radius", 3.0} }));
}

TEST_F(FallbackPolicyTest, AbsentColorMatrixTypeIsNotNative)
{
    ParamMap const params{ {"values", std::vector<double>(20, 0.5)} };
    EXPECT_NE(decide(PrimitiveKind::ColorMatrix, params), RenderStrategy::NativeEffect);
}

TEST_F(FallbackPolicyTest, CompositeBlendTable)
{
    EXPECT_EQ(decide(PrimitiveKind::Composite, ParamMap{ {"mode", "multiply"} }), RenderStrategy::NativeEffect);
    EXPECT_EQ(decide(PrimitiveKind::Composite, ParamMap{ {"operator", "arithmetic"}, {"k2", 0.5} }),
              RenderStrategy::EMFFallback);
}

TEST_F(FallbackPolicyTest, TilePresets)
{
    EXPECT_EQ(decide(PrimitiveKind::Tile, ParamMap{ {"pattern", "brick"} }), RenderStrategy::NativeEffect);
    EXPECT_EQ(decide(PrimitiveKind::Tile, ParamMap{ {"pattern", "hexagonal"} }), RenderStrategy::EMFFallback);
}

TEST_F(FallbackPolicyTest, TableOrder)
{
    NativeEffectEntry entry;
    entry.native = true;
    entry.ranges["radius"] = NumericRange{0, 10};
    policy.set_table(single_entry_table(PrimitiveKind::Morphology, entry));

    ParamMap inside{ {"radius", 5.0} };
    ParamMap outside{ {"radius", 15.0} };
    EXPECT_EQ(policy.decide(PrimitiveKind::Morphology, inside, 1.0), RenderStrategy::NativeEffect);
    EXPECT_EQ(policy.decide(PrimitiveKind::Morphology, outside, 1.0), RenderStrategy::VectorApprox);

    policy.clear_vector_approximation(PrimitiveKind::Morphology);
    EXPECT_FALSE(policy.has_vector_approximation(PrimitiveKind::Morphology));
    EXPECT_EQ(policy.decide(PrimitiveKind::Morphology, outside, 1.0), RenderStrategy::EMFFallback);

    // A predicate outside its error bound rejects the approximation.
    VectorApproximation never;
    never.within_bound = [] (ParamMap const &) { return false; };
    policy.set_vector_approximation(PrimitiveKind::Morphology, never);
    EXPECT_EQ(policy.decide(PrimitiveKind::Morphology, outside, 1.0), RenderStrategy::EMFFallback);

    // A kind without a table entry or an approximation.
    policy.clear_vector_approximation(PrimitiveKind::Flood);
    EXPECT_EQ(policy.decide(PrimitiveKind::Flood, ParamMap{}, 0.0), RenderStrategy::EMFFallback);
}

TEST_F(FallbackPolicyTest, Deterministic)
{
    ParamMap params{ {"stdDeviation", 4.0} };
    auto const first = decide(PrimitiveKind::Blur, params);
    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(decide(PrimitiveKind::Blur, params), first);
    }
}

TEST_F(FallbackPolicyTest, CountsDecisions)
{
    policy.reset_stats();
    EXPECT_EQ(policy.stats().decisions, 0u);

    EXPECT_EQ(policy.decide(PrimitiveKind::Blur, ParamMap{ {"stdDeviation", 2.0} }, 0.4), RenderStrategy::NativeEffect);
    EXPECT_EQ(policy.decide(PrimitiveKind::Blur, ParamMap{ {"stdDeviation", 2.0} }, 0.4), RenderStrategy::NativeEffect);
    EXPECT_EQ(decide(PrimitiveKind::Morphology, ParamMap{ {"operator", "erode"}, {"radius", 3.0} }),
              RenderStrategy::VectorApprox);
    EXPECT_EQ(decide(PrimitiveKind::Tile, ParamMap{ {"pattern", "hexagonal"} }), RenderStrategy::EMFFallback);
    policy.record_raster_escalation();

    auto stats = policy.stats();
    EXPECT_EQ(stats.decisions, 4u);
    EXPECT_EQ(stats.native, 2u);
    EXPECT_EQ(stats.vector, 1u);
    EXPECT_EQ(stats.emf, 1u);
    EXPECT_EQ(stats.raster_escalations, 1u);

    policy.reset_stats();
    stats = policy.stats();
    EXPECT_EQ(stats.decisions, 0u);
    EXPECT_EQ(stats.raster_escalations, 0u);
}

TEST_F(FallbackPolicyTest, CountingFromManyThreads)
{
    policy.reset_stats();
    ParamMap const params{ {"stdDeviation", 2.0} };

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; i++) {
                EXPECT_EQ(policy.decide(PrimitiveKind::Blur, params, 0.4), RenderStrategy::NativeEffect);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(policy.stats().native, 1000u);
    EXPECT_EQ(policy.stats().decisions, 1000u);
}

TEST_F(FallbackPolicyTest, NeverChoosesRaster)
{
    for (auto kind : ALL_PRIMITIVE_KINDS) {
        for (double c = 0.0; c <= 100.0; c += 0.5) {
            EXPECT_NE(policy.decide(kind, ParamMap{}, c), RenderStrategy::RasterFallback) << kind_name(kind);
        }
    }
}

TEST_F(FallbackPolicyTest, Monotonic)
{
    std::vector<std::pair<PrimitiveKind, ParamMap>> const cases = {
        { PrimitiveKind::Blur,            ParamMap{ {"stdDeviation", 3.0} } },
        { PrimitiveKind::Offset,          ParamMap{ {"dx", 4.0}, {"dy", 4.0} } },
        { PrimitiveKind::Merge,           ParamMap{} },
        { PrimitiveKind::ColorMatrix,     ParamMap{ {"type", "saturate"}, {"values", 0.5} } },
        { PrimitiveKind::Composite,       ParamMap{ {"operator", "over"} } },
        { PrimitiveKind::Morphology,      ParamMap{ {"operator", "dilate"}, {"radius", 2.0} } },
        { PrimitiveKind::DiffuseLighting, ParamMap{ {"light", "distant"} } },
        { PrimitiveKind::Tile,            ParamMap{ {"pattern", "grid"} } },
    };

    for (auto const &[kind, params] : cases) {
        int previous = 0;
        for (double c = 0.0; c <= 50.0; c += 0.25) {
            int const rank = strategy_rank(policy.decide(kind, params, c));
            EXPECT_GE(rank, previous) << kind_name(kind) << " at complexity " << c;
            previous = rank;
        }
    }
}

TEST_F(FallbackPolicyTest, FingerprintTracksInputs)
{
    auto const initial = policy.fingerprint();
    EXPECT_EQ(policy.fingerprint(), initial);

    auto table = policy.table();
    table.set_version(table.version() + 1);
    policy.set_table(table);
    auto const bumped = policy.fingerprint();
    EXPECT_NE(bumped, initial);

    policy.set_vector_approximation(PrimitiveKind::Blur, VectorApproximation{});
    EXPECT_NE(policy.fingerprint(), bumped);
}
