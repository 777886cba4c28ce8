// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the process-wide runtime
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <stdexcept>
#include <gtest/gtest.h>
#include "filters/filter-chain.h"
#include "filters/filter-graph.h"
#include "filters/filter-registry.h"
#include "runtime.h"
#include "settings.h"

using namespace Svgfx;
using namespace Svgfx::Filters;

namespace {

class RuntimeTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        Runtime::shutdown();
    }

    static Settings small_settings()
    {
        Settings settings;
        settings.worker_threads.set(2);
        settings.cache_sweep_seconds.set(1);
        return settings;
    }

    static std::shared_ptr<FilterGraph const> blur_graph()
    {
        FilterPrimitiveSpec blur;
        blur.id = "blur";
        blur.kind = PrimitiveKind::Blur;
        blur.params = ParamMap{ {"stdDeviation", 2.0} };
        return std::make_shared<FilterGraph const>(std::vector<FilterPrimitiveSpec>{blur});
    }
};

} // namespace

TEST_F(RuntimeTest, GetBeforeInit)
{
    EXPECT_FALSE(Runtime::exists());
    EXPECT_THROW(Runtime::get(), std::logic_error);
    // Harmless without a runtime.
    Runtime::shutdown();
}

TEST_F(RuntimeTest, InitAndShutdown)
{
    auto &runtime = Runtime::init(small_settings());
    EXPECT_TRUE(Runtime::exists());
    EXPECT_EQ(&Runtime::get(), &runtime);

    EXPECT_EQ(runtime.pool().size(), 2);
    EXPECT_EQ(runtime.policy().table().version(), 2);
    for (auto kind : ALL_PRIMITIVE_KINDS) {
        EXPECT_TRUE(runtime.registry().contains(kind)) << kind_name(kind);
    }

    Runtime::shutdown();
    EXPECT_FALSE(Runtime::exists());
    EXPECT_THROW(Runtime::get(), std::logic_error);

    // A new runtime may follow.
    Runtime::init(small_settings());
    EXPECT_TRUE(Runtime::exists());
}

TEST_F(RuntimeTest, DoubleInit)
{
    Runtime::init(small_settings());
    EXPECT_THROW(Runtime::init(small_settings()), std::logic_error);
    EXPECT_TRUE(Runtime::exists());
}

TEST_F(RuntimeTest, BadNativeTable)
{
    auto settings = small_settings();
    settings.native_table.set("/nonexistent/native-effects.ini");
    EXPECT_THROW(Runtime::init(settings), ConfigError);
    EXPECT_FALSE(Runtime::exists());
}

TEST_F(RuntimeTest, ChainOptionsFollowSettings)
{
    auto settings = small_settings();
    settings.fail_fast.set(true);
    settings.primitive_timeout_ms.set(250);
    auto &runtime = Runtime::init(settings);

    ChainInput input;
    input.fingerprint = 7;
    auto const options = runtime.chain_options(input, ExecutionMode::Lazy);
    EXPECT_TRUE(options.fail_fast);
    EXPECT_EQ(options.primitive_timeout.count(), 250);
    EXPECT_EQ(options.mode, ExecutionMode::Lazy);
    EXPECT_EQ(options.input.fingerprint, 7u);
}

TEST_F(RuntimeTest, ChainsShareTheCache)
{
    auto &runtime = Runtime::init(small_settings());

    ChainInput input;
    input.source_bounds = Geom::Rect(0, 0, 50, 50);
    input.fingerprint = 1;

    auto first = runtime.make_chain(blur_graph(), input)->execute();
    EXPECT_EQ(first.state, ChainState::Completed);
    EXPECT_EQ(first.cache_hits, 0u);
    EXPECT_EQ(*first.output.markup(), "<a:blur rad=\"19050\" grow=\"1\"/>");

    auto second = runtime.make_chain(blur_graph(), input)->execute();
    EXPECT_EQ(second.cache_hits, 1u);
    EXPECT_EQ(runtime.cache().stats().hits, 1u);
}
