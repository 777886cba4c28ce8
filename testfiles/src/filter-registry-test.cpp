// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the primitive registry
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <atomic>
#include <iterator>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "filters/builtin-primitives.h"
#include "filters/fallback-policy.h"
#include "filters/filter-errors.h"
#include "filters/filter-flood.h"
#include "filters/filter-offset.h"
#include "filters/filter-registry.h"

using namespace Svgfx::Filters;

namespace {

/// An offset that tags its markup, to tell registrations apart.
class TaggedOffset : public FilterOffset
{
public:
    explicit TaggedOffset(std::string tag) : _tag(std::move(tag)) {}

    PrimitiveOutput apply(ParamMap const &, PrimitiveInputs const &, PrimitiveContext &) const override
    {
        PrimitiveOutput out;
        out.markup = _tag;
        return out;
    }

private:
    std::string _tag;
};

std::string markup_of(FilterPrimitive const &primitive)
{
    Svgfx::Async::ProgressAlways<double> progress;
    PrimitiveContext ctx(RenderStrategy::NativeEffect, progress);
    return primitive.apply(ParamMap{}, {}, ctx).markup;
}

} // namespace

TEST(FilterRegistryTest, ResolveRegistered)
{
    FilterRegistry registry;
    EXPECT_FALSE(registry.contains(PrimitiveKind::Offset));

    registry.add(PrimitiveKind::Offset, [] { return std::make_unique<TaggedOffset>("first"); });
    EXPECT_TRUE(registry.contains(PrimitiveKind::Offset));

    auto primitive = registry.resolve(PrimitiveKind::Offset);
    ASSERT_TRUE(primitive);
    EXPECT_EQ(primitive->kind(), PrimitiveKind::Offset);
    EXPECT_EQ(markup_of(*primitive), "first");

    // One instance per registration.
    EXPECT_EQ(registry.resolve(PrimitiveKind::Offset), primitive);
}

TEST(FilterRegistryTest, MissingKindThrows)
{
    FilterRegistry registry;
    try {
        registry.resolve(PrimitiveKind::Tile);
        FAIL() << "resolve() should throw";
    } catch (FilterNotFoundError const &e) {
        EXPECT_EQ(e.kind(), PrimitiveKind::Tile);
    }
}

TEST(FilterRegistryTest, LastRegistrationWins)
{
    FilterRegistry registry;
    registry.add(PrimitiveKind::Offset, [] { return std::make_unique<TaggedOffset>("first"); });
    auto old = registry.resolve(PrimitiveKind::Offset);

    registry.add(PrimitiveKind::Offset, [] { return std::make_unique<TaggedOffset>("second"); });
    EXPECT_EQ(markup_of(*registry.resolve(PrimitiveKind::Offset)), "second");

    // Holders of the old implementation keep it.
    EXPECT_EQ(markup_of(*old), "first");
}

TEST(FilterRegistryTest, RejectsEmptyFactories)
{
    FilterRegistry registry;
    EXPECT_THROW(registry.add(PrimitiveKind::Offset, nullptr), std::invalid_argument);
    EXPECT_THROW(registry.add(PrimitiveKind::Offset, [] { return std::unique_ptr<FilterPrimitive>(); }),
                 std::invalid_argument);
    EXPECT_FALSE(registry.contains(PrimitiveKind::Offset));
}

TEST(FilterRegistryTest, RemoveAndClear)
{
    FilterRegistry registry;
    registry.add(PrimitiveKind::Offset, [] { return std::make_unique<FilterOffset>(); });
    registry.add(PrimitiveKind::Flood, [] { return std::make_unique<FilterFlood>(); });

    EXPECT_EQ(registry.kinds(), (std::vector<PrimitiveKind>{ PrimitiveKind::Offset, PrimitiveKind::Flood }));

    registry.remove(PrimitiveKind::Offset);
    EXPECT_FALSE(registry.contains(PrimitiveKind::Offset));
    EXPECT_THROW(registry.resolve(PrimitiveKind::Offset), FilterNotFoundError);

    registry.clear();
    EXPECT_TRUE(registry.kinds().empty());
}

TEST(FilterRegistryTest, ConcurrentResolve)
{
    FilterRegistry registry;
    registry.add(PrimitiveKind::Offset, [] { return std::make_unique<FilterOffset>(); });

    std::atomic<int> resolved{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            for (int j = 0; j < 1000; j++) {
                if (registry.resolve(PrimitiveKind::Offset)) {
                    resolved++;
                }
            }
        });
    }
    // A writer in the middle of the readers.
    registry.add(PrimitiveKind::Flood, [] { return std::make_unique<FilterFlood>(); });
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(resolved.load(), 8000);
}

TEST(FilterRegistryTest, BuiltinPrimitives)
{
    FilterRegistry registry;
    FallbackPolicyEngine policy;
    register_builtin_primitives(registry, policy);

    for (auto kind : ALL_PRIMITIVE_KINDS) {
        ASSERT_TRUE(registry.contains(kind)) << kind_name(kind);
        EXPECT_EQ(registry.resolve(kind)->kind(), kind) << kind_name(kind);
        EXPECT_TRUE(policy.has_vector_approximation(kind)) << kind_name(kind);
    }
    EXPECT_EQ(registry.kinds().size(), std::size(ALL_PRIMITIVE_KINDS));
}
