// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for filter graph resolution
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <gtest/gtest.h>
#include "filters/filter-errors.h"
#include "filters/filter-graph.h"
#include "filters/slot-resolver.h"

using namespace Svgfx::Filters;

namespace {

FilterPrimitiveSpec node(std::string id, PrimitiveKind kind, std::string in, std::string result, std::string in2 = {})
{
    FilterPrimitiveSpec spec;
    spec.id = std::move(id);
    spec.kind = kind;
    spec.in = std::move(in);
    spec.in2 = std::move(in2);
    spec.result = std::move(result);
    return spec;
}

} // namespace

TEST(SlotResolverTest, SourcesAndShadowing)
{
    SlotResolver resolver;
    EXPECT_EQ(resolver.read("SourceGraphic"), FILTER_SOURCEGRAPHIC);
    EXPECT_EQ(resolver.read("SourceAlpha"), FILTER_SOURCEALPHA);
    EXPECT_EQ(resolver.read("BackgroundImage"), FILTER_BACKGROUNDIMAGE);
    EXPECT_EQ(resolver.read("blur"), FILTER_SLOT_NOT_SET);

    resolver.write("blur", 0);
    resolver.write("blur", 3);
    EXPECT_EQ(resolver.read("blur"), 3);

    EXPECT_STREQ(source_slot_name(FILTER_SOURCEALPHA), "SourceAlpha");
    EXPECT_EQ(source_slot_name(2), nullptr);
}

TEST(FilterGraphTest, ImplicitInputsChain)
{
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "", ""),
        node("b", PrimitiveKind::Offset, "", ""),
        node("c", PrimitiveKind::Flood, "", "")
    };

    auto resolved = graph.resolve();
    EXPECT_EQ(resolved.nodes[0].inputs, (std::vector<int>{ FILTER_SOURCEGRAPHIC }));
    EXPECT_EQ(resolved.nodes[1].inputs, (std::vector<int>{ 0 }));
    EXPECT_EQ(resolved.nodes[2].inputs, (std::vector<int>{ 1 }));
    EXPECT_EQ(resolved.levels.size(), 3u);
    EXPECT_EQ(resolved.output, 2u);
}

TEST(FilterGraphTest, Levels)
{
    // Two offsets of the source, merged.
    auto merge = node("merge", PrimitiveKind::Merge, "left", "", "right");
    FilterGraph graph{
        node("left", PrimitiveKind::Offset, "SourceGraphic", "left"),
        node("right", PrimitiveKind::Offset, "SourceAlpha", "right"),
        merge
    };

    auto resolved = graph.resolve();
    ASSERT_EQ(resolved.levels.size(), 2u);
    EXPECT_EQ(resolved.levels[0], (std::vector<std::size_t>{ 0, 1 }));
    EXPECT_EQ(resolved.levels[1], (std::vector<std::size_t>{ 2 }));
    EXPECT_EQ(resolved.nodes[2].inputs, (std::vector<int>{ 0, 1 }));
    EXPECT_EQ(resolved.nodes[0].dependents, (std::vector<std::size_t>{ 2 }));
    EXPECT_EQ(resolved.nodes[2].level, 1u);
}

TEST(FilterGraphTest, MergeWithManyInputs)
{
    auto merge = node("merge", PrimitiveKind::Merge, "a", "", "b");
    merge.more_inputs = { "c", "SourceGraphic" };

    FilterGraph graph{
        node("a", PrimitiveKind::Flood, "", "a"),
        node("b", PrimitiveKind::Flood, "", "b"),
        node("c", PrimitiveKind::Flood, "", "c"),
        merge
    };

    auto resolved = graph.resolve();
    EXPECT_EQ(resolved.nodes[3].inputs, (std::vector<int>{ 0, 1, 2, FILTER_SOURCEGRAPHIC }));
    EXPECT_EQ(graph[3].inputs().size(), 4u);
}

TEST(FilterGraphTest, NearestEarlierProducer)
{
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "", "x"),
        node("b", PrimitiveKind::Offset, "x", "x"),
        node("c", PrimitiveKind::Flood, "x", "")
    };

    auto resolved = graph.resolve();
    EXPECT_EQ(resolved.nodes[1].inputs, (std::vector<int>{ 0 }));
    EXPECT_EQ(resolved.nodes[2].inputs, (std::vector<int>{ 1 }));
}

TEST(FilterGraphTest, ForwardReferenceIsRejected)
{
    // "later" exists, but only after the node reading it.
    FilterGraph graph{
        node("a", PrimitiveKind::Offset, "later", "a"),
        node("b", PrimitiveKind::Flood, "SourceGraphic", "later")
    };

    try {
        graph.resolve();
        FAIL() << "forward reference accepted";
    } catch (UnresolvedReferenceError const &e) {
        EXPECT_EQ(e.node_id(), "a");
        EXPECT_EQ(e.reference(), "later");
    }
}

TEST(FilterGraphTest, ForwardReferenceAfterEarlierInput)
{
    FilterGraph graph{
        node("a", PrimitiveKind::Flood, "", "a"),
        node("b", PrimitiveKind::Merge, "a", "", "c"),
        node("c", PrimitiveKind::Offset, "SourceAlpha", "c")
    };

    EXPECT_THROW(graph.resolve(), UnresolvedReferenceError);
}

TEST(FilterGraphTest, CycleThroughSeveralLaterNodes)
{
    // a -> c -> b -> a, where a and b read later results.
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "c-out", "a-out"),
        node("b", PrimitiveKind::Offset, "a-out", "b-out"),
        node("c", PrimitiveKind::Offset, "b-out", "c-out"),
        node("d", PrimitiveKind::Flood, "SourceGraphic", "")
    };

    try {
        graph.resolve();
        FAIL() << "cycle accepted";
    } catch (CyclicFilterGraphError const &e) {
        EXPECT_EQ(e.node_ids(), (std::vector<std::string>{ "a", "b", "c" }));
    }
}

TEST(FilterGraphTest, UnresolvedReference)
{
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "", "a"),
        node("b", PrimitiveKind::Offset, "missing", "")
    };

    try {
        graph.resolve();
        FAIL() << "unresolved reference accepted";
    } catch (UnresolvedReferenceError const &e) {
        EXPECT_EQ(e.node_id(), "b");
        EXPECT_EQ(e.reference(), "missing");
    }
}

TEST(FilterGraphTest, SelfReferenceIsCycle)
{
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "self", "self")
    };

    try {
        graph.resolve();
        FAIL() << "self reference accepted";
    } catch (CyclicFilterGraphError const &e) {
        EXPECT_EQ(e.node_ids(), (std::vector<std::string>{ "a" }));
    }
}

TEST(FilterGraphTest, CycleThroughLaterNode)
{
    // a reads the result of b, which reads a.
    FilterGraph graph{
        node("a", PrimitiveKind::Blur, "b-out", "a-out"),
        node("b", PrimitiveKind::Offset, "a-out", "b-out"),
        node("c", PrimitiveKind::Flood, "SourceGraphic", "")
    };

    try {
        graph.resolve();
        FAIL() << "cycle accepted";
    } catch (CyclicFilterGraphError const &e) {
        EXPECT_EQ(e.node_ids(), (std::vector<std::string>{ "a", "b" }));
    }

    EXPECT_THROW(graph.resolve(), FilterGraphError);
}

TEST(FilterGraphTest, LabelsForAnonymousNodes)
{
    FilterGraph graph{
        node("", PrimitiveKind::Blur, "", ""),
        node("named", PrimitiveKind::Offset, "", "")
    };

    EXPECT_EQ(graph.label(0), "#0");
    EXPECT_EQ(graph.label(1), "named");
}

TEST(FilterGraphTest, Empty)
{
    FilterGraph graph;
    EXPECT_TRUE(graph.empty());

    auto resolved = graph.resolve();
    EXPECT_TRUE(resolved.nodes.empty());
    EXPECT_TRUE(resolved.levels.empty());
}
