// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the built-in filter primitives
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <chrono>
#include <limits>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "filters/filter-colormatrix.h"
#include "filters/filter-component-transfer.h"
#include "filters/filter-composite.h"
#include "filters/filter-convolve-matrix.h"
#include "filters/filter-displacement-map.h"
#include "filters/filter-errors.h"
#include "filters/filter-flood.h"
#include "filters/filter-gaussian.h"
#include "filters/filter-lighting.h"
#include "filters/filter-merge.h"
#include "filters/filter-morphology.h"
#include "filters/filter-offset.h"
#include "filters/filter-tile.h"

using namespace Svgfx;
using namespace Svgfx::Filters;

namespace {

bool contains(std::string const &haystack, std::string const &needle)
{
    return haystack.find(needle) != std::string::npos;
}

class PrimitiveTest : public ::testing::Test
{
protected:
    PrimitiveTest()
    {
        source.bounds = Geom::Rect(0, 0, 100, 80);
        upstream.bounds = Geom::Rect(50, 40, 150, 120);
        upstream.payload = MarkupFragment{"<up/>"};
    }

    PrimitiveOutput run(FilterPrimitive const &primitive, ParamMap const &params,
                        RenderStrategy strategy = RenderStrategy::NativeEffect, PrimitiveInputs inputs = {})
    {
        if (inputs.empty()) {
            inputs.push_back({"SourceGraphic", &source});
        }
        PrimitiveContext ctx(strategy, progress);
        ctx.source_bounds = source.bounds;
        ctx.region = region;
        return primitive.apply(params, inputs, ctx);
    }

    PrimitiveOutput run_emf(FilterPrimitive const &primitive, ParamMap const &params)
    {
        return run(primitive, params, RenderStrategy::EMFFallback);
    }

    FilterExecutionResult source;
    FilterExecutionResult upstream;
    Geom::OptRect region;
    Async::ProgressAlways<double> progress;
};

} // namespace

TEST_F(PrimitiveTest, Gaussian)
{
    FilterGaussian blur;
    EXPECT_EQ(blur.kind(), PrimitiveKind::Blur);

    auto out = run(blur, ParamMap{ {"stdDeviation", 2.0} }, RenderStrategy::NativeEffect,
                   { {"up", &upstream} });
    EXPECT_EQ(out.markup, "<up/><a:blur rad=\"19050\" grow=\"1\"/>");
    ASSERT_TRUE(out.bounds);
    EXPECT_EQ(*out.bounds, Geom::Rect(44, 34, 156, 126));

    auto emf = run_emf(blur, ParamMap{ {"stdDeviation", 2.0} });
    EXPECT_EQ(emf.commands.size(), static_cast<std::size_t>(FilterGaussian::FALLOFF_STEPS));
    EXPECT_TRUE(emf.markup.empty());

    EXPECT_DOUBLE_EQ(blur.complexity(ParamMap{ {"stdDeviation", 5.0} }), 1.0);
    EXPECT_DOUBLE_EQ(blur.complexity(ParamMap{ {"stdDeviation", std::vector<double>{5, 10}} }), 7.0);
    EXPECT_THROW(blur.complexity(ParamMap{ {"stdDeviation", -1.0} }), ParameterError);

    // Zero deviation leaves the input untouched.
    auto none = run(blur, ParamMap{}, RenderStrategy::NativeEffect, { {"up", &upstream} });
    EXPECT_EQ(none.markup, "<up/>");
}

TEST_F(PrimitiveTest, GaussianHonoursCancellation)
{
    Async::CancellationToken token;
    token.cancel();
    Async::DeadlineProgress<double> cancelled(token, std::chrono::steady_clock::now() + std::chrono::hours(1));

    FilterGaussian blur;
    PrimitiveInputs inputs{ {"SourceGraphic", &source} };
    PrimitiveContext ctx(RenderStrategy::EMFFallback, cancelled);
    EXPECT_THROW(blur.apply(ParamMap{ {"stdDeviation", 3.0} }, inputs, ctx), Async::CancelledException);
}

TEST_F(PrimitiveTest, Offset)
{
    FilterOffset offset;
    auto out = run(offset, ParamMap{ {"dx", 0.0}, {"dy", 5.0} });
    EXPECT_EQ(out.markup, "<a:outerShdw dist=\"47625\" dir=\"5400000\" algn=\"ctr\" rotWithShape=\"0\">"
                          "<a:srgbClr val=\"000000\"/></a:outerShdw>");
    EXPECT_EQ(*out.bounds, Geom::Rect(0, 5, 100, 85));

    EXPECT_TRUE(run(offset, ParamMap{}).markup.empty());

    auto emf = run_emf(offset, ParamMap{ {"dx", 10.0} });
    ASSERT_EQ(emf.commands.size(), 1u);
    EXPECT_EQ(std::get<Emf::Rectangle>(emf.commands[0]).rect, Geom::Rect(10, 0, 110, 80));
}

TEST_F(PrimitiveTest, Flood)
{
    FilterFlood flood;
    region = Geom::Rect(10, 10, 20, 20);

    auto out = run(flood, ParamMap{ {"flood-color", "#3366CC"}, {"flood-opacity", 0.5} });
    EXPECT_EQ(out.markup, "<a:solidFill><a:srgbClr val=\"3366CC\"><a:alpha val=\"50000\"/></a:srgbClr></a:solidFill>");
    EXPECT_EQ(*out.bounds, Geom::Rect(10, 10, 20, 20));

    // Opacity is clamped; flood replaces whatever came before.
    auto clamped = run(flood, ParamMap{ {"flood-opacity", 3.0} }, RenderStrategy::NativeEffect, { {"up", &upstream} });
    EXPECT_EQ(clamped.markup, "<a:solidFill><a:srgbClr val=\"000000\"><a:alpha val=\"100000\"/></a:srgbClr></a:solidFill>");

    auto emf = run_emf(flood, ParamMap{ {"flood-color", "#f00"} });
    ASSERT_EQ(emf.commands.size(), 1u);
    EXPECT_EQ(std::get<Emf::Rectangle>(emf.commands[0]).fill.color, 0xff0000u);
}

TEST_F(PrimitiveTest, Merge)
{
    FilterMerge merge;
    auto out = run(merge, ParamMap{}, RenderStrategy::NativeEffect, { {"a", &upstream}, {"b", &source} });
    EXPECT_EQ(out.markup, "<up/>");
    EXPECT_EQ(*out.bounds, Geom::Rect(0, 0, 150, 120));

    auto emf = run(merge, ParamMap{}, RenderStrategy::EMFFallback, { {"a", &upstream}, {"b", &source} });
    EXPECT_EQ(emf.commands.size(), 2u);
}

TEST_F(PrimitiveTest, ColorMatrix)
{
    FilterColorMatrix matrix;

    ParamMap saturate{ {"type", "saturate"}, {"values", 0.5} };
    EXPECT_EQ(FilterColorMatrix::classify(saturate), FilterColorMatrix::Shape::Saturate);
    EXPECT_EQ(run(matrix, saturate).markup, "<a:hsl hue=\"0\" sat=\"-50000\" lum=\"0\"/>");

    ParamMap hue{ {"type", "hueRotate"}, {"values", 90.0} };
    EXPECT_EQ(run(matrix, hue).markup, "<a:hsl hue=\"5400000\" sat=\"0\" lum=\"0\"/>");

    ParamMap grey{ {"type", "matrix"}, {"values", std::vector<double>{
        0.3, 0.59, 0.11, 0, 0,
        0.3, 0.59, 0.11, 0, 0,
        0.3, 0.59, 0.11, 0, 0,
        0, 0, 0, 1, 0 }} };
    EXPECT_EQ(FilterColorMatrix::classify(grey), FilterColorMatrix::Shape::Greyscale);
    EXPECT_TRUE(matrix.vector_approximable(grey));
    EXPECT_EQ(run(matrix, grey, RenderStrategy::VectorApprox).markup, "<a:grayscl/>");

    EXPECT_EQ(FilterColorMatrix::classify(ParamMap{}), FilterColorMatrix::Shape::Identity);

    ParamMap luminance{ {"type", "luminanceToAlpha"} };
    EXPECT_FALSE(matrix.vector_approximable(luminance));
    EXPECT_THROW(run(matrix, luminance), ParameterError);

    auto emf = run_emf(matrix, luminance);
    ASSERT_EQ(emf.commands.size(), 1u);
    auto const &rect = std::get<Emf::Rectangle>(emf.commands[0]);
    EXPECT_EQ(rect.fill.color, 0x000000u);
    EXPECT_NEAR(rect.fill.opacity, 0.5, 0.01);

    EXPECT_THROW(matrix.complexity(ParamMap{ {"values", std::vector<double>{1, 2, 3}} }), ParameterError);
    EXPECT_THROW(matrix.complexity(ParamMap{ {"type", "sepia"} }), ParameterError);
}

TEST_F(PrimitiveTest, ComponentTransferPatterns)
{
    using Pattern = FilterComponentTransfer::Pattern;
    auto recognise = [] (ParamMap const &params) { return FilterComponentTransfer::recognise(params); };

    EXPECT_EQ(recognise(ParamMap{}), Pattern::Identity);

    ParamMap bilevel;
    for (auto c : {"R", "G", "B"}) {
        bilevel.set(std::string("func") + c + ".type", "discrete");
        bilevel.set(std::string("func") + c + ".tableValues", std::vector<double>{0, 1});
    }
    EXPECT_EQ(recognise(bilevel), Pattern::BiLevel);

    ParamMap duotone{
        {"funcR.type", "table"}, {"funcR.tableValues", std::vector<double>{0.2, 1.0}},
        {"funcG.type", "table"}, {"funcG.tableValues", std::vector<double>{0.0, 0.5}},
        {"funcB.type", "table"}, {"funcB.tableValues", std::vector<double>{0.4, 0.0}}
    };
    EXPECT_EQ(recognise(duotone), Pattern::Duotone);

    ParamMap greyscale{
        {"funcR.type", "linear"}, {"funcR.slope", 0.2126},
        {"funcG.type", "linear"}, {"funcG.slope", 0.7152},
        {"funcB.type", "linear"}, {"funcB.slope", 0.0722}
    };
    EXPECT_EQ(recognise(greyscale), Pattern::Greyscale);

    ParamMap single_channel{
        {"funcR.type", "linear"}, {"funcR.slope", 1.0},
        {"funcG.type", "linear"}, {"funcG.slope", 0.0},
        {"funcB.type", "linear"}, {"funcB.slope", 0.0}
    };
    EXPECT_EQ(recognise(single_channel), Pattern::Greyscale);

    ParamMap gamma;
    ParamMap inverse;
    for (auto c : {"R", "G", "B"}) {
        gamma.set(std::string("func") + c + ".type", "gamma");
        gamma.set(std::string("func") + c + ".exponent", 2.2);
        inverse.set(std::string("func") + c + ".type", "gamma");
        inverse.set(std::string("func") + c + ".exponent", 0.45);
    }
    EXPECT_EQ(recognise(gamma), Pattern::Gamma);
    EXPECT_EQ(recognise(inverse), Pattern::InvGamma);

    ParamMap alpha{ {"funcA.type", "linear"}, {"funcA.slope", 0.5} };
    EXPECT_EQ(recognise(alpha), Pattern::AlphaScale);

    ParamMap mixed{ {"funcR.type", "gamma"}, {"funcR.exponent", 2.0}, {"funcG.type", "linear"}, {"funcG.slope", 0.5} };
    EXPECT_EQ(recognise(mixed), Pattern::Heterogeneous);

    // A 0..1 table is the identity.
    ParamMap ramp{ {"funcR.type", "table"}, {"funcR.tableValues", std::vector<double>{0, 1}} };
    EXPECT_EQ(recognise(ramp), Pattern::Identity);

    EXPECT_THROW(recognise(ParamMap{ {"funcR.type", "sigmoid"} }), ParameterError);
}

TEST_F(PrimitiveTest, ComponentTransferOutput)
{
    FilterComponentTransfer transfer;

    ParamMap alpha{ {"funcA.type", "linear"}, {"funcA.slope", 0.5} };
    EXPECT_TRUE(transfer.vector_approximable(alpha));
    EXPECT_DOUBLE_EQ(transfer.complexity(alpha), 1.0);
    EXPECT_EQ(run(transfer, alpha, RenderStrategy::VectorApprox).markup, "<a:alphaModFix amt=\"50000\"/>");

    ParamMap duotone{
        {"funcR.type", "table"}, {"funcR.tableValues", std::vector<double>{0.0, 1.0}},
        {"funcG.type", "table"}, {"funcG.tableValues", std::vector<double>{0.0, 0.0}},
        {"funcB.type", "table"}, {"funcB.tableValues", std::vector<double>{1.0, 0.0}}
    };
    EXPECT_EQ(run(transfer, duotone, RenderStrategy::VectorApprox).markup,
              "<a:duotone><a:srgbClr val=\"0000FF\"/><a:srgbClr val=\"FF0000\"/></a:duotone>");

    ParamMap mixed{ {"funcR.type", "gamma"}, {"funcR.exponent", 2.0}, {"funcG.type", "linear"}, {"funcG.slope", 0.5} };
    EXPECT_FALSE(transfer.vector_approximable(mixed));
    EXPECT_DOUBLE_EQ(transfer.complexity(mixed), 3.0);
    EXPECT_THROW(run(transfer, mixed), ParameterError);

    auto emf = run_emf(transfer, mixed);
    ASSERT_EQ(emf.commands.size(), 1u);
    // R: 0.5^2, G: 0.25, B: 0.5.
    EXPECT_EQ(std::get<Emf::Rectangle>(emf.commands[0]).fill.color, 0x404080u);
}

TEST_F(PrimitiveTest, Composite)
{
    FilterComposite composite;
    PrimitiveInputs two{ {"a", &upstream}, {"b", &source} };

    auto blend = run(composite, ParamMap{ {"mode", "multiply"} }, RenderStrategy::NativeEffect, two);
    EXPECT_EQ(blend.markup, "<up/><a:blend blend=\"mult\"><a:cont></a:cont></a:blend>");
    EXPECT_EQ(*blend.bounds, Geom::Rect(0, 0, 150, 120));

    auto in = run(composite, ParamMap{ {"operator", "in"} }, RenderStrategy::EMFFallback, two);
    EXPECT_EQ(*in.bounds, Geom::Rect(50, 40, 100, 80));

    auto out = run(composite, ParamMap{ {"operator", "out"} }, RenderStrategy::EMFFallback, two);
    EXPECT_EQ(*out.bounds, *upstream.bounds);

    // Mode wins over operator.
    EXPECT_EQ(FilterComposite::effective_operator(ParamMap{ {"operator", "xor"}, {"mode", "screen"} }), "screen");
    EXPECT_TRUE(FilterComposite::is_porter_duff("atop"));
    EXPECT_FALSE(FilterComposite::blend_for("overlay"));

    EXPECT_THROW(run(composite, ParamMap{ {"operator", "xor"} }, RenderStrategy::NativeEffect, two), ParameterError);
    EXPECT_THROW(composite.complexity(ParamMap{ {"operator", "plus"} }), ParameterError);

    ParamMap arithmetic{ {"operator", "arithmetic"}, {"k1", 0.1}, {"k2", 0.2}, {"k3", 0.3}, {"k4", 0.4} };
    EXPECT_FALSE(composite.vector_approximable(arithmetic));
    auto emf = run(composite, arithmetic, RenderStrategy::EMFFallback, two);
    ASSERT_EQ(emf.commands.size(), 1u);
    auto const &pixel = std::get<Emf::PixelComposite>(emf.commands[0]);
    EXPECT_EQ(pixel.op, "arithmetic");
    EXPECT_DOUBLE_EQ(pixel.k[3], 0.4);
}

TEST_F(PrimitiveTest, ConvolveMatrix)
{
    FilterConvolveMatrix convolve;
    auto kernel = [] (std::vector<double> values) {
        return ParamMap{ {"order", 3.0}, {"kernelMatrix", std::move(values)} };
    };

    EXPECT_EQ(FilterConvolveMatrix::recognise(kernel({ 0, 0, 0, 0, 1, 0, 0, 0, 0 })), KnownKernel::Identity);
    EXPECT_EQ(FilterConvolveMatrix::recognise(kernel({ 1, 0, -1, 2, 0, -2, 1, 0, -1 })), KnownKernel::SobelHorizontal);
    EXPECT_EQ(FilterConvolveMatrix::recognise(kernel({ 0, 1, 0, 1, -4, 1, 0, 1, 0 })), KnownKernel::Laplacian4);
    EXPECT_EQ(FilterConvolveMatrix::recognise(kernel({ -1, -1, -1, -1, 8, -1, -1, -1, -1 })), KnownKernel::Laplacian8);
    EXPECT_EQ(FilterConvolveMatrix::recognise(kernel({ 1, 1, 1, 1, 1, 1, 1, 1, 1 })), KnownKernel::None);

    EXPECT_EQ(run(convolve, kernel({ 0, 0, 0, 0, 1, 0, 0, 0, 0 }), RenderStrategy::VectorApprox).markup, "");
    EXPECT_TRUE(contains(run(convolve, kernel({ -1, -1, -1, -1, 8, -1, -1, -1, -1 }), RenderStrategy::VectorApprox).markup,
                         "<a:prstDash val=\"solid\"/>"));
    EXPECT_THROW(run(convolve, kernel({ 1, 1, 1, 1, 1, 1, 1, 1, 1 })), ParameterError);

    EXPECT_EQ(FilterConvolveMatrix::fallback_fill({ 1, 2, 1, 2, 4, 2, 1, 2, 1 }), Emf::FillSemantics::Solid);
    EXPECT_EQ(FilterConvolveMatrix::fallback_fill({ -2, -1, 0, -1, 1, 1, 0, 1, 2 }), Emf::FillSemantics::Hatch);
    EXPECT_EQ(FilterConvolveMatrix::fallback_fill({ 0, -1, 0, -1, 5, -1, 0, -1, 0 }), Emf::FillSemantics::Crosshatch);

    EXPECT_THROW(convolve.complexity(ParamMap{ {"order", 3.0}, {"kernelMatrix", std::vector<double>{1, 2}} }), ParameterError);
    EXPECT_THROW(run(convolve, ParamMap{ {"kernelMatrix", std::vector<double>(9, 1.0)}, {"divisor", 0.0} }), ParameterError);

    double const small = convolve.complexity(kernel({ 0, 0, 0, 0, 1, 0, 0, 0, 0 }));
    double const large = convolve.complexity(ParamMap{ {"order", 5.0}, {"kernelMatrix", std::vector<double>(25, 3.0)} });
    EXPECT_LT(small, large);
    EXPECT_LE(large, 1.0);
}

TEST_F(PrimitiveTest, Morphology)
{
    FilterMorphology morphology;

    auto dilate = run(morphology, ParamMap{ {"operator", "dilate"}, {"radius", 2.0} });
    EXPECT_EQ(dilate.markup, "<a:ln w=\"38100\"><a:solidFill><a:srgbClr val=\"000000\"/></a:solidFill></a:ln>");
    EXPECT_EQ(*dilate.bounds, Geom::Rect(-2, -2, 102, 82));

    auto erode = run(morphology, ParamMap{ {"radius", 2.0} }, RenderStrategy::VectorApprox);
    EXPECT_EQ(erode.markup, "<a:innerShdw blurRad=\"0\" dist=\"19050\" dir=\"0\"><a:srgbClr val=\"000000\"/></a:innerShdw>");
    EXPECT_EQ(*erode.bounds, Geom::Rect(2, 2, 98, 78));

    auto zero = run(morphology, ParamMap{ {"operator", "dilate"} }, RenderStrategy::NativeEffect, { {"up", &upstream} });
    EXPECT_EQ(zero.markup, "<up/>");
    EXPECT_DOUBLE_EQ(morphology.complexity(ParamMap{}), 0.0);

    EXPECT_DOUBLE_EQ(morphology.complexity(ParamMap{ {"radius", 12.0} }), 1.5);
    EXPECT_TRUE(morphology.vector_approximable(ParamMap{ {"radius", 50.0} }));
    EXPECT_FALSE(morphology.vector_approximable(ParamMap{ {"radius", 51.0} }));

    EXPECT_THROW(morphology.complexity(ParamMap{ {"radius", -1.0} }), ParameterError);
    EXPECT_THROW(run(morphology, ParamMap{ {"operator", "open"}, {"radius", 1.0} }), ParameterError);

    auto emf = run_emf(morphology, ParamMap{ {"operator", "dilate"}, {"radius", 4.0} });
    ASSERT_EQ(emf.commands.size(), 1u);
    auto const &polygon = std::get<Emf::Polygon>(emf.commands[0]);
    EXPECT_EQ(polygon.points.size(), 4u);
    EXPECT_TRUE(polygon.stroke);
}

TEST_F(PrimitiveTest, Lighting)
{
    FilterDiffuseLighting diffuse;
    FilterSpecularLighting specular;

    ParamMap distant{ {"light", "distant"}, {"azimuth", 0.0}, {"surfaceScale", 2.0} };
    auto out = run(diffuse, distant, RenderStrategy::VectorApprox);
    EXPECT_EQ(out.markup,
              "<a:scene3d><a:camera prst=\"orthographicFront\"/><a:lightRig rig=\"threePt\" dir=\"r\"/></a:scene3d>"
              "<a:sp3d prstMaterial=\"matte\"><a:bevelT w=\"38100\" h=\"19050\"/></a:sp3d>");

    ParamMap point{ {"light", "point"}, {"x", 50.0}, {"y", -100.0}, {"z", 20.0} };
    EXPECT_TRUE(contains(run(diffuse, point).markup, "rig=\"balanced\" dir=\"t\""));

    ParamMap shiny{ {"light", "spot"}, {"limitingConeAngle", 20.0}, {"specularExponent", 40.0} };
    EXPECT_TRUE(contains(run(specular, shiny).markup, "prstMaterial=\"metal\""));
    EXPECT_TRUE(contains(run(specular, shiny).markup, "rig=\"harsh\""));

    EXPECT_DOUBLE_EQ(diffuse.complexity(ParamMap{}), 0.5);
    EXPECT_DOUBLE_EQ(diffuse.complexity(point), 1.0);
    // Spot +1, narrow cone +0.5, exponent over 32 +1.
    EXPECT_DOUBLE_EQ(specular.complexity(shiny), 3.0);
    EXPECT_DOUBLE_EQ(diffuse.complexity(ParamMap{ {"lighting-color", "#ff8000"} }), 0.8);

    auto const spot = FilterLighting::light(shiny);
    EXPECT_EQ(spot.type, SPOT_LIGHT);
    EXPECT_DOUBLE_EQ(spot.spot.limitingConeAngle, 20.0);

    EXPECT_THROW(FilterLighting::light(ParamMap{ {"light", "laser"} }), ParameterError);
    EXPECT_THROW(diffuse.complexity(ParamMap{ {"diffuseConstant", -1.0} }), ParameterError);

    auto emf = run_emf(diffuse, distant);
    EXPECT_EQ(emf.commands.size(), static_cast<std::size_t>(FilterLighting::FALLOFF_STEPS));
}

TEST_F(PrimitiveTest, DisplacementMap)
{
    FilterDisplacementMap displacement;

    EXPECT_EQ(FilterDisplacementMap::control_points(0), 32);
    EXPECT_EQ(FilterDisplacementMap::control_points(10), 112);
    EXPECT_TRUE(displacement.vector_approximable(ParamMap{ {"scale", 20.0} }));
    EXPECT_FALSE(displacement.vector_approximable(ParamMap{ {"scale", 60.0} }));
    EXPECT_DOUBLE_EQ(displacement.complexity(ParamMap{ {"scale", 20.0} }), 3.0);

    ParamMap params{ {"scale", 4.0}, {"xChannelSelector", "R"}, {"yChannelSelector", "G"} };
    auto outline = FilterDisplacementMap::displaced_outline(Geom::Rect(0, 0, 100, 80), params);
    EXPECT_EQ(outline.size(), 64u);
    for (auto const &p : outline) {
        EXPECT_GE(p.x(), -2.0 - 1e-9);
        EXPECT_LE(p.x(), 102.0 + 1e-9);
    }

    auto out = run(displacement, params, RenderStrategy::VectorApprox);
    EXPECT_TRUE(contains(out.markup, "<a:custGeom><a:pathLst><a:path w=\"952500\" h=\"762000\"><a:moveTo>"));
    EXPECT_TRUE(contains(out.markup, "<a:close/></a:path>"));
    EXPECT_EQ(*out.bounds, Geom::Rect(-2, -2, 102, 82));

    auto emf = run_emf(displacement, params);
    ASSERT_EQ(emf.commands.size(), 1u);
    auto const &line = std::get<Emf::Polyline>(emf.commands[0]);
    EXPECT_EQ(line.points.size(), 65u);
    EXPECT_EQ(line.points.front(), line.points.back());

    EXPECT_THROW(run(displacement, ParamMap{ {"xChannelSelector", "Q"} }), ParameterError);
}

TEST_F(PrimitiveTest, DisplacementScaleMustBeFiniteAndBounded)
{
    FilterDisplacementMap displacement;

    EXPECT_EQ(FilterDisplacementMap::control_points(FilterDisplacementMap::MAX_SCALE), 4 * 20008);
    EXPECT_THROW(FilterDisplacementMap::control_points(1e12), ParameterError);
    EXPECT_THROW(FilterDisplacementMap::control_points(-1e12), ParameterError);
    EXPECT_THROW(FilterDisplacementMap::control_points(std::numeric_limits<double>::quiet_NaN()), ParameterError);
    EXPECT_THROW(FilterDisplacementMap::control_points(std::numeric_limits<double>::infinity()), ParameterError);

    ParamMap const huge{ {"scale", 5e9} };
    EXPECT_THROW(displacement.complexity(huge), ParameterError);
    EXPECT_THROW(displacement.vector_approximable(huge), ParameterError);
    EXPECT_THROW(run(displacement, huge, RenderStrategy::VectorApprox), ParameterError);
    EXPECT_THROW(run_emf(displacement, huge), ParameterError);
}

TEST_F(PrimitiveTest, NumericColours)
{
    EXPECT_EQ(ParamMap({ {"c", 0.0} }).color_or("c", 1), 0x000000u);
    EXPECT_EQ(ParamMap({ {"c", double(0x102030)} }).color_or("c", 1), 0x102030u);
    EXPECT_EQ(ParamMap({ {"c", double(0xffffff)} }).color_or("c", 1), 0xffffffu);
    EXPECT_EQ(ParamMap{}.color_or("c", 0xabcdef), 0xabcdefu);

    EXPECT_THROW(ParamMap({ {"c", -1.0} }).color_or("c", 0), ParameterError);
    EXPECT_THROW(ParamMap({ {"c", double(0x1000000)} }).color_or("c", 0), ParameterError);
    EXPECT_THROW(ParamMap({ {"c", std::numeric_limits<double>::quiet_NaN()} }).color_or("c", 0), ParameterError);

    FilterFlood flood;
    EXPECT_THROW(run(flood, ParamMap{ {"flood-color", -5.0} }), ParameterError);
}

TEST_F(PrimitiveTest, Tile)
{
    FilterTile tile;

    auto pattern = [] (double w, double h) {
        return FilterTile::pattern(ParamMap{ {"width", w}, {"height", h} });
    };
    EXPECT_EQ(pattern(10, 10), Emf::FillSemantics::Hexagonal);
    EXPECT_EQ(pattern(30, 10), Emf::FillSemantics::Hatch);
    EXPECT_EQ(pattern(10, 30), Emf::FillSemantics::HatchVertical);
    EXPECT_EQ(pattern(15, 10), Emf::FillSemantics::Grid);
    EXPECT_THROW(pattern(0, 10), ParameterError);
    EXPECT_THROW(FilterTile::pattern(ParamMap{ {"pattern", "solid"} }), ParameterError);
    EXPECT_THROW(FilterTile::pattern(ParamMap{ {"pattern", "polka"} }), ParameterError);

    ParamMap brick{ {"pattern", "brick"}, {"color", "#102030"} };
    EXPECT_EQ(run(tile, brick).markup,
              "<a:pattFill prst=\"horzBrick\"><a:fgClr><a:srgbClr val=\"102030\"/></a:fgClr>"
              "<a:bgClr><a:srgbClr val=\"FFFFFF\"/></a:bgClr></a:pattFill>");
    EXPECT_TRUE(contains(run(tile, ParamMap{ {"pattern", "crosshatch"} }).markup, "prst=\"diagCross\""));

    ParamMap hexagonal{ {"pattern", "hexagonal"} };
    EXPECT_FALSE(tile.vector_approximable(hexagonal));
    EXPECT_DOUBLE_EQ(tile.complexity(hexagonal), 5.0);
    EXPECT_THROW(run(tile, hexagonal), ParameterError);

    auto emf = run_emf(tile, hexagonal);
    ASSERT_EQ(emf.commands.size(), 1u);
    EXPECT_EQ(std::get<Emf::Rectangle>(emf.commands[0]).fill.semantics, Emf::FillSemantics::Hexagonal);
}

TEST_F(PrimitiveTest, Names)
{
    EXPECT_EQ(FilterGaussian().name(), "Gaussian Blur");
    EXPECT_EQ(FilterSpecularLighting().kind(), PrimitiveKind::SpecularLighting);
    EXPECT_EQ(FilterTile().kind(), PrimitiveKind::Tile);
}
