// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the metafile encoder
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <future>
#include <vector>
#include <gtest/gtest.h>
#include "emf/emf-encoder.h"
#include "emf/emf-patterns.h"

using namespace Svgfx::Emf;

namespace {

Rectangle rectangle(double x0, double y0, double x1, double y1, FillSemantics semantics = FillSemantics::Solid)
{
    Rectangle rect;
    rect.rect = Geom::Rect(x0, y0, x1, y1);
    rect.fill.semantics = semantics;
    rect.fill.color = 0x336699;
    return rect;
}

std::vector<Command> sample_commands()
{
    std::vector<Command> commands;
    commands.emplace_back(rectangle(0, 0, 100, 50));

    Polygon triangle;
    triangle.points = { {10, 10}, {90, 10}, {50, 45} };
    triangle.fill.semantics = FillSemantics::Hexagonal;
    triangle.stroke = Stroke{0x000000, 2.0};
    commands.emplace_back(triangle);

    Polyline line;
    line.points = { {0, 0}, {25, 40}, {100, 50} };
    commands.emplace_back(line);

    FillPath ring;
    ring.contours = {
        { {0, 0}, {60, 0}, {60, 60}, {0, 60} },
        { {20, 20}, {40, 20}, {40, 40}, {20, 40} }
    };
    ring.rule = FillRule::EvenOdd;
    ring.fill.semantics = FillSemantics::Brick;
    commands.emplace_back(ring);

    return commands;
}

} // namespace

TEST(EmfEncoderTest, EmptyDocument)
{
    auto doc = EmfEncoder().encode({});

    ASSERT_EQ(doc.records().size(), 2u);
    EXPECT_EQ(doc.records().front().type, EMR_HEADER);
    EXPECT_EQ(doc.records().back().type, EMR_EOF);
    EXPECT_EQ(doc.size(), EmfEncoder::HEADER_SIZE + 20);
    EXPECT_FALSE(doc.bounds());
}

TEST(EmfEncoderTest, HeaderLayout)
{
    auto doc = EmfEncoder().encode({ rectangle(10, 20, 110, 70) });

    EXPECT_EQ(doc.read_u32(0), EMR_HEADER);
    EXPECT_EQ(doc.read_u32(4), EmfEncoder::HEADER_SIZE);

    // Bounds, inclusive logical units.
    EXPECT_EQ(doc.read_i32(8), 10);
    EXPECT_EQ(doc.read_i32(12), 20);
    EXPECT_EQ(doc.read_i32(16), 110);
    EXPECT_EQ(doc.read_i32(20), 70);

    EXPECT_EQ(doc.read_u32(40), 0x464d4520u);
    EXPECT_EQ(doc.read_u32(44), 0x10000u);
    EXPECT_EQ(doc.read_u32(48), doc.size());
    EXPECT_EQ(doc.read_u32(52), doc.records().size());
    EXPECT_EQ(doc.read_u32(56) & 0xffff, 3u);

    ASSERT_TRUE(doc.bounds());
    EXPECT_EQ(doc.bounds()->min(), Geom::IntPoint(10, 20));
    EXPECT_EQ(doc.bounds()->max(), Geom::IntPoint(110, 70));
}

TEST(EmfEncoderTest, RecordsAreAlignedAndContiguous)
{
    auto doc = EmfEncoder().encode(sample_commands());

    std::size_t offset = 0;
    for (auto const &record : doc.records()) {
        EXPECT_EQ(record.offset, offset);
        EXPECT_EQ(record.size % 4, 0u);
        EXPECT_EQ(doc.read_u32(record.offset), record.type);
        EXPECT_EQ(doc.read_u32(record.offset + 4), record.size);
        offset += record.size;
    }
    EXPECT_EQ(offset, doc.size());
}

TEST(EmfEncoderTest, RecordSequence)
{
    auto doc = EmfEncoder().encode({ rectangle(0, 0, 10, 10) });

    std::vector<std::uint32_t> types;
    for (auto const &record : doc.records()) {
        types.push_back(record.type);
    }
    EXPECT_EQ(types, (std::vector<std::uint32_t>{
        EMR_HEADER, EMR_CREATEBRUSHINDIRECT, EMR_SELECTOBJECT, EMR_SELECTOBJECT,
        EMR_RECTANGLE, EMR_DELETEOBJECT, EMR_EOF }));
}

TEST(EmfEncoderTest, PatternBrushes)
{
    auto doc = EmfEncoder().encode(sample_commands());

    EXPECT_EQ(doc.count(EMR_CREATEMONOBRUSH), 2u);      // hexagonal, brick
    EXPECT_EQ(doc.count(EMR_CREATEBRUSHINDIRECT), 1u);  // solid
    EXPECT_EQ(doc.count(EMR_CREATEPEN), 2u);            // triangle outline, polyline
    EXPECT_EQ(doc.count(EMR_POLYLINE), 1u);
    EXPECT_EQ(doc.count(EMR_SETPOLYFILLMODE), 1u);
    EXPECT_EQ(doc.count(EMR_BEGINPATH), 1u);
    EXPECT_EQ(doc.count(EMR_ENDPATH), 1u);
    EXPECT_EQ(doc.count(EMR_FILLPATH), 1u);
    EXPECT_EQ(doc.count(EMR_POLYGON), 3u);              // triangle and two path contours

    auto hatched = EmfEncoder().encode({ rectangle(0, 0, 10, 10, FillSemantics::Crosshatch) });
    auto const &brush = hatched.records()[1];
    ASSERT_EQ(brush.type, EMR_CREATEBRUSHINDIRECT);
    EXPECT_EQ(hatched.read_u32(brush.offset + 12), BS_HATCHED);
    EXPECT_EQ(hatched.read_u32(brush.offset + 16), 0x996633u); // COLORREF is 0x00BBGGRR
    EXPECT_EQ(hatched.read_u32(brush.offset + 20), HS_DIAGCROSS);
}

TEST(EmfEncoderTest, PatternTable)
{
    EXPECT_TRUE(pattern_for(FillSemantics::Solid).stock);
    EXPECT_EQ(pattern_for(FillSemantics::Hatch).hatch, HS_HORIZONTAL);
    EXPECT_EQ(pattern_for(FillSemantics::HatchVertical).hatch, HS_VERTICAL);
    EXPECT_EQ(pattern_for(FillSemantics::Grid).hatch, HS_CROSS);
    EXPECT_FALSE(pattern_for(FillSemantics::Hexagonal).stock);
    EXPECT_FALSE(pattern_for(FillSemantics::Brick).stock);
    EXPECT_EQ(pattern_for(FillSemantics::Hexagonal).preset, nullptr);

    EXPECT_EQ(pattern_from_name("crosshatch"), FillSemantics::Crosshatch);
    EXPECT_FALSE(pattern_from_name("polka"));
}

TEST(EmfEncoderTest, Deterministic)
{
    auto const commands = sample_commands();
    EmfEncoder encoder;

    auto first = encoder.encode(commands);
    auto second = encoder.encode(commands);
    EXPECT_EQ(first.bytes(), second.bytes());

    // Same bytes from other threads, with encodes interleaved.
    std::vector<std::future<EmfDocument>> futures;
    for (int i = 0; i < 4; i++) {
        futures.push_back(std::async(std::launch::async, [&, i] {
            encoder.encode({ rectangle(0, 0, i, i) });
            return encoder.encode(commands);
        }));
    }
    for (auto &future : futures) {
        EXPECT_EQ(future.get(), first);
    }
}

TEST(EmfEncoderTest, DpiScalesCoordinates)
{
    auto doc = EmfEncoder(EmfEncoder::DEFAULT_SIZE_CAP, 192).encode({ rectangle(1.2, 0, 10, 10) });

    ASSERT_TRUE(doc.bounds());
    EXPECT_EQ(doc.bounds()->min(), Geom::IntPoint(2, 0));
    EXPECT_EQ(doc.bounds()->max(), Geom::IntPoint(20, 20));
}

TEST(EmfEncoderTest, SizeCap)
{
    std::vector<Command> commands;
    for (int i = 0; i < 100; i++) {
        commands.emplace_back(rectangle(i, i, i + 10, i + 10));
    }

    try {
        EmfEncoder(1024).encode(commands);
        FAIL() << "size cap not enforced";
    } catch (EmfEncodingError const &e) {
        EXPECT_EQ(e.reason(), EmfEncodingError::Reason::SizeExceeded);
    }

    auto doc = EmfEncoder(1024 * 1024).encode(commands);
    EXPECT_LE(doc.size(), 1024u * 1024u);
}

TEST(EmfEncoderTest, UnsupportedCommands)
{
    auto reason = [] (Command command) {
        try {
            EmfEncoder().encode({ command });
        } catch (EmfEncodingError const &e) {
            return e.reason();
        }
        ADD_FAILURE() << "command accepted";
        return EmfEncodingError::Reason::SizeExceeded;
    };

    PixelComposite composite;
    composite.rect = Geom::Rect(0, 0, 10, 10);
    composite.op = "arithmetic";
    EXPECT_EQ(reason(composite), EmfEncodingError::Reason::UnsupportedRecord);

    Polygon degenerate;
    degenerate.points = { {0, 0}, {1, 1} };
    EXPECT_EQ(reason(degenerate), EmfEncodingError::Reason::UnsupportedRecord);

    Polyline dot;
    dot.points = { {0, 0} };
    EXPECT_EQ(reason(dot), EmfEncodingError::Reason::UnsupportedRecord);

    EXPECT_EQ(reason(rectangle(0, 0, 1e12, 10)), EmfEncodingError::Reason::UnsupportedRecord);
}
