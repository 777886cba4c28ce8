// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the raster fallback
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <vector>
#include <cairo.h>
#include <gtest/gtest.h>
#include "raster/rasterizer.h"

using namespace Svgfx;

namespace {

bool is_png(std::vector<std::uint8_t> const &bytes)
{
    static std::uint8_t const signature[] = { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n' };
    return bytes.size() > sizeof(signature) && std::equal(std::begin(signature), std::end(signature), bytes.begin());
}

std::vector<Emf::Command> sample_commands()
{
    Emf::Rectangle rect;
    rect.rect = Geom::Rect(10, 10, 60, 40);
    rect.fill.color = 0x336699;
    rect.fill.opacity = 0.5;

    Emf::Polygon hatched;
    hatched.points = { {0, 0}, {50, 0}, {25, 40} };
    hatched.fill.semantics = Emf::FillSemantics::Crosshatch;
    hatched.stroke = Emf::Stroke{0xff0000, 2.0};

    Emf::Polyline line;
    line.points = { {0, 50}, {100, 50} };

    Emf::FillPath path;
    path.contours = { { {0, 0}, {100, 0}, {100, 50}, {0, 50} }, { {20, 10}, {80, 10}, {80, 40}, {20, 40} } };
    path.rule = Emf::FillRule::EvenOdd;
    path.fill.semantics = Emf::FillSemantics::Hexagonal;

    Emf::PixelComposite composite;
    composite.rect = Geom::Rect(0, 0, 100, 50);
    composite.op = "multiply";

    return { rect, hatched, line, path, composite };
}

struct PngReader
{
    std::vector<std::uint8_t> const *bytes;
    std::size_t offset = 0;
};

cairo_status_t read_png(void *closure, unsigned char *data, unsigned int length)
{
    auto reader = static_cast<PngReader *>(closure);
    if (reader->offset + length > reader->bytes->size()) {
        return CAIRO_STATUS_READ_ERROR;
    }
    std::memcpy(data, reader->bytes->data() + reader->offset, length);
    reader->offset += length;
    return CAIRO_STATUS_SUCCESS;
}

/// Alpha of each pixel of row \a y of a decoded PNG.
std::vector<int> alpha_row(std::vector<std::uint8_t> const &png, int y)
{
    PngReader reader{&png};
    auto surface = cairo_image_surface_create_from_png_stream(&read_png, &reader);
    std::vector<int> row;
    if (cairo_surface_status(surface) == CAIRO_STATUS_SUCCESS) {
        cairo_surface_flush(surface);
        auto const data = cairo_image_surface_get_data(surface) + y * cairo_image_surface_get_stride(surface);
        for (int x = 0; x < cairo_image_surface_get_width(surface); x++) {
            std::uint32_t pixel;
            std::memcpy(&pixel, data + 4 * x, 4);
            row.push_back(pixel >> 24);
        }
    }
    cairo_surface_destroy(surface);
    return row;
}

std::vector<int> composite_row(char const *op)
{
    Emf::PixelComposite composite;
    composite.rect = Geom::Rect(0, 0, 10, 10);
    composite.op = op;

    Raster::Rasterizer rasterizer;
    auto image = rasterizer.rasterize({ composite }, Geom::Rect(0, 0, 20, 10));
    return alpha_row(image.png, 5);
}

} // namespace

TEST(RasterizerTest, PixelCompositeIsAPlaceholder)
{
    // Fixed layers: destination alpha 0.5, source alpha 0.75.
    auto over = composite_row("over");
    ASSERT_EQ(over.size(), 20u);
    EXPECT_NEAR(over[5], 223, 2);
    EXPECT_EQ(over[15], 0);

    auto xor_ = composite_row("xor");
    ASSERT_EQ(xor_.size(), 20u);
    EXPECT_NEAR(xor_[5], 128, 2);
    EXPECT_EQ(xor_[15], 0);

    // The same request always gives the same image.
    EXPECT_EQ(composite_row("multiply"), composite_row("multiply"));
}

TEST(RasterizerTest, EmptyInputGivesOnePixel)
{
    Raster::Rasterizer rasterizer;
    auto image = rasterizer.rasterize({}, {});
    EXPECT_EQ(image.width, 1);
    EXPECT_EQ(image.height, 1);
    EXPECT_TRUE(is_png(image.png));
}

TEST(RasterizerTest, SizeFollowsBounds)
{
    Raster::Rasterizer rasterizer;
    auto image = rasterizer.rasterize(sample_commands(), Geom::Rect(0, 0, 100, 50));
    EXPECT_EQ(image.width, 100);
    EXPECT_EQ(image.height, 50);
    EXPECT_TRUE(is_png(image.png));

    // Partial pixels round up.
    auto fractional = rasterizer.rasterize({}, Geom::Rect(5, 5, 15.5, 25.2));
    EXPECT_EQ(fractional.width, 11);
    EXPECT_EQ(fractional.height, 21);
}

TEST(RasterizerTest, CommandBoundsWithoutExplicitBounds)
{
    Emf::Polygon triangle;
    triangle.points = { {10, 10}, {30, 10}, {30, 40} };

    Raster::Rasterizer rasterizer;
    auto image = rasterizer.rasterize({ triangle }, {});
    EXPECT_EQ(image.width, 20);
    EXPECT_EQ(image.height, 30);
}

TEST(RasterizerTest, ScalesDownToMaximumDimension)
{
    Raster::Rasterizer rasterizer(64);
    EXPECT_EQ(rasterizer.max_dimension(), 64);

    auto image = rasterizer.rasterize(sample_commands(), Geom::Rect(0, 0, 1024, 512));
    EXPECT_EQ(image.width, 64);
    EXPECT_EQ(image.height, 32);

    auto tall = rasterizer.rasterize({}, Geom::Rect(0, 0, 128, 4096));
    EXPECT_EQ(tall.width, 2);
    EXPECT_EQ(tall.height, 64);

    // Never below one pixel.
    EXPECT_EQ(Raster::Rasterizer(0).max_dimension(), 1);
}

TEST(RasterizerTest, Deterministic)
{
    Raster::Rasterizer rasterizer;
    auto a = rasterizer.rasterize(sample_commands(), Geom::Rect(0, 0, 100, 50));
    auto b = rasterizer.rasterize(sample_commands(), Geom::Rect(0, 0, 100, 50));
    EXPECT_EQ(a.png, b.png);

    auto other = rasterizer.rasterize({ sample_commands().front() }, Geom::Rect(0, 0, 100, 50));
    EXPECT_NE(a.png, other.png);
}
