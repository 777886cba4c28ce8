// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for settings and the native-effect table
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <gtest/gtest.h>
#include "filters/native-effect-table.h"
#include "settings.h"

using namespace Svgfx;
using namespace Svgfx::Filters;

TEST(SettingsTest, Defaults)
{
    Settings settings;
    EXPECT_EQ(settings.emf_size_cap.get(), 8 * 1024 * 1024);
    EXPECT_EQ(settings.emf_dpi.get(), 96);
    EXPECT_EQ(settings.raster_max_dimension.get(), 2048);
    EXPECT_EQ(settings.worker_threads.get(), 0);
    EXPECT_FALSE(settings.fail_fast.get());
    EXPECT_EQ(settings.primitive_timeout().count(), 2000);
    EXPECT_EQ(settings.chain_timeout().count(), 30000);
    EXPECT_DOUBLE_EQ(settings.emu_per_px.get(), 9525.0);
    EXPECT_EQ(settings.native_table.get(), Settings::default_native_table());
}

TEST(SettingsTest, LoadFromData)
{
    Settings settings;
    settings.load_from_data(
        "[emf]\n"
        "dpi=300\n"
        "[chain]\n"
        "fail-fast=true\n"
        "timeout-ms=500\n"
        "[cache]\n"
        "capacity-bytes=4096\n");

    EXPECT_EQ(settings.emf_dpi.get(), 300);
    EXPECT_TRUE(settings.fail_fast.get());
    EXPECT_EQ(settings.chain_timeout().count(), 500);
    EXPECT_EQ(settings.cache_capacity_bytes.get(), 4096);

    // Untouched keys keep their values.
    EXPECT_EQ(settings.emf_size_cap.get(), 8 * 1024 * 1024);
    EXPECT_EQ(settings.primitive_timeout().count(), 2000);
}

TEST(SettingsTest, OutOfRangeValuesAreClamped)
{
    Settings settings;
    settings.load_from_data(
        "[emf]\n"
        "dpi=100000\n"
        "[raster]\n"
        "max-dimension=0\n");
    EXPECT_EQ(settings.emf_dpi.get(), 2400);
    EXPECT_EQ(settings.raster_max_dimension.get(), 1);

    EXPECT_TRUE(settings.worker_threads.set(-4));
    EXPECT_EQ(settings.worker_threads.get(), 0);
    EXPECT_FALSE(settings.worker_threads.set(8));
    settings.worker_threads.reset();
    EXPECT_EQ(settings.worker_threads.get(), 0);
}

TEST(SettingsTest, Errors)
{
    Settings settings;
    EXPECT_THROW(settings.load_from_data("[emf]\ndpi=high\n"), ConfigError);
    EXPECT_THROW(settings.load_from_data("this is not a key file\n"), ConfigError);
    EXPECT_THROW(settings.load_from_file("/nonexistent/svgfx.ini"), ConfigError);
}

TEST(NativeEffectTableTest, DefaultTable)
{
    auto const table = NativeEffectTable::load_from_file(Settings::default_native_table());
    EXPECT_EQ(table.version(), 2);

    auto blur = table.find(PrimitiveKind::Blur);
    ASSERT_TRUE(blur);
    EXPECT_TRUE(blur->native);
    ASSERT_EQ(blur->ranges.count("stdDeviation"), 1u);
    EXPECT_DOUBLE_EQ(blur->ranges.at("stdDeviation").max, 25.0);
    ASSERT_TRUE(blur->max_complexity);
    EXPECT_DOUBLE_EQ(*blur->max_complexity, 5.0);

    auto composite = table.find(PrimitiveKind::Composite);
    ASSERT_TRUE(composite);
    EXPECT_EQ(composite->values.at("mode").count("multiply"), 1u);

    auto transfer = table.find(PrimitiveKind::ComponentTransfer);
    ASSERT_TRUE(transfer);
    EXPECT_FALSE(transfer->native);
}

TEST(NativeEffectTableTest, Supports)
{
    auto const table = NativeEffectTable::load_from_data(
        "[meta]\n"
        "version=2\n"
        "[morphology]\n"
        "native=true\n"
        "values.operator=dilate\n"
        "range.radius=0;20\n");

    auto entry = table.find(PrimitiveKind::Morphology);
    ASSERT_TRUE(entry);
    EXPECT_TRUE(entry->supports(ParamMap{}));
    EXPECT_TRUE(entry->supports(ParamMap{ {"operator", "dilate"}, {"radius", 5.0} }));
    EXPECT_TRUE(entry->supports(ParamMap{ {"radius", "3 4"} }));
    EXPECT_FALSE(entry->supports(ParamMap{ {"operator", "erode"} }));
    EXPECT_FALSE(entry->supports(ParamMap{ {"radius", 21.0} }));
    EXPECT_FALSE(entry->supports(ParamMap{ {"radius", "wide"} }));

    EXPECT_FALSE(table.find(PrimitiveKind::Blur));
}

TEST(NativeEffectTableTest, AbsentParametersTakeTheirDefaults)
{
    auto const table = NativeEffectTable::load_from_data(
        "[morphology]\n"
        "native=true\n"
        "values.operator=dilate\n"
        "default.operator=erode\n"
        "range.radius=0;20\n"
        "default.radius=30\n");

    auto entry = table.find(PrimitiveKind::Morphology);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->defaults.string("operator"), "erode");
    EXPECT_FALSE(entry->supports(ParamMap{ {"radius", 3.0} }));
    EXPECT_FALSE(entry->supports(ParamMap{ {"operator", "dilate"} }));
    EXPECT_TRUE(entry->supports(ParamMap{ {"operator", "dilate"}, {"radius", 3.0} }));

    auto const without = NativeEffectTable::load_from_data(
        "[morphology]\nnative=true\nvalues.operator=dilate\nrange.radius=0;20\n");
    EXPECT_NE(table.fingerprint(), without.fingerprint());
}

TEST(NativeEffectTableTest, Malformed)
{
    EXPECT_THROW(NativeEffectTable::load_from_data("[blur]\nrange.stdDeviation=5;1\n"), ConfigError);
    EXPECT_THROW(NativeEffectTable::load_from_data("[blur]\nrange.stdDeviation=5\n"), ConfigError);
    EXPECT_THROW(NativeEffectTable::load_from_data("[blur]\nnative=perhaps\n"), ConfigError);
    EXPECT_THROW(NativeEffectTable::load_from_file("/nonexistent/native-effects.ini"), ConfigError);

    // Unknown kinds are skipped.
    auto const table = NativeEffectTable::load_from_data("[sparkle]\nnative=true\n[flood]\nnative=true\n");
    EXPECT_TRUE(table.find(PrimitiveKind::Flood));

    auto morphology = table.find(PrimitiveKind::Morphology);
    ASSERT_TRUE(morphology);
    EXPECT_EQ(morphology->defaults.string_or("operator", ""), "erode");
    auto colormatrix = table.find(PrimitiveKind::ColorMatrix);
    ASSERT_TRUE(colormatrix);
    EXPECT_EQ(colormatrix->defaults.string_or("type", ""), "matrix");
}

TEST(NativeEffectTableTest, FingerprintTracksContents)
{
    auto const a = NativeEffectTable::load_from_data("[meta]\nversion=1\n[blur]\nnative=true\n");
    auto const b = NativeEffectTable::load_from_data("[meta]\nversion=2\n[blur]\nnative=true\n");
    auto const c = NativeEffectTable::load_from_data("[meta]\nversion=1\n[blur]\nnative=false\n");
    auto const a2 = NativeEffectTable::load_from_data("[meta]\nversion=1\n[blur]\nnative=true\n");
    EXPECT_EQ(a.fingerprint(), a2.fingerprint());
    EXPECT_NE(a.fingerprint(), b.fingerprint());
    EXPECT_NE(a.fingerprint(), c.fingerprint());
}
