// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Raster fallback renderer
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "rasterizer.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <map>
#include <string>
#include <cairo.h>
#include <cairomm/context.h>
#include <cairomm/pattern.h>
#include <cairomm/surface.h>
#include "emf/emf-patterns.h"

namespace Svgfx {
namespace Raster {
namespace {

Cairo::Operator composite_operator(std::string const &op)
{
    static auto const table = std::map<std::string, Cairo::Operator>{
        { "over",        Cairo::OPERATOR_OVER },
        { "normal",      Cairo::OPERATOR_OVER },
        { "in",          Cairo::OPERATOR_IN },
        { "out",         Cairo::OPERATOR_OUT },
        { "atop",        Cairo::OPERATOR_ATOP },
        { "xor",         Cairo::OPERATOR_XOR },
        { "arithmetic",  Cairo::OPERATOR_ADD },
        { "multiply",    Cairo::OPERATOR_MULTIPLY },
        { "screen",      Cairo::OPERATOR_SCREEN },
        { "darken",      Cairo::OPERATOR_DARKEN },
        { "lighten",     Cairo::OPERATOR_LIGHTEN },
        { "overlay",     Cairo::OPERATOR_OVERLAY },
        { "color-dodge", Cairo::OPERATOR_COLOR_DODGE },
        { "color-burn",  Cairo::OPERATOR_COLOR_BURN },
        { "hard-light",  Cairo::OPERATOR_HARD_LIGHT },
        { "soft-light",  Cairo::OPERATOR_SOFT_LIGHT },
        { "difference",  Cairo::OPERATOR_DIFFERENCE },
        { "exclusion",   Cairo::OPERATOR_EXCLUSION },
        { "hue",         Cairo::OPERATOR_HSL_HUE },
        { "saturation",  Cairo::OPERATOR_HSL_SATURATION },
        { "color",       Cairo::OPERATOR_HSL_COLOR },
        { "luminosity",  Cairo::OPERATOR_HSL_LUMINOSITY }
    };

    if (auto it = table.find(op); it != table.end()) {
        return it->second;
    }
    return Cairo::OPERATOR_OVER;
}

void set_source_rgb(Cairo::RefPtr<Cairo::Context> const &cr, std::uint32_t rgb, double opacity)
{
    cr->set_source_rgba(((rgb >> 16) & 0xff) / 255.0,
                        ((rgb >> 8) & 0xff) / 255.0,
                        (rgb & 0xff) / 255.0,
                        opacity);
}

/// Build an 8x8 repeating tile for a pattern fill.
Cairo::RefPtr<Cairo::SurfacePattern> make_pattern(Emf::Fill const &fill)
{
    auto const &entry = Emf::pattern_for(fill.semantics);
    auto tile = Cairo::ImageSurface::create(Cairo::FORMAT_ARGB32, 8, 8);
    tile->flush();

    auto premultiply = [&] (std::uint32_t rgb) {
        auto const a = static_cast<std::uint32_t>(std::lround(std::clamp(fill.opacity, 0.0, 1.0) * 255));
        auto channel = [a] (std::uint32_t c) { return (c * a + 127) / 255; };
        return a << 24 | channel((rgb >> 16) & 0xff) << 16 | channel((rgb >> 8) & 0xff) << 8 | channel(rgb & 0xff);
    };
    auto const fg = premultiply(fill.color);
    auto const bg = premultiply(fill.background);

    auto data = tile->get_data();
    auto const stride = tile->get_stride();
    for (int y = 0; y < 8; y++) {
        auto row = reinterpret_cast<std::uint32_t *>(data + y * stride);
        for (int x = 0; x < 8; x++) {
            row[x] = Emf::pattern_bit(entry, x, y) ? fg : bg;
        }
    }
    tile->mark_dirty();

    auto pattern = Cairo::SurfacePattern::create(tile);
    pattern->set_extend(Cairo::EXTEND_REPEAT);
    pattern->set_filter(Cairo::FILTER_NEAREST);
    return pattern;
}

void set_fill(Cairo::RefPtr<Cairo::Context> const &cr, Emf::Fill const &fill)
{
    if (fill.semantics == Emf::FillSemantics::Solid) {
        set_source_rgb(cr, fill.color, fill.opacity);
    } else {
        cr->set_source(make_pattern(fill));
    }
}

void trace(Cairo::RefPtr<Cairo::Context> const &cr, std::vector<Geom::Point> const &points, bool close)
{
    if (points.empty()) return;
    cr->move_to(points[0][Geom::X], points[0][Geom::Y]);
    for (std::size_t i = 1; i < points.size(); i++) {
        cr->line_to(points[i][Geom::X], points[i][Geom::Y]);
    }
    if (close) {
        cr->close_path();
    }
}

void stroke(Cairo::RefPtr<Cairo::Context> const &cr, Emf::Stroke const &s)
{
    set_source_rgb(cr, s.color, 1.0);
    cr->set_line_width(s.width);
    cr->stroke();
}

struct Painter
{
    Cairo::RefPtr<Cairo::Context> cr;

    void operator()(Emf::Polygon const &polygon) const
    {
        trace(cr, polygon.points, true);
        set_fill(cr, polygon.fill);
        if (polygon.stroke) {
            cr->fill_preserve();
            stroke(cr, *polygon.stroke);
        } else {
            cr->fill();
        }
    }

    void operator()(Emf::Polyline const &polyline) const
    {
        trace(cr, polyline.points, false);
        stroke(cr, polyline.stroke);
    }

    void operator()(Emf::Rectangle const &rectangle) const
    {
        auto const &r = rectangle.rect;
        cr->rectangle(r.left(), r.top(), r.width(), r.height());
        set_fill(cr, rectangle.fill);
        if (rectangle.stroke) {
            cr->fill_preserve();
            stroke(cr, *rectangle.stroke);
        } else {
            cr->fill();
        }
    }

    void operator()(Emf::FillPath const &path) const
    {
        for (auto const &contour : path.contours) {
            trace(cr, contour, true);
        }
        cr->set_fill_rule(path.rule == Emf::FillRule::EvenOdd ? Cairo::FILL_RULE_EVEN_ODD : Cairo::FILL_RULE_WINDING);
        set_fill(cr, path.fill);
        cr->fill();
        cr->set_fill_rule(Cairo::FILL_RULE_WINDING);
    }

    void operator()(Emf::PixelComposite const &composite) const
    {
        // Destination layer, then the source layer combined with the requested operator.
        auto const &r = composite.rect;
        cr->save();
        cr->rectangle(r.left(), r.top(), r.width(), r.height());
        cr->clip();
        cr->set_source_rgba(0.5, 0.5, 0.5, 0.5);
        cr->paint();
        cr->set_operator(composite_operator(composite.op));
        double const alpha = composite.op == "arithmetic"
                           ? std::clamp(composite.k[0] + composite.k[1] + composite.k[2] + composite.k[3], 0.0, 1.0)
                           : 0.75;
        cr->set_source_rgba(0.25, 0.25, 0.25, alpha);
        cr->paint();
        cr->restore();
    }
};

cairo_status_t append_png(void *closure, unsigned char const *data, unsigned int length)
{
    auto out = static_cast<std::vector<std::uint8_t> *>(closure);
    out->insert(out->end(), data, data + length);
    return CAIRO_STATUS_SUCCESS;
}

Geom::OptRect command_bounds(std::vector<Emf::Command> const &commands)
{
    Geom::OptRect result;
    auto add_points = [&] (std::vector<Geom::Point> const &points) {
        for (auto const &p : points) {
            result.unionWith(Geom::Rect(p, p));
        }
    };
    for (auto const &command : commands) {
        if (auto polygon = std::get_if<Emf::Polygon>(&command)) {
            add_points(polygon->points);
        } else if (auto polyline = std::get_if<Emf::Polyline>(&command)) {
            add_points(polyline->points);
        } else if (auto rectangle = std::get_if<Emf::Rectangle>(&command)) {
            result.unionWith(rectangle->rect);
        } else if (auto path = std::get_if<Emf::FillPath>(&command)) {
            for (auto const &contour : path->contours) {
                add_points(contour);
            }
        } else if (auto composite = std::get_if<Emf::PixelComposite>(&command)) {
            result.unionWith(composite->rect);
        }
    }
    return result;
}

} // namespace

Rasterizer::Rasterizer(int max_dimension)
    : _max_dimension(std::max(1, max_dimension))
{}

RasterImage Rasterizer::rasterize(std::vector<Emf::Command> const &commands, Geom::OptRect const &bounds) const
{
    auto area = bounds ? bounds : command_bounds(commands);

    int width = 1;
    int height = 1;
    double scale = 1.0;
    if (area && area->width() > 0 && area->height() > 0) {
        scale = std::min(1.0, _max_dimension / std::max(area->width(), area->height()));
        width = std::clamp(static_cast<int>(std::ceil(area->width() * scale)), 1, _max_dimension);
        height = std::clamp(static_cast<int>(std::ceil(area->height() * scale)), 1, _max_dimension);
    }

    auto surface = Cairo::ImageSurface::create(Cairo::FORMAT_ARGB32, width, height);
    if (cairo_surface_status(surface->cobj()) != CAIRO_STATUS_SUCCESS) {
        throw RasterError("Cannot create raster surface");
    }

    {
        auto cr = Cairo::Context::create(surface);
        cr->scale(scale, scale);
        if (area) {
            cr->translate(-area->left(), -area->top());
        }
        Painter painter{cr};
        for (auto const &command : commands) {
            std::visit(painter, command);
        }
    }
    surface->flush();

    RasterImage image;
    image.width = width;
    image.height = height;
    auto status = cairo_surface_write_to_png_stream(surface->cobj(), &append_png, &image.png);
    if (status != CAIRO_STATUS_SUCCESS) {
        throw RasterError(std::string("Cannot encode PNG: ") + cairo_status_to_string(status));
    }
    return image;
}

} // namespace Raster
} // namespace Svgfx
