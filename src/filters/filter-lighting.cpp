// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Diffuse and specular lighting primitives
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-lighting.h"

#include <algorithm>
#include <cmath>
#include <2geom/angle.h>
#include "filters/filter-errors.h"

namespace Svgfx {
namespace Filters {
namespace {

char const *rig_for(LightType type)
{
    switch (type) {
        case POINT_LIGHT: return "balanced";
        case SPOT_LIGHT:  return "harsh";
        default:          return "threePt";
    }
}

/// Nearest of the eight light rig directions for a direction in degrees, y pointing down.
char const *rig_direction(double degrees)
{
    static char const *const DIRECTIONS[] = { "r", "br", "b", "bl", "l", "tl", "t", "tr" };
    double d = std::fmod(degrees, 360.0);
    if (d < 0) {
        d += 360.0;
    }
    return DIRECTIONS[static_cast<int>(std::lround(d / 45.0)) % 8];
}

std::uint32_t scale_color(std::uint32_t rgb, double factor)
{
    auto channel = [&] (int shift) {
        auto v = std::lround(((rgb >> shift) & 0xff) * std::clamp(factor, 0.0, 1.0));
        return static_cast<std::uint32_t>(v) << shift;
    };
    return channel(16) | channel(8) | channel(0);
}

} // namespace

FilterLighting::FilterLighting() = default;

FilterLighting::~FilterLighting() = default;

LightSource FilterLighting::light(ParamMap const &params)
{
    LightSource source;
    auto const type = params.string_or("light", "distant");

    if (type == "distant") {
        source.type = DISTANT_LIGHT;
        source.distant = { params.number_or("azimuth", 0.0), params.number_or("elevation", 0.0) };
    } else if (type == "point") {
        source.type = POINT_LIGHT;
        source.point = { params.number_or("x", 0.0), params.number_or("y", 0.0), params.number_or("z", 0.0) };
    } else if (type == "spot") {
        source.type = SPOT_LIGHT;
        source.spot.x = params.number_or("x", 0.0);
        source.spot.y = params.number_or("y", 0.0);
        source.spot.z = params.number_or("z", 0.0);
        source.spot.pointsAtX = params.number_or("pointsAtX", 0.0);
        source.spot.pointsAtY = params.number_or("pointsAtY", 0.0);
        source.spot.pointsAtZ = params.number_or("pointsAtZ", 0.0);
        source.spot.limitingConeAngle = params.number_or("limitingConeAngle", 90.0);
        source.spot.specularExponent = params.number_or("spot.specularExponent", 1.0);
    } else {
        throw ParameterError("light", "unknown light source '" + type + "'");
    }
    return source;
}

double FilterLighting::complexity(ParamMap const &params) const
{
    double c = 0.5;

    auto const scale = std::abs(params.number_or("surfaceScale", 1.0));
    if (scale > 20) {
        c += 2.0;
    } else if (scale > 10) {
        c += 1.5;
    } else if (scale > 5) {
        c += 1.0;
    }

    auto const k = reflectance(params);
    if (k > 3) {
        c += 0.5;
    } else if (k > 1.5) {
        c += 0.3;
    }

    c += model_complexity(params);

    auto const source = light(params);
    if (source.type == SPOT_LIGHT) {
        c += 1.0;
        if (source.spot.limitingConeAngle < 30) {
            c += 0.5;
        }
    } else if (source.type == POINT_LIGHT) {
        c += 0.5;
    }

    if (params.color_or("lighting-color", 0xffffff) != 0xffffff) {
        c += 0.3;
    }
    return c;
}

PrimitiveOutput FilterLighting::apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const
{
    auto const source = light(params);
    auto const scale = std::abs(params.number_or("surfaceScale", 1.0));
    auto const k = reflectance(params);
    auto const color = params.color_or("lighting-color", 0xffffff);
    auto const area = effect_area(inputs, ctx);

    // Where the light comes from, seen from the centre of the area.
    Geom::Point const centre = area ? area->midpoint() : Geom::Point(0, 0);
    Geom::Point toward;
    if (source.type == DISTANT_LIGHT) {
        toward = Geom::Point::polar(Geom::rad_from_deg(source.distant.azimuth));
    } else if (source.type == POINT_LIGHT) {
        toward = Geom::Point(source.point.x, source.point.y) - centre;
    } else {
        toward = Geom::Point(source.spot.x, source.spot.y) - centre;
    }

    PrimitiveOutput out;
    out.bounds = area;

    if (ctx.strategy != RenderStrategy::EMFFallback) {
        double const direction = toward.isZero() ? 270.0 : Geom::deg_from_rad(Geom::atan2(toward));
        out.markup = input_markup(inputs, 0);
        out.markup += Glib::ustring::compose(
            "<a:scene3d><a:camera prst=\"orthographicFront\"/><a:lightRig rig=\"%1\" dir=\"%2\"/></a:scene3d>"
            "<a:sp3d prstMaterial=\"%3\"><a:bevelT w=\"%4\" h=\"%5\"/></a:sp3d>",
            rig_for(source.type), rig_direction(direction), material(params),
            ctx.emu(2 * scale), ctx.emu(scale * k)).raw();
        return out;
    }

    if (!area) {
        return out;
    }

    Geom::Point focus = centre;
    if (!toward.isZero()) {
        auto const reach = std::min(area->width(), area->height()) / 4;
        focus = centre + Geom::unit_vector(toward) * reach;
    }

    for (int i = 0; i < FALLOFF_STEPS; i++) {
        double const t = 1.0 - double(i) / FALLOFF_STEPS;
        Geom::Rect ring(focus + (area->min() - focus) * t, focus + (area->max() - focus) * t);

        Emf::Polygon polygon;
        polygon.points = rect_points(ring);
        polygon.fill.color = scale_color(color, k * (i + 1) / FALLOFF_STEPS);
        out.commands.emplace_back(std::move(polygon));

        ctx.progress.report_or_throw(double(i + 1) / FALLOFF_STEPS);
    }
    return out;
}

FilterDiffuseLighting::FilterDiffuseLighting() = default;

FilterDiffuseLighting::~FilterDiffuseLighting() = default;

double FilterDiffuseLighting::reflectance(ParamMap const &params) const
{
    auto const k = params.number_or("diffuseConstant", 1.0);
    if (k < 0) {
        throw ParameterError("diffuseConstant", "must not be negative");
    }
    return k;
}

FilterSpecularLighting::FilterSpecularLighting() = default;

FilterSpecularLighting::~FilterSpecularLighting() = default;

double FilterSpecularLighting::reflectance(ParamMap const &params) const
{
    auto const k = params.number_or("specularConstant", 1.0);
    if (k < 0) {
        throw ParameterError("specularConstant", "must not be negative");
    }
    return k;
}

double FilterSpecularLighting::model_complexity(ParamMap const &params) const
{
    auto const e = params.number_or("specularExponent", 1.0);
    if (e > 128) {
        return 2.0;
    }
    if (e > 64) {
        return 1.5;
    }
    if (e > 32) {
        return 1.0;
    }
    if (e > 16) {
        return 0.5;
    }
    return 0.0;
}

char const *FilterSpecularLighting::material(ParamMap const &params) const
{
    return params.number_or("specularExponent", 1.0) > 32 ? "metal" : "plastic";
}

} // namespace Filters
} // namespace Svgfx

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
