// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_LIGHTING_H
#define SEEN_SVGFX_FILTER_LIGHTING_H

/*
 * Diffuse and specular lighting primitives
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstdint>
#include "filters/filter-primitive.h"
#include "filters/light-types.h"

namespace Svgfx {
namespace Filters {

/**
 * Common part of the lighting primitives.
 *
 * Parameters: surfaceScale, lighting-color, light (distant, point or spot) with azimuth and
 * elevation, or x, y, z, pointsAtX, pointsAtY, pointsAtZ, limitingConeAngle and
 * spot.specularExponent of the light.
 *
 * The vector form is a bevel lit by a preset light rig facing the light. The metafile form
 * draws concentric polygons brightening towards the light.
 */
class FilterLighting : public FilterPrimitive
{
public:
    ~FilterLighting() override;

    PrimitiveOutput apply(ParamMap const &params, PrimitiveInputs const &inputs, PrimitiveContext &ctx) const override;
    double complexity(ParamMap const &params) const override;
    bool vector_approximable(ParamMap const &) const override { return true; }

    static LightSource light(ParamMap const &params);

    static constexpr int FALLOFF_STEPS = 8;

protected:
    FilterLighting();

    /// diffuseConstant or specularConstant.
    virtual double reflectance(ParamMap const &params) const = 0;

    /// Complexity particular to the lighting model.
    virtual double model_complexity(ParamMap const &) const { return 0.0; }

    /// prstMaterial of the bevelled shape.
    virtual char const *material(ParamMap const &params) const = 0;
};

class FilterDiffuseLighting : public FilterLighting
{
public:
    FilterDiffuseLighting();
    ~FilterDiffuseLighting() override;

    PrimitiveKind kind() const override { return PrimitiveKind::DiffuseLighting; }
    Glib::ustring name() const override { return "Diffuse Lighting"; }

protected:
    double reflectance(ParamMap const &params) const override;
    char const *material(ParamMap const &) const override { return "matte"; }
};

class FilterSpecularLighting : public FilterLighting
{
public:
    FilterSpecularLighting();
    ~FilterSpecularLighting() override;

    PrimitiveKind kind() const override { return PrimitiveKind::SpecularLighting; }
    Glib::ustring name() const override { return "Specular Lighting"; }

protected:
    double reflectance(ParamMap const &params) const override;
    double model_complexity(ParamMap const &params) const override;
    char const *material(ParamMap const &params) const override;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_LIGHTING_H
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
