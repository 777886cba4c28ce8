// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Hashing helpers for geometry types.
 */
#ifndef SVGFX_UTIL_HASH_H
#define SVGFX_UTIL_HASH_H

#include <cstddef>
#include <boost/functional/hash.hpp>
#include <2geom/point.h>
#include <2geom/rect.h>

namespace Svgfx {
namespace Util {

inline void hash_combine_double(std::size_t &seed, double v)
{
    boost::hash_combine(seed, v == 0.0 ? 0.0 : v);
}

struct geom_point_hash
{
    std::size_t operator()(Geom::Point const &pt) const
    {
        std::size_t hash = 0;
        hash_combine_double(hash, pt.x());
        hash_combine_double(hash, pt.y());
        return hash;
    }
};

inline void hash_combine_rect(std::size_t &seed, Geom::OptRect const &rect)
{
    boost::hash_combine(seed, static_cast<bool>(rect));
    if (rect) {
        boost::hash_combine(seed, geom_point_hash()(rect->min()));
        boost::hash_combine(seed, geom_point_hash()(rect->max()));
    }
}

} // namespace Util
} // namespace Svgfx

#endif // SVGFX_UTIL_HASH_H
