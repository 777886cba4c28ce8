// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_CACHE_KEY_H
#define SEEN_SVGFX_CACHE_KEY_H

/*
 * Structural cache keys of filter graph nodes
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstddef>
#include <vector>
#include "filters/cache-manager.h"

namespace Svgfx {
namespace Filters {

class FilterGraph;
struct ResolvedGraph;

/**
 * Compute the cache key of every node of a resolved graph.
 *
 * A node's key covers its kind, parameters and region, the keys of the nodes it reads (or the
 * source slot), the fingerprint of the source geometry, the policy fingerprint, and the options
 * that shape the output (units, metafile settings). Node ids and result names are left out, so
 * structurally equal graphs share keys whatever their naming or attribute order.
 */
std::vector<CacheKey> compute_node_keys(FilterGraph const &graph, ResolvedGraph const &resolved,
                                        std::size_t input_fingerprint, std::size_t policy_fingerprint,
                                        std::size_t options_fingerprint);

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_CACHE_KEY_H
