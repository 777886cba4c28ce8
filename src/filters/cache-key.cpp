// SPDX-License-Identifier: GPL-2.0-or-later
#include "cache-key.h"

#include <boost/functional/hash.hpp>
#include "filters/filter-graph.h"
#include "util/hash.h"

namespace Svgfx {
namespace Filters {

std::vector<CacheKey> compute_node_keys(FilterGraph const &graph, ResolvedGraph const &resolved,
                                        std::size_t input_fingerprint, std::size_t policy_fingerprint,
                                        std::size_t options_fingerprint)
{
    std::vector<CacheKey> keys(graph.size(), 0);

    // Levels are in dependency order, so every upstream key is known when it is needed.
    for (auto const &level : resolved.levels) {
        for (auto i : level) {
            auto const &spec = graph[i];

            std::size_t seed = 0;
            boost::hash_combine(seed, static_cast<int>(spec.kind));
            boost::hash_combine(seed, spec.params.hash());
            Util::hash_combine_rect(seed, spec.region);

            for (int slot : resolved.nodes[i].inputs) {
                if (slot >= 0) {
                    boost::hash_combine(seed, keys[slot]);
                } else {
                    boost::hash_combine(seed, slot);
                }
            }

            boost::hash_combine(seed, input_fingerprint);
            boost::hash_combine(seed, policy_fingerprint);
            boost::hash_combine(seed, options_fingerprint);
            keys[i] = seed;
        }
    }
    return keys;
}

} // namespace Filters
} // namespace Svgfx
