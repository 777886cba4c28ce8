// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_GRAPH_H
#define SEEN_SVGFX_FILTER_GRAPH_H

/*
 * Filter graph: primitives connected by named results
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>
#include "filters/filter-primitive.h"

namespace Svgfx {
namespace Filters {

struct ResolvedNode
{
    std::vector<int> inputs;              ///< One slot per entry of FilterPrimitiveSpec::inputs().
    std::vector<std::size_t> dependents;  ///< Nodes reading this node's result.
    std::size_t level = 0;
};

/**
 * A graph after dependency resolution. Every node of level n depends only on nodes of levels
 * below n, so the nodes of one level may run concurrently.
 */
struct ResolvedGraph
{
    std::vector<ResolvedNode> nodes;
    std::vector<std::vector<std::size_t>> levels;
    std::size_t output = 0;  ///< The node whose result is the filter's result.
};

/**
 * Ordered primitives of one filter. Immutable after construction.
 */
class FilterGraph final
{
public:
    FilterGraph() = default;
    explicit FilterGraph(std::vector<FilterPrimitiveSpec> primitives);
    FilterGraph(std::initializer_list<FilterPrimitiveSpec> primitives);

    std::vector<FilterPrimitiveSpec> const &primitives() const { return _primitives; }
    FilterPrimitiveSpec const &operator[](std::size_t i) const { return _primitives[i]; }
    std::size_t size() const { return _primitives.size(); }
    bool empty() const { return _primitives.empty(); }

    /// The node id, or "#<index>" for nodes without one.
    std::string label(std::size_t i) const;

    /**
     * Resolve references and sort the nodes into dependency levels.
     *
     * A name refers to the most recent earlier node producing it. References never point forward.
     *
     * @throws UnresolvedReferenceError for a name that is not a source and that no earlier node
     * produces.
     * @throws CyclicFilterGraphError for a name produced only by this node or by a later node that
     * depends on it.
     */
    ResolvedGraph resolve() const;

private:
    std::vector<FilterPrimitiveSpec> _primitives;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_GRAPH_H
