// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-graph.h"

#include <algorithm>
#include <unordered_map>
#include "filters/filter-errors.h"
#include "filters/slot-resolver.h"

namespace Svgfx {
namespace Filters {
namespace {

/// Nodes on a dependency path from \a from down to \a to, both included; empty if there is none.
std::vector<int> dependency_path(ResolvedGraph const &graph, int from, int to)
{
    std::vector<int> parent(graph.nodes.size(), -1);
    std::vector<bool> seen(graph.nodes.size(), false);
    std::vector<int> stack{from};
    seen[from] = true;
    while (!stack.empty()) {
        int node = stack.back();
        stack.pop_back();
        if (node == to) {
            std::vector<int> path{to};
            while (node != from) {
                node = parent[node];
                path.push_back(node);
            }
            return path;
        }
        for (int slot : graph.nodes[node].inputs) {
            if (slot >= 0 && !seen[slot]) {
                seen[slot] = true;
                parent[slot] = node;
                stack.push_back(slot);
            }
        }
    }
    return {};
}

} // namespace

FilterGraph::FilterGraph(std::vector<FilterPrimitiveSpec> primitives)
    : _primitives(std::move(primitives))
{}

FilterGraph::FilterGraph(std::initializer_list<FilterPrimitiveSpec> primitives)
    : _primitives(primitives)
{}

std::string FilterGraph::label(std::size_t i) const
{
    if (i < _primitives.size() && !_primitives[i].id.empty()) {
        return _primitives[i].id;
    }
    return "#" + std::to_string(i);
}

ResolvedGraph FilterGraph::resolve() const
{
    int const n = _primitives.size();

    std::unordered_map<std::string, std::vector<int>> producers;
    for (int i = 0; i < n; i++) {
        if (!_primitives[i].result.empty()) {
            producers[_primitives[i].result].push_back(i);
        }
    }

    ResolvedGraph graph;
    graph.nodes.resize(n);

    SlotResolver resolver;
    struct ForwardReference
    {
        int node;
        int producer;
        std::string name;
    };
    std::vector<ForwardReference> forward;
    for (int i = 0; i < n; i++) {
        auto const &spec = _primitives[i];
        for (auto const &name : spec.inputs()) {
            int slot;
            if (name.empty()) {
                slot = i == 0 ? FILTER_SOURCEGRAPHIC : i - 1;
            } else {
                slot = resolver.read(name);
                if (slot == FILTER_SLOT_NOT_SET) {
                    auto it = producers.find(name);
                    if (it == producers.end()) {
                        throw UnresolvedReferenceError(label(i), name);
                    }
                    // Only this node or later ones produce the name.
                    slot = *std::lower_bound(it->second.begin(), it->second.end(), i);
                    forward.push_back({ i, slot, name });
                }
            }
            graph.nodes[i].inputs.push_back(slot);
        }
        resolver.write(spec.result, i);
    }

    // A forward reference is never executed. It is a cycle if the producer depends on the
    // referencing node, otherwise a reference to a result that does not exist yet.
    for (auto const &ref : forward) {
        auto cycle = dependency_path(graph, ref.producer, ref.node);
        if (cycle.empty()) {
            throw UnresolvedReferenceError(label(ref.node), ref.name);
        }
        std::sort(cycle.begin(), cycle.end());
        std::vector<std::string> ids;
        for (auto node : cycle) {
            ids.push_back(label(node));
        }
        throw CyclicFilterGraphError(std::move(ids));
    }

    // Kahn's algorithm, one frontier per level.
    std::vector<int> indegree(n, 0);
    for (int i = 0; i < n; i++) {
        for (int slot : graph.nodes[i].inputs) {
            if (slot >= 0) {
                graph.nodes[slot].dependents.push_back(i);
                indegree[i]++;
            }
        }
    }

    std::vector<std::size_t> frontier;
    for (int i = 0; i < n; i++) {
        if (indegree[i] == 0) {
            frontier.push_back(i);
        }
    }

    while (!frontier.empty()) {
        std::vector<std::size_t> next;
        for (auto i : frontier) {
            graph.nodes[i].level = graph.levels.size();
            for (auto d : graph.nodes[i].dependents) {
                if (--indegree[d] == 0) {
                    next.push_back(d);
                }
            }
        }
        std::sort(next.begin(), next.end());
        graph.levels.push_back(std::move(frontier));
        frontier = std::move(next);
    }

    graph.output = n > 0 ? n - 1 : 0;
    return graph;
}

} // namespace Filters
} // namespace Svgfx
