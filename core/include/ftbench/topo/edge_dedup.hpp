/**
 * @file edge_dedup.hpp
 * @brief Distinct edge sequence of a graph traversal
 *
 * Header-only. Visits the given nodes in order and each node's incident
 * edges in adjacency order; an edge id is emitted the first time it is
 * seen. Identity is the edge id, so parallel links survive.
 */

#ifndef FTBENCH_TOPO_EDGE_DEDUP_HPP
#define FTBENCH_TOPO_EDGE_DEDUP_HPP

#include "ftbench/topo/fat_tree_graph.hpp"

#include <cstdint>
#include <unordered_set>
#include <vector>

namespace ftbench { namespace topo {

inline std::vector<uint32_t> unique_edges(
        const std::vector<const GraphNode*>& traversal) {
    std::vector<uint32_t> order;
    std::unordered_set<uint32_t> seen;
    for (const GraphNode* n : traversal) {
        if (!n) continue;
        for (uint32_t eid : n->edges()) {
            if (seen.insert(eid).second)
                order.push_back(eid);
        }
    }
    return order;
}

}} // namespace ftbench::topo

#endif // FTBENCH_TOPO_EDGE_DEDUP_HPP
