/**
 * @file fat_tree_graph.hpp
 * @brief ftbench topo: Abstract Fat-Tree Graph
 *
 * Nodes carry a role variant (host coordinates or switch type/position)
 * and an ordered list of incident edge ids. Edges are identified by id,
 * so two parallel links between the same pair stay two edges.
 *
 * make_fat_tree() builds the standard k-ary fat-tree:
 *   - (k/2)^2 core switches
 *   - k pods, each with k/2 aggregation and k/2 edge switches
 *   - k/2 hosts per edge switch, host ids 2 .. k/2+1
 */

#ifndef FTBENCH_TOPO_FAT_TREE_GRAPH_HPP
#define FTBENCH_TOPO_FAT_TREE_GRAPH_HPP

#include "ftbench/ft_status.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace ftbench { namespace topo {

/* ================================================================== */
/*  Node roles                                                         */
/* ================================================================== */

struct HostInfo {
    uint32_t pod = 0;
    uint32_t sw  = 0;   /* edge switch index inside the pod */
    uint32_t hid = 0;
};

struct SwitchInfo {
    std::string type;   /* "core", "agg", "edge", ... */
    uint32_t    pod = 0;
    uint32_t    sw  = 0;
};

struct GraphEdge {
    uint32_t edge_id = 0;
    uint32_t left    = 0;
    uint32_t right   = 0;
};

struct GraphNode {
    uint32_t                           node_id = 0;
    std::variant<HostInfo, SwitchInfo> role;
    std::vector<uint32_t>              edge_ids;

    bool is_host() const { return std::holds_alternative<HostInfo>(role); }
    const std::vector<uint32_t>& edges() const { return edge_ids; }
};

/* ================================================================== */
/*  FatTreeGraph: owns nodes and edges, creation order preserved      */
/* ================================================================== */

class FatTreeGraph {
public:
    uint32_t add_host(uint32_t pod, uint32_t sw, uint32_t hid) {
        GraphNode n;
        n.node_id = next_node_id_++;
        n.role = HostInfo{pod, sw, hid};
        return push_node(std::move(n));
    }

    uint32_t add_switch(const std::string& type, uint32_t pod = 0,
                        uint32_t sw = 0) {
        GraphNode n;
        n.node_id = next_node_id_++;
        n.role = SwitchInfo{type, pod, sw};
        return push_node(std::move(n));
    }

    /** Connect two nodes. The edge is appended to the adjacency of every
     *  endpoint that exists; endpoints are not validated here. */
    uint32_t add_edge(uint32_t left, uint32_t right) {
        GraphEdge e;
        e.edge_id = next_edge_id_++;
        e.left  = left;
        e.right = right;
        edge_index_[e.edge_id] = edges_.size();
        edges_.push_back(e);

        if (auto* l = mutable_node(left)) l->edge_ids.push_back(e.edge_id);
        if (right != left)
            if (auto* r = mutable_node(right)) r->edge_ids.push_back(e.edge_id);
        return e.edge_id;
    }

    bool remove_edge(uint32_t edge_id) {
        auto it = edge_index_.find(edge_id);
        if (it == edge_index_.end()) return false;
        GraphEdge e = edges_[it->second];

        for (uint32_t id : {e.left, e.right}) {
            if (auto* n = mutable_node(id)) {
                auto& adj = n->edge_ids;
                adj.erase(std::remove(adj.begin(), adj.end(), edge_id), adj.end());
            }
        }
        edges_.erase(edges_.begin() + static_cast<std::ptrdiff_t>(it->second));
        edge_index_.clear();
        for (size_t i = 0; i < edges_.size(); ++i)
            edge_index_[edges_[i].edge_id] = i;
        return true;
    }

    bool is_neighbor(uint32_t a, uint32_t b) const {
        const GraphNode* n = find_node(a);
        if (!n) return false;
        for (uint32_t eid : n->edge_ids) {
            const GraphEdge* e = find_edge(eid);
            if (!e) continue;
            if ((e->left == a && e->right == b) ||
                (e->right == a && e->left == b))
                return true;
        }
        return false;
    }

    const GraphNode* find_node(uint32_t id) const {
        auto it = node_index_.find(id);
        return (it != node_index_.end()) ? &nodes_[it->second] : nullptr;
    }

    const GraphEdge* find_edge(uint32_t id) const {
        auto it = edge_index_.find(id);
        return (it != edge_index_.end()) ? &edges_[it->second] : nullptr;
    }

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    uint32_t num_hosts() const {
        return static_cast<uint32_t>(std::count_if(nodes_.begin(), nodes_.end(),
            [](const GraphNode& n) { return n.is_host(); }));
    }

    uint32_t num_switches() const {
        return static_cast<uint32_t>(nodes_.size()) - num_hosts();
    }

    uint32_t num_edges() const { return static_cast<uint32_t>(edges_.size()); }

private:
    uint32_t push_node(GraphNode&& n) {
        uint32_t id = n.node_id;
        node_index_[id] = nodes_.size();
        nodes_.push_back(std::move(n));
        return id;
    }

    GraphNode* mutable_node(uint32_t id) {
        auto it = node_index_.find(id);
        return (it != node_index_.end()) ? &nodes_[it->second] : nullptr;
    }

    std::vector<GraphNode>               nodes_;
    std::vector<GraphEdge>               edges_;
    std::unordered_map<uint32_t, size_t> node_index_;
    std::unordered_map<uint32_t, size_t> edge_index_;
    uint32_t                             next_node_id_ = 1;
    uint32_t                             next_edge_id_ = 0;
};

/** Build a k-ary fat-tree into *out (which is reset first).
 *  k must be even and >= 2. */
ft_status make_fat_tree(uint32_t k, FatTreeGraph* out);

}} // namespace ftbench::topo

#endif // FTBENCH_TOPO_FAT_TREE_GRAPH_HPP
