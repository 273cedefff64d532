/**
 * @file network.cpp
 * @brief Graph → concrete network adapter
 */

#include "ftbench/topo/network.hpp"
#include "ftbench/topo/edge_dedup.hpp"
#include "ftbench/log.h"

#include <cstdio>
#include <unordered_map>

namespace ftbench { namespace topo {

namespace {

/* Roles resolved once at entry: two typed lists in graph order */
struct RoleSplit {
    std::vector<std::pair<const GraphNode*, const HostInfo*>>   hosts;
    std::vector<std::pair<const GraphNode*, const SwitchInfo*>> switches;
};

struct RoleVisitor {
    const GraphNode* node;
    RoleSplit*       split;
    void operator()(const HostInfo& h) const   { split->hosts.push_back({node, &h}); }
    void operator()(const SwitchInfo& s) const { split->switches.push_back({node, &s}); }
};

RoleSplit split_roles(const FatTreeGraph& graph) {
    RoleSplit split;
    for (auto& n : graph.nodes())
        std::visit(RoleVisitor{&n, &split}, n.role);
    return split;
}

} // namespace

std::string host_address(const HostInfo& h) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "10.%u.%u.%u/8", h.pod, h.sw, h.hid);
    return buf;
}

ft_status build_network(const FatTreeGraph& graph, const LinkOptions& opts,
                        NetworkDescription* out) {
    if (!out) return FT_ERROR_INVALID_ARG;
    *out = NetworkDescription{};

    RoleSplit split = split_roles(graph);
    NetworkDescription net;
    std::unordered_map<uint32_t, std::string> node_map;  /* graph id → name */

    /* Hosts */
    uint32_t host_count = 0;
    for (auto& [node, info] : split.hosts) {
        ConcreteNode cn;
        cn.name          = "h" + std::to_string(++host_count);
        cn.kind          = NodeKind::Host;
        cn.graph_node_id = node->node_id;
        cn.address       = host_address(*info);
        node_map[node->node_id] = cn.name;
        net.hosts.push_back(std::move(cn));
    }

    /* Switches: independent sequence per type initial */
    std::unordered_map<char, uint32_t> per_type;
    for (auto& [node, info] : split.switches) {
        char initial = info->type.empty() ? 's' : info->type[0];
        ConcreteNode cn;
        cn.name          = initial + std::to_string(++per_type[initial]);
        cn.kind          = NodeKind::Switch;
        cn.graph_node_id = node->node_id;
        node_map[node->node_id] = cn.name;
        net.switches.push_back(std::move(cn));
    }

    for (auto& e : graph.edges()) {
        if (!node_map.count(e.left) || !node_map.count(e.right)) {
            ft_log(FT_LOG_ERROR, "topo",
                   "edge %u references unmapped node (%u -> %u)",
                   e.edge_id, e.left, e.right);
            return FT_ERROR_MALFORMED_GRAPH;
        }
    }

    /* Links: hosts first, then switches, first sighting of an edge wins */
    std::vector<const GraphNode*> traversal;
    traversal.reserve(split.hosts.size() + split.switches.size());
    for (auto& hs : split.hosts)    traversal.push_back(hs.first);
    for (auto& ss : split.switches) traversal.push_back(ss.first);

    for (uint32_t eid : unique_edges(traversal)) {
        const GraphEdge* e = graph.find_edge(eid);
        if (!e) {
            ft_log(FT_LOG_ERROR, "topo", "adjacency names unknown edge %u", eid);
            return FT_ERROR_MALFORMED_GRAPH;
        }
        ConcreteLink link;
        link.node_a  = node_map.at(e->left);
        link.node_b  = node_map.at(e->right);
        link.edge_id = eid;
        link.opts    = opts;
        net.links.push_back(std::move(link));
    }

    ft_log(FT_LOG_INFO, "topo", "network: %zu hosts, %zu switches, %zu links",
           net.hosts.size(), net.switches.size(), net.links.size());
    *out = std::move(net);
    return FT_OK;
}

}} // namespace ftbench::topo
