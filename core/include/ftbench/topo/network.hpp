/**
 * @file network.hpp
 * @brief ftbench topo: Concrete Network Description
 *
 * The adapter turns a FatTreeGraph into named hosts, switches and links
 * that an emulator can instantiate:
 *   - hosts   h1..hN in graph order, address 10.<pod>.<sw>.<hid>/8
 *   - switches <type-initial><n>, numbered independently per initial
 *   - one link per distinct edge id, uniform bandwidth/delay
 */

#ifndef FTBENCH_TOPO_NETWORK_HPP
#define FTBENCH_TOPO_NETWORK_HPP

#include "ftbench/ft_status.h"
#include "ftbench/topo/fat_tree_graph.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ftbench { namespace topo {

enum class NodeKind : uint8_t { Host, Switch };

struct LinkOptions {
    double      bandwidth_mbps = 15.0;
    std::string delay          = "5ms";
};

struct ConcreteNode {
    std::string name;
    NodeKind    kind          = NodeKind::Host;
    uint32_t    graph_node_id = 0;
    std::string address;        /* CIDR, hosts only */

    /** Address without the prefix length, e.g. "10.0.1.2". */
    std::string ip() const {
        auto slash = address.find('/');
        return slash == std::string::npos ? address : address.substr(0, slash);
    }
};

struct ConcreteLink {
    std::string node_a;
    std::string node_b;
    uint32_t    edge_id = 0;
    LinkOptions opts;
};

struct NetworkDescription {
    std::vector<ConcreteNode> hosts;
    std::vector<ConcreteNode> switches;
    std::vector<ConcreteLink> links;

    const ConcreteNode* find_node(const std::string& name) const {
        for (auto& n : hosts)
            if (n.name == name) return &n;
        for (auto& n : switches)
            if (n.name == name) return &n;
        return nullptr;
    }

    std::vector<std::string> host_names() const {
        std::vector<std::string> names;
        names.reserve(hosts.size());
        for (auto& h : hosts) names.push_back(h.name);
        return names;
    }

    uint32_t num_nodes() const {
        return static_cast<uint32_t>(hosts.size() + switches.size());
    }
};

/** Host address derived from its coordinates. */
std::string host_address(const HostInfo& h);

/** Materialize `graph` into *out. Fails with FT_ERROR_MALFORMED_GRAPH when
 *  an edge names a node that is not in the graph; *out is left empty. */
ft_status build_network(const FatTreeGraph& graph, const LinkOptions& opts,
                        NetworkDescription* out);

}} // namespace ftbench::topo

#endif // FTBENCH_TOPO_NETWORK_HPP
