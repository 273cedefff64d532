/**
 * @file fat_tree_graph_test.cpp
 * @brief k-ary fat-tree generator shape and graph queries
 */

#include "ftbench/topo/fat_tree_graph.hpp"
#include "ftbench/log.h"
#include <cstdio>
#include <cstdlib>
#include <variant>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace ftbench::topo;

static size_t degree_of_type(const FatTreeGraph& g, const char* type, size_t* count) {
    size_t deg = 0;
    *count = 0;
    for (auto& n : g.nodes()) {
        auto* sw = std::get_if<SwitchInfo>(&n.role);
        if (!sw || sw->type != type) continue;
        if (*count == 0) deg = n.edges().size();
        else if (n.edges().size() != deg) return SIZE_MAX;
        ++*count;
    }
    return deg;
}

int main() {
    printf("=== Fat-Tree Graph Test ===\n");
    ft_log_set_level(FT_LOG_WARN);

    /* Test 1: k=4 shape */
    {
        FatTreeGraph g;
        CHECK(make_fat_tree(4, &g) == FT_OK, "k=4 builds");
        CHECK(g.num_hosts() == 16, "16 hosts");
        CHECK(g.num_switches() == 20, "20 switches (4 core + 8 agg + 8 edge)");
        CHECK(g.num_edges() == 48, "48 edges");

        size_t n = 0;
        CHECK(degree_of_type(g, "core", &n) == 4 && n == 4, "core: 4 switches of degree k");
        CHECK(degree_of_type(g, "agg", &n) == 4 && n == 8, "agg: 8 switches of degree k");
        CHECK(degree_of_type(g, "edge", &n) == 4 && n == 8, "edge: 8 switches of degree k");

        for (auto& node : g.nodes())
            if (node.is_host()) CHECK(node.edges().size() == 1, "host has one uplink");
    }

    /* Test 2: creation order and coordinates */
    {
        FatTreeGraph g;
        CHECK(make_fat_tree(4, &g) == FT_OK, "k=4 builds");
        CHECK(g.nodes().front().node_id == 1, "node ids start at 1");
        CHECK(!g.nodes().front().is_host(), "cores come first");

        /* ids: cores 1-4, pod0 aggs 5-6, edge 7, hosts 8-9 */
        const GraphNode* h = g.find_node(8);
        CHECK(h && h->is_host(), "node 8 is the first host");
        auto& hi = std::get<HostInfo>(h->role);
        CHECK(hi.pod == 0 && hi.sw == 0 && hi.hid == 2, "first host is 0.0.2");
        const GraphNode* h2 = g.find_node(9);
        CHECK(std::get<HostInfo>(h2->role).hid == 3, "host ids run 2..k/2+1");
        CHECK(g.is_neighbor(7, 8) && g.is_neighbor(8, 7), "host hangs off edge switch 7");
        CHECK(!g.is_neighbor(8, 9), "hosts are not adjacent");
    }

    /* Test 3: agg s connects to cores s*(k/2) .. s*(k/2)+k/2-1 */
    {
        FatTreeGraph g;
        CHECK(make_fat_tree(4, &g) == FT_OK, "k=4 builds");
        /* pod0 agg0 = node 5, agg1 = node 6 */
        CHECK(g.is_neighbor(5, 1) && g.is_neighbor(5, 2), "agg0 -> cores 1,2");
        CHECK(!g.is_neighbor(5, 3) && !g.is_neighbor(5, 4), "agg0 not on cores 3,4");
        CHECK(g.is_neighbor(6, 3) && g.is_neighbor(6, 4), "agg1 -> cores 3,4");
    }

    /* Test 4: larger arity */
    {
        FatTreeGraph g;
        CHECK(make_fat_tree(6, &g) == FT_OK, "k=6 builds");
        CHECK(g.num_hosts() == 54, "k^3/4 hosts");
        CHECK(g.num_switches() == 45, "5k^2/4 switches");
        CHECK(g.num_edges() == 162, "3k^3/4 edges");
    }

    /* Test 5: invalid arity */
    {
        FatTreeGraph g;
        CHECK(make_fat_tree(3, &g) == FT_ERROR_INVALID_ARG, "odd k rejected");
        CHECK(make_fat_tree(0, &g) == FT_ERROR_INVALID_ARG, "k=0 rejected");
        CHECK(make_fat_tree(4, nullptr) == FT_ERROR_INVALID_ARG, "null out rejected");
    }

    /* Test 6: parallel edges and removal */
    {
        FatTreeGraph g;
        uint32_t a = g.add_switch("edge");
        uint32_t b = g.add_switch("agg");
        uint32_t e1 = g.add_edge(a, b);
        uint32_t e2 = g.add_edge(a, b);
        CHECK(e1 != e2, "parallel edges get distinct ids");
        CHECK(g.find_node(a)->edges().size() == 2, "both parallel edges in adjacency");

        CHECK(g.remove_edge(e1), "remove first");
        CHECK(g.num_edges() == 1, "one edge left");
        CHECK(g.find_node(a)->edges().size() == 1, "adjacency of a shrinks");
        CHECK(g.find_node(b)->edges().size() == 1, "adjacency of b shrinks");
        CHECK(g.find_edge(e2) != nullptr, "other edge still resolvable");
        CHECK(g.is_neighbor(a, b), "still neighbors through e2");
        CHECK(!g.remove_edge(e1), "double remove fails");
    }

    printf("PASS: all fat-tree graph tests passed\n");
    return 0;
}
