/**
 * @file fat_tree_graph.cpp
 * @brief k-ary fat-tree generator
 */

#include "ftbench/topo/fat_tree_graph.hpp"
#include "ftbench/log.h"

namespace ftbench { namespace topo {

ft_status make_fat_tree(uint32_t k, FatTreeGraph* out) {
    if (!out) return FT_ERROR_INVALID_ARG;
    if (k < 2 || (k % 2) != 0) {
        ft_log(FT_LOG_ERROR, "topo", "fat-tree arity must be even and >= 2 (got %u)", k);
        return FT_ERROR_INVALID_ARG;
    }

    *out = FatTreeGraph{};
    FatTreeGraph& g = *out;

    const uint32_t half  = k / 2;
    const uint32_t cores = half * half;

    std::vector<uint32_t> core_ids;
    core_ids.reserve(cores);
    for (uint32_t i = 0; i < cores; ++i)
        core_ids.push_back(g.add_switch("core", 0, i));

    std::vector<std::vector<uint32_t>> agg_by_pod(k), edge_by_pod(k);

    for (uint32_t p = 0; p < k; ++p) {
        for (uint32_t s = 0; s < half; ++s)
            agg_by_pod[p].push_back(g.add_switch("agg", p, s));

        for (uint32_t s = 0; s < half; ++s) {
            uint32_t edge_sw = g.add_switch("edge", p, s);
            edge_by_pod[p].push_back(edge_sw);

            /* Hosts hang off their edge switch; ids 2 .. k/2+1 */
            for (uint32_t h = 0; h < half; ++h) {
                uint32_t host = g.add_host(p, s, h + 2);
                g.add_edge(edge_sw, host);
            }
        }
    }

    /* Edge <-> aggregation: full bipartite mesh inside each pod */
    for (uint32_t p = 0; p < k; ++p)
        for (uint32_t e : edge_by_pod[p])
            for (uint32_t a : agg_by_pod[p])
                g.add_edge(e, a);

    /* Aggregation s of every pod uplinks to cores s*(k/2) .. s*(k/2)+k/2-1 */
    for (uint32_t p = 0; p < k; ++p)
        for (uint32_t s = 0; s < half; ++s)
            for (uint32_t port = 0; port < half; ++port)
                g.add_edge(agg_by_pod[p][s], core_ids[s * half + port]);

    ft_log(FT_LOG_DEBUG, "topo", "fat-tree k=%u: %u hosts, %u switches, %u edges",
           k, g.num_hosts(), g.num_switches(), g.num_edges());
    return FT_OK;
}

}} // namespace ftbench::topo
