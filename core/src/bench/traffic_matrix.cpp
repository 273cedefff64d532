/**
 * @file traffic_matrix.cpp
 * @brief Shuffle-and-repair traffic pair generation
 */

#include "ftbench/bench/traffic_matrix.hpp"
#include "ftbench/log.h"

#include <algorithm>
#include <utility>

namespace ftbench { namespace bench {

std::vector<TrafficPair> repair_fixed_points(const std::vector<std::string>& sources,
                                             std::vector<std::string> destinations) {
    std::vector<TrafficPair> pairs;
    const size_t n = sources.size();
    if (n <= 1 || destinations.size() != n) return pairs;

    pairs.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (destinations[i] == sources[i]) {
            size_t swap_idx = (i + 1) % n;
            std::swap(destinations[i], destinations[swap_idx]);
            ft_log(FT_LOG_TRACE, "traffic", "fixed point at %zu, swapped with %zu",
                   i, swap_idx);
        }
        pairs.push_back({sources[i], destinations[i]});
    }
    return pairs;
}

std::vector<TrafficPair> make_traffic_pairs(const std::vector<std::string>& hosts,
                                            std::mt19937& rng) {
    if (hosts.size() <= 1) {
        ft_log(FT_LOG_WARN, "traffic",
               "%zu host(s): no self-free pairing exists, skipping", hosts.size());
        return {};
    }

    std::vector<std::string> destinations(hosts);
    std::shuffle(destinations.begin(), destinations.end(), rng);
    return repair_fixed_points(hosts, std::move(destinations));
}

}} // namespace ftbench::bench
