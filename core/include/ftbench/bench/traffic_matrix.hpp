/**
 * @file traffic_matrix.hpp
 * @brief ftbench bench: Random all-to-all traffic pairs
 *
 * Destinations are a shuffled copy of the host list, repaired in one
 * forward pass: a fixed point at i swaps dst[i] with dst[(i+1) % N] and
 * pair i is recorded right after. No recorded pair is a self-pair.
 *
 * Known gap: when the last index is a fixed point, the wrap-around swap
 * rewrites dst[0] after pair 0 was recorded, so one host may receive two
 * flows and another none. Every host still sends exactly once.
 */

#ifndef FTBENCH_BENCH_TRAFFIC_MATRIX_HPP
#define FTBENCH_BENCH_TRAFFIC_MATRIX_HPP

#include <random>
#include <string>
#include <vector>

namespace ftbench { namespace bench {

struct TrafficPair {
    std::string sender;
    std::string receiver;

    std::string label() const { return sender + "->" + receiver; }
};

/** Single-pass fixed-point repair of a candidate destination list.
 *  Returns an empty list when N <= 1 or the sizes differ. */
std::vector<TrafficPair> repair_fixed_points(const std::vector<std::string>& sources,
                                             std::vector<std::string> destinations);

/** Shuffle + repair. Empty for N <= 1 (measurement is skipped). */
std::vector<TrafficPair> make_traffic_pairs(const std::vector<std::string>& hosts,
                                            std::mt19937& rng);

}} // namespace ftbench::bench

#endif // FTBENCH_BENCH_TRAFFIC_MATRIX_HPP
