/**
 * @file orchestrator.hpp
 * @brief ftbench bench: All-to-all throughput measurement run
 *
 * One run():
 *   1. cleanup stale state, create hosts/switches/links, start
 *   2. wait for the controller to settle, then ping all
 *      (any drop → RunStatus::Unreachable, nothing spawned)
 *   3. random traffic pairs (fewer than two hosts → RunStatus::Skipped)
 *   4. iperf listener on every host, registered but never awaited
 *   5. one iperf client per pair, all launched back to back
 *   6. sleep the run window, then collect each client with a bounded wait
 *   7. always: stop listeners, stop the network once, cleanup
 *
 * A run owns the emulated network exclusively; do not share the
 * EmulatorOps backend between concurrent runs.
 */

#ifndef FTBENCH_BENCH_ORCHESTRATOR_HPP
#define FTBENCH_BENCH_ORCHESTRATOR_HPP

#include "ftbench/ft_status.h"
#include "ftbench/bench/aggregator.hpp"
#include "ftbench/bench/traffic_matrix.hpp"
#include "ftbench/emu/emulator.hpp"
#include "ftbench/topo/network.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ftbench { namespace bench {

class MeasurementOrchestrator {
public:
    struct Config {
        uint64_t                controller_settle_ms = 15000;
        uint64_t                listener_settle_ms   = 2000;
        uint32_t                duration_s           = 10;
        uint64_t                run_window_ms        = 12000;
        uint64_t                collect_timeout_ms   = 5000;
        uint64_t                teardown_grace_ms    = 500;
        std::string             iperf                = "iperf";
        std::optional<uint32_t> seed;   /* unset → std::random_device */
    };

    MeasurementOrchestrator(emu::EmulatorOps ops, Config cfg);
    explicit MeasurementOrchestrator(emu::EmulatorOps ops)
        : MeasurementOrchestrator(std::move(ops), Config{}) {}

    /** Execute one measurement pass against `net`.
     *  FT_OK: measured (per-pair failures are in the report) or skipped.
     *  FT_ERROR_UNREACHABLE: reachability gate failed, total is 0.
     *  Anything else: the network could not be built or started. */
    ft_status run(const topo::NetworkDescription& net, AggregateReport* out);

    /** Pairs used by the last run that got past the reachability gate. */
    const std::vector<TrafficPair>& last_pairs() const { return pairs_; }

    std::string listener_command() const;
    std::string client_command(const std::string& dst_ip) const;

private:
    ft_status materialize(const topo::NetworkDescription& net);

    emu::EmulatorOps         ops_;
    Config                   cfg_;
    std::mt19937             rng_;
    std::vector<TrafficPair> pairs_;
};

}} // namespace ftbench::bench

#endif // FTBENCH_BENCH_ORCHESTRATOR_HPP
