/**
 * @file ftbench.cpp
 * @brief Fat-tree bisection bandwidth test: single-shot CLI
 *
 * Builds a k-ary fat-tree, hands it to the emulator backend, waits for the
 * controller, checks reachability, runs iperf between random host pairs
 * and prints the aggregate bandwidth. With no flags it runs the fixed
 * defaults (k=4, 15 Mbit/s 5ms links, 10 s clients, 12 s window).
 *
 * Needs root: the default exec template enters network namespaces.
 */

#include "ftbench/ft_status.h"
#include "ftbench/log.h"
#include "ftbench/bench/orchestrator.hpp"
#include "ftbench/bench/report.hpp"
#include "ftbench/emu/shell_emulator.hpp"
#include "ftbench/topo/fat_tree_graph.hpp"
#include "ftbench/topo/network.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <unistd.h>

/* ================================================================== */
/*  Options                                                            */
/* ================================================================== */

struct CliOptions {
    uint32_t                                     k = 4;
    ftbench::topo::LinkOptions                   link;
    ftbench::bench::MeasurementOrchestrator::Config bench;
    ftbench::emu::ShellEmulator::Config          emu;
    std::string                                  results_path;
    std::string                                  results_label = "default";
    std::string                                  json_path;
    ft_log_level                                 log_level = FT_LOG_INFO;
};

static void usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [--key=value ...]\n"
        "  --k=N                fat-tree arity (even, default 4)\n"
        "  --bw=MBPS            link bandwidth (default 15)\n"
        "  --delay=D            link delay (default 5ms)\n"
        "  --duration=S         iperf client duration (default 10)\n"
        "  --settle-ms=MS       controller settle delay (default 15000)\n"
        "  --listen-settle-ms=MS listener settle delay (default 2000)\n"
        "  --window-ms=MS       client run window (default 12000)\n"
        "  --collect-ms=MS      per-client collection timeout (default 5000)\n"
        "  --seed=N             traffic matrix seed (default random)\n"
        "  --iperf=PATH         iperf binary (default iperf)\n"
        "  --exec=TEMPLATE      per-host command, {host} {cmd}\n"
        "  --up=CMD --down=CMD --clean=CMD   platform hooks, {topo} {controller}\n"
        "                       --up is needed in practice: without it no host\n"
        "                       namespaces exist and the reachability check fails\n"
        "  --controller=IP:PORT (default 127.0.0.1:6653)\n"
        "  --topo-out=PATH      topology file (default ftbench_topology.txt)\n"
        "  --results=PATH --label=NAME       append \"label,total\" to a CSV\n"
        "  --json=PATH          write the report as JSON\n"
        "  --log=LEVEL          trace|debug|info|warn|error|off\n", prog);
}

static bool match(const char* arg, const char* key, const char** value) {
    size_t n = std::strlen(key);
    if (std::strncmp(arg, key, n) != 0) return false;
    *value = arg + n;
    return true;
}

static bool parse_args(int argc, char** argv, CliOptions* o) {
    for (int i = 1; i < argc; ++i) {
        const char* v = nullptr;
        const char* a = argv[i];
        if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) return false;
        else if (match(a, "--k=", &v))        o->k = static_cast<uint32_t>(std::atoi(v));
        else if (match(a, "--bw=", &v))       o->link.bandwidth_mbps = std::atof(v);
        else if (match(a, "--delay=", &v))    o->link.delay = v;
        else if (match(a, "--duration=", &v)) o->bench.duration_s = static_cast<uint32_t>(std::atoi(v));
        else if (match(a, "--settle-ms=", &v))        o->bench.controller_settle_ms = std::strtoull(v, nullptr, 10);
        else if (match(a, "--listen-settle-ms=", &v)) o->bench.listener_settle_ms = std::strtoull(v, nullptr, 10);
        else if (match(a, "--window-ms=", &v))  o->bench.run_window_ms = std::strtoull(v, nullptr, 10);
        else if (match(a, "--collect-ms=", &v)) o->bench.collect_timeout_ms = std::strtoull(v, nullptr, 10);
        else if (match(a, "--seed=", &v))     o->bench.seed = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
        else if (match(a, "--iperf=", &v))    o->bench.iperf = v;
        else if (match(a, "--exec=", &v))     o->emu.exec_template = v;
        else if (match(a, "--up=", &v))       o->emu.up_cmd = v;
        else if (match(a, "--down=", &v))     o->emu.down_cmd = v;
        else if (match(a, "--clean=", &v))    o->emu.cleanup_cmd = v;
        else if (match(a, "--controller=", &v)) o->emu.controller = v;
        else if (match(a, "--topo-out=", &v)) o->emu.topology_path = v;
        else if (match(a, "--results=", &v))  o->results_path = v;
        else if (match(a, "--label=", &v))    o->results_label = v;
        else if (match(a, "--json=", &v))     o->json_path = v;
        else if (match(a, "--log=", &v)) {
            if (!ft_log_level_parse(v, &o->log_level)) {
                std::fprintf(stderr, "unknown log level: %s\n", v);
                return false;
            }
        } else {
            std::fprintf(stderr, "unknown option: %s\n", a);
            return false;
        }
    }
    if (o->bench.duration_s == 0 || o->link.bandwidth_mbps <= 0.0) {
        std::fprintf(stderr, "duration and bandwidth must be positive\n");
        return false;
    }
    return true;
}

/* ================================================================== */
/*  Main                                                               */
/* ================================================================== */

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, &opts)) { usage(argv[0]); return 1; }
    ft_log_set_level(opts.log_level);

    if (::geteuid() != 0)
        ft_log(FT_LOG_WARN, "cli", "not running as root; host commands will likely fail");

    std::printf("-> Starting Fat-Tree Bandwidth Test...\n");

    ftbench::topo::FatTreeGraph graph;
    ft_status st = ftbench::topo::make_fat_tree(opts.k, &graph);
    if (st != FT_OK) {
        ft_log(FT_LOG_FATAL, "cli", "topology: %s", ft_status_str(st));
        return 1;
    }

    ftbench::topo::NetworkDescription net;
    st = ftbench::topo::build_network(graph, opts.link, &net);
    if (st != FT_OK) {
        ft_log(FT_LOG_FATAL, "cli", "network: %s", ft_status_str(st));
        return 1;
    }

    ftbench::emu::ShellEmulator emulator(opts.emu);
    ftbench::bench::MeasurementOrchestrator orch(emulator.ops(), opts.bench);

    ftbench::bench::AggregateReport report;
    st = orch.run(net, &report);
    if (st != FT_OK && st != FT_ERROR_UNREACHABLE) {
        ft_log(FT_LOG_FATAL, "cli", "measurement: %s", ft_status_str(st));
        return 1;
    }

    ftbench::bench::print_report(report, stdout);

    if (!opts.json_path.empty() &&
        ftbench::bench::write_report_json(opts.json_path, report) != FT_OK)
        ft_log(FT_LOG_ERROR, "cli", "could not write %s", opts.json_path.c_str());

    if (!opts.results_path.empty() && st == FT_OK &&
        report.status == ftbench::bench::RunStatus::Ok &&
        ftbench::bench::append_results_csv(opts.results_path, opts.results_label,
                                           report) != FT_OK)
        ft_log(FT_LOG_ERROR, "cli", "could not append to %s", opts.results_path.c_str());

    std::printf("-> Bandwidth test completed.\n");
    return st == FT_OK ? 0 : 1;
}
