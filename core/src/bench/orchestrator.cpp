/**
 * @file orchestrator.cpp
 * @brief Network lifecycle + concurrent iperf clients + bounded collection
 */

#include "ftbench/bench/orchestrator.hpp"
#include "ftbench/proc/process_registry.hpp"
#include "ftbench/log.h"

#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace ftbench { namespace bench {

namespace {

void settle(uint64_t ms, const char* why) {
    if (ms == 0) return;
    ft_log(FT_LOG_INFO, "orchestrator", "waiting %llu ms (%s)",
           (unsigned long long)ms, why);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

/* Scoped ownership of the emulated network and the listeners inside it.
 * teardown() runs once: listeners first, then stop, then cleanup. */
class NetworkSession {
public:
    NetworkSession(const emu::EmulatorOps& ops, uint64_t grace_ms)
        : ops_(ops), grace_ms_(grace_ms) {}
    ~NetworkSession() { teardown(); }

    NetworkSession(const NetworkSession&) = delete;
    NetworkSession& operator=(const NetworkSession&) = delete;

    proc::ProcessRegistry& listeners() { return listeners_; }

    void teardown() {
        if (torn_down_) return;
        torn_down_ = true;

        ft_log(FT_LOG_INFO, "orchestrator", "stopping network and cleaning up");
        size_t n = listeners_.terminate_all(grace_ms_);
        if (n) ft_log(FT_LOG_DEBUG, "orchestrator", "terminated %zu listener(s)", n);

        ft_status st = ops_.stop();
        if (st != FT_OK)
            ft_log(FT_LOG_ERROR, "orchestrator", "network stop: %s", ft_status_str(st));
        st = ops_.cleanup();
        if (st != FT_OK)
            ft_log(FT_LOG_ERROR, "orchestrator", "cleanup: %s", ft_status_str(st));
    }

private:
    const emu::EmulatorOps& ops_;
    uint64_t                grace_ms_;
    proc::ProcessRegistry   listeners_;
    bool                    torn_down_ = false;
};

struct ClientHandle {
    std::string                    label;
    std::unique_ptr<proc::Process> proc;   /* null if the launch failed */
};

} // namespace

MeasurementOrchestrator::MeasurementOrchestrator(emu::EmulatorOps ops, Config cfg)
    : ops_(std::move(ops)), cfg_(std::move(cfg)) {
    if (cfg_.seed) {
        rng_.seed(*cfg_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

std::string MeasurementOrchestrator::listener_command() const {
    return cfg_.iperf + " -s";
}

std::string MeasurementOrchestrator::client_command(const std::string& dst_ip) const {
    return cfg_.iperf + " -c " + dst_ip + " -t " + std::to_string(cfg_.duration_s) + " -y C";
}

ft_status MeasurementOrchestrator::materialize(const topo::NetworkDescription& net) {
    for (auto& h : net.hosts) {
        ft_status st = ops_.create_host(h.name, h.address);
        if (st != FT_OK) {
            ft_log(FT_LOG_ERROR, "orchestrator", "create host %s: %s",
                   h.name.c_str(), ft_status_str(st));
            return st;
        }
    }
    for (auto& s : net.switches) {
        ft_status st = ops_.create_switch(s.name);
        if (st != FT_OK) {
            ft_log(FT_LOG_ERROR, "orchestrator", "create switch %s: %s",
                   s.name.c_str(), ft_status_str(st));
            return st;
        }
    }
    for (auto& l : net.links) {
        ft_status st = ops_.create_link(l.node_a, l.node_b, l.opts);
        if (st != FT_OK) {
            ft_log(FT_LOG_ERROR, "orchestrator", "create link %s-%s: %s",
                   l.node_a.c_str(), l.node_b.c_str(), ft_status_str(st));
            return st;
        }
    }
    return FT_OK;
}

ft_status MeasurementOrchestrator::run(const topo::NetworkDescription& net,
                                       AggregateReport* out) {
    if (!out || !emu::ops_complete(ops_)) return FT_ERROR_INVALID_ARG;
    *out = AggregateReport{};
    pairs_.clear();

    ft_status st = ops_.cleanup();
    if (st != FT_OK)
        ft_log(FT_LOG_WARN, "orchestrator", "pre-run cleanup: %s", ft_status_str(st));

    NetworkSession session(ops_, cfg_.teardown_grace_ms);

    st = materialize(net);
    if (st != FT_OK) return st;

    st = ops_.start();
    if (st != FT_OK) {
        ft_log(FT_LOG_ERROR, "orchestrator", "network start: %s", ft_status_str(st));
        return st;
    }
    ft_log(FT_LOG_INFO, "orchestrator", "network started: %u nodes, %zu links",
           net.num_nodes(), net.links.size());
    settle(cfg_.controller_settle_ms, "controller convergence");

    /* ---- Reachability gate ---------------------------------------- */
    uint32_t unreachable = ops_.ping_all();
    if (unreachable > 0) {
        ft_log(FT_LOG_ERROR, "orchestrator",
               "%u unreachable pair(s), aborting bandwidth test", unreachable);
        out->status = RunStatus::Unreachable;
        return FT_ERROR_UNREACHABLE;
    }
    ft_log(FT_LOG_INFO, "orchestrator", "reachability confirmed");

    pairs_ = make_traffic_pairs(net.host_names(), rng_);
    if (pairs_.empty()) {
        out->status = RunStatus::Skipped;
        return FT_OK;
    }

    /* ---- Listeners: started, registered, never awaited ------------ */
    ft_log(FT_LOG_INFO, "orchestrator", "starting iperf servers on %zu hosts",
           net.hosts.size());
    for (auto& h : net.hosts) {
        std::unique_ptr<proc::Process> p;
        st = ops_.exec(h.name, listener_command(), /*background=*/true, &p);
        if (st != FT_OK) {
            ft_log(FT_LOG_WARN, "orchestrator", "listener on %s: %s",
                   h.name.c_str(), ft_status_str(st));
            continue;
        }
        session.listeners().add(h.name, std::move(p));
    }
    settle(cfg_.listener_settle_ms, "listener startup");

    /* ---- Clients: launched back to back, no waits in between ------ */
    ft_log(FT_LOG_INFO, "orchestrator", "starting %zu iperf clients", pairs_.size());
    std::vector<ClientHandle> clients;
    clients.reserve(pairs_.size());
    for (auto& pair : pairs_) {
        ClientHandle ch;
        ch.label = pair.label();
        const topo::ConcreteNode* dst = net.find_node(pair.receiver);
        if (dst) {
            st = ops_.exec(pair.sender, client_command(dst->ip()),
                           /*background=*/false, &ch.proc);
            if (st != FT_OK) {
                ft_log(FT_LOG_WARN, "orchestrator", "client %s: %s",
                       ch.label.c_str(), ft_status_str(st));
                ch.proc.reset();
            }
        }
        clients.push_back(std::move(ch));
    }

    settle(cfg_.run_window_ms, "clients running");

    /* ---- Collection: bounded wait per client ---------------------- */
    ft_log(FT_LOG_INFO, "orchestrator", "parsing iperf results");
    std::vector<ProbeResult> results;
    results.reserve(clients.size());
    for (auto& ch : clients) {
        if (!ch.proc) {
            results.push_back(parse_probe_output(ch.label, ""));
            continue;
        }
        if (ch.proc->wait_for(cfg_.collect_timeout_ms) != FT_OK) {
            ft_log(FT_LOG_WARN, "orchestrator", "%s still running, killing",
                   ch.label.c_str());
            results.push_back(timed_out_result(ch.label, ch.proc->output()));
            if (ch.proc->terminate(cfg_.teardown_grace_ms) != FT_OK)
                ft_log(FT_LOG_WARN, "orchestrator", "%s: reap failed", ch.label.c_str());
            continue;
        }
        results.push_back(parse_probe_output(ch.label, ch.proc->output()));
    }

    *out = aggregate(std::move(results));
    ft_log(FT_LOG_INFO, "orchestrator", "total %.2f Mbps over %u pair(s), %u failed",
           out->total_mbps, out->num_ok, out->num_failed);
    return FT_OK;
}

}} // namespace ftbench::bench
