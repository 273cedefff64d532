/**
 * @file shell_emulator.cpp
 * @brief Shell-driven emulator backend
 */

#include "ftbench/emu/shell_emulator.hpp"
#include "ftbench/log.h"

#include <cstdio>
#include <vector>

namespace ftbench { namespace emu {

std::string substitute(const std::string& tmpl, const std::string& key,
                       const std::string& value) {
    if (key.empty()) return tmpl;
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    for (;;) {
        size_t hit = tmpl.find(key, pos);
        if (hit == std::string::npos) break;
        out.append(tmpl, pos, hit - pos);
        out += value;
        pos = hit + key.size();
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

EmulatorOps ShellEmulator::ops() {
    EmulatorOps o;
    o.create_host = [this](const std::string& n, const std::string& a) {
        return create_host(n, a);
    };
    o.create_switch = [this](const std::string& n) { return create_switch(n); };
    o.create_link = [this](const std::string& a, const std::string& b,
                           const topo::LinkOptions& lo) {
        return create_link(a, b, lo);
    };
    o.start    = [this]() { return start(); };
    o.ping_all = [this]() { return ping_all(); };
    o.exec = [this](const std::string& h, const std::string& c, bool bg,
                    std::unique_ptr<proc::Process>* out) {
        return exec(h, c, bg, out);
    };
    o.stop    = [this]() { return stop(); };
    o.cleanup = [this]() { return cleanup(); };
    return o;
}

/* ---- Network recording ------------------------------------------- */

ft_status ShellEmulator::create_host(const std::string& name,
                                     const std::string& address) {
    if (name.empty() || net_.find_node(name)) return FT_ERROR_INVALID_ARG;
    topo::ConcreteNode n;
    n.name    = name;
    n.kind    = topo::NodeKind::Host;
    n.address = address;
    net_.hosts.push_back(std::move(n));
    return FT_OK;
}

ft_status ShellEmulator::create_switch(const std::string& name) {
    if (name.empty() || net_.find_node(name)) return FT_ERROR_INVALID_ARG;
    topo::ConcreteNode n;
    n.name = name;
    n.kind = topo::NodeKind::Switch;
    net_.switches.push_back(std::move(n));
    return FT_OK;
}

ft_status ShellEmulator::create_link(const std::string& a, const std::string& b,
                                     const topo::LinkOptions& opts) {
    if (!net_.find_node(a) || !net_.find_node(b)) return FT_ERROR_NOT_FOUND;
    topo::ConcreteLink l;
    l.node_a  = a;
    l.node_b  = b;
    l.edge_id = static_cast<uint32_t>(net_.links.size());
    l.opts    = opts;
    net_.links.push_back(std::move(l));
    return FT_OK;
}

ft_status ShellEmulator::write_topology() const {
    FILE* f = std::fopen(cfg_.topology_path.c_str(), "w");
    if (!f) {
        ft_log(FT_LOG_ERROR, "emu", "cannot write %s", cfg_.topology_path.c_str());
        return FT_ERROR_IO;
    }
    std::fprintf(f, "# ftbench topology\n");
    std::fprintf(f, "controller %s\n", cfg_.controller.c_str());
    for (auto& h : net_.hosts)
        std::fprintf(f, "host %s %s\n", h.name.c_str(), h.address.c_str());
    for (auto& s : net_.switches)
        std::fprintf(f, "switch %s\n", s.name.c_str());
    for (auto& l : net_.links)
        std::fprintf(f, "link %s %s %g %s\n", l.node_a.c_str(), l.node_b.c_str(),
                     l.opts.bandwidth_mbps, l.opts.delay.c_str());
    bool ok = std::ferror(f) == 0;
    if (std::fclose(f) != 0) ok = false;
    return ok ? FT_OK : FT_ERROR_IO;
}

/* ---- Lifecycle --------------------------------------------------- */

ft_status ShellEmulator::run_hook(const std::string& tmpl, const char* what) {
    if (tmpl.empty()) return FT_OK;
    std::string cmd = substitute(substitute(tmpl, "{topo}", cfg_.topology_path),
                                 "{controller}", cfg_.controller);
    ft_log(FT_LOG_DEBUG, "emu", "%s: %s", what, cmd.c_str());

    std::unique_ptr<proc::Process> p;
    ft_status st = proc::Process::spawn_shell(cmd, /*capture=*/false, &p);
    if (st != FT_OK) return st;

    st = p->wait_for(cfg_.hook_timeout_ms);
    if (st != FT_OK) {
        ft_log(FT_LOG_ERROR, "emu", "%s hook timed out", what);
        return st;   /* ~Process kills and reaps */
    }
    if (p->exit_code() != 0) {
        ft_log(FT_LOG_ERROR, "emu", "%s hook exited with %d", what, p->exit_code());
        return FT_ERROR_INTERNAL;
    }
    return FT_OK;
}

ft_status ShellEmulator::start() {
    ft_status st = write_topology();
    if (st != FT_OK) return st;
    st = run_hook(cfg_.up_cmd, "up");
    if (st != FT_OK) return st;
    started_ = true;
    return FT_OK;
}

ft_status ShellEmulator::stop() {
    if (!started_) return FT_OK;
    started_ = false;
    ft_status st = run_hook(cfg_.down_cmd, "down");
    net_ = topo::NetworkDescription{};
    return st;
}

/* Leaves the backend empty, ready for the next create_* sequence */
ft_status ShellEmulator::cleanup() {
    started_ = false;
    net_ = topo::NetworkDescription{};
    return run_hook(cfg_.cleanup_cmd, "cleanup");
}

/* ---- Host commands ----------------------------------------------- */

std::string ShellEmulator::render(const std::string& host,
                                  const std::string& cmd) const {
    /* {cmd} last so a command containing "{host}" is left alone */
    return substitute(substitute(cfg_.exec_template, "{host}", host), "{cmd}", cmd);
}

ft_status ShellEmulator::exec(const std::string& host, const std::string& cmd,
                              bool background, std::unique_ptr<proc::Process>* out) {
    const topo::ConcreteNode* n = net_.find_node(host);
    if (!n || n->kind != topo::NodeKind::Host) return FT_ERROR_NOT_FOUND;
    return proc::Process::spawn_shell(render(host, cmd), !background, out);
}

uint32_t ShellEmulator::ping_all() {
    uint32_t sent = 0, dropped = 0;

    for (auto& src : net_.hosts) {
        struct Probe { const topo::ConcreteNode* dst; std::unique_ptr<proc::Process> p; };
        std::vector<Probe> probes;

        for (auto& dst : net_.hosts) {
            if (&dst == &src) continue;
            ++sent;
            std::unique_ptr<proc::Process> p;
            if (exec(src.name, "ping -c1 -W1 " + dst.ip(), false, &p) != FT_OK) {
                ++dropped;
                continue;
            }
            probes.push_back({&dst, std::move(p)});
        }

        for (auto& pr : probes) {
            bool ok = pr.p->wait_for(cfg_.ping_timeout_ms) == FT_OK &&
                      pr.p->exit_code() == 0;
            if (!ok) {
                ++dropped;
                ft_log(FT_LOG_DEBUG, "emu", "%s -> %s: no reply",
                       src.name.c_str(), pr.dst->name.c_str());
            }
        }
    }

    ft_log(FT_LOG_INFO, "emu", "ping all: %u/%u received (%.0f%% dropped)",
           sent - dropped, sent, sent ? 100.0 * dropped / sent : 0.0);
    return dropped;
}

}} // namespace ftbench::emu
