/**
 * @file shell_emulator.hpp
 * @brief ftbench emu: Shell-driven emulator backend
 *
 * Records the network it is asked to create, writes it to a plain-text
 * topology file on start(), and delegates the platform work to external
 * commands:
 *   up_cmd / down_cmd / cleanup_cmd   run through /bin/sh, "{topo}" and
 *                                     "{controller}" substituted
 *   exec_template                     wraps per-host commands, "{host}"
 *                                     and "{cmd}" substituted
 *
 * Topology file lines:
 *   controller <ip:port>
 *   host <name> <cidr>
 *   switch <name>
 *   link <a> <b> <mbps> <delay>
 */

#ifndef FTBENCH_EMU_SHELL_EMULATOR_HPP
#define FTBENCH_EMU_SHELL_EMULATOR_HPP

#include "ftbench/emu/emulator.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace ftbench { namespace emu {

/** Replace every occurrence of `key` in `tmpl` with `value`. */
std::string substitute(const std::string& tmpl, const std::string& key,
                       const std::string& value);

class ShellEmulator {
public:
    struct Config {
        std::string exec_template   = "ip netns exec {host} {cmd}";
        std::string up_cmd;
        std::string down_cmd;
        std::string cleanup_cmd;
        std::string topology_path   = "ftbench_topology.txt";
        std::string controller      = "127.0.0.1:6653";
        uint64_t    ping_timeout_ms = 2000;
        uint64_t    hook_timeout_ms = 120000;
    };

    explicit ShellEmulator(Config cfg) : cfg_(std::move(cfg)) {}
    ShellEmulator() : ShellEmulator(Config{}) {}

    /** Capability table bound to this instance. */
    EmulatorOps ops();

    ft_status create_host(const std::string& name, const std::string& address);
    ft_status create_switch(const std::string& name);
    ft_status create_link(const std::string& a, const std::string& b,
                          const topo::LinkOptions& opts);
    ft_status start();
    uint32_t  ping_all();
    ft_status exec(const std::string& host, const std::string& cmd,
                   bool background, std::unique_ptr<proc::Process>* out);
    ft_status stop();
    ft_status cleanup();

    std::string render(const std::string& host, const std::string& cmd) const;
    ft_status   write_topology() const;

    const topo::NetworkDescription& network() const { return net_; }
    bool started() const { return started_; }

private:
    ft_status run_hook(const std::string& tmpl, const char* what);

    Config                   cfg_;
    topo::NetworkDescription net_;
    bool                     started_ = false;
};

}} // namespace ftbench::emu

#endif // FTBENCH_EMU_SHELL_EMULATOR_HPP
