/**
 * @file emulator.hpp
 * @brief ftbench emu: Emulation platform capability table
 *
 * The core never instantiates hosts, switches or links itself; it calls
 * through this table. Any backend (the shell-driven one in
 * shell_emulator.hpp, a mock in tests) fills every slot.
 *
 * exec() always returns a handle. With background = true the child's
 * output is discarded and the caller is expected to park the handle in a
 * ProcessRegistry rather than wait on it.
 */

#ifndef FTBENCH_EMU_EMULATOR_HPP
#define FTBENCH_EMU_EMULATOR_HPP

#include "ftbench/ft_status.h"
#include "ftbench/proc/process.hpp"
#include "ftbench/topo/network.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ftbench { namespace emu {

struct EmulatorOps {
    std::function<ft_status(const std::string& name, const std::string& address)> create_host;
    std::function<ft_status(const std::string& name)>                             create_switch;
    std::function<ft_status(const std::string& a, const std::string& b,
                            const topo::LinkOptions& opts)>                        create_link;
    std::function<ft_status()>                                                     start;
    /** All-pairs reachability probe. Returns the number of failed pairs. */
    std::function<uint32_t()>                                                      ping_all;
    std::function<ft_status(const std::string& host, const std::string& cmd,
                            bool background,
                            std::unique_ptr<proc::Process>* out)>                  exec;
    std::function<ft_status()>                                                     stop;
    std::function<ft_status()>                                                     cleanup;
};

inline bool ops_complete(const EmulatorOps& ops) {
    return ops.create_host && ops.create_switch && ops.create_link &&
           ops.start && ops.ping_all && ops.exec && ops.stop && ops.cleanup;
}

}} // namespace ftbench::emu

#endif // FTBENCH_EMU_EMULATOR_HPP
