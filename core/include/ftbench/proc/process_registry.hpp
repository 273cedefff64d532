/**
 * @file process_registry.hpp
 * @brief ftbench proc: Registry of unawaited background processes
 *
 * Header-only. Background children (e.g. throughput listeners) are
 * registered here instead of being waited on; terminate_all() stops every
 * entry uniformly, whether or not anyone ever looked at it again. The
 * destructor does the same.
 */

#ifndef FTBENCH_PROC_PROCESS_REGISTRY_HPP
#define FTBENCH_PROC_PROCESS_REGISTRY_HPP

#include "ftbench/proc/process.hpp"
#include "ftbench/log.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ftbench { namespace proc {

class ProcessRegistry {
public:
    ProcessRegistry() = default;
    ~ProcessRegistry() { terminate_all(); }

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    Process* add(const std::string& tag, std::unique_ptr<Process> p) {
        if (!p) return nullptr;
        Process* raw = p.get();
        entries_.push_back({tag, std::move(p)});
        return raw;
    }

    size_t size() const { return entries_.size(); }

    size_t num_running() {
        size_t n = 0;
        for (auto& e : entries_)
            if (e.proc->running()) ++n;
        return n;
    }

    /** Stop and reap every entry. Returns how many were still running. */
    size_t terminate_all(uint64_t grace_ms = 500) {
        size_t stopped = 0;
        for (auto& e : entries_) {
            if (!e.proc->running()) continue;
            ++stopped;
            ft_status st = e.proc->terminate(grace_ms);
            if (st != FT_OK)
                ft_log(FT_LOG_WARN, "proc", "terminate %s (pid %d): %s",
                       e.tag.c_str(), (int)e.proc->pid(), ft_status_str(st));
        }
        entries_.clear();
        return stopped;
    }

private:
    struct Entry {
        std::string              tag;
        std::unique_ptr<Process> proc;
    };

    std::vector<Entry> entries_;
};

}} // namespace ftbench::proc

#endif // FTBENCH_PROC_PROCESS_REGISTRY_HPP
