/**
 * @file aggregator.hpp
 * @brief ftbench bench: iperf CSV parsing and result aggregation
 *
 * `iperf -y C` prints one comma-separated record of nine fields; field 8
 * (0-based) is the transferred bandwidth in bits/second. A record with
 * any other field count is treated as no output at all; a non-numeric
 * bandwidth field is a parse failure. Neither ever aborts aggregation.
 */

#ifndef FTBENCH_BENCH_AGGREGATOR_HPP
#define FTBENCH_BENCH_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ftbench { namespace bench {

constexpr size_t kIperfCsvFields      = 9;
constexpr size_t kIperfBandwidthField = 8;
constexpr double kBitsPerMegabit      = 1e6;

enum class ProbeStatus : uint8_t {
    Ok          = 0,
    ParseFailed = 1,
    NoOutput    = 2,
    TimedOut    = 3,
};

const char* probe_status_str(ProbeStatus s);

struct ProbeResult {
    std::string           label;     /* "sender->receiver" */
    std::string           raw;       /* trimmed probe output */
    std::optional<double> mbps;      /* set only when status == Ok */
    ProbeStatus           status = ProbeStatus::NoOutput;
    std::string           reason;    /* human-readable failure cause */

    bool ok() const { return status == ProbeStatus::Ok; }
};

enum class RunStatus : uint8_t {
    Ok          = 0,
    Unreachable = 1,   /* reachability gate failed, nothing measured */
    Skipped     = 2,   /* fewer than two hosts */
};

const char* run_status_str(RunStatus s);

struct AggregateReport {
    RunStatus                status     = RunStatus::Ok;
    double                   total_mbps = 0.0;
    uint32_t                 num_ok     = 0;
    uint32_t                 num_failed = 0;
    std::vector<ProbeResult> pairs;
};

/** Parse one client's captured output. */
ProbeResult parse_probe_output(const std::string& label, const std::string& raw);

/** Result for a client still running when its collection window closed. */
ProbeResult timed_out_result(const std::string& label, const std::string& raw);

/** Sum the Ok results in order; count the rest. */
AggregateReport aggregate(std::vector<ProbeResult> results);

}} // namespace ftbench::bench

#endif // FTBENCH_BENCH_AGGREGATOR_HPP
