/**
 * @file aggregator.cpp
 * @brief iperf CSV field extraction + per-pair status
 */

#include "ftbench/bench/aggregator.hpp"
#include "ftbench/log.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace ftbench { namespace bench {

const char* probe_status_str(ProbeStatus s) {
    switch (s) {
        case ProbeStatus::Ok:          return "ok";
        case ProbeStatus::ParseFailed: return "parse-failed";
        case ProbeStatus::NoOutput:    return "no-output";
        case ProbeStatus::TimedOut:    return "timed-out";
        default:                       return "?";
    }
}

const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::Ok:          return "ok";
        case RunStatus::Unreachable: return "unreachable";
        case RunStatus::Skipped:     return "skipped";
        default:                     return "?";
    }
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> split_fields(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t pos = 0;
    for (;;) {
        size_t hit = s.find(sep, pos);
        out.push_back(s.substr(pos, hit == std::string::npos ? std::string::npos : hit - pos));
        if (hit == std::string::npos) break;
        pos = hit + 1;
    }
    return out;
}

/* Whole-field, finite decimal number; strtod's hex forms are refused */
static bool parse_double(const std::string& field, double* out) {
    std::string f = trim(field);
    if (f.empty() || f.find_first_of("xX") != std::string::npos) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(f.c_str(), &end);
    if (errno == ERANGE || end != f.c_str() + f.size() || !std::isfinite(v))
        return false;
    *out = v;
    return true;
}

ProbeResult parse_probe_output(const std::string& label, const std::string& raw) {
    ProbeResult r;
    r.label = label;
    r.raw   = trim(raw);

    auto fields = split_fields(r.raw, ',');
    if (r.raw.empty() || fields.size() != kIperfCsvFields) {
        r.status = ProbeStatus::NoOutput;
        r.reason = "iperf command produced no valid output";
        ft_log(FT_LOG_DEBUG, "report", "%s: %zu field(s) in output",
               label.c_str(), r.raw.empty() ? size_t(0) : fields.size());
        return r;
    }

    double bits = 0.0;
    if (!parse_double(fields[kIperfBandwidthField], &bits)) {
        r.status = ProbeStatus::ParseFailed;
        r.reason = "Could not parse bandwidth from output: " + r.raw;
        return r;
    }

    r.status = ProbeStatus::Ok;
    r.mbps   = bits / kBitsPerMegabit;
    return r;
}

ProbeResult timed_out_result(const std::string& label, const std::string& raw) {
    ProbeResult r;
    r.label  = label;
    r.raw    = trim(raw);
    r.status = ProbeStatus::TimedOut;
    r.reason = "iperf client still running after collection window";
    return r;
}

AggregateReport aggregate(std::vector<ProbeResult> results) {
    AggregateReport rep;
    for (auto& r : results) {
        if (r.ok() && r.mbps) {
            rep.total_mbps += *r.mbps;
            ++rep.num_ok;
        } else {
            ++rep.num_failed;
        }
    }
    rep.pairs = std::move(results);
    return rep;
}

}} // namespace ftbench::bench
