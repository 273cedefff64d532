/**
 * @file report.hpp
 * @brief ftbench bench: Report rendering and export
 */

#ifndef FTBENCH_BENCH_REPORT_HPP
#define FTBENCH_BENCH_REPORT_HPP

#include "ftbench/ft_status.h"
#include "ftbench/bench/aggregator.hpp"

#include <cstdio>
#include <string>

namespace ftbench { namespace bench {

/** One line per pair, then the aggregate total between rule lines. */
void print_report(const AggregateReport& rep, FILE* out);

/** {"status":..,"total_mbps":..,"ok":..,"failed":..,"pairs":[..]} */
std::string report_to_json(const AggregateReport& rep);

ft_status write_report_json(const std::string& path, const AggregateReport& rep);

/** Append "<label>,<total>" to a results CSV (one line per run). */
ft_status append_results_csv(const std::string& path, const std::string& label,
                             const AggregateReport& rep);

}} // namespace ftbench::bench

#endif // FTBENCH_BENCH_REPORT_HPP
