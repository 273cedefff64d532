/**
 * @file aggregator_test.cpp
 * @brief iperf CSV parsing, aggregation, console/JSON/CSV output
 */

#include "ftbench/bench/aggregator.hpp"
#include "ftbench/bench/report.hpp"
#include "ftbench/log.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <unistd.h>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

using namespace ftbench::bench;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static std::string read_file(const std::string& path) {
    std::string s;
    FILE* f = std::fopen(path.c_str(), "r");
    if (!f) return s;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) s.append(buf, n);
    std::fclose(f);
    return s;
}

int main() {
    printf("=== Aggregator Test ===\n");
    ft_log_set_level(FT_LOG_ERROR);

    /* Test 1: well-formed record, field 8 in bits/s */
    {
        auto r = parse_probe_output("h1->h2", "a,b,c,d,e,f,g,h,15000000\n");
        CHECK(r.status == ProbeStatus::Ok, "9 fields parse ok");
        CHECK(r.mbps && near(*r.mbps, 15.0), "15e6 bit/s = 15 Mbps");
        CHECK(r.raw == "a,b,c,d,e,f,g,h,15000000", "raw output trimmed");
        CHECK(r.label == "h1->h2", "label kept");
    }

    /* Test 2: realistic iperf -y C line */
    {
        auto r = parse_probe_output("h3->h9",
            "20260101120000,10.0.0.2,45678,10.1.0.3,5001,3,0.0-10.0,18350080,14286431\n");
        CHECK(r.ok() && near(*r.mbps, 14.286431), "real record parses");
    }

    /* Test 3: wrong field count → no output */
    {
        auto r = parse_probe_output("h1->h2", "a,b,c,d,e,f,g");
        CHECK(r.status == ProbeStatus::NoOutput, "7 fields → no-output");
        CHECK(!r.mbps, "no value on no-output");
        CHECK(r.reason == "iperf command produced no valid output", "no-output reason");

        CHECK(parse_probe_output("x", "").status == ProbeStatus::NoOutput, "empty → no-output");
        CHECK(parse_probe_output("x", "  \n").status == ProbeStatus::NoOutput,
              "whitespace → no-output");
        CHECK(parse_probe_output("x", "1,2,3,4,5,6,7,8,9,10").status == ProbeStatus::NoOutput,
              "10 fields → no-output");
        CHECK(parse_probe_output("x", "connect failed: Connection refused").status ==
              ProbeStatus::NoOutput, "error text → no-output");
    }

    /* Test 4: non-numeric bandwidth → parse failed */
    {
        auto r = parse_probe_output("h1->h2", "a,b,c,d,e,f,g,h,fast");
        CHECK(r.status == ProbeStatus::ParseFailed, "non-numeric → parse-failed");
        CHECK(!r.mbps, "no value on parse-failed");
        CHECK(r.reason.find("a,b,c,d,e,f,g,h,fast") != std::string::npos,
              "reason carries raw output");

        CHECK(parse_probe_output("x", "a,b,c,d,e,f,g,h,12abc").status ==
              ProbeStatus::ParseFailed, "trailing junk → parse-failed");
        CHECK(parse_probe_output("x", "a,b,c,d,e,f,g,h,").status ==
              ProbeStatus::ParseFailed, "empty field → parse-failed");
        CHECK(parse_probe_output("x", "a,b,c,d,e,f,g,h,inf").status ==
              ProbeStatus::ParseFailed, "infinity → parse-failed");
        CHECK(parse_probe_output("x", "a,b,c,d,e,f,g,h,0x1p20").status ==
              ProbeStatus::ParseFailed, "hex float → parse-failed");
        CHECK(parse_probe_output("x", "a,b,c,d,e,f,g,h,0X10").status ==
              ProbeStatus::ParseFailed, "hex integer → parse-failed");
        auto plus = parse_probe_output("x", "a,b,c,d,e,f,g,h,+2e6");
        CHECK(plus.ok() && near(*plus.mbps, 2.0), "signed exponent form accepted");
    }

    /* Test 5: aggregation sums ok results only, preserves order */
    {
        std::vector<ProbeResult> rs;
        rs.push_back(parse_probe_output("h1->h2", "a,b,c,d,e,f,g,h,10000000"));
        rs.push_back(parse_probe_output("h2->h3", "a,b,c,d,e,f,g,h,bogus"));
        rs.push_back(parse_probe_output("h3->h1", "a,b,c,d,e,f,g,h,20000000"));
        rs.push_back(timed_out_result("h4->h1", ""));
        auto rep = aggregate(std::move(rs));
        CHECK(near(rep.total_mbps, 30.0), "total = 10 + 20");
        CHECK(rep.num_ok == 2 && rep.num_failed == 2, "2 ok, 2 failed");
        CHECK(rep.pairs.size() == 4, "every pair kept");
        CHECK(rep.pairs[1].label == "h2->h3", "order preserved");
        CHECK(rep.pairs[3].status == ProbeStatus::TimedOut, "timeout kept");
        CHECK(rep.status == RunStatus::Ok, "default run status ok");

        auto empty = aggregate({});
        CHECK(empty.total_mbps == 0.0 && empty.num_ok == 0, "empty aggregate");
    }

    /* Test 6: console report */
    {
        std::vector<ProbeResult> rs;
        rs.push_back(parse_probe_output("h1->h2", "a,b,c,d,e,f,g,h,12345678"));
        rs.push_back(parse_probe_output("h2->h1", ""));
        auto rep = aggregate(std::move(rs));

        char path[] = "/tmp/ftbench_report_XXXXXX";
        int fd = ::mkstemp(path);
        CHECK(fd >= 0, "mkstemp");
        FILE* f = ::fdopen(fd, "w");
        CHECK(f != nullptr, "fdopen");
        print_report(rep, f);
        std::fclose(f);
        std::string text = read_file(path);
        ::unlink(path);

        CHECK(text.find("    h1->h2: 12.35 Mbps") != std::string::npos, "ok line");
        CHECK(text.find("h2->h1: FAILED (iperf command produced no valid output)") !=
              std::string::npos, "failed line");
        CHECK(text.find("Total Aggregate Bandwidth: 12.35 Mbps (1 ok, 1 failed)") !=
              std::string::npos, "total line");
        CHECK(text.find("unreachable") == std::string::npos, "no abort banner");
    }

    /* Test 7: JSON export */
    {
        std::vector<ProbeResult> rs;
        rs.push_back(parse_probe_output("h1->h2", "a,b,c,d,e,f,g,h,15000000"));
        rs.push_back(parse_probe_output("h2->h1", "a,b,c,d,e,f,g,h,\"x\""));
        auto rep = aggregate(std::move(rs));
        std::string js = report_to_json(rep);

        CHECK(js.find("\"status\":\"ok\"") != std::string::npos, "run status");
        CHECK(js.find("\"total_mbps\":15.000000") != std::string::npos, "total");
        CHECK(js.find("\"ok\":1,\"failed\":1") != std::string::npos, "counts");
        CHECK(js.find("{\"label\":\"h1->h2\",\"status\":\"ok\",\"mbps\":15.000000}") !=
              std::string::npos, "ok pair");
        CHECK(js.find("\"status\":\"parse-failed\",\"mbps\":null") != std::string::npos,
              "failed pair");
        CHECK(js.find("h,\\\"x\\\"") != std::string::npos, "quotes escaped in reason");

        AggregateReport unreachable;
        unreachable.status = RunStatus::Unreachable;
        CHECK(report_to_json(unreachable).find("\"status\":\"unreachable\",\"total_mbps\":0.000000")
              != std::string::npos, "unreachable report");
    }

    /* Test 8: results CSV appends one line per run */
    {
        char path[] = "/tmp/ftbench_results_XXXXXX";
        int fd = ::mkstemp(path);
        CHECK(fd >= 0, "mkstemp");
        ::close(fd);

        AggregateReport a; a.total_mbps = 123.456;
        AggregateReport b; b.total_mbps = 7.0;
        CHECK(append_results_csv(path, "pox", a) == FT_OK, "first append");
        CHECK(append_results_csv(path, "ryu", b) == FT_OK, "second append");
        CHECK(append_results_csv(path, "bad,label", b) == FT_ERROR_INVALID_ARG,
              "comma in label rejected");
        CHECK(read_file(path) == "pox,123.46\nryu,7.00\n", "csv content");

        CHECK(write_report_json(path, a) == FT_OK, "json write");
        CHECK(read_file(path).find("\"total_mbps\":123.456000") != std::string::npos,
              "json file content");
        ::unlink(path);

        CHECK(append_results_csv("/nonexistent-dir/x.csv", "l", a) == FT_ERROR_IO,
              "unwritable path");
    }

    CHECK(std::strcmp(probe_status_str(ProbeStatus::NoOutput), "no-output") == 0,
          "status name");

    printf("PASS: all aggregator tests passed\n");
    return 0;
}
