/**
 * @file report.cpp
 * @brief Console summary, JSON summary, results CSV
 */

#include "ftbench/bench/report.hpp"
#include "ftbench/log.h"

namespace ftbench { namespace bench {

static const char* k_rule =
    "--------------------------------------------------";

void print_report(const AggregateReport& rep, FILE* out) {
    if (rep.status == RunStatus::Unreachable) {
        std::fprintf(out, "!!! Some hosts are unreachable. Bandwidth test aborted. !!!\n");
    } else if (rep.status == RunStatus::Skipped) {
        std::fprintf(out, "*** Fewer than two hosts, bandwidth test skipped.\n");
    }

    for (auto& p : rep.pairs) {
        if (p.ok() && p.mbps)
            std::fprintf(out, "    %s: %.2f Mbps\n", p.label.c_str(), *p.mbps);
        else
            std::fprintf(out, "    %s: FAILED (%s)\n", p.label.c_str(), p.reason.c_str());
    }

    std::fprintf(out, "%s\n", k_rule);
    std::fprintf(out, "Total Aggregate Bandwidth: %.2f Mbps (%u ok, %u failed)\n",
                 rep.total_mbps, rep.num_ok, rep.num_failed);
    std::fprintf(out, "%s\n", k_rule);
}

static void append_json_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", c);
                    out += esc;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

std::string report_to_json(const AggregateReport& rep) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
        "{\"status\":\"%s\",\"total_mbps\":%.6f,\"ok\":%u,\"failed\":%u,\"pairs\":[",
        run_status_str(rep.status), rep.total_mbps, rep.num_ok, rep.num_failed);
    std::string out = buf;

    for (size_t i = 0; i < rep.pairs.size(); ++i) {
        const auto& p = rep.pairs[i];
        if (i) out += ',';
        out += "{\"label\":";
        append_json_string(out, p.label);
        out += ",\"status\":\"";
        out += probe_status_str(p.status);
        out += "\",\"mbps\":";
        if (p.mbps) {
            std::snprintf(buf, sizeof(buf), "%.6f", *p.mbps);
            out += buf;
        } else {
            out += "null";
        }
        if (!p.ok()) {
            out += ",\"reason\":";
            append_json_string(out, p.reason);
        }
        out += '}';
    }
    out += "]}";
    return out;
}

ft_status write_report_json(const std::string& path, const AggregateReport& rep) {
    FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        ft_log(FT_LOG_ERROR, "report", "cannot open %s", path.c_str());
        return FT_ERROR_IO;
    }
    std::string js = report_to_json(rep);
    bool ok = std::fwrite(js.data(), 1, js.size(), f) == js.size() &&
              std::fputc('\n', f) != EOF;
    if (std::fclose(f) != 0) ok = false;
    return ok ? FT_OK : FT_ERROR_IO;
}

ft_status append_results_csv(const std::string& path, const std::string& label,
                             const AggregateReport& rep) {
    if (label.find(',') != std::string::npos) return FT_ERROR_INVALID_ARG;
    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        ft_log(FT_LOG_ERROR, "report", "cannot open %s", path.c_str());
        return FT_ERROR_IO;
    }
    bool ok = std::fprintf(f, "%s,%.2f\n", label.c_str(), rep.total_mbps) > 0;
    if (std::fclose(f) != 0) ok = false;
    return ok ? FT_OK : FT_ERROR_IO;
}

}} // namespace ftbench::bench
