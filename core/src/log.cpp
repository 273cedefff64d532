/**
 * @file log.cpp
 * @brief Console logging + status strings
 */

#include "ftbench/log.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <atomic>
#include <mutex>

/* ---- Status strings ---- */

const char* ft_status_str(ft_status st) {
    switch (st) {
        case FT_OK:                    return "ok";
        case FT_ERROR_INVALID_ARG:     return "invalid argument";
        case FT_ERROR_NOT_FOUND:       return "not found";
        case FT_ERROR_MALFORMED_GRAPH: return "malformed topology graph";
        case FT_ERROR_UNREACHABLE:     return "hosts unreachable";
        case FT_ERROR_SPAWN:           return "process spawn failed";
        case FT_ERROR_TIMEOUT:         return "timed out";
        case FT_ERROR_IO:              return "i/o error";
        case FT_ERROR_INTERNAL:        return "internal error";
        default:                       return "?";
    }
}

/* ---- Logging ---- */

static ft_log_fn      s_log_fn    = nullptr;
static void*          s_log_ud    = nullptr;
static std::atomic<ft_log_level> s_log_level{FT_LOG_INFO};
static std::mutex     s_log_mu;

void ft_log_set_callback(ft_log_fn fn, void* userdata) {
    std::lock_guard<std::mutex> lk(s_log_mu);
    s_log_fn = fn;
    s_log_ud = userdata;
}

void ft_log_set_level(ft_log_level level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

ft_log_level ft_log_get_level(void) {
    return s_log_level.load(std::memory_order_relaxed);
}

static const char* level_str(ft_log_level l) {
    switch (l) {
        case FT_LOG_TRACE: return "TRACE";
        case FT_LOG_DEBUG: return "DEBUG";
        case FT_LOG_INFO:  return "INFO";
        case FT_LOG_WARN:  return "WARN";
        case FT_LOG_ERROR: return "ERROR";
        case FT_LOG_FATAL: return "FATAL";
        default:           return "?";
    }
}

int ft_log_level_parse(const char* name, ft_log_level* out) {
    static const struct { const char* name; ft_log_level level; } k_levels[] = {
        {"trace", FT_LOG_TRACE}, {"debug", FT_LOG_DEBUG},
        {"info",  FT_LOG_INFO},  {"warn",  FT_LOG_WARN},
        {"error", FT_LOG_ERROR}, {"fatal", FT_LOG_FATAL},
        {"off",   FT_LOG_OFF},
    };
    if (!name || !out) return 0;
    for (auto& e : k_levels) {
        if (std::strcmp(name, e.name) == 0) {
            *out = e.level;
            return 1;
        }
    }
    return 0;
}

void ft_log(ft_log_level level, const char* component, const char* fmt, ...) {
    if (level < s_log_level.load(std::memory_order_relaxed) || level >= FT_LOG_OFF) return;

    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lk(s_log_mu);
    if (s_log_fn) {
        s_log_fn(level, component, buf, s_log_ud);
    } else {
        std::fprintf(stderr, "[%s] %s: %s\n", level_str(level), component, buf);
    }
}
