/**
 * @file log.h
 * @brief Leveled, component-tagged console logging
 *
 * C-ABI compatible. Messages below the global level are dropped; the rest
 * go to the installed callback, or to stderr as "[LEVEL] component: msg".
 */

#ifndef FTBENCH_LOG_H
#define FTBENCH_LOG_H

#include "ftbench/ft_status.h" /* FT_API */

#ifdef __cplusplus
extern "C" {
#endif

/* ---- Log Levels ---- */
typedef enum ft_log_level {
    FT_LOG_TRACE = 0,
    FT_LOG_DEBUG = 1,
    FT_LOG_INFO  = 2,
    FT_LOG_WARN  = 3,
    FT_LOG_ERROR = 4,
    FT_LOG_FATAL = 5,
    FT_LOG_OFF   = 6
} ft_log_level;

/* ---- Log callback ---- */
typedef void (*ft_log_fn)(ft_log_level level, const char* component,
                          const char* message, void* userdata);

FT_API void ft_log_set_callback(ft_log_fn fn, void* userdata);
FT_API void ft_log_set_level(ft_log_level level);
FT_API ft_log_level ft_log_get_level(void);
FT_API void ft_log(ft_log_level level, const char* component, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/** Parse "trace".."fatal"/"off". Returns 0 and leaves *out untouched on
 *  an unknown name. */
FT_API int ft_log_level_parse(const char* name, ft_log_level* out);

#ifdef __cplusplus
}
#endif

#endif /* FTBENCH_LOG_H */
