/**
 * @file ft_status.h
 * @brief ftbench status codes and export macros
 *
 * Every fallible core operation returns an ft_status. Plain C enum so the
 * logging and report helpers stay usable from C callers.
 */

#ifndef FTBENCH_STATUS_H
#define FTBENCH_STATUS_H

#include <stddef.h>
#include <stdint.h>

/* ------------------------------------------------------------------ */
/*  Export / Visibility Macros                                         */
/* ------------------------------------------------------------------ */

#if defined(__GNUC__) || defined(__clang__)
  #define FT_API __attribute__((visibility("default")))
#else
  #define FT_API
#endif

#define FT_VERSION_MAJOR 0
#define FT_VERSION_MINOR 2
#define FT_VERSION_PATCH 0

/* ------------------------------------------------------------------ */
/*  Status Codes                                                       */
/* ------------------------------------------------------------------ */

typedef enum ft_status {
    FT_OK                     = 0,
    FT_ERROR_INVALID_ARG      = 1,
    FT_ERROR_NOT_FOUND        = 2,
    FT_ERROR_MALFORMED_GRAPH  = 3,   /**< edge references an unmapped node */
    FT_ERROR_UNREACHABLE      = 4,   /**< reachability check reported drops */
    FT_ERROR_SPAWN            = 5,   /**< fork/exec or pipe setup failed */
    FT_ERROR_TIMEOUT          = 6,
    FT_ERROR_IO               = 7,
    FT_ERROR_INTERNAL         = 255
} ft_status;

#ifdef __cplusplus
extern "C" {
#endif

FT_API const char* ft_status_str(ft_status st);

#ifdef __cplusplus
}
#endif

#endif /* FTBENCH_STATUS_H */
