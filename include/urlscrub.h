// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef URLSCRUB_H
#define URLSCRUB_H

#ifdef __cplusplus
namespace urlscrub{
class line_processor;
} // namespace urlscrub

using urlscrub_handle = urlscrub::line_processor *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum URLSCRUB_RET_CODE
 *
 * Codes returned by urlscrub_redact_line.
 **/
typedef enum
{
    URLSCRUB_ERR_INTERNAL         = -2,
    URLSCRUB_ERR_INVALID_ARGUMENT = -1,
    URLSCRUB_OK                   = 0,
    URLSCRUB_REDACTED             = 1,
} URLSCRUB_RET_CODE;

/**
 * @enum URLSCRUB_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    URLSCRUB_LOG_TRACE,
    URLSCRUB_LOG_DEBUG,
    URLSCRUB_LOG_INFO,
    URLSCRUB_LOG_WARN,
    URLSCRUB_LOG_ERROR,
    URLSCRUB_LOG_OFF,
} URLSCRUB_LOG_LEVEL;

/**
 * @enum URLSCRUB_QUERY_MODE
 *
 * How the query string of a URL is rebuilt once redacted.
 **/
typedef enum
{
    // Only the redacted values change, the rest of the query is kept as is
    URLSCRUB_QUERY_PRESERVE  = 0,
    // Parameters are grouped by name, blank values dropped and everything re-encoded
    URLSCRUB_QUERY_CANONICAL = 1,
} URLSCRUB_QUERY_MODE;

#ifndef __cplusplus
typedef struct _urlscrub_handle* urlscrub_handle;
#endif

typedef struct _urlscrub_config urlscrub_config;
typedef struct _urlscrub_result urlscrub_result;

struct _urlscrub_config
{
    /** Names of the query parameters to redact, the strings are owned by the caller */
    const char *const *parameters;
    /** Number of elements in parameters */
    uint32_t parameters_size;
    /** Replacement value, NULL for the default ("REDACTED") */
    const char *redaction_string;
    /** Query reconstruction mode */
    URLSCRUB_QUERY_MODE query_mode;
};

struct _urlscrub_result
{
    /** Rewritten line, NUL-terminated, owned by the result */
    char *text;
    /** Length of the rewritten line (excluding NUL terminator) */
    size_t length;
    /** Number of URL candidates found in the line */
    uint32_t urls_found;
    /** Number of URLs with at least one redacted parameter */
    uint32_t urls_redacted;
    /** Number of URL candidates which couldn't be parsed and were left as is */
    uint32_t urls_malformed;
};

/**
 * @typedef urlscrub_log_cb
 *
 * Callback that urlscrub will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*urlscrub_log_cb)(
    URLSCRUB_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * urlscrub_init
 *
 * Initialize a redaction instance
 *
 * @param config Optional configuration. (nullable)
 *
 * @return Handle to the instance or NULL on error.
 *
 * @note If config is NULL, the default parameters (api_key, password,
 *       session_id, auth_token) and redaction string are used.
 **/
urlscrub_handle urlscrub_init(const urlscrub_config *config);

/**
 * urlscrub_destroy
 *
 * Destroy a redaction instance.
 *
 * @param handle Handle to the instance.
 */
void urlscrub_destroy(urlscrub_handle handle);

/**
 * urlscrub_redact_line
 *
 * Redact the sensitive query parameters of every URL found in a line of text.
 *
 * @param handle Handle to the instance. (nonnull)
 * @param line Line of text, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the line.
 * @param result Structure populated with the rewritten line. (nonnull)
 *
 * @return URLSCRUB_REDACTED if at least one URL was redacted, URLSCRUB_OK if
 *         the line was left as is, or an error code. On error the result is
 *         left untouched, otherwise it must be freed with urlscrub_result_free.
 *
 * @note A line which fails to be processed internally is returned unmodified
 *       with URLSCRUB_OK.
 **/
URLSCRUB_RET_CODE urlscrub_redact_line(urlscrub_handle handle, const char *line,
    size_t length, urlscrub_result *result);

/**
 * urlscrub_result_free
 *
 * Free the memory owned by a result.
 *
 * @param result Result to free. (nonnull)
 **/
void urlscrub_result_free(urlscrub_result *result);

/**
 * urlscrub_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *urlscrub_get_version();

/**
 * urlscrub_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool urlscrub_set_log_cb(urlscrub_log_cb cb, URLSCRUB_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*URLSCRUB_H */
