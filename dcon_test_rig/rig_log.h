// rig_log.h
// Timestamped log lines for the rig core
//
// Every failure in the core ends up here as one line of the form
//   [HH:MM:SS] message
// where the timestamp is the controller uptime. Lines are echoed to a debug
// port (normally USB Serial) and handed to one registered sink, which is how
// the host link forwards them to the operator's PC.

#ifndef RIG_LOG_H
#define RIG_LOG_H

#include <Arduino.h>
#include <stdarg.h>
#include <stdint.h>

typedef enum {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO,
    LOG_LEVEL_WARNING,
    LOG_LEVEL_ERROR,
    LOG_LEVEL_NONE          // Keep this last
} log_level_t;

// Receives every line at or above the configured level, already formatted
typedef void (*LogSink)(log_level_t level, const char* line);

#define RIG_LOG_LINE_SIZE 160

// Set the debug echo port (nullptr disables the echo)
void rig_log_init(Print* echo_port);

void rig_log_set_level(log_level_t level);
log_level_t rig_log_get_level(void);

void rig_log_set_sink(LogSink sink);

void rig_log(log_level_t level, const char* format, ...) __attribute__((format(printf, 2, 3)));
void rig_log_v(log_level_t level, const char* format, va_list args);

void rig_log_debug(const char* format, ...) __attribute__((format(printf, 1, 2)));
void rig_log_info(const char* format, ...) __attribute__((format(printf, 1, 2)));
void rig_log_warning(const char* format, ...) __attribute__((format(printf, 1, 2)));
void rig_log_error(const char* format, ...) __attribute__((format(printf, 1, 2)));

// Writes "[HH:MM:SS]" for an uptime in milliseconds
void rig_log_format_timestamp(uint32_t uptime_ms, char* out, size_t out_size);

const char* rig_log_level_to_string(log_level_t level);

// Diagnostics
uint32_t rig_log_get_line_count(void);
const char* rig_log_get_last_line(void);
void rig_log_reset(void);

#endif // RIG_LOG_H
