// rig_log.cpp
// Timestamped log line implementation

#include "rig_log.h"
#include <stdio.h>
#include <string.h>

// =============================================================================
// PRIVATE DATA
// =============================================================================

static Print* echo_port = nullptr;
static LogSink log_sink = nullptr;
static log_level_t minimum_level = LOG_LEVEL_INFO;

static char last_line[RIG_LOG_LINE_SIZE] = {0};
static uint32_t line_count = 0;

// Guards against a sink that logs from inside its own callback
static bool in_sink = false;

// =============================================================================
// PUBLIC FUNCTIONS
// =============================================================================

void rig_log_init(Print* port) {
    echo_port = port;
}

void rig_log_set_level(log_level_t level) {
    minimum_level = level;
}

log_level_t rig_log_get_level(void) {
    return minimum_level;
}

void rig_log_set_sink(LogSink sink) {
    log_sink = sink;
}

void rig_log_format_timestamp(uint32_t uptime_ms, char* out, size_t out_size) {
    if (out == nullptr || out_size == 0) return;

    uint32_t total_seconds = uptime_ms / 1000;
    uint32_t hours = (total_seconds / 3600) % 100;
    uint32_t minutes = (total_seconds / 60) % 60;
    uint32_t seconds = total_seconds % 60;

    snprintf(out, out_size, "[%02lu:%02lu:%02lu]",
             (unsigned long)hours, (unsigned long)minutes, (unsigned long)seconds);
}

const char* rig_log_level_to_string(log_level_t level) {
    switch (level) {
        case LOG_LEVEL_DEBUG:   return "DEBUG";
        case LOG_LEVEL_INFO:    return "INFO";
        case LOG_LEVEL_WARNING: return "WARNING";
        case LOG_LEVEL_ERROR:   return "ERROR";
        default:                return "NONE";
    }
}

void rig_log_v(log_level_t level, const char* format, va_list args) {
    if (format == nullptr || level < minimum_level || level >= LOG_LEVEL_NONE) {
        return;
    }

    char line[RIG_LOG_LINE_SIZE];
    rig_log_format_timestamp(millis(), line, sizeof(line));
    size_t used = strlen(line);

    // Warnings and errors carry their level so they stand out in the panel
    if (level >= LOG_LEVEL_WARNING) {
        used += snprintf(line + used, sizeof(line) - used, " %s:", rig_log_level_to_string(level));
    }
    if (used < sizeof(line) - 1) {
        line[used++] = ' ';
        line[used] = '\0';
        vsnprintf(line + used, sizeof(line) - used, format, args);
    }

    strncpy(last_line, line, sizeof(last_line) - 1);
    last_line[sizeof(last_line) - 1] = '\0';
    line_count++;

    if (echo_port != nullptr) {
        echo_port->println(line);
    }

    if (log_sink != nullptr && !in_sink) {
        in_sink = true;
        log_sink(level, line);
        in_sink = false;
    }
}

void rig_log(log_level_t level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    rig_log_v(level, format, args);
    va_end(args);
}

void rig_log_debug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    rig_log_v(LOG_LEVEL_DEBUG, format, args);
    va_end(args);
}

void rig_log_info(const char* format, ...) {
    va_list args;
    va_start(args, format);
    rig_log_v(LOG_LEVEL_INFO, format, args);
    va_end(args);
}

void rig_log_warning(const char* format, ...) {
    va_list args;
    va_start(args, format);
    rig_log_v(LOG_LEVEL_WARNING, format, args);
    va_end(args);
}

void rig_log_error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    rig_log_v(LOG_LEVEL_ERROR, format, args);
    va_end(args);
}

uint32_t rig_log_get_line_count(void) {
    return line_count;
}

const char* rig_log_get_last_line(void) {
    return last_line;
}

void rig_log_reset(void) {
    last_line[0] = '\0';
    line_count = 0;
    minimum_level = LOG_LEVEL_INFO;
    log_sink = nullptr;
    echo_port = nullptr;
}
