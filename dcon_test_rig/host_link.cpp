// host_link.cpp
// Line-oriented text protocol between the rig and the operator's PC

#include "host_link.h"
#include "msg_bus.h"
#include "rig_controller.h"
#include <ctype.h>
#include <stdio.h>
#include <stdarg.h>
#include <string.h>

// Global instance
HostLink g_host_link;

// Static pointer for bus and log callbacks (since callbacks can't be member functions)
static HostLink* g_host_link_instance = nullptr;

// Longest line the link sends
#define HOST_LINK_OUTPUT_SIZE (RIG_LOG_LINE_SIZE + 8)

static bool equals_ignore_case(const char* a, const char* b) {
    while (*a != '\0' && *b != '\0') {
        if (toupper((unsigned char)*a) != toupper((unsigned char)*b)) {
            return false;
        }
        a++;
        b++;
    }
    return *a == '\0' && *b == '\0';
}

// Splits line in place on whitespace
static uint8_t tokenize(char* line, char* tokens[], uint8_t max_tokens) {
    uint8_t count = 0;
    char* p = line;
    while (*p != '\0' && count < max_tokens) {
        while (*p != '\0' && isspace((unsigned char)*p)) p++;
        if (*p == '\0') break;
        tokens[count++] = p;
        while (*p != '\0' && !isspace((unsigned char)*p)) p++;
        if (*p != '\0') {
            *p = '\0';
            p++;
        }
    }
    return count;
}

HostLink::HostLink() :
    port(nullptr),
    rig(nullptr),
    enabled(false),
    line_length(0),
    discarding_line(false),
    commands_processed(0),
    command_errors(0),
    line_overflows(0),
    events_sent(0)
{
    memset(line_buffer, 0, sizeof(line_buffer));
}

bool HostLink::init(Stream* stream, RigController* rig_controller) {
    if (stream == nullptr || rig_controller == nullptr) {
        rig_log_error("HostLink: Init failed - null port or rig");
        return false;
    }

    port = stream;
    rig = rig_controller;
    line_length = 0;
    discarding_line = false;
    reset_statistics();

    g_host_link_instance = this;
    g_message_bus.setGlobalBroadcastHandler(bus_message_trampoline);
    rig_log_set_sink(log_line_trampoline);

    enabled = true;
    rig_log_info("HostLink: Ready");
    return true;
}

void HostLink::shutdown() {
    if (g_host_link_instance == this) {
        g_message_bus.clearGlobalBroadcastHandler();
        rig_log_set_sink(nullptr);
        g_host_link_instance = nullptr;
    }
    enabled = false;
    port = nullptr;
    rig = nullptr;
}

void HostLink::update() {
    if (!enabled) {
        return;
    }
    process_incoming_bytes();
}

void HostLink::reset_statistics() {
    commands_processed = 0;
    command_errors = 0;
    line_overflows = 0;
    events_sent = 0;
}

// =============================================================================
// INPUT
// =============================================================================

void HostLink::process_incoming_bytes() {
    while (port->available() > 0) {
        int c = port->read();
        if (c < 0) {
            break;
        }

        if (c == '\r' || c == '\n') {
            if (discarding_line) {
                discarding_line = false;
                line_length = 0;
                reply_error("line too long");
                continue;
            }
            if (line_length > 0) {
                line_buffer[line_length] = '\0';
                line_length = 0;
                handle_line(line_buffer);
            }
            continue;
        }

        if (discarding_line) {
            continue;
        }

        if (line_length >= LINE_BUFFER_SIZE - 1) {
            line_overflows++;
            discarding_line = true;
            line_length = 0;
            continue;
        }

        line_buffer[line_length++] = (char)c;
    }
}

void HostLink::handle_line(const char* line) {
    if (line == nullptr || rig == nullptr) {
        return;
    }

    char work[LINE_BUFFER_SIZE];
    strncpy(work, line, sizeof(work) - 1);
    work[sizeof(work) - 1] = '\0';

    char* tokens[MAX_TOKENS];
    uint8_t token_count = tokenize(work, tokens, MAX_TOKENS);
    if (token_count == 0) {
        return;
    }

    commands_processed++;
    execute(tokens, token_count);
}

// =============================================================================
// COMMANDS
// =============================================================================

void HostLink::execute(char* tokens[], uint8_t token_count) {
    const char* command = tokens[0];

    if (equals_ignore_case(command, "CONNECT")) {
        connect_error_t result = rig->connect();
        if (result == CONNECT_OK) {
            reply_ok("CONNECT");
        } else {
            reply_error(connect_error_to_string(result));
        }
        return;
    }

    if (equals_ignore_case(command, "DISCONNECT")) {
        rig->disconnect();
        reply_ok("DISCONNECT");
        return;
    }

    if (equals_ignore_case(command, "PRESSURE")) {
        pressure_sample_t sample;
        if (rig->read_pressure(&sample)) {
            reply_ok("PRESSURE %.2f", sample.value);
        } else {
            reply_error("pressure read failed");
        }
        return;
    }

    if (equals_ignore_case(command, "SET")) {
        if (token_count != 3) {
            reply_error("usage: SET <actuator> <0|1>");
            return;
        }
        actuator_id_t actuator;
        if (!ActuatorController::actuator_from_name(tokens[1], &actuator)) {
            reply_error("unknown actuator");
            return;
        }
        bool on;
        if (rig->is_test_active()) {
            reply_error("test running");
            return;
        }
        if (strcmp(tokens[2], "1") == 0) {
            on = true;
        } else if (strcmp(tokens[2], "0") == 0) {
            on = false;
        } else {
            reply_error("state must be 0 or 1");
            return;
        }
        if (rig->send_actuator(actuator, on)) {
            reply_ok("SET %s %d", ActuatorController::actuator_name(actuator), on ? 1 : 0);
        } else {
            reply_error("actuator write failed");
        }
        return;
    }

    if (equals_ignore_case(command, "PULSE")) {
        if (token_count != 2) {
            reply_error("usage: PULSE <UP|DOWN>");
            return;
        }
        bool up;
        if (rig->is_test_active()) {
            reply_error("test running");
            return;
        }
        if (equals_ignore_case(tokens[1], "UP")) {
            up = true;
        } else if (equals_ignore_case(tokens[1], "DOWN")) {
            up = false;
        } else {
            reply_error("direction must be UP or DOWN");
            return;
        }
        if (rig->pulse_frequency(up)) {
            reply_ok("PULSE %s", up ? "UP" : "DOWN");
        } else {
            reply_error("pulse failed");
        }
        return;
    }

    if (equals_ignore_case(command, "TEST")) {
        if (token_count != 2) {
            reply_error("usage: TEST <FORWARD|REVERSE>");
            return;
        }
        test_profile_t profile;
        if (equals_ignore_case(tokens[1], "FORWARD")) {
            profile = TEST_PROFILE_FORWARD;
        } else if (equals_ignore_case(tokens[1], "REVERSE")) {
            profile = TEST_PROFILE_REVERSE;
        } else {
            reply_error("unknown profile");
            return;
        }
        uint32_t run_id = 0;
        seq_error_t result = rig->start_test(profile, &run_id);
        if (result == SEQ_OK) {
            reply_ok("TEST %lu", (unsigned long)run_id);
        } else {
            reply_error(seq_error_to_string(result));
        }
        return;
    }

    if (equals_ignore_case(command, "CANCEL")) {
        test_run_snapshot_t run = rig->get_test_snapshot();
        if (rig->is_test_active() && rig->request_cancel(run.run_id)) {
            reply_ok("CANCEL %lu", (unsigned long)run.run_id);
        } else {
            reply_error("no active test");
        }
        return;
    }

    if (equals_ignore_case(command, "STOP")) {
        rig->stop_all();
        reply_ok("STOP");
        return;
    }

    if (equals_ignore_case(command, "STATUS")) {
        test_run_snapshot_t run = rig->get_test_snapshot();
        char pressure_text[16];
        if (rig->has_last_pressure()) {
            snprintf(pressure_text, sizeof(pressure_text), "%.2f", rig->get_last_pressure());
        } else {
            snprintf(pressure_text, sizeof(pressure_text), "-");
        }
        reply_ok("STATUS link=%d run=%lu test=%s step=%u/%u mask=0x%02X pressure=%s",
                 rig->is_connected() ? 1 : 0,
                 (unsigned long)run.run_id,
                 test_status_to_string(run.status),
                 (unsigned)run.step_index, (unsigned)run.step_count,
                 (unsigned)rig->get_actuators().get_state_mask(),
                 pressure_text);
        return;
    }

    reply_error("unknown command");
}

// =============================================================================
// EVENTS
// =============================================================================

void HostLink::on_bus_message(const RigMessage* msg) {
    if (!enabled || msg == nullptr) {
        return;
    }

    switch (msg->id) {
        case MSG_LINK_STATE:
            send_line("LINK %u", (unsigned)MSG_UNPACK_UINT8(msg));
            break;

        case MSG_PRESSURE_LIVE:
            send_line("PRESSURE %.2f", MSG_UNPACK_PRESSURE_SAMPLE(msg)->value);
            break;

        case MSG_ACTUATOR_STATE: {
            const actuator_state_msg_t* state = MSG_UNPACK_ACTUATOR_STATE(msg);
            send_line("ACTUATOR %s %u",
                      ActuatorController::actuator_name((actuator_id_t)state->actuator),
                      (unsigned)state->on);
            break;
        }

        case MSG_ACTUATORS_RESET:
            send_line("RESET 0x%02X", (unsigned)MSG_UNPACK_ACTUATORS_RESET(msg)->state_mask);
            break;

        case MSG_TEST_PROGRESS: {
            const test_progress_msg_t* progress = MSG_UNPACK_TEST_PROGRESS(msg);
            send_line("PROGRESS %lu %u %.2f", (unsigned long)progress->run_id, (unsigned)progress->step_index,
                      progress->pressure);
            break;
        }

        case MSG_TEST_SUMMARY: {
            const test_summary_msg_t* summary = MSG_UNPACK_TEST_SUMMARY(msg);
            send_line("SUMMARY %.2f %.2f", summary->fixed_open_pressure,
                      summary->fixed_close_pressure);
            break;
        }

        case MSG_TEST_STATUS: {
            const test_status_msg_t* status = MSG_UNPACK_TEST_STATUS(msg);
            send_line("TEST %lu %s %s", (unsigned long)status->run_id,
                      test_status_to_string((test_status_t)status->status),
                      seq_failure_to_string((seq_failure_t)status->failure));
            break;
        }

        default:
            return;
    }

    events_sent++;
}

void HostLink::on_log_line(const char* line) {
    if (!enabled || line == nullptr) {
        return;
    }
    send_line("LOG %s", line);
}

// =============================================================================
// OUTPUT
// =============================================================================

void HostLink::send_line(const char* format, ...) {
    if (port == nullptr) {
        return;
    }

    char buffer[HOST_LINK_OUTPUT_SIZE];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    port->println(buffer);
}

void HostLink::reply_ok(const char* format, ...) {
    if (port == nullptr) {
        return;
    }

    char buffer[HOST_LINK_OUTPUT_SIZE];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    send_line("OK %s", buffer);
}

void HostLink::reply_error(const char* reason) {
    command_errors++;
    send_line("ERR %s", reason);
}

void HostLink::bus_message_trampoline(const RigMessage* msg) {
    if (g_host_link_instance != nullptr) {
        g_host_link_instance->on_bus_message(msg);
    }
}

void HostLink::log_line_trampoline(log_level_t level, const char* line) {
    (void)level;
    if (g_host_link_instance != nullptr) {
        g_host_link_instance->on_log_line(line);
    }
}
