// host_link.h
// Line-oriented text protocol between the rig and the operator's PC
//
// ============================================================================
// HOST LINK OVERVIEW
// ============================================================================
//
// The PC (or a plain terminal) talks to the rig over USB Serial. Every
// request is one line; every reply is one line starting with OK or ERR.
// Events from the rig core are pushed as unsolicited lines.
//
//   Operator PC  ←→  USB Serial  ←→  HostLink  ←→  RigController
//                                        ↑
//                         Message bus (global broadcast) + rig log sink
//
// COMMANDS (case-insensitive, CR or LF terminated):
//
//   CONNECT                      open the DCON link
//   DISCONNECT                   close the DCON link
//   PRESSURE                     read the pressure once
//   SET <actuator> <0|1>         valve1..valve4, pumpStart, pumpPlus, pumpMinus
//   PULSE <UP|DOWN>              momentary pump frequency trim
//   TEST <FORWARD|REVERSE>       start an automated test
//   CANCEL                       cancel the active test
//   STOP                         stop everything
//   STATUS                       one-line summary of the rig
//
// EVENTS:
//
//   LOG <line>                   PRESSURE <value>
//   PROGRESS <run> <step> <value>
//   SUMMARY <open> <close>       ACTUATOR <name> <0|1>
//   RESET <mask>                 TEST <run> <status> <reason>
//   LINK <0|1>
//
// ============================================================================

#ifndef HOST_LINK_H
#define HOST_LINK_H

#include <Arduino.h>
#include "msg_definitions.h"
#include "rig_log.h"

class RigController;

class HostLink {
public:
    HostLink();

    // Attach to a port and a rig. Registers the bus broadcast handler and
    // the log sink.
    bool init(Stream* port, RigController* rig);
    void shutdown();

    // Read and execute pending input (call from main loop)
    void update();

    // Execute one command line (without terminator)
    void handle_line(const char* line);

    // Bus and log forwarding
    void on_bus_message(const RigMessage* msg);
    void on_log_line(const char* line);

    // Status and statistics
    bool is_enabled() const { return enabled; }
    uint32_t get_commands_processed() const { return commands_processed; }
    uint32_t get_command_errors() const { return command_errors; }
    uint32_t get_line_overflows() const { return line_overflows; }
    uint32_t get_events_sent() const { return events_sent; }
    void reset_statistics();

    static const uint8_t LINE_BUFFER_SIZE = 96;
    static const uint8_t MAX_TOKENS = 4;

private:
    Stream* port;
    RigController* rig;
    bool enabled;

    char line_buffer[LINE_BUFFER_SIZE];
    uint8_t line_length;
    bool discarding_line;

    uint32_t commands_processed;
    uint32_t command_errors;
    uint32_t line_overflows;
    uint32_t events_sent;

    void process_incoming_bytes();
    void execute(char* tokens[], uint8_t token_count);

    void send_line(const char* format, ...) __attribute__((format(printf, 2, 3)));
    void reply_ok(const char* format, ...) __attribute__((format(printf, 2, 3)));
    void reply_error(const char* reason);

    // Static trampolines (bus and log callbacks can't be member functions)
    static void bus_message_trampoline(const RigMessage* msg);
    static void log_line_trampoline(log_level_t level, const char* line);
};

// Global instance
extern HostLink g_host_link;

#endif // HOST_LINK_H
