// dcon_transport.h
// Serial connection to the DCON modules
//
// ============================================================================
// TRANSPORT OVERVIEW
// ============================================================================
//
// One DconTransport owns the single RS-485 UART. Every command frame the rig
// sends goes through exchange(), which is the only place bytes touch the
// wire:
//
//   drain stale input → write frame → wait settle time → [read one line]
//
// The main loop is cooperative, so exchanges never overlap. A nested call
// (from a callback running inside an exchange) is refused with
// TRANSPORT_ERROR_BUSY rather than interleaving frames on the bus.
//
// If the link is closed, exchange() first reopens it with the last
// configuration passed to connect() or set_config(). Failures are logged and returned;
// nothing is retried.
//
// USAGE:
//
// DconTransport transport;
// transport.connect(RIG_DEFAULT_CONFIG.link);
// char response[DCON_MAX_RESPONSE_SIZE];
// transport.exchange("70170200\r", true, response, sizeof(response));
//
// ============================================================================

#ifndef DCON_TRANSPORT_H
#define DCON_TRANSPORT_H

#include <Arduino.h>
#include "rig_types.h"

typedef enum {
    CONNECT_OK = 0,
    CONNECT_ERROR_PORT_UNAVAILABLE,
    CONNECT_ERROR_INVALID_CONFIG
} connect_error_t;

typedef enum {
    TRANSPORT_OK = 0,
    TRANSPORT_ERROR_NOT_CONNECTED,
    TRANSPORT_ERROR_WRITE_FAILED,
    TRANSPORT_ERROR_READ_TIMEOUT,
    TRANSPORT_ERROR_BUSY
} transport_error_t;

#define DCON_DEFAULT_SETTLE_TIME_MS 100

// SERIAL_8N1 is 0 on some cores, so unsupported formats use a value no core defines
#define DCON_FORMAT_UNSUPPORTED 0xFFFF

class DconTransport {
public:
    DconTransport();

    // Open the link. A no-op returning CONNECT_OK when already open.
    connect_error_t connect(const link_config_t& config);

    // Reopen with the last known configuration
    connect_error_t connect();

    void disconnect();

    // Replace the stored configuration without opening the port.
    // Refused while connected.
    bool set_config(const link_config_t& config);

    // Send one frame and optionally read back one CR-terminated line into
    // response (always NUL-terminated on success)
    transport_error_t exchange(const char* frame, bool expect_response,
                               char* response, size_t response_size);

    // Status
    bool is_connected() const { return port != nullptr; }
    bool has_config() const { return config_valid; }
    bool is_busy() const { return in_exchange; }
    const link_config_t& get_config() const { return config; }

    void set_settle_time(uint32_t ms) { settle_time_ms = ms; }
    uint32_t get_settle_time() const { return settle_time_ms; }

    // Statistics
    uint32_t get_exchanges() const { return exchanges; }
    uint32_t get_write_failures() const { return write_failures; }
    uint32_t get_read_timeouts() const { return read_timeouts; }
    uint32_t get_reconnects() const { return reconnects; }
    uint32_t get_stale_bytes_dropped() const { return stale_bytes_dropped; }
    void reset_statistics();

    // Frame format constant (SERIAL_8N1 etc.) for a configuration
    static uint16_t serial_format_for(const link_config_t& config);

    // UART for a port number, nullptr if the board has no such port
    static HardwareSerial* resolve_port(uint8_t port_number);

private:
    HardwareSerial* port;
    link_config_t config;
    bool config_valid;
    bool in_exchange;
    uint32_t settle_time_ms;

    uint32_t exchanges;
    uint32_t write_failures;
    uint32_t read_timeouts;
    uint32_t reconnects;
    uint32_t stale_bytes_dropped;

    void drain_input();
    void publish_link_state(bool open);
};

const char* connect_error_to_string(connect_error_t error);
const char* transport_error_to_string(transport_error_t error);

#endif // DCON_TRANSPORT_H
