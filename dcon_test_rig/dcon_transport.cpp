// dcon_transport.cpp
// Serial connection to the DCON modules

#include "dcon_transport.h"
#include "dcon_codec.h"
#include "msg_bus.h"
#include "rig_config.h"
#include "rig_log.h"
#include <string.h>

static bool same_link_config(const link_config_t& a, const link_config_t& b) {
    return a.port_number == b.port_number &&
           a.baud_rate == b.baud_rate &&
           a.data_bits == b.data_bits &&
           a.stop_bits == b.stop_bits &&
           a.parity == b.parity &&
           a.read_timeout_ms == b.read_timeout_ms;
}

DconTransport::DconTransport() :
    port(nullptr),
    config_valid(false),
    in_exchange(false),
    settle_time_ms(DCON_DEFAULT_SETTLE_TIME_MS),
    exchanges(0),
    write_failures(0),
    read_timeouts(0),
    reconnects(0),
    stale_bytes_dropped(0)
{
    memset(&config, 0, sizeof(config));
}

// =============================================================================
// CONNECTION MANAGEMENT
// =============================================================================

connect_error_t DconTransport::connect(const link_config_t& new_config) {
    if (port != nullptr) {
        if (!same_link_config(new_config, config)) {
            rig_log_warning("Transport: Already connected on Serial%u, new configuration ignored",
                            config.port_number);
        }
        return CONNECT_OK;
    }

    if (!rig_validate_link_config(new_config)) {
        rig_log_error("Transport: Connect refused, invalid link configuration");
        return CONNECT_ERROR_INVALID_CONFIG;
    }

    uint16_t format = serial_format_for(new_config);
    if (format == DCON_FORMAT_UNSUPPORTED) {
        rig_log_error("Transport: Connect refused, unsupported frame format");
        return CONNECT_ERROR_INVALID_CONFIG;
    }

    // Remembered even when the port is missing so a later connect() retries it
    config = new_config;
    config_valid = true;

    HardwareSerial* uart = resolve_port(new_config.port_number);
    if (uart == nullptr) {
        rig_log_error("Transport: Serial%u is not available", new_config.port_number);
        return CONNECT_ERROR_PORT_UNAVAILABLE;
    }

    uart->begin(new_config.baud_rate, format);
    uart->setTimeout(new_config.read_timeout_ms);
    port = uart;

    rig_log_info("Transport: Connected on Serial%u at %lu baud",
                 new_config.port_number, (unsigned long)new_config.baud_rate);
    publish_link_state(true);

    return CONNECT_OK;
}

bool DconTransport::set_config(const link_config_t& new_config) {
    if (port != nullptr) {
        rig_log_warning("Transport: Disconnect before changing the link configuration");
        return false;
    }
    if (!rig_validate_link_config(new_config) ||
        serial_format_for(new_config) == DCON_FORMAT_UNSUPPORTED) {
        rig_log_error("Transport: Invalid link configuration");
        return false;
    }

    config = new_config;
    config_valid = true;
    return true;
}

connect_error_t DconTransport::connect() {
    if (!config_valid) {
        rig_log_error("Transport: No previous link configuration to reconnect with");
        return CONNECT_ERROR_INVALID_CONFIG;
    }
    link_config_t last = config;
    return connect(last);
}

void DconTransport::disconnect() {
    if (port == nullptr) {
        return;
    }

    port->end();
    port = nullptr;

    rig_log_info("Transport: Disconnected from Serial%u", config.port_number);
    publish_link_state(false);
}

// =============================================================================
// EXCHANGE
// =============================================================================

transport_error_t DconTransport::exchange(const char* frame, bool expect_response,
                                          char* response, size_t response_size) {
    if (in_exchange) {
        rig_log_error("Transport: Exchange refused, another exchange is in progress");
        return TRANSPORT_ERROR_BUSY;
    }
    if (frame == nullptr || (expect_response && (response == nullptr || response_size < 2))) {
        rig_log_error("Transport: Exchange called without a frame or response buffer");
        return TRANSPORT_ERROR_WRITE_FAILED;
    }

    in_exchange = true;

    if (port == nullptr) {
        if (!config_valid || connect() != CONNECT_OK) {
            rig_log_error("Transport: Not connected");
            in_exchange = false;
            return TRANSPORT_ERROR_NOT_CONNECTED;
        }
        reconnects++;
    }

    exchanges++;

    // Anything still waiting belongs to an earlier command
    drain_input();

    size_t length = strlen(frame);
    size_t written = port->write((const uint8_t*)frame, length);
    if (written != length) {
        write_failures++;
        rig_log_error("Transport: Short write (%u of %u bytes)",
                      (unsigned)written, (unsigned)length);
        in_exchange = false;
        return TRANSPORT_ERROR_WRITE_FAILED;
    }
    port->flush();

    delay(settle_time_ms);

    if (!expect_response) {
        in_exchange = false;
        return TRANSPORT_OK;
    }

    port->setTimeout(config.read_timeout_ms);
    size_t received = port->readBytesUntil(DCON_FRAME_TERMINATOR, response, response_size - 1);
    response[received] = '\0';

    if (received == 0) {
        read_timeouts++;
        rig_log_error("Transport: No response within %lums",
                      (unsigned long)config.read_timeout_ms);
        in_exchange = false;
        return TRANSPORT_ERROR_READ_TIMEOUT;
    }

    in_exchange = false;
    return TRANSPORT_OK;
}

// =============================================================================
// HELPERS
// =============================================================================

void DconTransport::drain_input() {
    while (port->available() > 0) {
        port->read();
        stale_bytes_dropped++;
    }
}

void DconTransport::publish_link_state(bool open) {
    g_message_bus.publishUint8(MSG_LINK_STATE, open ? 1 : 0);
}

void DconTransport::reset_statistics() {
    exchanges = 0;
    write_failures = 0;
    read_timeouts = 0;
    reconnects = 0;
    stale_bytes_dropped = 0;
}

uint16_t DconTransport::serial_format_for(const link_config_t& link) {
    if (link.data_bits == 8) {
        if (link.parity == PARITY_NONE) {
            return link.stop_bits == 2 ? SERIAL_8N2 : SERIAL_8N1;
        }
        if (link.stop_bits != 1) return DCON_FORMAT_UNSUPPORTED;
        return link.parity == PARITY_EVEN ? SERIAL_8E1 : SERIAL_8O1;
    }
    if (link.data_bits == 7 && link.stop_bits == 1) {
        if (link.parity == PARITY_EVEN) return SERIAL_7E1;
        if (link.parity == PARITY_ODD) return SERIAL_7O1;
    }
    return DCON_FORMAT_UNSUPPORTED;
}

HardwareSerial* DconTransport::resolve_port(uint8_t port_number) {
    switch (port_number) {
        case 1: return &Serial1;
        case 2: return &Serial2;
        default: return nullptr;
    }
}

const char* connect_error_to_string(connect_error_t error) {
    switch (error) {
        case CONNECT_OK:                     return "OK";
        case CONNECT_ERROR_PORT_UNAVAILABLE: return "port unavailable";
        case CONNECT_ERROR_INVALID_CONFIG:   return "invalid link configuration";
        default:                             return "unknown";
    }
}

const char* transport_error_to_string(transport_error_t error) {
    switch (error) {
        case TRANSPORT_OK:                  return "OK";
        case TRANSPORT_ERROR_NOT_CONNECTED: return "not connected";
        case TRANSPORT_ERROR_WRITE_FAILED:  return "write failed";
        case TRANSPORT_ERROR_READ_TIMEOUT:  return "read timeout";
        case TRANSPORT_ERROR_BUSY:          return "transport busy";
        default:                            return "unknown";
    }
}
