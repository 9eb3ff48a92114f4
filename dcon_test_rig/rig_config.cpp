#include "rig_config.h"
#include "rig_log.h"

// =============================================================================
// BENCH RIG CONFIGURATION
// =============================================================================
const RigConfiguration RIG_DEFAULT_CONFIG = {
    .rig_name = "DCON Pump/Valve Test Rig",
    .firmware_version = "1.0.0",

    // RS-485 transceiver on Serial1 (pins 0/1), DE driven by the UART
    .link = {
        .port_number = 1,
        .baud_rate = 57600,
        .data_bits = 8,
        .stop_bits = 1,
        .parity = PARITY_NONE,
        .read_timeout_ms = 200
    },

    // I-7050 digital outputs at address 01, I-7017 analog inputs at address 02
    .channels = {
        .digital_module_id = 0x7050,
        .analog_module_id = 0x7017,
        .digital_address = 1,
        .analog_address = 2,
        .actuator_channels = {
            1,      // ACTUATOR_VALVE1
            4,      // ACTUATOR_VALVE2
            3,      // ACTUATOR_VALVE3
            2,      // ACTUATOR_VALVE4
            5,      // ACTUATOR_PUMP_START
            6,      // ACTUATOR_PUMP_PLUS
            7       // ACTUATOR_PUMP_MINUS
        },
        .analog_read_channel = 0,
        .pressure_channel = 5
    },

    // 4-20 mA transmitter, 0-6 bar, trimmed against the reference gauge
    .calibration = {
        .min_current_ma = 3.86f,
        .max_current_ma = 19.368f,
        .min_pressure = 0.0f,
        .max_pressure = 6.0f
    },

    .timing = {
        .plus_minus_time_ms = 100,
        .plus_step_time_ms = 1000,
        .minus_step_time_ms = 1000,
        .plus_step = 80,
        .minus_step = 40,
        .settle_time_ms = 100,
        .pre_ramp_settle_ms = 1000,
        .poll_interval_ms = 1000
    },

    .host_baud_rate = 115200,
    .enable_debug_output = false,
    .poll_pressure_on_startup = true
};

// =============================================================================
// VALIDATION
// =============================================================================

bool rig_validate_link_config(const link_config_t& link) {
    if (link.baud_rate == 0) {
        rig_log_error("Config: Baud rate must be non-zero");
        return false;
    }
    if (link.data_bits != 7 && link.data_bits != 8) {
        rig_log_error("Config: Unsupported data bits %u", link.data_bits);
        return false;
    }
    if (link.stop_bits != 1 && link.stop_bits != 2) {
        rig_log_error("Config: Unsupported stop bits %u", link.stop_bits);
        return false;
    }
    if (link.parity != PARITY_NONE && link.parity != PARITY_EVEN && link.parity != PARITY_ODD) {
        rig_log_error("Config: Unsupported parity");
        return false;
    }
    // 7-bit frames need parity; 8-bit frames with parity only take one stop bit
    if (link.data_bits == 7 && (link.parity == PARITY_NONE || link.stop_bits != 1)) {
        rig_log_error("Config: Unsupported frame format 7%c%u",
                      link.parity == PARITY_NONE ? 'N' : 'P', link.stop_bits);
        return false;
    }
    if (link.data_bits == 8 && link.parity != PARITY_NONE && link.stop_bits != 1) {
        rig_log_error("Config: Unsupported frame format 8P2");
        return false;
    }
    if (link.read_timeout_ms == 0) {
        rig_log_error("Config: Read timeout must be non-zero");
        return false;
    }
    return true;
}

bool rig_validate_calibration(const calibration_params_t& calibration) {
    if (!(calibration.max_current_ma > calibration.min_current_ma)) {
        rig_log_error("Config: Calibration max current %.3f must exceed min current %.3f",
                      calibration.max_current_ma, calibration.min_current_ma);
        return false;
    }
    return true;
}

bool rig_validate_timing(const timing_params_t& timing) {
    if (timing.plus_step < 1 || timing.plus_step > RIG_MAX_STEPS) {
        rig_log_error("Config: plusStep %u outside 1..%d", timing.plus_step, RIG_MAX_STEPS);
        return false;
    }
    if (timing.minus_step < 1 || timing.minus_step > RIG_MAX_STEPS) {
        rig_log_error("Config: minusStep %u outside 1..%d", timing.minus_step, RIG_MAX_STEPS);
        return false;
    }
    if (timing.poll_interval_ms == 0) {
        rig_log_error("Config: Poll interval must be non-zero");
        return false;
    }
    return true;
}

bool rig_validate_channel_map(const channel_map_t& channels) {
    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        for (uint8_t j = i + 1; j < ACTUATOR_COUNT; j++) {
            if (channels.actuator_channels[i] == channels.actuator_channels[j]) {
                rig_log_error("Config: Actuators %u and %u share output channel %u",
                              i, j, channels.actuator_channels[i]);
                return false;
            }
        }
    }
    if (channels.digital_address == channels.analog_address &&
        channels.digital_module_id == channels.analog_module_id) {
        rig_log_error("Config: Digital and analog modules share an address");
        return false;
    }
    return true;
}

bool rig_validate_configuration(const RigConfiguration& config) {
    return rig_validate_link_config(config.link) &&
           rig_validate_channel_map(config.channels) &&
           rig_validate_calibration(config.calibration) &&
           rig_validate_timing(config.timing);
}

void rig_print_configuration(const RigConfiguration& config) {
    const char parity_chars[] = {'N', 'E', 'O'};
    rig_log_info("%s v%s", config.rig_name, config.firmware_version);
    rig_log_info("Link: Serial%u %lu %u%c%u, timeout %lums",
                 config.link.port_number,
                 (unsigned long)config.link.baud_rate,
                 config.link.data_bits,
                 parity_chars[config.link.parity <= PARITY_ODD ? config.link.parity : 0],
                 config.link.stop_bits,
                 (unsigned long)config.link.read_timeout_ms);
    rig_log_info("Modules: digital %04X@%02X, analog %04X@%02X ch %u",
                 config.channels.digital_module_id, config.channels.digital_address,
                 config.channels.analog_module_id, config.channels.analog_address,
                 config.channels.pressure_channel);
    rig_log_info("Calibration: %.3f-%.3f mA -> %.2f-%.2f",
                 config.calibration.min_current_ma, config.calibration.max_current_ma,
                 config.calibration.min_pressure, config.calibration.max_pressure);
    rig_log_info("Timing: %u steps fwd, %u steps rev, settle %lums",
                 config.timing.plus_step, config.timing.minus_step,
                 (unsigned long)config.timing.settle_time_ms);
}
