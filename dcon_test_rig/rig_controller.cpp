// rig_controller.cpp
// Rig controller implementation

#include "rig_controller.h"
#include "msg_bus.h"
#include "rig_log.h"
#include <string.h>

// Global instance
RigController g_rig_controller;

RigController::RigController() : RigController(RIG_DEFAULT_CONFIG) {
}

RigController::RigController(const RigConfiguration& initial_config) :
    config(initial_config),
    transport(),
    reader(transport, config.channels, config.calibration),
    actuators(transport, config.channels),
    sequencer(reader, actuators, config.timing),
    polling_enabled(initial_config.poll_pressure_on_startup),
    last_poll_ms(0),
    last_pressure(0.0f),
    last_pressure_valid(false),
    loop_count(0),
    last_loop_time_us(0)
{
    transport.set_settle_time(config.timing.settle_time_ms);
}

bool RigController::init() {
    rig_print_configuration(config);

    if (!rig_validate_configuration(config)) {
        rig_log_error("Rig: Configuration is invalid, rig disabled");
        return false;
    }

    transport.set_settle_time(config.timing.settle_time_ms);
    last_poll_ms = millis();
    return true;
}

void RigController::update() {
    uint32_t loop_start_us = micros();

    poll_pressure();
    actuators.update();
    sequencer.update();

    last_loop_time_us = micros() - loop_start_us;
    loop_count++;
}

// =============================================================================
// LINK
// =============================================================================

connect_error_t RigController::connect() {
    connect_error_t result = transport.connect(config.link);
    if (result == CONNECT_OK) {
        rig_log_info("Rig: Connected to COM port");
    } else {
        rig_log_error("Rig: COM port connection failed: %s", connect_error_to_string(result));
    }
    return result;
}

void RigController::disconnect() {
    transport.disconnect();
}

// =============================================================================
// MANUAL OPERATION
// =============================================================================

bool RigController::read_pressure(pressure_sample_t* sample_out) {
    pressure_sample_t sample;
    if (!reader.read_pressure(&sample, 0)) {
        return false;
    }

    last_pressure = sample.value;
    last_pressure_valid = true;
    rig_log_info("Current pressure: %.2f", sample.value);

    if (sample_out != nullptr) {
        *sample_out = sample;
    }
    return true;
}

bool RigController::send_actuator(const char* name, bool on) {
    actuator_id_t actuator;
    if (!ActuatorController::actuator_from_name(name, &actuator)) {
        rig_log_error("Rig: Unknown actuator \"%s\"", name != nullptr ? name : "");
        return false;
    }
    return send_actuator(actuator, on);
}

bool RigController::send_actuator(actuator_id_t actuator, bool on) {
    if (sequencer.is_active()) {
        rig_log_warning("Rig: Manual outputs are locked while a test is running");
        return false;
    }
    return actuators.set(actuator, on);
}

bool RigController::pulse_frequency(bool up) {
    if (sequencer.is_active()) {
        rig_log_warning("Rig: Manual outputs are locked while a test is running");
        return false;
    }

    actuator_id_t trim = up ? ACTUATOR_PUMP_PLUS : ACTUATOR_PUMP_MINUS;
    if (!actuators.pulse(trim, config.timing.plus_minus_time_ms)) {
        return false;
    }
    rig_log_info("Pump frequency %s", up ? "increased" : "decreased");
    return true;
}

// =============================================================================
// AUTOMATED TESTS
// =============================================================================

seq_error_t RigController::start_test(test_profile_t profile, uint32_t* run_id_out) {
    return sequencer.start(profile, run_id_out);
}

bool RigController::request_cancel(uint32_t run_id) {
    return sequencer.request_cancel(run_id);
}

void RigController::stop_all() {
    // Outputs go off now; the run notices the cancel at its next step
    if (sequencer.is_active()) {
        sequencer.request_cancel(sequencer.get_snapshot().run_id);
    }
    actuators.apply_shutdown();
}

// =============================================================================
// CONFIGURATION
// =============================================================================

bool RigController::set_link_config(const link_config_t& link) {
    if (transport.is_connected()) {
        rig_log_warning("Rig: Disconnect before changing the link configuration");
        return false;
    }
    // The transport keeps its own copy for the reconnect inside exchange()
    if (!transport.set_config(link)) {
        return false;
    }
    config.link = link;
    return true;
}

bool RigController::set_calibration(const calibration_params_t& calibration) {
    if (!reader.set_calibration(calibration)) {
        return false;
    }
    config.calibration = calibration;
    return true;
}

bool RigController::set_timing(const timing_params_t& timing) {
    if (!sequencer.set_timing(timing)) {
        return false;
    }
    config.timing = timing;
    transport.set_settle_time(timing.settle_time_ms);
    return true;
}

// =============================================================================
// PRESSURE POLLER
// =============================================================================

void RigController::poll_pressure() {
    if (!polling_enabled || !transport.is_connected()) {
        return;
    }

    uint32_t now = millis();
    if (now - last_poll_ms < config.timing.poll_interval_ms) {
        return;
    }
    last_poll_ms = now;

    pressure_sample_t sample;
    if (!reader.read_pressure(&sample, 0)) {
        return;
    }

    last_pressure = sample.value;
    last_pressure_valid = true;

    pressure_sample_msg_t live;
    memset(&live, 0, sizeof(live));
    live.value = sample.value;
    live.step_index = 0;
    g_message_bus.publish(MSG_PRESSURE_LIVE, &live, sizeof(live));
}
