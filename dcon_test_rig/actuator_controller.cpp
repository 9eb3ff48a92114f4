// actuator_controller.cpp
// Valve and pump outputs on the digital output module

#include "actuator_controller.h"
#include "dcon_codec.h"
#include "msg_bus.h"
#include "rig_log.h"
#include <ctype.h>
#include <string.h>

// Indexed by actuator_id_t
static const char* const ACTUATOR_NAMES[ACTUATOR_COUNT] = {
    "valve1",
    "valve2",
    "valve3",
    "valve4",
    "pumpStart",
    "pumpPlus",
    "pumpMinus"
};

// Write order for the baseline: trim outputs first, then valves, pump last
static const actuator_id_t BASELINE_ORDER[] = {
    ACTUATOR_PUMP_MINUS,
    ACTUATOR_PUMP_PLUS,
    ACTUATOR_VALVE1,
    ACTUATOR_VALVE2,
    ACTUATOR_VALVE3,
    ACTUATOR_VALVE4,
    ACTUATOR_PUMP_START
};

static const actuator_id_t SHUTDOWN_OFF_ORDER[] = {
    ACTUATOR_VALVE1,
    ACTUATOR_VALVE2,
    ACTUATOR_VALVE3,
    ACTUATOR_VALVE4,
    ACTUATOR_PUMP_START
};

ActuatorController::ActuatorController(DconTransport& transport_ref, const channel_map_t& channel_map) :
    transport(transport_ref),
    channels(channel_map),
    writes_ok(0),
    writes_failed(0)
{
    reset_model();
}

bool ActuatorController::set(actuator_id_t actuator, bool on) {
    if (actuator >= ACTUATOR_COUNT) {
        rig_log_error("Actuators: Unknown actuator %d", (int)actuator);
        return false;
    }

    char frame[DCON_MAX_FRAME_SIZE];
    dcon_result_t encoded = dcon_encode_write(channels.digital_module_id, channels.digital_address,
                                              channels.actuator_channels[actuator], on ? 1 : 0,
                                              frame, sizeof(frame));
    if (encoded != DCON_OK) {
        writes_failed++;
        rig_log_error("Actuators: Cannot build frame for %s: %s",
                      actuator_name(actuator), dcon_result_to_string(encoded));
        return false;
    }

    transport_error_t result = transport.exchange(frame, false, nullptr, 0);
    if (result != TRANSPORT_OK) {
        writes_failed++;
        rig_log_error("Actuators: %s %s failed: %s", actuator_name(actuator),
                      on ? "on" : "off", transport_error_to_string(result));
        return false;
    }

    writes_ok++;
    if (states[actuator] != on) {
        states[actuator] = on;
        rig_log_info("Actuators: %s %s", actuator_name(actuator), on ? "on" : "off");
    }
    publish_state(actuator, on);
    return true;
}

bool ActuatorController::get_state(actuator_id_t actuator) const {
    if (actuator >= ACTUATOR_COUNT) return false;
    return states[actuator];
}

uint8_t ActuatorController::get_state_mask() const {
    uint8_t mask = 0;
    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        if (states[i]) mask |= (uint8_t)(1 << i);
    }
    return mask;
}

// =============================================================================
// PULSES
// =============================================================================

bool ActuatorController::pulse(actuator_id_t actuator, uint32_t hold_ms) {
    if (actuator >= ACTUATOR_COUNT) {
        rig_log_error("Actuators: Unknown actuator %d", (int)actuator);
        return false;
    }
    if (pulse_active[actuator]) {
        rig_log_warning("Actuators: %s pulse already in progress", actuator_name(actuator));
        return false;
    }
    if (!set(actuator, true)) {
        return false;
    }

    pulse_active[actuator] = true;
    pulse_release_ms[actuator] = millis() + hold_ms;
    return true;
}

bool ActuatorController::is_pulse_active(actuator_id_t actuator) const {
    if (actuator >= ACTUATOR_COUNT) return false;
    return pulse_active[actuator];
}

void ActuatorController::update() {
    uint32_t now = millis();
    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        if (!pulse_active[i]) continue;
        if ((int32_t)(now - pulse_release_ms[i]) < 0) continue;

        // One release attempt; a failed release leaves the model showing "on"
        pulse_active[i] = false;
        set((actuator_id_t)i, false);
    }
}

// =============================================================================
// BASELINE AND SHUTDOWN
// =============================================================================

uint8_t ActuatorController::apply_baseline() {
    uint8_t failed = 0;
    for (uint8_t i = 0; i < sizeof(BASELINE_ORDER) / sizeof(BASELINE_ORDER[0]); i++) {
        pulse_active[BASELINE_ORDER[i]] = false;
        if (!set(BASELINE_ORDER[i], false)) {
            failed++;
        }
    }
    if (failed > 0) {
        rig_log_warning("Actuators: Baseline finished with %u failed writes", failed);
    }
    return failed;
}

uint8_t ActuatorController::apply_shutdown() {
    uint8_t failed = 0;

    // Pending pulses are superseded by the shutdown state
    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        pulse_active[i] = false;
    }

    for (uint8_t i = 0; i < sizeof(SHUTDOWN_OFF_ORDER) / sizeof(SHUTDOWN_OFF_ORDER[0]); i++) {
        if (!set(SHUTDOWN_OFF_ORDER[i], false)) {
            failed++;
        }
    }
    if (!set(ACTUATOR_PUMP_MINUS, true)) {
        failed++;
    }

    actuators_reset_msg_t reset;
    memset(&reset, 0, sizeof(reset));
    reset.state_mask = get_state_mask();
    reset.failed_writes = failed;
    g_message_bus.publish(MSG_ACTUATORS_RESET, &reset, sizeof(reset));

    if (failed > 0) {
        rig_log_warning("Actuators: Shutdown finished with %u failed writes", failed);
    } else {
        rig_log_info("Actuators: All processes stopped");
    }
    return failed;
}

void ActuatorController::reset_model() {
    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        states[i] = false;
        pulse_active[i] = false;
        pulse_release_ms[i] = 0;
    }
}

// =============================================================================
// NAMES
// =============================================================================

const char* ActuatorController::actuator_name(actuator_id_t actuator) {
    if (actuator >= ACTUATOR_COUNT) return "unknown";
    return ACTUATOR_NAMES[actuator];
}

bool ActuatorController::actuator_from_name(const char* name, actuator_id_t* actuator_out) {
    if (name == nullptr || actuator_out == nullptr) return false;

    for (uint8_t i = 0; i < ACTUATOR_COUNT; i++) {
        const char* candidate = ACTUATOR_NAMES[i];
        size_t j = 0;
        while (candidate[j] != '\0' && name[j] != '\0' &&
               tolower((unsigned char)candidate[j]) == tolower((unsigned char)name[j])) {
            j++;
        }
        if (candidate[j] == '\0' && name[j] == '\0') {
            *actuator_out = (actuator_id_t)i;
            return true;
        }
    }
    return false;
}

void ActuatorController::publish_state(actuator_id_t actuator, bool on) {
    actuator_state_msg_t state;
    memset(&state, 0, sizeof(state));
    state.actuator = (uint8_t)actuator;
    state.on = on ? 1 : 0;
    g_message_bus.publish(MSG_ACTUATOR_STATE, &state, sizeof(state));
}
