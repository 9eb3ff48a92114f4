// actuator_controller.h
// Valve and pump outputs on the digital output module
//
// The controller keeps the only authoritative on/off model of every output.
// A state changes only after its write exchange succeeded, so the model and
// the module never disagree because of a lost frame. Every change is
// published as MSG_ACTUATOR_STATE; the panel just mirrors those events.

#ifndef ACTUATOR_CONTROLLER_H
#define ACTUATOR_CONTROLLER_H

#include "rig_types.h"
#include "dcon_transport.h"

class ActuatorController {
public:
    ActuatorController(DconTransport& transport, const channel_map_t& channels);

    // Write one output. On failure the model is left untouched.
    bool set(actuator_id_t actuator, bool on);

    bool get_state(actuator_id_t actuator) const;

    // Bit n set = actuator n energized
    uint8_t get_state_mask() const;

    // Momentary contact: energize now, release from update() after hold_ms
    bool pulse(actuator_id_t actuator, uint32_t hold_ms);
    bool is_pulse_active(actuator_id_t actuator) const;

    // Release pulses whose hold time has elapsed (call from main loop)
    void update();

    // Everything off, pump trim first. Returns the number of failed writes.
    uint8_t apply_baseline();

    // Valves and pump off, pump trimmed down. Publishes MSG_ACTUATORS_RESET.
    // Returns the number of failed writes.
    uint8_t apply_shutdown();

    // Forget the model (after the link was reopened the outputs are unknown)
    void reset_model();

    // Names used on the host link
    static const char* actuator_name(actuator_id_t actuator);
    static bool actuator_from_name(const char* name, actuator_id_t* actuator_out);

    // Statistics
    uint32_t get_writes_ok() const { return writes_ok; }
    uint32_t get_writes_failed() const { return writes_failed; }

private:
    DconTransport& transport;
    const channel_map_t& channels;

    bool states[ACTUATOR_COUNT];
    bool pulse_active[ACTUATOR_COUNT];
    uint32_t pulse_release_ms[ACTUATOR_COUNT];

    uint32_t writes_ok;
    uint32_t writes_failed;

    void publish_state(actuator_id_t actuator, bool on);
};

#endif // ACTUATOR_CONTROLLER_H
