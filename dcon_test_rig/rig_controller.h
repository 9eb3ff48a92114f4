// rig_controller.h
// Rig controller - coordinates transport, reader, actuators and sequencer

#ifndef RIG_CONTROLLER_H
#define RIG_CONTROLLER_H

#include <stdint.h>
#include "rig_config.h"
#include "dcon_transport.h"
#include "pressure_reader.h"
#include "actuator_controller.h"
#include "test_sequencer.h"

class RigController {
public:
    RigController();
    explicit RigController(const RigConfiguration& config);

    // Validate configuration and print it. Returns false on invalid config.
    bool init();

    // Poll pressure, release pulses, advance the sequencer (call from loop)
    void update();

    // Link
    connect_error_t connect();
    void disconnect();
    bool is_connected() const { return transport.is_connected(); }

    // Manual operation
    bool read_pressure(pressure_sample_t* sample_out);
    bool send_actuator(const char* name, bool on);
    bool send_actuator(actuator_id_t actuator, bool on);
    bool pulse_frequency(bool up);

    // Automated tests
    seq_error_t start_test(test_profile_t profile, uint32_t* run_id_out = nullptr);
    bool request_cancel(uint32_t run_id);
    bool is_test_active() const { return sequencer.is_active(); }
    test_run_snapshot_t get_test_snapshot() const { return sequencer.get_snapshot(); }

    // Stop button: cancel any active run and put the rig in its shutdown state
    void stop_all();

    // Configuration (link refused while connected, timing while a test runs)
    bool set_link_config(const link_config_t& link);
    bool set_calibration(const calibration_params_t& calibration);
    bool set_timing(const timing_params_t& timing);
    const RigConfiguration& get_config() const { return config; }

    void set_polling_enabled(bool enabled) { polling_enabled = enabled; }
    bool is_polling_enabled() const { return polling_enabled; }

    // Last good reading from any source
    bool has_last_pressure() const { return last_pressure_valid; }
    float get_last_pressure() const { return last_pressure; }

    // Diagnostics
    uint32_t get_loop_count() const { return loop_count; }
    uint32_t get_last_loop_time() const { return last_loop_time_us; }

    // Subsystem access
    DconTransport& get_transport() { return transport; }
    PressureReader& get_reader() { return reader; }
    ActuatorController& get_actuators() { return actuators; }
    TestSequencer& get_sequencer() { return sequencer; }

private:
    // Declared first: the subsystems below hold references into it
    RigConfiguration config;

    DconTransport transport;
    PressureReader reader;
    ActuatorController actuators;
    TestSequencer sequencer;

    bool polling_enabled;
    uint32_t last_poll_ms;
    float last_pressure;
    bool last_pressure_valid;

    uint32_t loop_count;
    uint32_t last_loop_time_us;

    void poll_pressure();
};

// Global instance
extern RigController g_rig_controller;

#endif
