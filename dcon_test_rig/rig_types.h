// rig_types.h
// Core data structures for the DCON test rig
//
// This file contains only the type definitions and structures.
// Keep it small and focused on data layout.

#ifndef RIG_TYPES_H
#define RIG_TYPES_H

#include <stdint.h>

// =============================================================================
// SERIAL LINK
// =============================================================================

typedef enum {
    PARITY_NONE = 0,
    PARITY_EVEN,
    PARITY_ODD
} link_parity_t;

// Serial link parameters. Immutable while the link is open.
typedef struct {
    uint8_t port_number;        // Hardware UART: 1 = Serial1, 2 = Serial2
    uint32_t baud_rate;         // Bits per second
    uint8_t data_bits;          // 7 or 8
    uint8_t stop_bits;          // 1 or 2
    link_parity_t parity;
    uint32_t read_timeout_ms;   // Max wait for a response line
} link_config_t;

// =============================================================================
// ACTUATORS AND CHANNEL MAP
// =============================================================================

typedef enum {
    ACTUATOR_VALVE1 = 0,        // To valve, forward path
    ACTUATOR_VALVE2,            // To valve, reverse path
    ACTUATOR_VALVE3,            // From valve, forward path
    ACTUATOR_VALVE4,            // From valve, reverse path
    ACTUATOR_PUMP_START,        // Pump run/stop
    ACTUATOR_PUMP_PLUS,         // Pump frequency increase (momentary)
    ACTUATOR_PUMP_MINUS,        // Pump frequency decrease (momentary)
    ACTUATOR_COUNT              // Keep this last
} actuator_id_t;

// Fixed addressing of the rig hardware on the DCON bus
typedef struct {
    uint16_t digital_module_id;         // Digital output module (I-7050 class)
    uint16_t analog_module_id;          // Analog input module (I-7017/7019 class)
    uint8_t digital_address;            // Bus address of the digital module
    uint8_t analog_address;             // Bus address of the analog module
    uint8_t actuator_channels[ACTUATOR_COUNT];  // Output channel per actuator
    uint8_t analog_read_channel;        // Channel field of the read command
    uint8_t pressure_channel;           // Token index of pressure in the response
} channel_map_t;

// =============================================================================
// CALIBRATION AND TIMING
// =============================================================================

// Linear map from current-loop reading (mA) to pressure.
// Invariant: max_current_ma > min_current_ma
typedef struct {
    float min_current_ma;
    float max_current_ma;
    float min_pressure;
    float max_pressure;
} calibration_params_t;

typedef struct {
    uint32_t plus_minus_time_ms;    // Hold time of a frequency trim pulse
    uint32_t plus_step_time_ms;     // Forward ramp: wait after each step
    uint32_t minus_step_time_ms;    // Reverse ramp: wait after each step
    uint16_t plus_step;             // Forward test step count
    uint16_t minus_step;            // Reverse test step count
    uint32_t settle_time_ms;        // Device turnaround after every write
    uint32_t pre_ramp_settle_ms;    // Wait after pump/valves on, before step 0
    uint32_t poll_interval_ms;      // Live pressure poller period
} timing_params_t;

// =============================================================================
// SAMPLES AND TEST RUNS
// =============================================================================

typedef struct {
    uint16_t step_index;
    float value;
    uint32_t timestamp_ms;
} pressure_sample_t;

typedef enum {
    TEST_PROFILE_FORWARD = 0,
    TEST_PROFILE_REVERSE,
    TEST_PROFILE_COUNT          // Keep this last
} test_profile_t;

typedef enum {
    TEST_STATUS_IDLE = 0,
    TEST_STATUS_RUNNING,
    TEST_STATUS_CANCELLING,
    TEST_STATUS_COMPLETED,
    TEST_STATUS_FAILED
} test_status_t;

typedef enum {
    SEQ_FAILURE_NONE = 0,
    SEQ_FAILURE_NO_SAMPLES_COLLECTED
} seq_failure_t;

// Copy of a test run handed to readers
typedef struct {
    uint32_t run_id;
    test_profile_t profile;
    test_status_t status;
    seq_failure_t failure;
    uint16_t step_count;
    uint16_t step_index;
    uint16_t samples_collected;
    float fixed_open_pressure;
    float fixed_close_pressure;
    bool cancel_requested;
} test_run_snapshot_t;

#endif // RIG_TYPES_H
