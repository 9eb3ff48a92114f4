// msg_definitions.h
// Message definitions for the DCON test rig event bus
//
// Every event leaving the rig core (pressure samples, sequence progress,
// summaries, actuator states) travels as a fixed-size message so that the
// bus queue holds immutable copies and never shares state with the sender.

#ifndef MSG_DEFINITIONS_H
#define MSG_DEFINITIONS_H

#include <stdint.h>

#define RIG_MSG_MAX_PAYLOAD 12

// Rig message structure (same layout on target and desktop)
typedef struct {
    uint32_t id;          // Message ID
    uint8_t len;          // Data length (0-RIG_MSG_MAX_PAYLOAD bytes)
    uint8_t buf[RIG_MSG_MAX_PAYLOAD];  // Data payload
    uint32_t timestamp;   // millis() when published
} RigMessage;

// =============================================================================
// MESSAGE ID ARCHITECTURE
// =============================================================================

// Message ID Structure: [SUBSYSTEM(8)] [PARAMETER(16)]
#define SUBSYSTEM_MASK          0x00FF0000  // Subsystem identifier (8 bits)
#define PARAMETER_MASK          0x0000FFFF  // Parameter identifier (16 bits)

// Subsystem Identifiers
#define SUBSYSTEM_LINK          0x00010000  // Serial link to the DCON modules
#define SUBSYSTEM_PRESSURE      0x00020000  // Pressure readings
#define SUBSYSTEM_ACTUATORS     0x00030000  // Valves and pump outputs
#define SUBSYSTEM_SEQUENCER     0x00040000  // Automated test sequencer

#define MAKE_MSG_ID(subsystem, parameter) \
    ((subsystem) | ((parameter) & PARAMETER_MASK))


// =============================================================================
// EVENT MESSAGE DEFINITIONS
// =============================================================================

// Link state changed (uint8: 1 = open, 0 = closed)
#define MSG_LINK_STATE          MAKE_MSG_ID(SUBSYSTEM_LINK, 0x01)

// Live pressure from the periodic poller (pressure_sample_msg_t)
#define MSG_PRESSURE_LIVE       MAKE_MSG_ID(SUBSYSTEM_PRESSURE, 0x01)

// Single actuator changed state (actuator_state_msg_t)
#define MSG_ACTUATOR_STATE      MAKE_MSG_ID(SUBSYSTEM_ACTUATORS, 0x01)
// All actuators forced to their shutdown state (actuators_reset_msg_t)
#define MSG_ACTUATORS_RESET     MAKE_MSG_ID(SUBSYSTEM_ACTUATORS, 0x02)

// Sequencer events
#define MSG_TEST_PROGRESS       MAKE_MSG_ID(SUBSYSTEM_SEQUENCER, 0x01)  // test_progress_msg_t
#define MSG_TEST_SUMMARY        MAKE_MSG_ID(SUBSYSTEM_SEQUENCER, 0x02)  // test_summary_msg_t
#define MSG_TEST_STATUS         MAKE_MSG_ID(SUBSYSTEM_SEQUENCER, 0x03)  // test_status_msg_t

// =============================================================================
// MESSAGE PAYLOADS
// =============================================================================

typedef struct {
    float value;                // Pressure (engineering units)
    uint16_t step_index;        // Step index (0 for live readings)
    uint8_t reserved[2];
} __attribute__((packed)) pressure_sample_msg_t;

typedef struct {
    uint8_t actuator;           // actuator_id_t
    uint8_t on;                 // 1 = energized
    uint8_t reserved[6];
} __attribute__((packed)) actuator_state_msg_t;

typedef struct {
    uint8_t state_mask;         // Bit n set = actuator n energized
    uint8_t failed_writes;      // Writes that failed during shutdown
    uint8_t reserved[6];
} __attribute__((packed)) actuators_reset_msg_t;

typedef struct {
    uint32_t run_id;            // Same id as MSG_TEST_STATUS
    uint16_t step_index;        // Step that produced the sample
    float pressure;             // Sampled pressure
} __attribute__((packed)) test_progress_msg_t;

typedef struct {
    float fixed_open_pressure;  // Max pressure seen in the forward run
    float fixed_close_pressure; // Recorded by the reverse profile (0 if never run)
} __attribute__((packed)) test_summary_msg_t;

typedef struct {
    uint32_t run_id;
    uint8_t profile;            // test_profile_t
    uint8_t status;             // test_status_t
    uint8_t failure;            // seq_failure_t
    uint8_t reserved;
} __attribute__((packed)) test_status_msg_t;

// =============================================================================
// PACK/UNPACK HELPERS
// =============================================================================

#define MSG_UNPACK_UINT8(msg) ((msg)->buf[0])

#define MSG_UNPACK_PRESSURE_SAMPLE(msg) ((const pressure_sample_msg_t*)(msg)->buf)
#define MSG_UNPACK_ACTUATOR_STATE(msg) ((const actuator_state_msg_t*)(msg)->buf)
#define MSG_UNPACK_ACTUATORS_RESET(msg) ((const actuators_reset_msg_t*)(msg)->buf)
#define MSG_UNPACK_TEST_PROGRESS(msg) ((const test_progress_msg_t*)(msg)->buf)
#define MSG_UNPACK_TEST_SUMMARY(msg) ((const test_summary_msg_t*)(msg)->buf)
#define MSG_UNPACK_TEST_STATUS(msg) ((const test_status_msg_t*)(msg)->buf)

// Message handler function pointer type
typedef void (*MessageHandler)(const RigMessage* msg);

#endif // MSG_DEFINITIONS_H
