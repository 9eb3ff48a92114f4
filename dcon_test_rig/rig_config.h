#ifndef RIG_CONFIG_H
#define RIG_CONFIG_H

#include <stdint.h>
#include "rig_types.h"

// =============================================================================
// COMPLETE RIG CONFIGURATION
// =============================================================================
struct RigConfiguration {
    char rig_name[32];
    char firmware_version[16];

    link_config_t link;
    channel_map_t channels;
    calibration_params_t calibration;
    timing_params_t timing;

    // Host link (USB serial to the operator's PC)
    uint32_t host_baud_rate;
    bool enable_debug_output;
    bool poll_pressure_on_startup;
};

// Largest step count a test profile may use
#define RIG_MAX_STEPS 200

// =============================================================================
// CONFIGURATION PRESETS
// =============================================================================
// Bench rig as wired: Serial1 RS-485, I-7050 at address 1, I-7017 at address 2
extern const RigConfiguration RIG_DEFAULT_CONFIG;

// =============================================================================
// VALIDATION
// =============================================================================
bool rig_validate_link_config(const link_config_t& link);
bool rig_validate_calibration(const calibration_params_t& calibration);
bool rig_validate_timing(const timing_params_t& timing);
bool rig_validate_channel_map(const channel_map_t& channels);
bool rig_validate_configuration(const RigConfiguration& config);

// Logs a short summary of the configuration
void rig_print_configuration(const RigConfiguration& config);

#endif
