// sensor_calibration.h
// Current-loop pressure calibration
//
// Separated so it's easy to modify calibration without touching the reader.

#ifndef SENSOR_CALIBRATION_H
#define SENSOR_CALIBRATION_H

#include "rig_types.h"

// =============================================================================
// CALIBRATION FUNCTIONS
// =============================================================================

// Linear current-loop calibration:
//   min_pressure + |raw - min_current| * (max_pressure - min_pressure) / (max_current - min_current)
// rounded to 2 decimals. Readings below min_current fold back upwards, so the
// result never drops below min_pressure.
float calibrate_current_loop(const calibration_params_t* params, float raw_current_ma);

// =============================================================================
// UTILITY FUNCTIONS
// =============================================================================

// True when a calibrated value lies within [min_pressure, max_pressure]
bool pressure_in_calibrated_range(const calibration_params_t* params, float pressure);

#endif
