// sensor_calibration.cpp
// Current-loop pressure calibration implementation

#include "sensor_calibration.h"
#include <math.h>

// =============================================================================
// CALIBRATION FUNCTIONS
// =============================================================================

float calibrate_current_loop(const calibration_params_t* params, float raw_current_ma) {
    if (params == nullptr) return 0.0f;

    double current_span = (double)params->max_current_ma - (double)params->min_current_ma;
    if (current_span <= 0.0) {
        return params->min_pressure;
    }

    double pressure_span = (double)params->max_pressure - (double)params->min_pressure;
    double offset = fabs((double)raw_current_ma - (double)params->min_current_ma);
    double pressure = (double)params->min_pressure + offset * pressure_span / current_span;

    return (float)(round(pressure * 100.0) / 100.0);
}

// =============================================================================
// UTILITY FUNCTIONS
// =============================================================================

bool pressure_in_calibrated_range(const calibration_params_t* params, float pressure) {
    if (params == nullptr || isnan(pressure)) return false;
    return pressure >= params->min_pressure && pressure <= params->max_pressure;
}
