// pressure_reader.cpp
// Reads the line pressure from the analog input module

#include "pressure_reader.h"
#include "sensor_calibration.h"
#include "rig_config.h"
#include "rig_log.h"

PressureReader::PressureReader(DconTransport& transport_ref, const channel_map_t& channel_map,
                               const calibration_params_t& initial_calibration) :
    transport(transport_ref),
    channels(channel_map),
    calibration(initial_calibration),
    reads_ok(0),
    reads_failed(0),
    last_parse_result(DCON_OK),
    last_transport_error(TRANSPORT_OK)
{
    last_response[0] = '\0';
}

bool PressureReader::read_pressure(pressure_sample_t* sample_out, uint16_t step_index) {
    char frame[DCON_MAX_FRAME_SIZE];
    dcon_result_t encoded = dcon_encode_read(channels.analog_module_id, channels.analog_address,
                                             channels.analog_read_channel, frame, sizeof(frame));
    if (encoded != DCON_OK) {
        reads_failed++;
        rig_log_error("Pressure: Cannot build read frame: %s", dcon_result_to_string(encoded));
        return false;
    }

    last_transport_error = transport.exchange(frame, true, last_response, sizeof(last_response));
    if (last_transport_error != TRANSPORT_OK) {
        reads_failed++;
        last_response[0] = '\0';
        rig_log_error("Pressure: Read failed: %s", transport_error_to_string(last_transport_error));
        return false;
    }

    float raw = 0.0f;
    last_parse_result = dcon_decode_analog_response(last_response, channels.pressure_channel, &raw);
    if (last_parse_result != DCON_OK) {
        reads_failed++;
        rig_log_error("Pressure: Bad response \"%s\": %s",
                      last_response, dcon_result_to_string(last_parse_result));
        return false;
    }

    float pressure = calibrate_current_loop(&calibration, raw);
    if (!pressure_in_calibrated_range(&calibration, pressure)) {
        rig_log_warning("Pressure: %.2f outside calibrated range (raw %.3f mA)", pressure, raw);
    }

    if (sample_out != nullptr) {
        sample_out->step_index = step_index;
        sample_out->value = pressure;
        sample_out->timestamp_ms = millis();
    }

    reads_ok++;
    rig_log_debug("Pressure: %.2f (raw %.3f mA)", pressure, raw);
    return true;
}

bool PressureReader::set_calibration(const calibration_params_t& new_calibration) {
    if (!rig_validate_calibration(new_calibration)) {
        return false;
    }
    calibration = new_calibration;
    return true;
}
