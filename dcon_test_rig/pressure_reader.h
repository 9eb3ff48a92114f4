// pressure_reader.h
// Reads the line pressure from the analog input module
//
// One read is one DCON exchange: the analog read frame goes out, one line of
// channel readings comes back, the token at the pressure channel is turned
// into engineering units with the current-loop calibration.

#ifndef PRESSURE_READER_H
#define PRESSURE_READER_H

#include "rig_types.h"
#include "dcon_transport.h"
#include "dcon_codec.h"

class PressureReader {
public:
    PressureReader(DconTransport& transport, const channel_map_t& channels,
                   const calibration_params_t& calibration);

    // Take one reading. Returns false (and logs why) when no value could be
    // obtained; sample_out is only written on success.
    bool read_pressure(pressure_sample_t* sample_out, uint16_t step_index = 0);

    // Rejects parameters with max current not above min current
    bool set_calibration(const calibration_params_t& calibration);
    const calibration_params_t& get_calibration() const { return calibration; }

    // Diagnostics
    uint32_t get_reads_ok() const { return reads_ok; }
    uint32_t get_reads_failed() const { return reads_failed; }
    dcon_result_t get_last_parse_result() const { return last_parse_result; }
    transport_error_t get_last_transport_error() const { return last_transport_error; }
    const char* get_last_response() const { return last_response; }

private:
    DconTransport& transport;
    const channel_map_t& channels;
    calibration_params_t calibration;

    uint32_t reads_ok;
    uint32_t reads_failed;
    dcon_result_t last_parse_result;
    transport_error_t last_transport_error;
    char last_response[DCON_MAX_RESPONSE_SIZE];
};

#endif // PRESSURE_READER_H
