// dcon_codec.h
// DCON ASCII frame encoding and response parsing
//
// Command frames are fixed-width uppercase hex fields terminated by CR:
//
//   write:  MMMM AA CC VV \r   (module id, address, channel, value) = 11 chars
//   read:   MMMM AA CC    \r   (module id, address, channel)        =  9 chars
//
// Analog responses are one line of whitespace-separated decimal tokens; the
// caller picks the token that carries the channel it wants.

#ifndef DCON_CODEC_H
#define DCON_CODEC_H

#include <stdint.h>
#include <stddef.h>

#define DCON_WRITE_FRAME_LENGTH 11
#define DCON_READ_FRAME_LENGTH  9
#define DCON_FRAME_TERMINATOR   '\r'

// Buffer large enough for any command frame plus the string terminator
#define DCON_MAX_FRAME_SIZE     (DCON_WRITE_FRAME_LENGTH + 1)

// Longest response line the rig reads back
#define DCON_MAX_RESPONSE_SIZE  96

typedef enum {
    DCON_OK = 0,

    // Encoding errors
    DCON_ERROR_VALUE_OUT_OF_RANGE,
    DCON_ERROR_BUFFER_TOO_SMALL,

    // Parse errors
    DCON_ERROR_EMPTY_RESPONSE,
    DCON_ERROR_TOO_FEW_TOKENS,
    DCON_ERROR_NOT_NUMERIC
} dcon_result_t;

// Encode a digital write command. out must hold DCON_WRITE_FRAME_LENGTH + 1.
dcon_result_t dcon_encode_write(uint32_t module_id, uint32_t device_address,
                                uint32_t channel, uint32_t value,
                                char* out, size_t out_size);

// Encode an analog read command. out must hold DCON_READ_FRAME_LENGTH + 1.
dcon_result_t dcon_encode_read(uint32_t module_id, uint32_t device_address,
                               uint32_t channel, char* out, size_t out_size);

// Extract the numeric token at channel_index from a response line
dcon_result_t dcon_decode_analog_response(const char* line, uint8_t channel_index,
                                          float* raw_out);

const char* dcon_result_to_string(dcon_result_t result);

#endif // DCON_CODEC_H
