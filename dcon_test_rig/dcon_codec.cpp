// dcon_codec.cpp
// DCON ASCII frame encoding and response parsing

#include "dcon_codec.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <math.h>

// =============================================================================
// PRIVATE HELPERS
// =============================================================================

static const char HEX_DIGITS[] = "0123456789ABCDEF";

// Writes value as `digits` uppercase hex characters, most significant first
static void put_hex(char* out, uint32_t value, uint8_t digits) {
    for (int8_t i = digits - 1; i >= 0; i--) {
        out[i] = HEX_DIGITS[value & 0x0F];
        value >>= 4;
    }
}

static bool parse_decimal_token(const char* token, size_t length, float* value_out) {
    char buffer[32];
    if (length == 0 || length >= sizeof(buffer)) {
        return false;
    }
    memcpy(buffer, token, length);
    buffer[length] = '\0';

    // strtod also takes hex floats, inf and nan; a reading is plain decimal
    for (size_t i = 0; i < length; i++) {
        char c = buffer[i];
        if (!isdigit((unsigned char)c) && c != '+' && c != '-' && c != '.' &&
            c != 'e' && c != 'E') {
            return false;
        }
    }

    char* end = nullptr;
    double parsed = strtod(buffer, &end);
    if (end == buffer || *end != '\0' || !isfinite(parsed)) {
        return false;
    }

    *value_out = (float)parsed;
    return true;
}

// =============================================================================
// PUBLIC FUNCTIONS
// =============================================================================

dcon_result_t dcon_encode_write(uint32_t module_id, uint32_t device_address,
                                uint32_t channel, uint32_t value,
                                char* out, size_t out_size) {
    if (module_id > 0xFFFF || device_address > 0xFF || channel > 0xFF || value > 0xFF) {
        return DCON_ERROR_VALUE_OUT_OF_RANGE;
    }
    if (out == nullptr || out_size < DCON_WRITE_FRAME_LENGTH + 1) {
        return DCON_ERROR_BUFFER_TOO_SMALL;
    }

    put_hex(out, module_id, 4);
    put_hex(out + 4, device_address, 2);
    put_hex(out + 6, channel, 2);
    put_hex(out + 8, value, 2);
    out[10] = DCON_FRAME_TERMINATOR;
    out[11] = '\0';

    return DCON_OK;
}

dcon_result_t dcon_encode_read(uint32_t module_id, uint32_t device_address,
                               uint32_t channel, char* out, size_t out_size) {
    if (module_id > 0xFFFF || device_address > 0xFF || channel > 0xFF) {
        return DCON_ERROR_VALUE_OUT_OF_RANGE;
    }
    if (out == nullptr || out_size < DCON_READ_FRAME_LENGTH + 1) {
        return DCON_ERROR_BUFFER_TOO_SMALL;
    }

    put_hex(out, module_id, 4);
    put_hex(out + 4, device_address, 2);
    put_hex(out + 6, channel, 2);
    out[8] = DCON_FRAME_TERMINATOR;
    out[9] = '\0';

    return DCON_OK;
}

dcon_result_t dcon_decode_analog_response(const char* line, uint8_t channel_index,
                                          float* raw_out) {
    if (line == nullptr || raw_out == nullptr) {
        return DCON_ERROR_EMPTY_RESPONSE;
    }

    const char* p = line;
    uint8_t token_index = 0;
    bool saw_token = false;

    while (*p != '\0') {
        while (*p != '\0' && isspace((unsigned char)*p)) p++;
        if (*p == '\0') break;

        const char* start = p;
        while (*p != '\0' && !isspace((unsigned char)*p)) p++;
        saw_token = true;

        if (token_index == channel_index) {
            if (!parse_decimal_token(start, (size_t)(p - start), raw_out)) {
                return DCON_ERROR_NOT_NUMERIC;
            }
            return DCON_OK;
        }
        token_index++;
    }

    return saw_token ? DCON_ERROR_TOO_FEW_TOKENS : DCON_ERROR_EMPTY_RESPONSE;
}

const char* dcon_result_to_string(dcon_result_t result) {
    switch (result) {
        case DCON_OK:                       return "OK";
        case DCON_ERROR_VALUE_OUT_OF_RANGE: return "field value out of range";
        case DCON_ERROR_BUFFER_TOO_SMALL:   return "frame buffer too small";
        case DCON_ERROR_EMPTY_RESPONSE:     return "empty response";
        case DCON_ERROR_TOO_FEW_TOKENS:     return "too few tokens in response";
        case DCON_ERROR_NOT_NUMERIC:        return "response token is not numeric";
        default:                            return "unknown";
    }
}
