// -----------------------------------------------------------------------------
// @file message_id.cpp
// @brief Implementation of MessageId, the 6-byte 2ping correlation token.
//
// - Constructors (default, integer, raw buffer)
// - Packing and unpacking to/from raw byte arrays
// - Hex conversion for logs
//
// @note Heap-free; safe on Linux and Arduino alike.
// -----------------------------------------------------------------------------
#include "twoping/message_id.hpp"

namespace twoping {

// =============================================================================
// Constructors
// =============================================================================

MessageId::MessageId() { bytes.fill(0); }

MessageId::MessageId(uint64_t value) {
    // Highest used byte (bits 40–47) goes first
    for (size_t i = 0; i < SIZE; ++i) {
        bytes[i] = static_cast<uint8_t>((value >> (8 * (SIZE - 1 - i))) & 0xFF);
    }
}

MessageId::MessageId(const uint8_t* data, size_t len) {
    unpack(data, len);
}

// =============================================================================
// Packing & Unpacking
// =============================================================================

void MessageId::pack(uint8_t* out_buf) const {
    for (size_t i = 0; i < SIZE; ++i) out_buf[i] = bytes[i];
}

void MessageId::unpack(const uint8_t* in_buf, size_t len) {
    if (!in_buf || len < SIZE) {
        bytes.fill(0);
        return;
    }
    for (size_t i = 0; i < SIZE; ++i) bytes[i] = in_buf[i];
}

// =============================================================================
// Conversion
// =============================================================================

etl::string<MessageId::SIZE * 2> MessageId::to_hex_string() const {
    static const char* DIGITS = "0123456789ABCDEF";
    etl::string<SIZE * 2> hex;
    for (size_t i = 0; i < SIZE; ++i) {
        hex += DIGITS[bytes[i] >> 4];
        hex += DIGITS[bytes[i] & 0x0F];
    }
    return hex;
}

} // namespace twoping
