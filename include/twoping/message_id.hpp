/**
 * @file message_id.hpp
 * @brief 2ping MessageId: the 6-byte opaque correlation token.
 *
 * Every 2ping packet carries a message id chosen by its sender. A reply echoes
 * the id of the packet it answers in its "in reply to" opcode segment and picks
 * a fresh id of its own. The responder never interprets the bytes; it only
 * copies, compares and prints them.
 *
 * | Byte | Contents                    |
 * |------|-----------------------------|
 * | 0–5  | id, most significant first  |
 *
 * ### Example
 * `[0x00, 0x00, 0x00, 0x00, 0x00, 0x01]` is id `0x000000000001`, printed as
 * `"000000000001"`.
 *
 * @note Heap-free and Arduino-safe: storage is a fixed 6-byte array.
 */
#ifndef TWOPING_MESSAGE_ID_HPP
#define TWOPING_MESSAGE_ID_HPP

#include "etl/array.h"
#include "etl/string.h"
#include "twoping/wire.hpp"
#include <stdint.h>
#include <stddef.h>

namespace twoping {

/**
 * @struct MessageId
 * @brief Six opaque bytes identifying one 2ping packet.
 */
struct MessageId {
    static constexpr size_t SIZE = wire::MESSAGE_ID_SIZE;

    etl::array<uint8_t, SIZE> bytes;

    /// @brief All-zero id.
    MessageId();

    /**
     * @brief Build an id from the low 48 bits of an integer.
     * @param value Big-endian interpretation: bit 47 lands in bytes[0].
     */
    explicit MessageId(uint64_t value);

    /**
     * @brief Copy the first 6 bytes of a buffer.
     * @note A buffer shorter than 6 bytes yields the all-zero id.
     */
    MessageId(const uint8_t* data, size_t len);

    /// @brief Write the 6 bytes to @p out_buf.
    void pack(uint8_t* out_buf) const;

    /// @brief Load 6 bytes from @p in_buf; clears the id if @p len < 6.
    void unpack(const uint8_t* in_buf, size_t len);

    /// @brief Uppercase hex form, 12 characters.
    etl::string<SIZE * 2> to_hex_string() const;

    bool operator==(const MessageId& other) const { return bytes == other.bytes; }
    bool operator!=(const MessageId& other) const { return !(*this == other); }
};

} // namespace twoping

#endif // TWOPING_MESSAGE_ID_HPP
