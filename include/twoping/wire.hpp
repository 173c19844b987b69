/**
 * @file wire.hpp
 * @brief 2ping wire constants: magic, header offsets, opcode bits, extended ids.
 *
 * Every number the codec needs to talk to a stock 2ping peer lives here, so the
 * rest of the code never carries a bare offset.
 *
 * ### Packet layout (all integers big-endian)
 *
 * | Offset | Size | Field        | Notes                                   |
 * |--------|------|--------------|-----------------------------------------|
 * | 0      | 2    | magic        | 0x32 0x50 ("2P")                        |
 * | 2      | 2    | checksum     | 0 means "no checksum present"           |
 * | 4      | 6    | message id   | sender-chosen correlation token         |
 * | 10     | 2    | opcode flags | one bit per following opcode segment    |
 * | 12     | ...  | segments     | per set bit, ascending: len(2) + data   |
 * | ...    | ...  | padding      | zero bytes, ignored                     |
 *
 * The extended-segments opcode (0x8000) carries a list of
 * `id(4) + len(2) + data` entries.
 */
#ifndef TWOPING_WIRE_HPP
#define TWOPING_WIRE_HPP

#include <stdint.h>
#include <stddef.h>

namespace twoping {
namespace wire {

static constexpr uint8_t  MAGIC_0 = 0x32;   ///< '2'
static constexpr uint8_t  MAGIC_1 = 0x50;   ///< 'P'

static constexpr size_t   MAGIC_OFFSET      = 0;
static constexpr size_t   CHECKSUM_OFFSET   = 2;
static constexpr size_t   MESSAGE_ID_OFFSET = 4;
static constexpr size_t   FLAGS_OFFSET      = 10;
static constexpr size_t   HEADER_SIZE       = 12;  ///< Fixed part, before opcode segments
static constexpr size_t   MESSAGE_ID_SIZE   = 6;

static constexpr size_t   OPCODE_LENGTH_SIZE = 2;  ///< Length prefix of each opcode segment
static constexpr size_t   EXT_HEADER_SIZE    = 6;  ///< id(4) + len(2)

/// Largest datagram the responder accepts or emits.
static constexpr size_t   MAX_PACKET_SIZE   = 1024;

/// The original responder always transmits a zero-padded 128-byte reply.
static constexpr size_t   DEFAULT_MIN_PACKET_SIZE = 128;

/// 2ping well-known UDP port.
static constexpr uint16_t DEFAULT_PORT = 15998;

/// @name Opcode flag bits
///@{
static constexpr uint16_t OP_REPLY_REQUESTED     = 0x0001;
static constexpr uint16_t OP_IN_REPLY_TO         = 0x0002;
static constexpr uint16_t OP_RTT_ENCLOSED        = 0x0004;
static constexpr uint16_t OP_INVESTIGATION_DONE  = 0x0008;
static constexpr uint16_t OP_INVESTIGATE         = 0x0010;
static constexpr uint16_t OP_COURTESY_EXPIRATION = 0x0020;
static constexpr uint16_t OP_HMAC                = 0x0040;
static constexpr uint16_t OP_HOST_LATENCY        = 0x0080;
static constexpr uint16_t OP_EXTENDED            = 0x8000;
///@}

/// @name Extended segment ids
///@{
static constexpr uint32_t EXT_PROGRAM_VERSION = 0x3250564e;  ///< "2PVN", UTF-8 text
static constexpr uint32_t EXT_BATTERY_LEVELS  = 0x88a1f7c7;  ///< count(2) + n * (id(2) + level(2))
///@}

/// Battery level range on the wire: 0 = empty, 65535 = full.
static constexpr uint16_t BATTERY_LEVEL_FULL = 0xffff;

// ---------- big-endian helpers ----------

inline uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
            static_cast<uint32_t>(p[3]);
}

inline void write_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

inline void write_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}

} // namespace wire
} // namespace twoping

#endif // TWOPING_WIRE_HPP
