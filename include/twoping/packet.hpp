/**
 * @file packet.hpp
 * @brief Structured 2ping packet, as decoded from or encoded to a datagram.
 *
 * ## Model
 * The wire carries an opcode-flags word and then one length-prefixed block per
 * set bit. Here the flags are not stored: they are derived from which fields
 * are present (`Packet::flags()`), so "in_reply_to present iff its flag is set"
 * holds by construction and the encoder cannot emit a flag without its data.
 *
 * | Field              | Flag bit | Representation                        |
 * |--------------------|----------|---------------------------------------|
 * | reply_requested    | 0x0001   | bool                                  |
 * | in_reply_to        | 0x0002   | etl::optional<MessageId>              |
 * | other opcodes      | any      | OpcodeSegment list (opaque, in order) |
 * | extended segments  | 0x8000   | `extended` + SegmentList              |
 *
 * Opcodes this responder never acts on (RTT, investigation, courtesy
 * expiration, HMAC, host latency, reserved bits) are kept as opaque data so a
 * decoded packet re-encodes to the same fields.
 *
 * ## Lifetime
 * Byte views inside a Packet borrow storage owned elsewhere (the datagram buffer
 * or the reply builder). A Packet lives for one datagram and is then discarded.
 */
#ifndef TWOPING_PACKET_HPP
#define TWOPING_PACKET_HPP

#include "etl/optional.h"
#include "etl/vector.h"
#include "twoping/message_id.hpp"
#include "twoping/segment.hpp"
#include "twoping/wire.hpp"
#include <stdint.h>
#include <stddef.h>

namespace twoping {

/// @brief Data of one opcode this responder does not interpret.
struct OpcodeSegment {
    uint16_t flag{0};   ///< Single flag bit, e.g. wire::OP_RTT_ENCLOSED
    ByteView data{};    ///< Borrowed data bytes

    OpcodeSegment() = default;
    OpcodeSegment(uint16_t f, ByteView d) : flag(f), data(d) {}
};

inline bool operator==(const OpcodeSegment& a, const OpcodeSegment& b) {
    return a.flag == b.flag && same_bytes(a.data, b.data);
}
inline bool operator!=(const OpcodeSegment& a, const OpcodeSegment& b) { return !(a == b); }

/// One slot per flag bit is enough.
static constexpr size_t MAX_OPCODE_SEGMENTS = 16;

using OpcodeSegmentList = etl::vector<OpcodeSegment, MAX_OPCODE_SEGMENTS>;

/**
 * @struct Packet
 * @brief One 2ping packet.
 */
struct Packet {
    MessageId                 ping_id{};           ///< Sender-chosen id
    bool                      reply_requested{false};
    etl::optional<MessageId>  in_reply_to{};       ///< Id of the packet this answers
    OpcodeSegmentList         opcode_segments{};   ///< Uninterpreted opcodes, ascending bit order
    bool                      extended{false};     ///< Extended section present (may be empty)
    SegmentList               segments{};          ///< Extended segments, wire order

    /// Checksum as seen on the wire; filled by decode, ignored by encode.
    uint16_t                  checksum{0};

    /// @brief Opcode flags word implied by the present fields.
    uint16_t flags() const;

    /// @brief First extended segment with @p opcode, or nullptr.
    const Segment* find_segment(uint32_t opcode) const;

    /// @brief Convenience: append an extended segment and mark the section present.
    /// @return false when the segment list is full.
    bool add_segment(uint32_t opcode, ByteView payload);
};

/// @brief Field-wise equality (flags, ids, opaque opcodes, segments). Checksum excluded.
bool operator==(const Packet& a, const Packet& b);
inline bool operator!=(const Packet& a, const Packet& b) { return !(a == b); }

} // namespace twoping

#endif // TWOPING_PACKET_HPP
