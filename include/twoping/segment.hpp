/**
 * @file segment.hpp
 * @brief Extended segments: the TLV entries inside a packet's 0x8000 opcode.
 *
 * ```
 *  +-----------+-----------+------------------+
 *  | id (4)    | len (2)   | payload (len)    |
 *  +-----------+-----------+------------------+
 * ```
 *
 * The decoder never needs to understand a payload to step over it, so segment
 * ids this responder does not know (random data, clocks, notices, ...) are kept
 * as opaque bytes instead of failing the packet.
 *
 * Payloads are `etl::span` views, not copies. A decoded segment borrows the
 * datagram buffer; a built segment borrows whatever storage the builder used.
 */
#ifndef TWOPING_SEGMENT_HPP
#define TWOPING_SEGMENT_HPP

#include "etl/span.h"
#include "etl/vector.h"
#include "twoping/errors.hpp"
#include "twoping/wire.hpp"
#include <stdint.h>
#include <stddef.h>

namespace twoping {

/// Read-only view of bytes owned elsewhere.
using ByteView = etl::span<const uint8_t>;

/// @brief True if both views hold the same bytes.
bool same_bytes(ByteView a, ByteView b);

/// @brief One extended segment.
struct Segment {
    uint32_t opcode{0};  ///< Extended id, e.g. wire::EXT_BATTERY_LEVELS
    ByteView payload{};  ///< Borrowed payload bytes

    Segment() = default;
    Segment(uint32_t op, ByteView data) : opcode(op), payload(data) {}
};

inline bool operator==(const Segment& a, const Segment& b) {
    return a.opcode == b.opcode && same_bytes(a.payload, b.payload);
}
inline bool operator!=(const Segment& a, const Segment& b) { return !(a == b); }

/// Upper bound on extended segments per packet.
static constexpr size_t MAX_EXTENDED_SEGMENTS = 32;

using SegmentList = etl::vector<Segment, MAX_EXTENDED_SEGMENTS>;

namespace segment_codec {

/**
 * @brief Split an extended section into segments.
 *
 * @param section          First byte of the section.
 * @param declared_length  Section length from its opcode length prefix.
 * @param out              Cleared, then filled in wire order.
 * @param err              Set on failure.
 *
 * @retval false, Malformed  Fewer than 6 bytes left for a segment header, or
 *                           more than MAX_EXTENDED_SEGMENTS entries.
 * @retval false, Truncated  A payload length runs past @p declared_length.
 *
 * On failure @p out is left empty.
 */
bool decode_all(const uint8_t* section, size_t declared_length,
                SegmentList& out, ErrorKind& err);

/// @brief Bytes one segment occupies on the wire.
size_t encoded_size(const Segment& seg);

/// @brief Bytes a whole section occupies on the wire.
size_t encoded_size(const SegmentList& segs);

/**
 * @brief Append one segment (id, length, payload) to @p out.
 * @return false if the payload does not fit a 16-bit length or @p out is full;
 *         @p out is unchanged in that case.
 */
bool encode(const Segment& seg, etl::ivector<uint8_t>& out);

} // namespace segment_codec
} // namespace twoping

#endif // TWOPING_SEGMENT_HPP
