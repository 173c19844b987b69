/**
 * @file packet_codec.hpp
 * @brief Datagram ⇄ Packet conversion with checksum handling.
 *
 * ### Decode order
 *  1. at least 12 header bytes             → else Truncated
 *  2. magic "2P"                           → else BadMagic
 *  3. message id, opcode flags
 *  4. one block per set flag bit, ascending:
 *       - 2-byte length and data must fit  → else Truncated
 *       - in-reply-to must be 6 bytes      → else Malformed
 *       - extended section                 → segment_codec::decode_all
 *       - anything else                    → kept opaque
 *  5. remaining bytes are padding
 *  6. checksum over the whole datagram     → else ChecksumMismatch
 *
 * The checksum is checked last so a structural problem is reported as itself
 * rather than as a checksum failure.
 *
 * Decoding is all-or-nothing: on failure the output packet is reset.
 *
 * ### Encode
 * Same field order; flags derived from the packet; zero padding up to
 * `min_size`; checksum computed with its field zeroed and patched in place.
 * The output always passes checksum::verify().
 */
#ifndef TWOPING_PACKET_CODEC_HPP
#define TWOPING_PACKET_CODEC_HPP

#include "etl/vector.h"
#include "twoping/errors.hpp"
#include "twoping/packet.hpp"
#include "twoping/wire.hpp"
#include <stdint.h>
#include <stddef.h>

namespace twoping {
namespace packet_codec {

/// Buffer large enough for any datagram the responder handles.
using Buffer = etl::vector<uint8_t, wire::MAX_PACKET_SIZE>;

/**
 * @brief Decode a raw datagram.
 *
 * @param raw  Datagram bytes; must outlive @p out (views borrow them).
 * @param len  Datagram length.
 * @param out  Decoded packet on success; default packet on failure.
 * @param err  ErrorKind::None on success, the failure kind otherwise.
 */
bool decode(const uint8_t* raw, size_t len, Packet& out, ErrorKind& err);

/**
 * @brief Encode a packet.
 *
 * @param pkt       Packet to write.
 * @param out       Cleared, then filled with the datagram.
 * @param min_size  Zero-pad the datagram up to this many bytes.
 *
 * @return false if the datagram would not fit @p out, if an opaque opcode
 *         duplicates or collides with a modelled one, or if a section exceeds a
 *         16-bit length. @p out is empty in that case.
 */
bool encode(const Packet& pkt, etl::ivector<uint8_t>& out, size_t min_size = 0);

} // namespace packet_codec
} // namespace twoping

#endif // TWOPING_PACKET_CODEC_HPP
