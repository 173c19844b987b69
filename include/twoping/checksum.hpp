/**
 * @file checksum.hpp
 * @brief 2ping packet checksum: 16-bit one's-complement sum, integer only.
 *
 * The algorithm is the Internet-checksum family:
 *  - the buffer is read as big-endian 16-bit words (an odd trailing byte is
 *    treated as the high half of a word whose low half is zero),
 *  - the words are summed with end-around carry,
 *  - the result is one's-complemented.
 *
 * 2ping reserves a checksum field value of zero for "no checksum", so a computed
 * zero is transmitted as 0xFFFF (both are zero in one's-complement arithmetic).
 *
 * @note The accumulator is 32 bits. Buffers are bounded by MAX_PACKET_SIZE, so
 *       it cannot overflow before folding.
 */
#ifndef TWOPING_CHECKSUM_HPP
#define TWOPING_CHECKSUM_HPP

#include <stdint.h>
#include <stddef.h>

namespace twoping {
namespace checksum {

/**
 * @brief Compute the 2ping checksum over @p len bytes.
 * @return Checksum in 1..0xFFFF (never 0).
 */
uint16_t compute(const uint8_t* data, size_t len);

/**
 * @brief Compute the checksum as if the checksum field (bytes 2..3) were zero.
 *
 * Used by both encode (field not yet filled) and verify (field holds the
 * transmitted value). @p len must be at least the fixed header size.
 */
uint16_t compute_with_zeroed_field(const uint8_t* data, size_t len);

/**
 * @brief Check a complete datagram against its transmitted checksum.
 *
 * @retval true  The transmitted checksum is 0 (absent) or matches.
 * @retval false Buffer shorter than the header, or mismatch.
 */
bool verify(const uint8_t* data, size_t len);

} // namespace checksum
} // namespace twoping

#endif // TWOPING_CHECKSUM_HPP
