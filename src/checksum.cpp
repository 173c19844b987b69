// -----------------------------------------------------------------------------
// checksum.cpp: 2ping checksum.
//
// API contract: see include/twoping/checksum.hpp
// -----------------------------------------------------------------------------
#include "twoping/checksum.hpp"
#include "twoping/wire.hpp"

namespace twoping {
namespace checksum {

namespace {

// Sum bytes as big-endian words: even offsets are the high byte, odd the low.
// `skip_from`/`skip_to` mark a byte range treated as zero.
uint32_t sum_words(const uint8_t* data, size_t len, size_t skip_from, size_t skip_to) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        if (i >= skip_from && i < skip_to) continue;
        if (i & 1) sum += data[i];
        else       sum += static_cast<uint32_t>(data[i]) << 8;
    }
    return sum;
}

uint16_t finish(uint32_t sum) {
    // two folds are enough: after the first, the value is at most 0x1FFFE
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum = (sum >> 16) + (sum & 0xFFFF);
    uint16_t out = static_cast<uint16_t>(~sum & 0xFFFF);
    return out == 0 ? 0xFFFF : out;
}

} // namespace

uint16_t compute(const uint8_t* data, size_t len) {
    return finish(sum_words(data, len, 0, 0));
}

uint16_t compute_with_zeroed_field(const uint8_t* data, size_t len) {
    return finish(sum_words(data, len,
                            wire::CHECKSUM_OFFSET,
                            wire::CHECKSUM_OFFSET + 2));
}

bool verify(const uint8_t* data, size_t len) {
    if (!data || len < wire::HEADER_SIZE) return false;

    const uint16_t sent = wire::read_u16(data + wire::CHECKSUM_OFFSET);
    if (sent == 0) return true;  // sender chose not to checksum

    return compute_with_zeroed_field(data, len) == sent;
}

} // namespace checksum
} // namespace twoping
