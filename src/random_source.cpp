#include "twoping/random_source.hpp"

namespace twoping {

Mt19937RandomSource::Mt19937RandomSource() : mt_(std::random_device{}()) {}

Mt19937RandomSource::Mt19937RandomSource(uint32_t seed) : mt_(seed) {}

void Mt19937RandomSource::fill(uint8_t* out, size_t len) {
    // 4 bytes per draw, big-endian; the tail takes the high bytes of one more
    size_t i = 0;
    while (i < len) {
        const uint32_t v = static_cast<uint32_t>(mt_());
        for (int shift = 24; shift >= 0 && i < len; shift -= 8) {
            out[i++] = static_cast<uint8_t>((v >> shift) & 0xFF);
        }
    }
}

} // namespace twoping
