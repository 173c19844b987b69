#ifndef TWOPING_RANDOM_SOURCE_HPP
#define TWOPING_RANDOM_SOURCE_HPP

#include <stdint.h>
#include <stddef.h>
#include <random>

namespace twoping {

/// @brief Supplies bytes for fresh message ids.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(uint8_t* out, size_t len) = 0;
};

/**
 * @brief Mersenne Twister, seeded once from std::random_device.
 *
 * Message ids only need to be unpredictable enough to avoid collisions between
 * concurrent pings; they carry no security weight.
 */
class Mt19937RandomSource : public RandomSource {
public:
    Mt19937RandomSource();
    explicit Mt19937RandomSource(uint32_t seed);

    void fill(uint8_t* out, size_t len) override;

private:
    std::mt19937 mt_;
};

} // namespace twoping

#endif // TWOPING_RANDOM_SOURCE_HPP
