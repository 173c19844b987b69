/**
 * @file battery.hpp
 * @brief Battery readings and the sources that produce them.
 *
 * A BatterySource hands out one raw reading per reply. The reading is mapped to
 * the 2ping battery level (0 = empty, 65535 = full) with integer arithmetic only;
 * the target has no FPU to spare.
 *
 * ### Mapping
 * `level = raw >= full_scale ? 65535 : raw * 65535 / full_scale`
 *
 * `raw` and `full_scale` are 16-bit, so the product fits 32 bits.
 */
#ifndef TWOPING_BATTERY_HPP
#define TWOPING_BATTERY_HPP

#include <stdint.h>
#include <stddef.h>

namespace twoping {

/**
 * @struct BatteryReading
 * @brief One sample, valid for a single reply.
 */
struct BatteryReading {
    uint16_t raw{0};          ///< ADC counts (or simulated counts)
    uint16_t full_scale{1};   ///< Counts that mean "full"; never 0

    /// @brief Wire level in 0..65535.
    uint16_t level() const;
};

/// @brief Source of battery readings.
class BatterySource {
public:
    virtual ~BatterySource() = default;

    /// @return false if no reading could be taken.
    virtual bool read(BatteryReading& out) = 0;
};

/**
 * @brief Integer sawtooth discharge for platforms without an ADC.
 *
 * Starts full and drops by `step` counts per read; wraps back to full after
 * reaching empty. Every reading lies within [0, full_scale].
 */
class SimulatedBatterySource : public BatterySource {
public:
    explicit SimulatedBatterySource(uint16_t full_scale = 1023, uint16_t step = 7);

    bool read(BatteryReading& out) override;

private:
    uint16_t full_scale_;
    uint16_t step_;
    uint16_t current_;
};

} // namespace twoping

#endif // TWOPING_BATTERY_HPP
