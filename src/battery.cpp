// -----------------------------------------------------------------------------
// battery.cpp: reading → level mapping and the simulated source.
// -----------------------------------------------------------------------------
#include "twoping/battery.hpp"
#include "twoping/wire.hpp"

namespace twoping {

uint16_t BatteryReading::level() const {
    if (full_scale == 0)      return 0;
    if (raw >= full_scale)    return wire::BATTERY_LEVEL_FULL;
    const uint32_t scaled = static_cast<uint32_t>(raw) * wire::BATTERY_LEVEL_FULL;
    return static_cast<uint16_t>(scaled / full_scale);
}

SimulatedBatterySource::SimulatedBatterySource(uint16_t full_scale, uint16_t step)
: full_scale_(full_scale == 0 ? 1 : full_scale),
  step_(step == 0 ? 1 : step),
  current_(full_scale == 0 ? 1 : full_scale) {}

bool SimulatedBatterySource::read(BatteryReading& out) {
    out.raw = current_;
    out.full_scale = full_scale_;

    // discharge; an empty battery is "replaced" by a full one
    if (current_ == 0)            current_ = full_scale_;
    else if (current_ < step_)    current_ = 0;
    else                          current_ = static_cast<uint16_t>(current_ - step_);
    return true;
}

} // namespace twoping
