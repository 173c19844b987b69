// -----------------------------------------------------------------------------
// config.cpp: Config validation.
// -----------------------------------------------------------------------------
#include "twoping/config.hpp"

namespace twoping {

bool validate(const Config& cfg, const char*& reason) {
  if (cfg.host.empty())                         { reason = "empty_host"; return false; }
  if (cfg.port == 0)                            { reason = "invalid_port"; return false; }
  if (cfg.program_version.empty())              { reason = "empty_program_version"; return false; }
  if (cfg.min_packet_size > wire::MAX_PACKET_SIZE) { reason = "min_packet_size_too_large"; return false; }
  if (cfg.recv_timeout_ms <= 0)                 { reason = "invalid_recv_timeout"; return false; }

  if (cfg.led.enabled && cfg.led.gpio_root.empty()) {
    reason = "empty_gpio_root";
    return false;
  }

  if (cfg.battery.enabled) {
    if (cfg.battery.adc_max == 0) { reason = "invalid_adc_max"; return false; }
    if (!cfg.battery.simulate && cfg.battery.iio_root.empty()) {
      reason = "empty_iio_root";
      return false;
    }
  }
  return true;
}

} // namespace twoping
