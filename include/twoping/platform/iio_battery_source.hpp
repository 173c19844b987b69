#pragma once
/**
 * @file iio_battery_source.hpp
 * @brief Battery readings from a Linux IIO ADC channel (header-only).
 *
 * Reads `<root>/iio:device<N>/in_voltage<pin>_raw` on every read(). The value
 * is clamped to `adc_max`, which is also reported as the full-scale count.
 */

#if !defined(__linux__)
#  error "iio_battery_source.hpp is Linux-only."
#endif

#include "twoping/battery.hpp"
#include "twoping/config.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>

namespace twoping::platform {

class IioBatterySource : public BatterySource {
public:
  explicit IioBatterySource(const BatteryConfig& cfg)
  : path_(std::string(cfg.iio_root.c_str()) + "/iio:device" + std::to_string(cfg.iio_device) +
          "/in_voltage" + std::to_string(cfg.adc_pin) + "_raw"),
    full_scale_(cfg.adc_max ? cfg.adc_max : 1) {}

  bool read(BatteryReading& out) override {
    const int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd < 0) {
      last_error_ = path_ + ": " + std::strerror(errno);
      return false;
    }
    char buf[16] = {0};
    const ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
    ::close(fd);
    if (n <= 0) {
      last_error_ = path_ + ": empty read";
      return false;
    }

    uint32_t raw = 0;
    ssize_t i = 0;
    for (; i < n && buf[i] >= '0' && buf[i] <= '9'; ++i) {
      if (raw < 0x10000u) raw = raw * 10 + static_cast<uint32_t>(buf[i] - '0');
    }
    if (i == 0) {
      last_error_ = path_ + ": not a number";
      return false;
    }

    out.full_scale = full_scale_;
    out.raw = raw > full_scale_ ? full_scale_ : static_cast<uint16_t>(raw);
    return true;
  }

  const std::string& path() const { return path_; }
  const std::string& last_error() const { return last_error_; }

private:
  std::string path_;
  uint16_t    full_scale_;
  std::string last_error_;
};

} // namespace twoping::platform
