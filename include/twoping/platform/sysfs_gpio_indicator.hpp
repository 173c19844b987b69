#pragma once
/**
 * @file sysfs_gpio_indicator.hpp
 * @brief Activity LED on a Linux GPIO line via the sysfs interface (header-only).
 *
 * Depends on: unistd.h, fcntl.h. STL only for std::string (Linux-only path).
 *
 * begin() exports `<root>/gpio<pin>` if needed and sets it as an output with
 * the LED off. With `active_low` (the usual wiring on dev boards) "on" drives
 * the line to 0.
 */

#if !defined(__linux__)
#  error "sysfs_gpio_indicator.hpp is Linux-only."
#endif

#include "twoping/config.hpp"
#include "twoping/indicator.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>

namespace twoping::platform {

class SysfsGpioIndicator : public Indicator {
public:
  explicit SysfsGpioIndicator(const LedConfig& cfg)
  : root_(cfg.gpio_root.c_str()), pin_(cfg.pin), active_low_(cfg.active_low) {}

  /// Export, set direction, switch off. false is a fatal startup error.
  bool begin() {
    const std::string line = line_dir();
    if (::access(line.c_str(), F_OK) != 0) {
      // EBUSY means someone exported it first; that is fine
      if (!write_file(root_ + "/export", std::to_string(pin_)) && errno != EBUSY) return false;
    }
    if (!write_file(line + "/direction", "out")) return false;
    return clear();
  }

  bool signal() override { return write_level(!active_low_); }
  bool clear() override  { return write_level(active_low_); }

  const std::string& last_error() const { return last_error_; }

private:
  std::string line_dir() const { return root_ + "/gpio" + std::to_string(pin_); }

  bool write_level(bool high) {
    return write_file(line_dir() + "/value", high ? "1" : "0");
  }

  bool write_file(const std::string& path, const std::string& text) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC);
    if (fd < 0) return fail(path);
    const ssize_t w = ::write(fd, text.data(), text.size());
    const int saved = errno;
    ::close(fd);
    errno = saved;
    if (w != static_cast<ssize_t>(text.size())) return fail(path);
    return true;
  }

  bool fail(const std::string& path) {
    const int err = errno;
    last_error_ = path + ": " + std::strerror(err);
    errno = err;
    return false;
  }

  std::string root_;
  uint16_t    pin_;
  bool        active_low_;
  std::string last_error_;
};

} // namespace twoping::platform
