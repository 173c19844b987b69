#pragma once
/**
 * @file indicator.hpp
 * @brief Per-datagram activity indicator (typically an LED).
 *
 * The responder calls signal() when a datagram arrives and clear() once it is
 * done with it, so an LED is lit for the duration of processing. Failures are
 * reported through the return value and only ever logged.
 */

namespace twoping {

class Indicator {
public:
  virtual ~Indicator() = default;

  /// Turn the indicator on. @return false if the hardware write failed.
  virtual bool signal() = 0;

  /// Turn the indicator off. @return false if the hardware write failed.
  virtual bool clear() { return true; }
};

/// For builds without an indicator.
class NullIndicator : public Indicator {
public:
  bool signal() override { return true; }
};

} // namespace twoping
