/**
 * @file config.hpp
 * @brief Responder configuration: one plain struct, defaults, validation.
 *
 * @details
 * Everything the responder can be told lives here and is handed over once, at
 * construction. Nothing reads the environment or a file behind your back; the
 * JSON loader (config_parser.hpp) and the command line fill this struct, in
 * that order, over the defaults.
 *
 * Strings are fixed-capacity ETL strings so a board build carries no heap.
 *
 * | Field             | Default              | Constraint      |
 * |-------------------|----------------------|-----------------|
 * | debug             | false                |                 |
 * | host              | "0.0.0.0"            | non-empty       |
 * | port              | 15998                | != 0            |
 * | ipv6              | false                |                 |
 * | program_version   | "2ping micro C++"    | non-empty       |
 * | min_packet_size   | 128                  | <= 1024         |
 * | recv_timeout_ms   | 500                  | > 0             |
 * | led.pin           | 2                    |                 |
 * | led.active_low    | true                 |                 |
 * | battery.adc_pin   | 0                    |                 |
 * | battery.adc_max   | 1023                 | != 0            |
 */
#ifndef TWOPING_CONFIG_HPP
#define TWOPING_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/string.h"
#include "twoping/reply_builder.hpp"
#include "twoping/wire.hpp"

namespace twoping {

static constexpr size_t HOST_MAX = 63;
static constexpr size_t PATH_MAX_LEN = 127;

using HostStr = etl::string<HOST_MAX>;
using PathStr = etl::string<PATH_MAX_LEN>;

/// Default text of the program-version segment.
static constexpr const char* DEFAULT_PROGRAM_VERSION = "2ping micro C++";

struct LedConfig {
  bool     enabled{false};
  uint16_t pin{2};
  bool     active_low{true};        ///< LED lit when the line is driven low
  PathStr  gpio_root{"/sys/class/gpio"};
};

struct BatteryConfig {
  bool     enabled{false};
  uint16_t adc_pin{0};
  uint16_t adc_max{1023};           ///< ADC counts that mean "full"
  bool     simulate{false};         ///< Sawtooth instead of the ADC
  uint16_t iio_device{0};
  PathStr  iio_root{"/sys/bus/iio/devices"};
};

struct Config {
  bool       debug{false};
  HostStr    host{"0.0.0.0"};
  uint16_t   port{wire::DEFAULT_PORT};
  bool       ipv6{false};
  VersionStr program_version{DEFAULT_PROGRAM_VERSION};
  uint16_t   min_packet_size{static_cast<uint16_t>(wire::DEFAULT_MIN_PACKET_SIZE)};
  int        recv_timeout_ms{500};

  LedConfig     led{};
  BatteryConfig battery{};
};

/**
 * @brief Check @p cfg against the constraints above.
 * @param reason Set to a short snake_case reason on failure, untouched otherwise.
 * @return true if the responder can be started with @p cfg.
 */
bool validate(const Config& cfg, const char*& reason);

} // namespace twoping

#endif // TWOPING_CONFIG_HPP
