/**
 * @file config_parser.hpp
 * @brief Load a Config from JSON.
 *
 * @details
 * Two layouts are accepted and may be mixed:
 *
 * Nested:
 * @code{.json}
 * { "port": 15998, "debug": true,
 *   "led":     { "enabled": true, "pin": 2, "active_low": true },
 *   "battery": { "enabled": true, "adc_pin": 0, "adc_max": 1023 } }
 * @endcode
 *
 * Flat (the layout MicroPython deployments already carry around):
 * @code{.json}
 * { "port": 15998, "led": true, "led_pin": 2, "led_swapped": true,
 *   "battery": true, "battery_pin": 0 }
 * @endcode
 *
 * Keys not present keep the value already in the Config, so the loader layers
 * over defaults. Unknown keys are ignored. A key present with the wrong type, an
 * out-of-range number or an overlong string fails the whole load and leaves the
 * Config untouched.
 *
 * ## Dual Backend
 * - Desktop/Linux builds use nlohmann::json.
 * - `ARDUINO` builds use ArduinoJson with a fixed-size document.
 *
 * Neither path throws; errors come back as text in @p error.
 */
#ifndef TWOPING_CONFIG_PARSER_HPP
#define TWOPING_CONFIG_PARSER_HPP

#include <string>
#include "twoping/config.hpp"

namespace twoping {
namespace config_parser {

/**
 * @brief Apply the JSON document in @p text over @p cfg.
 * @return false with @p error set if the document is unusable.
 */
bool load_json(const std::string& text, Config& cfg, std::string& error);

/**
 * @brief Read @p path and apply it with load_json().
 * @return false with @p error set if the file cannot be read or parsed.
 */
bool load_file(const std::string& path, Config& cfg, std::string& error);

} // namespace config_parser
} // namespace twoping

#endif // TWOPING_CONFIG_PARSER_HPP
