/**
 * @file config_parser.cpp
 * @brief JSON → Config, on nlohmann::json (desktop) or ArduinoJson (boards).
 *
 * @details
 *   The field mapping is written once against a small read-only node view.
 *   Each backend supplies its own view:
 *     - Desktop/Linux (no @c ARDUINO): wraps a `const nlohmann::json*`.
 *       json::parse() is the only call that can throw; its parse_error is
 *       caught and reported.
 *     - Arduino (@c ARDUINO): wraps an `ArduinoJson::JsonVariantConst` from a
 *       StaticJsonDocument, so memory use is bounded at compile time.
 *
 *   The mapping works on a copy of the Config and commits it only when every
 *   key checked out.
 */

#include "twoping/config_parser.hpp"

#include <stdint.h>

#ifdef ARDUINO

#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::deserializeJson;
using ArduinoJson::JsonVariantConst;
using ArduinoJson::JsonObjectConst;

#else

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
using nlohmann::json;

#endif

namespace twoping {
namespace config_parser {

namespace {

#ifdef ARDUINO

class Node {
public:
  explicit Node(JsonVariantConst v) : v_(v) {}

  Node member(const char* key) const { return Node(v_[key]); }

  bool present() const   { return !v_.isNull(); }
  bool is_object() const { return v_.is<JsonObjectConst>(); }
  bool is_bool() const   { return v_.is<bool>(); }
  bool is_uint() const   { return v_.is<unsigned long>(); }
  bool is_int() const    { return v_.is<long>(); }
  bool is_string() const { return v_.is<const char*>(); }

  bool        as_bool() const   { return v_.as<bool>(); }
  uint64_t    as_uint() const   { return v_.as<unsigned long>(); }
  int64_t     as_int() const    { return v_.as<long>(); }
  std::string as_string() const { return std::string(v_.as<const char*>()); }

private:
  JsonVariantConst v_;
};

#else

class Node {
public:
  explicit Node(const json* j) : j_(j) {}

  Node member(const char* key) const {
    if (!j_ || !j_->is_object()) return Node(nullptr);
    auto it = j_->find(key);
    return it == j_->end() ? Node(nullptr) : Node(&*it);
  }

  bool present() const   { return j_ != nullptr && !j_->is_null(); }
  bool is_object() const { return j_ && j_->is_object(); }
  bool is_bool() const   { return j_ && j_->is_boolean(); }
  bool is_uint() const   { return j_ && j_->is_number_unsigned(); }
  bool is_int() const    { return j_ && j_->is_number_integer(); }
  bool is_string() const { return j_ && j_->is_string(); }

  bool        as_bool() const   { return j_->get<bool>(); }
  uint64_t    as_uint() const   { return j_->get<uint64_t>(); }
  int64_t     as_int() const    { return j_->get<int64_t>(); }
  std::string as_string() const { return j_->get<std::string>(); }

private:
  const json* j_;
};

#endif

// -----------------------------------------------------------------------------
// Field readers. Each returns false only for a key that is present and wrong;
// an absent key leaves `out` alone.
// -----------------------------------------------------------------------------

bool read_bool(const Node& parent, const char* key, bool& out, std::string& error) {
  Node n = parent.member(key);
  if (!n.present()) return true;
  if (!n.is_bool()) {
    error = std::string(key) + ": expected boolean";
    return false;
  }
  out = n.as_bool();
  return true;
}

bool read_u16(const Node& parent, const char* key, uint16_t& out, std::string& error) {
  Node n = parent.member(key);
  if (!n.present()) return true;
  if (!n.is_uint()) {
    error = std::string(key) + ": expected non-negative integer";
    return false;
  }
  const uint64_t v = n.as_uint();
  if (v > 0xFFFFu) {
    error = std::string(key) + ": out of range";
    return false;
  }
  out = static_cast<uint16_t>(v);
  return true;
}

bool read_int(const Node& parent, const char* key, int& out, std::string& error) {
  Node n = parent.member(key);
  if (!n.present()) return true;
  if (!n.is_int()) {
    error = std::string(key) + ": expected integer";
    return false;
  }
  const int64_t v = n.as_int();
  if (v < INT32_MIN || v > INT32_MAX) {
    error = std::string(key) + ": out of range";
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

template <size_t N>
bool read_string(const Node& parent, const char* key, etl::string<N>& out, std::string& error) {
  Node n = parent.member(key);
  if (!n.present()) return true;
  if (!n.is_string()) {
    error = std::string(key) + ": expected string";
    return false;
  }
  const std::string s = n.as_string();
  if (s.size() > N) {
    error = std::string(key) + ": longer than " + std::to_string(N) + " bytes";
    return false;
  }
  out.assign(s.c_str(), s.size());
  return true;
}

// "led": true | { ... }, plus the flat led_pin / led_swapped keys.
bool apply_led(const Node& root, LedConfig& led, std::string& error) {
  Node n = root.member("led");
  if (n.present()) {
    if (n.is_bool()) {
      led.enabled = n.as_bool();
    } else if (n.is_object()) {
      if (!read_bool(n, "enabled", led.enabled, error))       return false;
      if (!read_u16(n, "pin", led.pin, error))                return false;
      if (!read_bool(n, "active_low", led.active_low, error)) return false;
      if (!read_string(n, "gpio_root", led.gpio_root, error)) return false;
    } else {
      error = "led: expected boolean or object";
      return false;
    }
  }

  if (!read_u16(root, "led_pin", led.pin, error))                return false;
  if (!read_bool(root, "led_swapped", led.active_low, error))    return false;
  return true;
}

// "battery": true | { ... }, plus the flat battery_pin key.
bool apply_battery(const Node& root, BatteryConfig& bat, std::string& error) {
  Node n = root.member("battery");
  if (n.present()) {
    if (n.is_bool()) {
      bat.enabled = n.as_bool();
    } else if (n.is_object()) {
      if (!read_bool(n, "enabled", bat.enabled, error))         return false;
      if (!read_u16(n, "adc_pin", bat.adc_pin, error))          return false;
      if (!read_u16(n, "adc_max", bat.adc_max, error))          return false;
      if (!read_bool(n, "simulate", bat.simulate, error))       return false;
      if (!read_u16(n, "iio_device", bat.iio_device, error))    return false;
      if (!read_string(n, "iio_root", bat.iio_root, error))     return false;
    } else {
      error = "battery: expected boolean or object";
      return false;
    }
  }

  if (!read_u16(root, "battery_pin", bat.adc_pin, error)) return false;
  return true;
}

bool apply(const Node& root, Config& cfg, std::string& error) {
  if (!root.is_object()) {
    error = "top level: expected object";
    return false;
  }

  Config next = cfg;
  if (!read_bool(root, "debug", next.debug, error))                       return false;
  if (!read_string(root, "host", next.host, error))                       return false;
  if (!read_u16(root, "port", next.port, error))                          return false;
  if (!read_bool(root, "ipv6", next.ipv6, error))                         return false;
  if (!read_string(root, "program_version", next.program_version, error)) return false;
  if (!read_u16(root, "min_packet_size", next.min_packet_size, error))    return false;
  if (!read_int(root, "recv_timeout_ms", next.recv_timeout_ms, error))    return false;
  if (!apply_led(root, next.led, error))                                  return false;
  if (!apply_battery(root, next.battery, error))                          return false;

  cfg = next;
  return true;
}

} // namespace

bool load_json(const std::string& text, Config& cfg, std::string& error) {
#ifdef ARDUINO
  StaticJsonDocument<768> doc;
  auto err = deserializeJson(doc, text);
  if (err) {
    error = std::string("parse error: ") + err.c_str();
    return false;
  }
  return apply(Node(doc.as<JsonVariantConst>()), cfg, error);
#else
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    error = std::string("parse error: ") + e.what();
    return false;
  }
  return apply(Node(&doc), cfg, error);
#endif
}

bool load_file(const std::string& path, Config& cfg, std::string& error) {
#ifdef ARDUINO
  (void)path;
  (void)cfg;
  error = "config files are not supported on this platform";
  return false;
#else
  std::ifstream in(path);
  if (!in) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_json(ss.str(), cfg, error);
#endif
}

} // namespace config_parser
} // namespace twoping
