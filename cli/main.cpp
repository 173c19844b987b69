/**
 * @file main.cpp
 * @brief twoping-responder: Linux daemon around twoping::Responder.
 *
 * Responsibilities:
 *  - Build the Config: defaults, then the JSON file given with --config, then
 *    whatever was set on the command line (CLI11).
 *  - Open the UDP transport and the optional LED / battery collaborators.
 *  - Run the responder until SIGINT or SIGTERM.
 *
 * Status lines go to stderr as `status=<ok|error> ...`; with --debug the
 * responder's own `event=...` lines follow them.
 *
 * Exit codes:
 *  - 0  clean stop
 *  - 1  startup failure (bind, GPIO export)
 *  - 2  invalid configuration or command line
 */

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>

#include <CLI/CLI.hpp>

#include "twoping/battery.hpp"
#include "twoping/config.hpp"
#include "twoping/config_parser.hpp"
#include "twoping/indicator.hpp"
#include "twoping/log.hpp"
#include "twoping/platform/iio_battery_source.hpp"
#include "twoping/platform/sysfs_gpio_indicator.hpp"
#include "twoping/random_source.hpp"
#include "twoping/responder.hpp"
#include "twoping/transport/transport_linux_udp.hpp"

using namespace twoping;

// ---------- signals ----------

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static bool stop_requested() { return g_stop != 0; }

static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;  // no SA_RESTART: poll() must return so the loop sees the flag
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

// ---------- small utilities ----------

static void stderr_sink(const char* line) {
  std::fprintf(stderr, "%s\n", line);
}

static int fail(int code, const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

template <size_t N>
static bool assign_bounded(etl::string<N>& out, const std::string& in) {
  if (in.size() > N) return false;
  out.assign(in.c_str(), in.size());
  return true;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  bool        opt_debug = false;
  std::string opt_host;
  uint16_t    opt_port = 0;
  bool        opt_ipv6 = false;
  std::string opt_version;
  uint16_t    opt_min_size = 0;
  uint16_t    opt_led_pin = 0;
  bool        opt_led_active_high = false;
  uint16_t    opt_battery_pin = 0;
  bool        opt_battery_simulate = false;
  uint16_t    opt_adc_max = 0;

  CLI::App app{"twoping-responder: answers 2ping requests over UDP"};

  app.add_option("--config", opt_config, "JSON configuration file")->check(CLI::ExistingFile);
  app.add_flag("--debug", opt_debug, "Log every datagram to stderr");
  auto* o_host    = app.add_option("--host", opt_host, "Bind address");
  auto* o_port    = app.add_option("--port", opt_port, "UDP port")->check(CLI::Range(1, 65535));
  app.add_flag("--ipv6", opt_ipv6, "Bind an IPv6 socket");
  auto* o_version = app.add_option("--program-version", opt_version, "Text of the program-version segment");
  auto* o_min     = app.add_option("--min-packet-size", opt_min_size, "Pad replies to at least this many bytes")
                       ->check(CLI::Range(0, static_cast<int>(wire::MAX_PACKET_SIZE)));
  auto* o_led     = app.add_option("--led-pin", opt_led_pin, "Enable the activity LED on this GPIO line");
  app.add_flag("--led-active-high", opt_led_active_high, "LED is lit when the line is high");
  auto* o_battery = app.add_option("--battery-pin", opt_battery_pin, "Enable battery reporting from this ADC channel");
  app.add_flag("--battery-simulate", opt_battery_simulate, "Enable battery reporting with a simulated discharge");
  auto* o_adc_max = app.add_option("--adc-max", opt_adc_max, "ADC counts that mean a full battery")
                       ->check(CLI::Range(1, 65535));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  // defaults < JSON < command line
  Config cfg;
  if (!opt_config.empty()) {
    std::string err;
    if (!config_parser::load_file(opt_config, cfg, err)) return fail(2, "config (" + err + ")");
  }

  if (opt_debug) cfg.debug = true;
  if (opt_ipv6) cfg.ipv6 = true;
  if (o_host->count() && !assign_bounded(cfg.host, opt_host))              return fail(2, "host_too_long");
  if (o_port->count()) cfg.port = opt_port;
  if (o_version->count() && !assign_bounded(cfg.program_version, opt_version)) return fail(2, "program_version_too_long");
  if (o_min->count()) cfg.min_packet_size = opt_min_size;
  if (o_led->count()) {
    cfg.led.enabled = true;
    cfg.led.pin = opt_led_pin;
  }
  if (opt_led_active_high) cfg.led.active_low = false;
  if (o_battery->count()) {
    cfg.battery.enabled = true;
    cfg.battery.adc_pin = opt_battery_pin;
  }
  if (opt_battery_simulate) {
    cfg.battery.enabled = true;
    cfg.battery.simulate = true;
  }
  if (o_adc_max->count()) cfg.battery.adc_max = opt_adc_max;

  // the IPv4 wildcard makes no sense on an IPv6 socket
  if (cfg.ipv6 && cfg.host == "0.0.0.0") cfg.host = "::";

  const char* reason = nullptr;
  if (!validate(cfg, reason)) return fail(2, reason);

  // ---- collaborators ----

  transport::UdpConfig ucfg;
  ucfg.host            = cfg.host.c_str();
  ucfg.port            = cfg.port;
  ucfg.ipv6            = cfg.ipv6;
  ucfg.recv_timeout_ms = cfg.recv_timeout_ms;
  ucfg.mtu             = static_cast<uint16_t>(wire::MAX_PACKET_SIZE);

  transport::LinuxUdp udp;
  if (!udp.begin(ucfg)) return fail(1, "bind (" + udp.last_error() + ")");
  if (!udp.last_error().empty()) {
    std::cerr << "status=warning reason=" << udp.last_error() << "\n";
  }

  NullIndicator no_led;
  std::unique_ptr<platform::SysfsGpioIndicator> led;
  Indicator* indicator = &no_led;
  if (cfg.led.enabled) {
    led = std::make_unique<platform::SysfsGpioIndicator>(cfg.led);
    if (!led->begin()) return fail(1, "gpio (" + led->last_error() + ")");
    indicator = led.get();
  }

  std::unique_ptr<BatterySource> battery;
  if (cfg.battery.enabled) {
    if (cfg.battery.simulate) battery = std::make_unique<SimulatedBatterySource>(cfg.battery.adc_max);
    else                      battery = std::make_unique<platform::IioBatterySource>(cfg.battery);
  }

  Mt19937RandomSource rng;
  Responder responder(cfg, udp, *indicator, battery.get(), rng, stderr_sink);

  install_signal_handlers();

  std::cerr << "status=ok event=listening host=" << cfg.host.c_str()
            << " port=" << udp.local_port()
            << " transport=" << udp.name()
            << " led=" << (cfg.led.enabled ? "on" : "off")
            << " battery=" << (cfg.battery.enabled ? (cfg.battery.simulate ? "simulated" : "adc") : "off")
            << "\n";

  responder.run(stop_requested);

  if (led && !led->clear()) {
    std::cerr << "status=warning reason=gpio (" << led->last_error() << ")\n";
  }
  udp.end();
  std::cerr << "status=ok event=stopped\n";
  return 0;
}
