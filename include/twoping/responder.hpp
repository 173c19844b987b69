/**
 * @file responder.hpp
 * @brief twoping Responder: the per-datagram pipeline and its receive loop.
 *
 * @details
 * ## Field Brief
 * The responder is the whole "server": one blocking receive, one datagram
 * processed start to finish, then the next. It owns no peer table and keeps
 * nothing between datagrams except two reusable byte buffers. If the box
 * reboots mid-ping, nothing is lost.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Transport]                 [Responder]
 *      │ recv(bytes, peer)          │
 *      └──────────────────────────► │ indicator.signal()
 *                                   │ packet_codec::decode()  ── fail ──► drop
 *                                   │ reply requested?        ── no   ──► drop
 *                                   │ ReplyBuilder::build()
 *                                   │ packet_codec::encode()
 *      ◄────────────── send(reply) ─┤
 *                                   │ indicator.clear()
 * ```
 *
 * Every datagram ends as exactly one of two outcomes, `Dropped` or `Replied`.
 * Neither is an error to the caller. Malformed input is never answered.
 *
 * ---
 *
 * @par Failure Model
 * - **Decode failure** (bad magic, truncated, malformed, checksum): drop;
 *   logged as `event=drop reason=<kind>` when debug is on.
 * - **No reply requested:** drop; that is normal 2ping behaviour.
 * - **Oversize datagram** (longer than wire::MAX_PACKET_SIZE): dropped by
 *   poll_once() before decoding; logged as `event=drop reason=oversize`.
 * - **Indicator failure:** logged, processing continues.
 * - **Battery unavailable:** reply goes out without the battery segment.
 * - **Send failure:** logged, loop continues. No retries.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * twoping::transport::LinuxUdp udp;
 * udp.begin(udp_cfg);
 * twoping::NullIndicator led;
 * twoping::Mt19937RandomSource rng;
 * twoping::Responder responder(cfg, udp, led, nullptr, rng, stderr_sink);
 * responder.run(stop_requested);
 * @endcode
 */
#ifndef TWOPING_RESPONDER_HPP
#define TWOPING_RESPONDER_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/array.h"
#include "twoping/battery.hpp"
#include "twoping/config.hpp"
#include "twoping/indicator.hpp"
#include "twoping/log.hpp"
#include "twoping/packet_codec.hpp"
#include "twoping/random_source.hpp"
#include "twoping/reply_builder.hpp"
#include "twoping/transport/transport_base.hpp"

namespace twoping {

class Responder {
public:
  enum class Outcome : uint8_t { Dropped = 0, Replied = 1 };

  /// Polled between receives; return true to leave run().
  using StopFn = bool (*)();

  /**
   * @brief Wire the pipeline.
   *
   * @param cfg        Validated configuration. Copied where needed; not retained.
   * @param transport  Opened transport; must outlive the responder.
   * @param indicator  Activity indicator; must outlive the responder.
   * @param battery    Battery source, or nullptr. Used only when
   *                   `cfg.battery.enabled` is set.
   * @param rng        Source of reply ids; must outlive the responder.
   * @param log        Sink for debug lines; nullptr disables logging.
   */
  Responder(const Config& cfg,
            transport::ITransport& transport,
            Indicator& indicator,
            BatterySource* battery,
            RandomSource& rng,
            LogSink log = nullptr);

  /**
   * @brief Run one datagram through the pipeline.
   *
   * Signals the indicator, decodes, validates, builds, encodes and sends.
   * @p data must stay valid for the duration of the call.
   */
  Outcome handle_datagram(const uint8_t* data, size_t len, const transport::PeerAddress& peer);

  /**
   * @brief Receive at most one datagram (waiting up to the transport timeout)
   *        and handle it.
   * @return true if a datagram was received.
   */
  bool poll_once();

  /// @brief Loop poll_once() until @p should_stop returns true.
  void run(StopFn should_stop);

private:
  Outcome process(const uint8_t* data, size_t len, const transport::PeerAddress& peer);

  bool logging() const { return debug_ && log_ != nullptr; }
  void describe(const transport::PeerAddress& peer, char* out, size_t cap) const;

  transport::ITransport& transport_;
  Indicator&             indicator_;
  ReplyBuilder           builder_;
  LogSink                log_;
  bool                   debug_;
  size_t                 min_packet_size_;

  // reused per datagram; contents never outlive one pipeline run
  etl::array<uint8_t, wire::MAX_PACKET_SIZE> rx_{};
  packet_codec::Buffer                       tx_{};
};

} // namespace twoping

#endif // TWOPING_RESPONDER_HPP
