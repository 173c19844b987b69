// -----------------------------------------------------------------------------
// responder.cpp: Implementation of the twoping Responder.
//
// API & operational model:
//   see include/twoping/responder.hpp
//
// NOTE: Nothing in here may fail the loop. Every error path ends in a
// "dropped" outcome or a log line, never an early exit from run().
// -----------------------------------------------------------------------------
#include "twoping/responder.hpp"

namespace twoping {

namespace {

ReplyContext make_context(const Config& cfg, BatterySource* battery) {
  ReplyContext ctx;
  ctx.program_version = cfg.program_version;
  ctx.battery_enabled = cfg.battery.enabled;
  ctx.battery         = battery;
  return ctx;
}

} // namespace

Responder::Responder(const Config& cfg,
                     transport::ITransport& transport,
                     Indicator& indicator,
                     BatterySource* battery,
                     RandomSource& rng,
                     LogSink log)
: transport_(transport),
  indicator_(indicator),
  builder_(make_context(cfg, battery), rng),
  log_(log),
  debug_(cfg.debug),
  min_packet_size_(cfg.min_packet_size) {}

Responder::Outcome Responder::handle_datagram(const uint8_t* data, size_t len,
                                              const transport::PeerAddress& peer) {
  // the indicator is best effort: a dead LED must not cost a reply
  if (!indicator_.signal() && logging()) {
    LogLine("event", "indicator_failed").kv("op", "signal").emit(log_);
  }

  const Outcome outcome = process(data, len, peer);

  if (!indicator_.clear() && logging()) {
    LogLine("event", "indicator_failed").kv("op", "clear").emit(log_);
  }
  return outcome;
}

// -----------------------------------------------------------------------------
// process(): decode → validate → build → encode → send.
// PRE:   data points at one received datagram of len bytes.
// POLICY:
//   - Any decode error: drop, never answer.
//   - Reply-requested unset: drop quietly; that is a valid 2ping exchange end.
//   - Battery read failure: reply anyway without that segment.
// -----------------------------------------------------------------------------
Responder::Outcome Responder::process(const uint8_t* data, size_t len,
                                      const transport::PeerAddress& peer) {
  char who[64] = {0};
  if (logging()) {
    describe(peer, who, sizeof(who));
    LogLine("event", "recv").kv("len", static_cast<uint32_t>(len)).kv("peer", who).emit(log_);
  }

  Packet inbound;
  ErrorKind err = ErrorKind::None;
  if (!packet_codec::decode(data, len, inbound, err)) {
    if (logging()) {
      LogLine("event", "drop").kv("reason", error_kind_name(err))
          .kv("len", static_cast<uint32_t>(len)).kv("peer", who).emit(log_);
    }
    return Outcome::Dropped;
  }

  if (logging()) {
    LogLine line("event", "decoded");
    line.kv("id", inbound.ping_id.to_hex_string().c_str()).kv_hex("flags", inbound.flags());
    if (inbound.checksum != 0) line.kv_hex("checksum", inbound.checksum);
    line.kv("segments", static_cast<uint32_t>(inbound.segments.size())).emit(log_);
  }

  if (!inbound.reply_requested) {
    if (logging()) {
      LogLine("event", "drop").kv("reason", "no_reply_requested").kv("peer", who).emit(log_);
    }
    return Outcome::Dropped;
  }

  Packet reply;
  if (!builder_.build(inbound, reply) && logging()) {
    LogLine("event", "battery_unavailable").emit(log_);
  }

  if (!packet_codec::encode(reply, tx_, min_packet_size_)) {
    if (logging()) {
      LogLine("event", "drop").kv("reason", "encode_failed").kv("peer", who).emit(log_);
    }
    return Outcome::Dropped;
  }

  const transport::TxResult tx = transport_.send(tx_.data(), tx_.size(), peer);
  if (logging()) {
    LogLine line("event", tx == transport::TxResult::Ok ? "reply" : "send_failed");
    line.kv("id", reply.ping_id.to_hex_string().c_str())
        .kv("in_reply_to", inbound.ping_id.to_hex_string().c_str())
        .kv("len", static_cast<uint32_t>(tx_.size()))
        .kv("peer", who)
        .emit(log_);
  }
  return Outcome::Replied;
}

bool Responder::poll_once() {
  size_t len = 0;
  transport::PeerAddress peer;
  const transport::RxResult rx = transport_.recv(rx_.data(), rx_.size(), len, peer);

  if (rx == transport::RxResult::None) return false;
  if (rx == transport::RxResult::Error) {
    if (logging()) LogLine("event", "recv_failed").kv("transport", transport_.name()).emit(log_);
    return false;
  }
  if (rx == transport::RxResult::Oversize) {
    // clipped bytes are never decoded
    if (logging()) {
      char who[64] = {0};
      describe(peer, who, sizeof(who));
      LogLine("event", "drop").kv("reason", "oversize")
          .kv("len", static_cast<uint32_t>(len)).kv("peer", who).emit(log_);
    }
    return true;
  }

  handle_datagram(rx_.data(), len, peer);
  return true;
}

void Responder::run(StopFn should_stop) {
  while (!(should_stop && should_stop())) {
    poll_once();
  }
}

void Responder::describe(const transport::PeerAddress& peer, char* out, size_t cap) const {
  transport_.describe(peer, out, cap);
}

} // namespace twoping
