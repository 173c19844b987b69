#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "twoping/responder.hpp"
#include "test_support.hpp"

using namespace twoping;
using testing::Bytes;
using testing::FakeTransport;
using testing::RawBuilder;
using testing::RecordingIndicator;

namespace {

std::vector<std::string> g_lines;

void capture_sink(const char* line) { g_lines.emplace_back(line); }

bool logged(const std::string& fragment) {
    for (const auto& l : g_lines) {
        if (l.find(fragment) != std::string::npos) return true;
    }
    return false;
}

struct Rig {
    explicit Rig(const Config& c = Config(), BatterySource* battery = nullptr, bool led_ok = true)
    : cfg(c), led(led_ok), responder(cfg, transport, led, battery, rng, capture_sink) {
        g_lines.clear();
    }

    Responder::Outcome feed(const Bytes& raw) {
        return responder.handle_datagram(raw.data(), raw.size(), testing::loopback_peer(40000));
    }

    Packet decode_sent(size_t i = 0) {
        Packet p;
        ErrorKind err = ErrorKind::None;
        const Bytes& raw = transport.sent.at(i).bytes;
        REQUIRE(packet_codec::decode(raw.data(), raw.size(), p, err));
        return p;
    }

    Config                  cfg;
    FakeTransport           transport;
    RecordingIndicator      led;
    testing::CountingRandom rng;
    Responder               responder;
};

int g_polls_left = 0;
bool stop_after_polls() { return g_polls_left-- <= 0; }

} // namespace

TEST_CASE("Reply request is answered (scenario A)") {
    Rig rig;
    CHECK(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    REQUIRE(rig.transport.sent.size() == 1);

    const auto& sent = rig.transport.sent[0];
    CHECK(sent.peer.port == 40000);
    CHECK(sent.bytes.size() == wire::DEFAULT_MIN_PACKET_SIZE);

    Packet reply = rig.decode_sent();
    REQUIRE(reply.in_reply_to.has_value());
    CHECK(reply.in_reply_to.value() == MessageId(1ull));
    CHECK_FALSE(reply.reply_requested);
    CHECK(reply.checksum != 0);
    const Segment* v = reply.find_segment(wire::EXT_PROGRAM_VERSION);
    REQUIRE(v != nullptr);
    CHECK(std::string(reinterpret_cast<const char*>(v->payload.data()), v->payload.size()) ==
          DEFAULT_PROGRAM_VERSION);
}

TEST_CASE("Corrupted checksum gets no reply (scenario B)") {
    Config cfg;
    cfg.debug = true;
    Rig rig(cfg);

    Bytes raw = testing::reply_request();
    raw[wire::CHECKSUM_OFFSET + 1] ^= 0x5A;
    CHECK(rig.feed(raw) == Responder::Outcome::Dropped);
    CHECK(rig.transport.sent.empty());
    CHECK(logged("event=drop reason=checksum_mismatch"));
}

TEST_CASE("Datagram shorter than the header gets no reply (scenario C)") {
    Rig rig;
    const Bytes raw = {wire::MAGIC_0, wire::MAGIC_1, 0x00};
    CHECK(rig.feed(raw) == Responder::Outcome::Dropped);
    CHECK(rig.responder.handle_datagram(nullptr, 0, testing::loopback_peer(1)) ==
          Responder::Outcome::Dropped);
    CHECK(rig.transport.sent.empty());
}

TEST_CASE("Battery level rides along when enabled (scenario D)") {
    Config cfg;
    cfg.battery.enabled = true;
    testing::FixedBattery battery(300, 1023);
    Rig rig(cfg, &battery);

    REQUIRE(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    Packet reply = rig.decode_sent();
    const Segment* b = reply.find_segment(wire::EXT_BATTERY_LEVELS);
    REQUIRE(b != nullptr);
    CHECK(wire::read_u16(&b->payload[4]) == BatteryReading{300, 1023}.level());
}

TEST_CASE("Unavailable battery still produces a reply") {
    Config cfg;
    cfg.debug = true;
    cfg.battery.enabled = true;
    testing::FixedBattery battery(0, 1023, false);
    Rig rig(cfg, &battery);

    CHECK(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    Packet reply = rig.decode_sent();
    CHECK(reply.find_segment(wire::EXT_BATTERY_LEVELS) == nullptr);
    CHECK(logged("event=battery_unavailable"));
}

TEST_CASE("Packets without reply-requested are not answered") {
    Config cfg;
    cfg.debug = true;
    Rig rig(cfg);

    RawBuilder b;
    b.block(wire::OP_IN_REPLY_TO, {0, 0, 0, 0, 0, 3});
    CHECK(rig.feed(b.build()) == Responder::Outcome::Dropped);
    CHECK(rig.transport.sent.empty());
    CHECK(logged("reason=no_reply_requested"));
}

TEST_CASE("Indicator is lit while a datagram is handled") {
    Rig rig;
    rig.feed(testing::reply_request());
    rig.feed(Bytes{0x00});
    CHECK(rig.led.signals == 2);
    CHECK(rig.led.clears == 2);
    CHECK_FALSE(rig.led.lit);
}

TEST_CASE("Indicator failure does not cost the reply") {
    Config cfg;
    cfg.debug = true;
    Rig rig(cfg, nullptr, false);
    CHECK(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    CHECK(rig.transport.sent.size() == 1);
    CHECK(logged("event=indicator_failed op=signal"));
}

TEST_CASE("Send failure is logged and not fatal") {
    Config cfg;
    cfg.debug = true;
    Rig rig(cfg);
    rig.transport.tx_result = transport::TxResult::Error;
    CHECK(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    CHECK(logged("event=send_failed"));

    rig.transport.tx_result = transport::TxResult::Ok;
    CHECK(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    CHECK(rig.transport.sent.size() == 2);
}

TEST_CASE("Minimum packet size follows the configuration") {
    Config cfg;
    cfg.min_packet_size = 0;
    Rig rig(cfg);
    REQUIRE(rig.feed(testing::reply_request()) == Responder::Outcome::Replied);
    CHECK(rig.transport.sent[0].bytes.size() < wire::DEFAULT_MIN_PACKET_SIZE);
}

TEST_CASE("Debug off means no log lines") {
    Rig rig;
    Bytes raw = testing::reply_request();
    raw[0] = 0;
    rig.feed(raw);
    rig.feed(testing::reply_request());
    CHECK(g_lines.empty());
}

TEST_CASE("poll_once and run drain the transport") {
    Rig rig;
    CHECK_FALSE(rig.responder.poll_once());

    rig.transport.inbox.push_back({testing::reply_request(), testing::loopback_peer(5)});
    rig.transport.inbox.push_back({Bytes{1, 2, 3}, testing::loopback_peer(6)});
    rig.transport.inbox.push_back({testing::reply_request(), testing::loopback_peer(7)});

    g_polls_left = 5;
    rig.responder.run(stop_after_polls);
    CHECK(rig.transport.inbox.empty());
    REQUIRE(rig.transport.sent.size() == 2);
    CHECK(rig.transport.sent[0].peer.port == 5);
    CHECK(rig.transport.sent[1].peer.port == 7);
}

TEST_CASE("Oversize datagram is dropped before decoding and logged") {
    Config cfg;
    cfg.debug = true;
    Rig rig(cfg);

    // a valid request padded past the receive buffer
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.padding = 2000;
    rig.transport.inbox.push_back({b.build(), testing::loopback_peer(9)});

    CHECK(rig.responder.poll_once());
    CHECK(rig.transport.inbox.empty());
    CHECK(rig.transport.sent.empty());
    CHECK(rig.led.signals == 0);
    CHECK(logged("event=drop reason=oversize len=2014 peer=fake:9"));
}
