#include <doctest/doctest.h>
#include <cstring>
#include <string>
#include "twoping/responder.hpp"
#include "twoping/transport/transport_linux_udp.hpp"
#include "test_support.hpp"

using namespace twoping;

namespace {

transport::UdpConfig loopback_config() {
    transport::UdpConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;               // let the kernel pick
    cfg.recv_timeout_ms = 200;
    return cfg;
}

} // namespace

TEST_CASE("LinuxUdp: recv times out quietly") {
    transport::LinuxUdp udp;
    transport::UdpConfig cfg = loopback_config();
    cfg.recv_timeout_ms = 10;
    REQUIRE(udp.begin(cfg));
    CHECK(udp.local_port() != 0);

    uint8_t buf[16];
    size_t len = 99;
    transport::PeerAddress peer;
    CHECK(udp.recv(buf, sizeof(buf), len, peer) == transport::RxResult::None);
    CHECK(len == 0);
}

TEST_CASE("LinuxUdp: bad bind address fails begin") {
    transport::LinuxUdp udp;
    transport::UdpConfig cfg = loopback_config();
    cfg.host = "not-an-address";
    CHECK_FALSE(udp.begin(cfg));
    CHECK_FALSE(udp.is_open());
    CHECK_FALSE(udp.last_error().empty());
}

TEST_CASE("LinuxUdp: datagram and peer address survive the loopback") {
    transport::LinuxUdp server, client;
    REQUIRE(server.begin(loopback_config()));
    REQUIRE(client.begin(loopback_config()));

    const uint8_t msg[] = {'2', 'P', 0, 0};
    REQUIRE(client.send(msg, sizeof(msg), testing::loopback_peer(server.local_port())) ==
            transport::TxResult::Ok);

    uint8_t buf[64];
    size_t len = 0;
    transport::PeerAddress peer;
    REQUIRE(server.recv(buf, sizeof(buf), len, peer) == transport::RxResult::Ok);
    CHECK(len == sizeof(msg));
    CHECK(std::memcmp(buf, msg, len) == 0);
    CHECK(peer.family == transport::AddressFamily::IPv4);
    CHECK(peer.port == client.local_port());

    char who[64];
    server.describe(peer, who, sizeof(who));
    CHECK(std::string(who) == "127.0.0.1:" + std::to_string(client.local_port()));
}

TEST_CASE("Responder answers over a real socket") {
    transport::LinuxUdp server, client;
    REQUIRE(server.begin(loopback_config()));
    REQUIRE(client.begin(loopback_config()));

    NullIndicator led;
    Mt19937RandomSource rng(1234);
    Responder responder(Config(), server, led, nullptr, rng);

    const testing::Bytes request = testing::reply_request();
    REQUIRE(client.send(request.data(), request.size(), testing::loopback_peer(server.local_port())) ==
            transport::TxResult::Ok);
    REQUIRE(responder.poll_once());

    uint8_t buf[wire::MAX_PACKET_SIZE];
    size_t len = 0;
    transport::PeerAddress peer;
    REQUIRE(client.recv(buf, sizeof(buf), len, peer) == transport::RxResult::Ok);
    CHECK(len == wire::DEFAULT_MIN_PACKET_SIZE);
    CHECK(peer.port == server.local_port());

    Packet reply;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(buf, len, reply, err));
    REQUIRE(reply.in_reply_to.has_value());
    CHECK(reply.in_reply_to.value() == MessageId(1ull));
}

TEST_CASE("LinuxUdp: datagram longer than the buffer reports its real length") {
    transport::LinuxUdp server, client;
    REQUIRE(server.begin(loopback_config()));
    REQUIRE(client.begin(loopback_config()));

    uint8_t big[1500];
    std::memset(big, 0x5A, sizeof(big));
    REQUIRE(client.send(big, sizeof(big), testing::loopback_peer(server.local_port())) ==
            transport::TxResult::Ok);

    uint8_t buf[wire::MAX_PACKET_SIZE];
    size_t len = 0;
    transport::PeerAddress peer;
    CHECK(server.recv(buf, sizeof(buf), len, peer) == transport::RxResult::Oversize);
    CHECK(len == sizeof(big));
    CHECK(peer.port == client.local_port());

    // the clipped datagram is consumed; the socket is clean for the next one
    CHECK(server.recv(buf, sizeof(buf), len, peer) == transport::RxResult::None);
}
