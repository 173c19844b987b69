#include <doctest/doctest.h>
#include "twoping/packet_codec.hpp"
#include "twoping/checksum.hpp"
#include "test_support.hpp"

using namespace twoping;
using testing::Bytes;
using testing::RawBuilder;
using testing::ext_entry;

namespace {

ErrorKind decode_error(const Bytes& raw) {
    Packet pkt;
    ErrorKind err = ErrorKind::None;
    packet_codec::decode(raw.data(), raw.size(), pkt, err);
    return err;
}

} // namespace

TEST_CASE("Minimal reply request decodes") {
    const Bytes raw = testing::reply_request();
    Packet pkt;
    ErrorKind err = ErrorKind::Malformed;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    CHECK(err == ErrorKind::None);
    CHECK(pkt.ping_id == MessageId(1ull));
    CHECK(pkt.reply_requested);
    CHECK_FALSE(pkt.in_reply_to.has_value());
    CHECK_FALSE(pkt.extended);
    CHECK(pkt.segments.empty());
    CHECK(pkt.flags() == wire::OP_REPLY_REQUESTED);
    CHECK(pkt.checksum != 0);
}

TEST_CASE("Header bounds: short, empty and null input are truncated") {
    const Bytes raw = testing::reply_request();
    Packet pkt;
    ErrorKind err = ErrorKind::None;
    for (size_t len = 0; len < wire::HEADER_SIZE; ++len) {
        CHECK_FALSE(packet_codec::decode(raw.data(), len, pkt, err));
        CHECK(err == ErrorKind::Truncated);
    }
    CHECK_FALSE(packet_codec::decode(nullptr, 64, pkt, err));
    CHECK(err == ErrorKind::Truncated);
}

TEST_CASE("Wrong magic is rejected before anything else") {
    Bytes raw = testing::reply_request();
    raw[1] = 'Q';
    CHECK(decode_error(raw) == ErrorKind::BadMagic);
}

TEST_CASE("Opcode blocks must fit the datagram") {
    SUBCASE("flag set but no length prefix") {
        RawBuilder b;
        b.flags = wire::OP_REPLY_REQUESTED;
        CHECK(decode_error(b.build()) == ErrorKind::Truncated);
    }
    SUBCASE("declared length runs past the end") {
        RawBuilder b;
        b.block(wire::OP_RTT_ENCLOSED, {0, 0, 0, 5});
        Bytes raw = b.build();
        raw.resize(raw.size() - 2);
        RawBuilder::patch_checksum(raw);
        CHECK(decode_error(raw) == ErrorKind::Truncated);
    }
}

TEST_CASE("In-reply-to must carry exactly one message id") {
    RawBuilder b;
    b.block(wire::OP_IN_REPLY_TO, {1, 2, 3, 4});
    CHECK(decode_error(b.build()) == ErrorKind::Malformed);

    RawBuilder ok;
    ok.block(wire::OP_IN_REPLY_TO, {0, 0, 0, 0, 0, 9});
    const Bytes raw = ok.build();
    Packet pkt;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    REQUIRE(pkt.in_reply_to.has_value());
    CHECK(pkt.in_reply_to.value() == MessageId(9ull));
}

TEST_CASE("Extended section errors propagate") {
    RawBuilder b;
    Bytes section = ext_entry(wire::EXT_PROGRAM_VERSION, {'x'});
    section.push_back(0xFF);  // stray byte
    b.block(wire::OP_EXTENDED, section);
    CHECK(decode_error(b.build()) == ErrorKind::Malformed);
}

TEST_CASE("Unknown opcodes and extended ids are skipped, not rejected") {
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.block(wire::OP_RTT_ENCLOSED, {0x00, 0x00, 0x10, 0x00});
    b.block(wire::OP_HOST_LATENCY, {0x01});
    b.block(wire::OP_EXTENDED, ext_entry(0xDEADBEEF, {1, 2, 3}));
    const Bytes raw = b.build();

    Packet pkt;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    CHECK(pkt.reply_requested);
    REQUIRE(pkt.opcode_segments.size() == 2);
    CHECK(pkt.opcode_segments[0].flag == wire::OP_RTT_ENCLOSED);
    CHECK(pkt.opcode_segments[1].flag == wire::OP_HOST_LATENCY);
    CHECK(pkt.extended);
    REQUIRE(pkt.segments.size() == 1);
    CHECK(pkt.find_segment(0xDEADBEEF) != nullptr);
    CHECK(pkt.find_segment(wire::EXT_BATTERY_LEVELS) == nullptr);
}

TEST_CASE("An unknown extended id between known ones keeps its bytes and position") {
    Bytes ext = ext_entry(wire::EXT_PROGRAM_VERSION, {'v', '1'});
    const Bytes opaque = ext_entry(0xDEADBEEF, {1, 2, 3});
    const Bytes battery = ext_entry(wire::EXT_BATTERY_LEVELS, {0x00, 0x01, 0x00, 0x00, 0x80, 0x00});
    ext.insert(ext.end(), opaque.begin(), opaque.end());
    ext.insert(ext.end(), battery.begin(), battery.end());

    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.block(wire::OP_EXTENDED, ext);
    const Bytes raw = b.build();

    Packet pkt;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    REQUIRE(pkt.segments.size() == 3);
    CHECK(pkt.segments[0].opcode == wire::EXT_PROGRAM_VERSION);
    CHECK(pkt.segments[1].opcode == 0xDEADBEEF);
    CHECK(pkt.segments[2].opcode == wire::EXT_BATTERY_LEVELS);

    const ByteView middle = pkt.segments[1].payload;
    REQUIRE(middle.size() == 3);
    CHECK(middle[0] == 1);
    CHECK(middle[1] == 2);
    CHECK(middle[2] == 3);

    const ByteView version = pkt.segments[0].payload;
    REQUIRE(version.size() == 2);
    CHECK(version[0] == 'v');
    CHECK(version[1] == '1');

    const ByteView levels = pkt.segments[2].payload;
    REQUIRE(levels.size() == 6);
    CHECK(wire::read_u16(&levels[0]) == 1);       // count
    CHECK(wire::read_u16(&levels[2]) == 0);       // battery id
    CHECK(wire::read_u16(&levels[4]) == 0x8000);  // level

    packet_codec::Buffer out;
    REQUIRE(packet_codec::encode(pkt, out));
    CHECK(Bytes(out.begin(), out.end()) == raw);
}

TEST_CASE("Trailing padding is ignored but covered by the checksum") {
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.padding = 100;
    Bytes raw = b.build();

    Packet pkt;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    CHECK(pkt.reply_requested);

    raw.back() = 0x01;
    CHECK(decode_error(raw) == ErrorKind::ChecksumMismatch);
}

TEST_CASE("Zero checksum field means unchecked") {
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.with_checksum = false;
    const Bytes raw = b.build();
    CHECK(decode_error(raw) == ErrorKind::None);
}

TEST_CASE("Every single-bit flip outside the checksum field is detected") {
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.block(wire::OP_EXTENDED, ext_entry(wire::EXT_PROGRAM_VERSION, {'a', 'b', 'c'}));
    b.padding = 7;
    const Bytes raw = b.build();
    REQUIRE(decode_error(raw) == ErrorKind::None);

    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == wire::CHECKSUM_OFFSET || i == wire::CHECKSUM_OFFSET + 1) continue;
        for (int bit = 0; bit < 8; ++bit) {
            Bytes flipped = raw;
            flipped[i] ^= static_cast<uint8_t>(1u << bit);
            Packet pkt;
            ErrorKind err = ErrorKind::None;
            CAPTURE(i);
            CAPTURE(bit);
            CHECK_FALSE(packet_codec::decode(flipped.data(), flipped.size(), pkt, err));
            CHECK(err != ErrorKind::None);
        }
    }
}

TEST_CASE("Failed decode leaves a default packet") {
    Bytes raw = testing::reply_request();
    raw[wire::MESSAGE_ID_OFFSET + 2] ^= 0x40;
    Packet pkt;
    pkt.reply_requested = true;
    ErrorKind err = ErrorKind::None;
    CHECK_FALSE(packet_codec::decode(raw.data(), raw.size(), pkt, err));
    CHECK(err == ErrorKind::ChecksumMismatch);
    CHECK(pkt == Packet());
}

TEST_CASE("Encode writes blocks in bit order with a valid checksum") {
    const uint8_t version[] = {'t', 'e', 's', 't'};
    Packet pkt;
    pkt.ping_id = MessageId(0x010203040506ull);
    pkt.in_reply_to = MessageId(0x0A0B0C0D0E0Full);
    REQUIRE(pkt.add_segment(wire::EXT_PROGRAM_VERSION, ByteView(version, sizeof(version))));

    packet_codec::Buffer out;
    REQUIRE(packet_codec::encode(pkt, out));
    CHECK(out[0] == wire::MAGIC_0);
    CHECK(out[1] == wire::MAGIC_1);
    CHECK(wire::read_u16(&out[wire::FLAGS_OFFSET]) == (wire::OP_IN_REPLY_TO | wire::OP_EXTENDED));
    CHECK(wire::read_u16(&out[12]) == 6);       // in-reply-to length
    CHECK(out[14] == 0x0A);
    CHECK(wire::read_u16(&out[20]) == 10);      // extended section length
    CHECK(out.size() == 32);
    CHECK(checksum::verify(out.data(), out.size()));
    CHECK(wire::read_u16(&out[wire::CHECKSUM_OFFSET]) != 0);
}

TEST_CASE("Encode pads to the requested minimum") {
    Packet pkt;
    pkt.reply_requested = true;
    packet_codec::Buffer out;
    REQUIRE(packet_codec::encode(pkt, out, wire::DEFAULT_MIN_PACKET_SIZE));
    CHECK(out.size() == wire::DEFAULT_MIN_PACKET_SIZE);
    CHECK(out.back() == 0);
    CHECK(checksum::verify(out.data(), out.size()));

    CHECK_FALSE(packet_codec::encode(pkt, out, wire::MAX_PACKET_SIZE + 1));
    CHECK(out.empty());
}

TEST_CASE("Encode rejects opaque opcodes that clash") {
    const uint8_t data[] = {1};
    packet_codec::Buffer out;

    Packet dup;
    dup.opcode_segments.push_back(OpcodeSegment(wire::OP_HMAC, ByteView(data, 1)));
    dup.opcode_segments.push_back(OpcodeSegment(wire::OP_HMAC, ByteView(data, 1)));
    CHECK_FALSE(packet_codec::encode(dup, out));

    Packet modelled;
    modelled.opcode_segments.push_back(OpcodeSegment(wire::OP_REPLY_REQUESTED, ByteView(data, 1)));
    CHECK_FALSE(packet_codec::encode(modelled, out));

    Packet two_bits;
    two_bits.opcode_segments.push_back(OpcodeSegment(0x0300, ByteView(data, 1)));
    CHECK_FALSE(packet_codec::encode(two_bits, out));
}

TEST_CASE("Decode then encode reproduces a canonical datagram") {
    RawBuilder b;
    b.block(wire::OP_REPLY_REQUESTED, {});
    b.block(wire::OP_COURTESY_EXPIRATION, {0, 1, 0, 0, 0, 0, 0, 7});
    b.block(wire::OP_EXTENDED, ext_entry(wire::EXT_PROGRAM_VERSION, {'z'}));
    const Bytes raw = b.build();

    Packet pkt;
    ErrorKind err = ErrorKind::None;
    REQUIRE(packet_codec::decode(raw.data(), raw.size(), pkt, err));

    packet_codec::Buffer out;
    REQUIRE(packet_codec::encode(pkt, out));
    CHECK(Bytes(out.begin(), out.end()) == raw);

    Packet again;
    REQUIRE(packet_codec::decode(out.data(), out.size(), again, err));
    CHECK(again == pkt);
}
