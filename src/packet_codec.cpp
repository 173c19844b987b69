// -----------------------------------------------------------------------------
// packet_codec.cpp: Implementation of the 2ping packet codec.
//
// API & decode order:
//   see include/twoping/packet_codec.hpp
//
// NOTE: This file holds the bounds checks. Every read is preceded by a length
// test against the bytes actually available; declared lengths are never
// trusted before that test.
// -----------------------------------------------------------------------------
#include "twoping/packet_codec.hpp"
#include "twoping/checksum.hpp"

namespace twoping {
namespace packet_codec {

namespace {

bool fail(Packet& out, ErrorKind& err, ErrorKind kind) {
    out = Packet();
    err = kind;
    return false;
}

const OpcodeSegment* find_opaque(const Packet& pkt, uint16_t flag) {
    for (const auto& op : pkt.opcode_segments) {
        if (op.flag == flag) return &op;
    }
    return nullptr;
}

bool is_single_bit(uint16_t v) { return v != 0 && (v & (v - 1)) == 0; }

// Opaque opcodes must be single, unique bits not claimed by a modelled field.
bool opaque_segments_valid(const Packet& pkt) {
    uint16_t seen = 0;
    for (const auto& op : pkt.opcode_segments) {
        if (!is_single_bit(op.flag)) return false;
        if (op.flag == wire::OP_REPLY_REQUESTED ||
            op.flag == wire::OP_IN_REPLY_TO     ||
            op.flag == wire::OP_EXTENDED) return false;
        if (seen & op.flag) return false;
        if (op.data.size() > 0xFFFF) return false;
        seen |= op.flag;
    }
    return true;
}

bool append_u16(etl::ivector<uint8_t>& out, uint16_t v) {
    if (out.available() < 2) return false;
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    return true;
}

bool append_bytes(etl::ivector<uint8_t>& out, const uint8_t* data, size_t len) {
    if (out.available() < len) return false;
    out.insert(out.end(), data, data + len);
    return true;
}

} // namespace

// -----------------------------------------------------------------------------
// decode()
// PRE:   raw may be anything; len is the datagram size reported by the transport.
// OUT:   out/err as documented; out is default on every failure path.
// -----------------------------------------------------------------------------
bool decode(const uint8_t* raw, size_t len, Packet& out, ErrorKind& err) {
    out = Packet();
    err = ErrorKind::None;

    if (!raw || len < wire::HEADER_SIZE) return fail(out, err, ErrorKind::Truncated);

    if (raw[wire::MAGIC_OFFSET]     != wire::MAGIC_0 ||
        raw[wire::MAGIC_OFFSET + 1] != wire::MAGIC_1) {
        return fail(out, err, ErrorKind::BadMagic);
    }

    out.ping_id.unpack(raw + wire::MESSAGE_ID_OFFSET, wire::MESSAGE_ID_SIZE);
    const uint16_t flags = wire::read_u16(raw + wire::FLAGS_OFFSET);

    size_t pos = wire::HEADER_SIZE;
    for (unsigned bit = 0; bit < 16; ++bit) {
        const uint16_t flag = static_cast<uint16_t>(1u << bit);
        if (!(flags & flag)) continue;

        if (len - pos < wire::OPCODE_LENGTH_SIZE) return fail(out, err, ErrorKind::Truncated);
        const size_t seg_len = wire::read_u16(raw + pos);
        pos += wire::OPCODE_LENGTH_SIZE;

        if (seg_len > len - pos) return fail(out, err, ErrorKind::Truncated);
        const uint8_t* data = raw + pos;

        switch (flag) {
            case wire::OP_REPLY_REQUESTED:
                out.reply_requested = true;   // no data defined; any bytes are skipped
                break;

            case wire::OP_IN_REPLY_TO:
                if (seg_len != wire::MESSAGE_ID_SIZE) return fail(out, err, ErrorKind::Malformed);
                out.in_reply_to = MessageId(data, seg_len);
                break;

            case wire::OP_EXTENDED: {
                ErrorKind seg_err = ErrorKind::None;
                if (!segment_codec::decode_all(data, seg_len, out.segments, seg_err)) {
                    return fail(out, err, seg_err);
                }
                out.extended = true;
                break;
            }

            default:
                if (out.opcode_segments.full()) return fail(out, err, ErrorKind::Malformed);
                out.opcode_segments.push_back(OpcodeSegment(flag, ByteView(data, seg_len)));
                break;
        }
        pos += seg_len;
    }

    // bytes past the last opcode block are padding

    out.checksum = wire::read_u16(raw + wire::CHECKSUM_OFFSET);
    if (!checksum::verify(raw, len)) return fail(out, err, ErrorKind::ChecksumMismatch);

    return true;
}

// -----------------------------------------------------------------------------
// encode()
// POLICY: flags come from Packet::flags(); blocks follow in ascending bit order,
//         exactly the order decode() consumes them.
// -----------------------------------------------------------------------------
bool encode(const Packet& pkt, etl::ivector<uint8_t>& out, size_t min_size) {
    out.clear();

    if (!opaque_segments_valid(pkt))         { return false; }
    if (out.max_size() < wire::HEADER_SIZE)  { return false; }

    const uint16_t flags = pkt.flags();

    out.resize(wire::HEADER_SIZE, 0);
    out[wire::MAGIC_OFFSET]     = wire::MAGIC_0;
    out[wire::MAGIC_OFFSET + 1] = wire::MAGIC_1;
    pkt.ping_id.pack(&out[wire::MESSAGE_ID_OFFSET]);
    wire::write_u16(&out[wire::FLAGS_OFFSET], flags);

    bool ok = true;
    for (unsigned bit = 0; ok && bit < 16; ++bit) {
        const uint16_t flag = static_cast<uint16_t>(1u << bit);
        if (!(flags & flag)) continue;

        switch (flag) {
            case wire::OP_REPLY_REQUESTED:
                ok = append_u16(out, 0);
                break;

            case wire::OP_IN_REPLY_TO: {
                uint8_t id[wire::MESSAGE_ID_SIZE];
                pkt.in_reply_to.value().pack(id);
                ok = append_u16(out, wire::MESSAGE_ID_SIZE) &&
                     append_bytes(out, id, wire::MESSAGE_ID_SIZE);
                break;
            }

            case wire::OP_EXTENDED: {
                const size_t section = segment_codec::encoded_size(pkt.segments);
                ok = section <= 0xFFFF && append_u16(out, static_cast<uint16_t>(section));
                for (size_t i = 0; ok && i < pkt.segments.size(); ++i) {
                    ok = segment_codec::encode(pkt.segments[i], out);
                }
                break;
            }

            default: {
                const OpcodeSegment* op = find_opaque(pkt, flag);
                ok = op != nullptr &&
                     append_u16(out, static_cast<uint16_t>(op->data.size())) &&
                     append_bytes(out, op->data.data(), op->data.size());
                break;
            }
        }
    }

    if (ok && out.size() < min_size) {
        ok = min_size <= out.max_size();
        if (ok) out.resize(min_size, 0);
    }

    if (!ok) {
        out.clear();
        return false;
    }

    const uint16_t sum = checksum::compute_with_zeroed_field(out.data(), out.size());
    wire::write_u16(&out[wire::CHECKSUM_OFFSET], sum);
    return true;
}

} // namespace packet_codec
} // namespace twoping
