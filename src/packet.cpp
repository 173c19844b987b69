// -----------------------------------------------------------------------------
// packet.cpp: Packet helpers and error names.
// -----------------------------------------------------------------------------
#include "twoping/packet.hpp"
#include "twoping/errors.hpp"

namespace twoping {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::BadMagic:         return "bad_magic";
        case ErrorKind::Truncated:        return "truncated";
        case ErrorKind::Malformed:        return "malformed";
        case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
    }
    return "unknown";
}

uint16_t Packet::flags() const {
    uint16_t f = 0;
    if (reply_requested)         f |= wire::OP_REPLY_REQUESTED;
    if (in_reply_to.has_value()) f |= wire::OP_IN_REPLY_TO;
    for (const auto& op : opcode_segments) f |= op.flag;
    if (extended)                f |= wire::OP_EXTENDED;
    return f;
}

const Segment* Packet::find_segment(uint32_t opcode) const {
    for (const auto& s : segments) {
        if (s.opcode == opcode) return &s;
    }
    return nullptr;
}

bool Packet::add_segment(uint32_t opcode, ByteView payload) {
    if (segments.full()) return false;
    segments.push_back(Segment(opcode, payload));
    extended = true;
    return true;
}

bool operator==(const Packet& a, const Packet& b) {
    if (a.ping_id != b.ping_id)                   return false;
    if (a.reply_requested != b.reply_requested)   return false;
    if (a.in_reply_to.has_value() != b.in_reply_to.has_value()) return false;
    if (a.in_reply_to.has_value() && a.in_reply_to.value() != b.in_reply_to.value()) return false;
    if (a.extended != b.extended)                 return false;

    if (a.opcode_segments.size() != b.opcode_segments.size()) return false;
    for (size_t i = 0; i < a.opcode_segments.size(); ++i) {
        if (a.opcode_segments[i] != b.opcode_segments[i]) return false;
    }

    if (a.segments.size() != b.segments.size()) return false;
    for (size_t i = 0; i < a.segments.size(); ++i) {
        if (a.segments[i] != b.segments[i]) return false;
    }
    return true;
}

} // namespace twoping
