// -----------------------------------------------------------------------------
// segment_codec.cpp: extended segment TLV walk.
//
// API contract: see include/twoping/segment.hpp
// -----------------------------------------------------------------------------
#include "twoping/segment.hpp"

namespace twoping {

bool same_bytes(ByteView a, ByteView b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

namespace segment_codec {

bool decode_all(const uint8_t* section, size_t declared_length,
                SegmentList& out, ErrorKind& err) {
    out.clear();
    err = ErrorKind::None;

    size_t pos = 0;
    while (pos < declared_length) {
        // a partial header means the entries overshoot the section
        if (declared_length - pos < wire::EXT_HEADER_SIZE) {
            out.clear();
            err = ErrorKind::Malformed;
            return false;
        }

        const uint32_t id  = wire::read_u32(section + pos);
        const size_t   len = wire::read_u16(section + pos + 4);
        pos += wire::EXT_HEADER_SIZE;

        if (len > declared_length - pos) {
            out.clear();
            err = ErrorKind::Truncated;
            return false;
        }

        if (out.full()) {
            out.clear();
            err = ErrorKind::Malformed;
            return false;
        }

        out.push_back(Segment(id, ByteView(section + pos, len)));
        pos += len;
    }
    return true;
}

size_t encoded_size(const Segment& seg) {
    return wire::EXT_HEADER_SIZE + seg.payload.size();
}

size_t encoded_size(const SegmentList& segs) {
    size_t n = 0;
    for (const auto& s : segs) n += encoded_size(s);
    return n;
}

bool encode(const Segment& seg, etl::ivector<uint8_t>& out) {
    if (seg.payload.size() > 0xFFFF) return false;
    if (out.available() < encoded_size(seg)) return false;

    uint8_t hdr[wire::EXT_HEADER_SIZE];
    wire::write_u32(hdr, seg.opcode);
    wire::write_u16(hdr + 4, static_cast<uint16_t>(seg.payload.size()));

    out.insert(out.end(), hdr, hdr + wire::EXT_HEADER_SIZE);
    out.insert(out.end(), seg.payload.begin(), seg.payload.end());
    return true;
}

} // namespace segment_codec
} // namespace twoping
