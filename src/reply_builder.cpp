// -----------------------------------------------------------------------------
// reply_builder.cpp: reply construction.
//
// Rules and storage lifetime: see include/twoping/reply_builder.hpp
// -----------------------------------------------------------------------------
#include "twoping/reply_builder.hpp"

namespace twoping {

ReplyBuilder::ReplyBuilder(const ReplyContext& ctx, RandomSource& rng)
: ctx_(ctx), rng_(rng) {}

bool ReplyBuilder::build(const Packet& inbound, Packet& reply) {
    reply = Packet();

    uint8_t id[MessageId::SIZE];
    rng_.fill(id, MessageId::SIZE);
    reply.ping_id.unpack(id, MessageId::SIZE);

    reply.in_reply_to = inbound.ping_id;

    // the version segment borrows our own copy of the string
    const uint8_t* version = reinterpret_cast<const uint8_t*>(ctx_.program_version.data());
    if (!reply.add_segment(wire::EXT_PROGRAM_VERSION,
                           ByteView(version, ctx_.program_version.size()))) {
        return false;
    }

    if (!ctx_.battery_enabled) return true;
    return append_battery(reply);
}

bool ReplyBuilder::append_battery(Packet& reply) {
    if (!ctx_.battery) return false;

    BatteryReading reading;
    if (!ctx_.battery->read(reading)) return false;

    wire::write_u16(&battery_payload_[0], 1);            // battery count
    wire::write_u16(&battery_payload_[2], BATTERY_ID);
    wire::write_u16(&battery_payload_[4], reading.level());

    return reply.add_segment(wire::EXT_BATTERY_LEVELS,
                             ByteView(battery_payload_.data(), battery_payload_.size()));
}

} // namespace twoping
