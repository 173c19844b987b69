/**
 * @file reply_builder.hpp
 * @brief Build the reply to a packet that asked for one.
 *
 * @details
 * ## Reply rules
 * - `ping_id` is a fresh random id; `in_reply_to` is the inbound `ping_id`.
 * - The extended section always carries the program-version segment.
 * - With battery reporting enabled, a battery-levels segment follows, holding
 *   one battery (id 0) with the level mapped from the current reading. If the
 *   source cannot produce a reading the segment is left out and the reply still
 *   goes out.
 * - Nothing from the inbound packet other than its id is echoed. Investigation
 *   requests are not answered. The reply never requests a reply itself.
 * - Flags and checksum are left to packet_codec::encode().
 *
 * ## Storage
 * Segment payloads in the reply point into this builder (its copy of the
 * version string and its battery scratch array). A reply stays valid until the
 * next build() on the same builder.
 *
 * @code
 * twoping::ReplyContext ctx;
 * ctx.program_version = "2ping micro C++";
 * twoping::ReplyBuilder builder(ctx, rng);
 *
 * twoping::Packet reply;
 * builder.build(inbound, reply);
 * packet_codec::encode(reply, tx, wire::DEFAULT_MIN_PACKET_SIZE);
 * @endcode
 */
#ifndef TWOPING_REPLY_BUILDER_HPP
#define TWOPING_REPLY_BUILDER_HPP

#include "etl/array.h"
#include "etl/string.h"
#include "twoping/battery.hpp"
#include "twoping/packet.hpp"
#include "twoping/random_source.hpp"
#include <stdint.h>
#include <stddef.h>

namespace twoping {

/// Longest program-version string carried in a reply.
static constexpr size_t PROGRAM_VERSION_MAX = 64;

using VersionStr = etl::string<PROGRAM_VERSION_MAX>;

/// @brief What the builder needs to know about this node.
struct ReplyContext {
    VersionStr     program_version{};         ///< Text of the version segment
    bool           battery_enabled{false};    ///< Append a battery-levels segment
    BatterySource* battery{nullptr};          ///< Required when battery_enabled
};

class ReplyBuilder {
public:
    /// count(2) + one entry of id(2) + level(2)
    static constexpr size_t BATTERY_PAYLOAD_SIZE = 6;

    /// Battery id used for the single reported battery.
    static constexpr uint16_t BATTERY_ID = 0;

    /**
     * @param ctx  Copied; the builder does not keep a reference to it.
     * @param rng  Source of reply ids; must outlive the builder.
     */
    ReplyBuilder(const ReplyContext& ctx, RandomSource& rng);

    /**
     * @brief Fill @p reply as the answer to @p inbound.
     *
     * @pre `inbound` decoded successfully and has reply_requested set.
     *
     * @retval true  Every configured segment is present.
     * @retval false Battery reporting is enabled but no reading was available;
     *               the reply is complete apart from that segment.
     */
    bool build(const Packet& inbound, Packet& reply);

private:
    bool append_battery(Packet& reply);

    ReplyContext ctx_;
    RandomSource& rng_;
    etl::array<uint8_t, BATTERY_PAYLOAD_SIZE> battery_payload_{};
};

} // namespace twoping

#endif // TWOPING_REPLY_BUILDER_HPP
