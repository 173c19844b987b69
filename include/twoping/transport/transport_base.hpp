#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, core-agnostic datagram transport interface.
 *
 * Header-only on purpose for easy embedding. No STL in the embedded path.
 */

#include <cstddef>
#include <cstdint>
#include "etl/array.h"

namespace twoping::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Oversize=3 };

enum class AddressFamily : uint8_t { Unspecified=0, IPv4=4, IPv6=6 };

/**
 * @brief Where a datagram came from / goes to.
 *
 * IPv4 uses the first 4 bytes of `addr`. Plain value type so the core can copy
 * it without knowing about sockaddr.
 */
struct PeerAddress {
  AddressFamily family{AddressFamily::Unspecified};
  etl::array<uint8_t, 16> addr{};
  uint16_t port{0};
  uint32_t scope_id{0};  // IPv6 link-local only
};

struct Config {
  // You can extend per-transport via downcast or specialized ctors.
  uint16_t mtu{1024};
  int      recv_timeout_ms{500};   // recv() returns None after this long without traffic
};

/**
 * @brief Transport trait the responder relies on.
 *
 * Contract:
 *  - begin(cfg) opens and binds; false is a fatal startup error.
 *  - recv() blocks up to the configured timeout; returns RxResult::Ok with
 *    out_len/peer filled, None on timeout, Error otherwise.
 *    A datagram longer than cap is consumed and reported as Oversize, with
 *    out_len set to its real length and peer filled; its bytes are not usable.
 *  - send() transmits one datagram to peer; never retries.
 *  - describe() prints a peer for logs ("192.0.2.1:15998", "[2001:db8::1]:15998").
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, PeerAddress& peer) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len, const PeerAddress& peer) = 0;
  virtual void        describe(const PeerAddress& peer, char* out, std::size_t cap) const = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace twoping::transport
