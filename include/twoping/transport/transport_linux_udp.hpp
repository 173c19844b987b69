#pragma once
/**
 * @file transport_linux_udp.hpp
 * @brief Linux UDP transport (header-only, BSD sockets; IPv4 or IPv6).
 *
 * Depends on: sys/socket.h, netdb.h, poll.h. STL only for std::string (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_udp.hpp is Linux-only."
#endif

#include "twoping/transport/transport_base.hpp"
#include "twoping/wire.hpp"
#include <string>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <unistd.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace twoping::transport {

struct UdpConfig : public Config {
  std::string host{"0.0.0.0"};         // bind address; "::" for IPv6 any
  uint16_t    port{wire::DEFAULT_PORT};
  bool        ipv6{false};
};

class LinuxUdp : public ITransport {
public:
  LinuxUdp() = default;
  ~LinuxUdp() override { end(); }

  LinuxUdp(const LinuxUdp&) = delete;
  LinuxUdp& operator=(const LinuxUdp&) = delete;

  bool begin(const Config& cfg) override {
    // We control the call sites; treat cfg as UdpConfig.
    const auto& uc = static_cast<const UdpConfig&>(cfg);
    end();

    mtu_        = uc.mtu;
    timeout_ms_ = uc.recv_timeout_ms;
    last_error_.clear();

    addrinfo hints{};
    hints.ai_family   = uc.ipv6 ? AF_INET6 : AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;
    hints.ai_flags    = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;  // no DNS at startup

    const std::string port = std::to_string(uc.port);
    const char* host = uc.host.empty() ? nullptr : uc.host.c_str();

    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host, port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
      last_error_ = std::string("getaddrinfo failed: ") + ::gai_strerror(gai);
      return false;
    }

    fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd_ < 0) {
      capture_errno("socket creation failed");
      ::freeaddrinfo(res);
      return false;
    }

    if (res->ai_family == AF_INET6) {
      // accept IPv4-mapped peers as well
      int off = 0;
      if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off)) != 0) {
        capture_errno("IPV6_V6ONLY not cleared, serving IPv6 peers only");
      }
    }

    if (::bind(fd_, res->ai_addr, res->ai_addrlen) != 0) {
      capture_errno("bind failed");
      ::freeaddrinfo(res);
      end();
      return false;
    }

    ::freeaddrinfo(res);
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, PeerAddress& peer) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;

    pollfd pfd{fd_, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, timeout_ms_);
    if (pr == 0) return RxResult::None;                          // timeout
    if (pr < 0) return errno == EINTR ? RxResult::None : fail_rx("poll failed");
    if (!(pfd.revents & POLLIN)) return fail_rx("socket not readable");

    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    // MSG_TRUNC: n is the real datagram length even when it exceeds cap
    const ssize_t n = ::recvfrom(fd_, out, cap, MSG_TRUNC, reinterpret_cast<sockaddr*>(&ss), &sl);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
      return fail_rx("recvfrom failed");
    }

    out_len = static_cast<std::size_t>(n);
    from_sockaddr(ss, peer);
    return out_len > cap ? RxResult::Oversize : RxResult::Ok;
  }

  TxResult send(const uint8_t* data, std::size_t len, const PeerAddress& peer) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;

    sockaddr_storage ss{};
    socklen_t sl = 0;
    if (!to_sockaddr(peer, ss, sl)) {
      last_error_ = "unsupported peer address family";
      return TxResult::Error;
    }

    const ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&ss), sl);
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
    if (w < 0) { capture_errno("sendto failed"); return TxResult::Error; }
    if (static_cast<std::size_t>(w) != len) {
      last_error_ = "partial send";
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  void describe(const PeerAddress& peer, char* out, std::size_t cap) const override {
    if (!out || cap == 0) return;
    char ip[INET6_ADDRSTRLEN] = {0};
    if (peer.family == AddressFamily::IPv4) {
      ::inet_ntop(AF_INET, peer.addr.data(), ip, sizeof(ip));
      std::snprintf(out, cap, "%s:%u", ip, static_cast<unsigned>(peer.port));
    } else if (peer.family == AddressFamily::IPv6) {
      ::inet_ntop(AF_INET6, peer.addr.data(), ip, sizeof(ip));
      std::snprintf(out, cap, "[%s]:%u", ip, static_cast<unsigned>(peer.port));
    } else {
      std::snprintf(out, cap, "unknown");
    }
  }

  const char* name() const override { return "linux-udp"; }
  std::size_t mtu() const override { return mtu_; }

  /// Port actually bound (useful after binding port 0). 0 if not open.
  uint16_t local_port() const {
    if (fd_ < 0) return 0;
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&ss), &sl) != 0) return 0;
    PeerAddress local;
    from_sockaddr(ss, local);
    return local.port;
  }

  bool is_open() const { return fd_ >= 0; }
  const std::string& last_error() const { return last_error_; }

private:
  static void from_sockaddr(const sockaddr_storage& ss, PeerAddress& peer) {
    peer = PeerAddress{};
    if (ss.ss_family == AF_INET) {
      const auto* sin = reinterpret_cast<const sockaddr_in*>(&ss);
      peer.family = AddressFamily::IPv4;
      std::memcpy(peer.addr.data(), &sin->sin_addr, 4);
      peer.port = ntohs(sin->sin_port);
    } else if (ss.ss_family == AF_INET6) {
      const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&ss);
      peer.family = AddressFamily::IPv6;
      std::memcpy(peer.addr.data(), &sin6->sin6_addr, 16);
      peer.port = ntohs(sin6->sin6_port);
      peer.scope_id = sin6->sin6_scope_id;
    }
  }

  static bool to_sockaddr(const PeerAddress& peer, sockaddr_storage& ss, socklen_t& sl) {
    ss = sockaddr_storage{};
    if (peer.family == AddressFamily::IPv4) {
      auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
      sin->sin_family = AF_INET;
      std::memcpy(&sin->sin_addr, peer.addr.data(), 4);
      sin->sin_port = htons(peer.port);
      sl = sizeof(sockaddr_in);
      return true;
    }
    if (peer.family == AddressFamily::IPv6) {
      auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
      sin6->sin6_family = AF_INET6;
      std::memcpy(&sin6->sin6_addr, peer.addr.data(), 16);
      sin6->sin6_port = htons(peer.port);
      sin6->sin6_scope_id = peer.scope_id;
      sl = sizeof(sockaddr_in6);
      return true;
    }
    return false;
  }

  RxResult fail_rx(const char* context) {
    capture_errno(context);
    return RxResult::Error;
  }

  void capture_errno(const char* context) {
    const int err = errno;
    last_error_ = std::string(context) + " (errno " + std::to_string(err) + ": " + std::strerror(err) + ")";
  }

  int fd_{-1};
  int timeout_ms_{500};
  std::size_t mtu_{wire::MAX_PACKET_SIZE};
  std::string last_error_;
};

} // namespace twoping::transport
