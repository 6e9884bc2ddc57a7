// comfoq/discovery.cpp

#include "comfoq/discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <string>

#include "comfoq/errors.hpp"
#include "comfoq/hex.hpp"
#include "component_logger.h"

namespace comfoq {

namespace {
const ComponentLogger kLog(ComponentId::Discovery);

constexpr size_t kMaxDgram = 4096;

// Owns the discovery socket; close() reports failure, the destructor is the
// fallback for error paths.
class UdpEndpoint {
 public:
  UdpEndpoint() : fd_(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0)) {
    if (fd_ < 0) throw DiscoveryFailure("discovery: socket() failed", errno);
  }
  ~UdpEndpoint() {
    if (fd_ >= 0) ::close(fd_);
  }

  UdpEndpoint(const UdpEndpoint&) = delete;
  UdpEndpoint& operator=(const UdpEndpoint&) = delete;

  int fd() const {
    return fd_;
  }

  void close() {
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) throw DiscoveryFailure("discovery: close() failed", errno);
  }

 private:
  int fd_;
};

sockaddr_in make_addr(const std::string& ip, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
    throw DiscoveryFailure("discovery: not an IPv4 address: " + ip);
  return addr;
}

}  // namespace

DiscoveryResult DiscoveryProtocol::run(const Settings& settings) {
  UdpEndpoint ep;

  int opt = 1;
  ::setsockopt(ep.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = INADDR_ANY;
  local.sin_port = htons(settings.effective_discovery_port());
  if (::bind(ep.fd(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0)
    throw DiscoveryFailure("discovery: bind() failed", errno);

  socklen_t llen = sizeof(local);
  if (::getsockname(ep.fd(), reinterpret_cast<sockaddr*>(&local), &llen) < 0)
    throw DiscoveryFailure("discovery: getsockname() failed", errno);
  const uint16_t bound_port = ntohs(local.sin_port);

  sockaddr_in dest{};
  if (!settings.remote_address) {
    dest = make_addr(settings.multicast_group, settings.port);
    if (IN_MULTICAST(ntohl(dest.sin_addr.s_addr))) {
      ip_mreq mreq{};
      mreq.imr_multiaddr = dest.sin_addr;
      mreq.imr_interface.s_addr = htonl(INADDR_ANY);
      if (::setsockopt(ep.fd(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
        throw DiscoveryFailure("discovery: IP_ADD_MEMBERSHIP failed", errno);
    }
    if (::setsockopt(ep.fd(), SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0)
      throw DiscoveryFailure("discovery: SO_BROADCAST failed", errno);
    kLog.debug("searching gateway via %s:%u", settings.multicast_group.c_str(), settings.port);
  } else {
    dest = make_addr(*settings.remote_address, settings.port);
    kLog.debug("probing gateway at %s:%u", settings.remote_address->c_str(), settings.port);
  }

  kLog.trace(" -> TX (UDP) : %s", to_hex(kDiscoveryProbe, sizeof(kDiscoveryProbe)).c_str());
  if (::sendto(ep.fd(), kDiscoveryProbe, sizeof(kDiscoveryProbe), 0,
               reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0)
    throw DiscoveryFailure("discovery: sendto() failed", errno);

  const auto deadline = std::chrono::steady_clock::now() + settings.discovery_timeout;
  uint8_t buf[kMaxDgram];

  while (true) {
    auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero())
      throw DiscoveryFailure("discovery: no gateway response", ETIMEDOUT);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(remaining).count();
    timeval tv{static_cast<time_t>(us / 1'000'000), static_cast<suseconds_t>(us % 1'000'000)};

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(ep.fd(), &fds);
    int rc = ::select(ep.fd() + 1, &fds, nullptr, nullptr, &tv);
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw DiscoveryFailure("discovery: select() failed", errno);
    }
    if (rc == 0) continue;  // deadline check above

    sockaddr_in sender{};
    socklen_t slen = sizeof(sender);
    ssize_t n =
        ::recvfrom(ep.fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&sender), &slen);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      throw DiscoveryFailure("discovery: recvfrom() failed", errno);
    }

    char sender_ip[INET_ADDRSTRLEN]{};
    ::inet_ntop(AF_INET, &sender.sin_addr, sender_ip, sizeof(sender_ip));
    kLog.trace(" <- RX (UDP) : %s (%s:%u)", to_hex(buf, static_cast<size_t>(n)).c_str(),
               sender_ip, ntohs(sender.sin_port));

    auto info = decoder_.decode_discovery(buf, static_cast<size_t>(n));
    if (!info) {
      kLog.debug("ignoring %zd-byte datagram from %s", n, sender_ip);
      continue;
    }

    // The advertised address must be dialable; otherwise reply to the sender.
    in_addr advertised{};
    std::string device = sender_ip;
    if (!info->address.empty()) {
      if (::inet_pton(AF_INET, info->address.c_str(), &advertised) == 1)
        device = info->address;
      else
        kLog.warn("gateway advertised unusable address '%s', using %s", info->address.c_str(),
                  sender_ip);
    }

    DiscoveryResult result;
    result.local_uuid = settings.local_uuid;
    result.remote_uuid = info->uuid;
    result.device = device;
    result.port = settings.port;
    result.bound_port = bound_port;

    ep.close();
    kLog.info("gateway %s found at %s (version %u)", to_hex(result.remote_uuid).c_str(),
              result.device.c_str(), info->version);
    return result;
  }
}

}  // namespace comfoq
