// comfoq/settings.cpp

#include "comfoq/settings.hpp"

#include <arpa/inet.h>

#include <stdexcept>

namespace comfoq {

const char* to_string(DiscoveryState s) {
  switch (s) {
    case DiscoveryState::Unknown:
      return "unknown";
    case DiscoveryState::Probing:
      return "probing";
    case DiscoveryState::Known:
      return "known";
  }
  return "?";
}

static bool is_ipv4(const std::string& text) {
  in_addr addr{};
  return ::inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

void Settings::validate() const {
  if (remote_uuid && !remote_address)
    throw std::invalid_argument("remote identity configured without a remote address");
  if (remote_address && !is_ipv4(*remote_address))
    throw std::invalid_argument("remote address is not an IPv4 address: " + *remote_address);
  if (!is_ipv4(multicast_group))
    throw std::invalid_argument("multicast group is not an IPv4 address: " + multicast_group);
  if (port == 0) throw std::invalid_argument("port must not be 0");
  if (idle_timeout.count() <= 0) throw std::invalid_argument("idle timeout must be positive");
  if (discovery_timeout.count() <= 0)
    throw std::invalid_argument("discovery timeout must be positive");
}

}  // namespace comfoq
