#pragma once
// comfoq/settings.hpp — Bridge configuration and identity tokens.

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace comfoq {

inline constexpr size_t kUuidSize = 16;
using Uuid = std::array<uint8_t, kUuidSize>;

inline constexpr uint16_t kDefaultPort = 56747;
inline constexpr char kDefaultMulticastGroup[] = "255.255.255.255";

enum class DiscoveryState : uint8_t { Unknown = 0, Probing = 1, Known = 2 };

const char* to_string(DiscoveryState s);

struct Settings {
  Uuid local_uuid{};
  std::optional<Uuid> remote_uuid;
  std::optional<std::string> remote_address;

  uint16_t port = kDefaultPort;
  // Local UDP port bound for discovery; unset binds `port`, 0 is ephemeral.
  std::optional<uint16_t> discovery_port;
  std::string multicast_group = kDefaultMulticastGroup;

  std::chrono::milliseconds idle_timeout{15'000};
  std::chrono::milliseconds keepalive_interval{5'000};
  // Unset follows idle_timeout.
  std::optional<std::chrono::milliseconds> connect_timeout;
  std::chrono::milliseconds discovery_timeout{5'000};
  std::chrono::milliseconds discovery_wait{30'000};

  bool verbose = false;
  bool debug = false;

  // Both remote identity and address are known.
  bool discovered() const {
    return remote_uuid.has_value() && remote_address.has_value();
  }

  uint16_t effective_discovery_port() const {
    return discovery_port.value_or(port);
  }

  std::chrono::milliseconds effective_connect_timeout() const {
    return connect_timeout ? std::min(*connect_timeout, idle_timeout) : idle_timeout;
  }

  // Throws std::invalid_argument on an inconsistent configuration.
  void validate() const;
};

}  // namespace comfoq
