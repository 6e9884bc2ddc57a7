#pragma once
// comfoq/discovery.hpp — UDP search for the LAN C gateway.
//
// The probe is the two bytes 0x0A 0x00 (an empty searchGatewayRequest).
// Without a known address it is broadcast (or sent to a joined multicast
// group); with one it is sent unicast. The first datagram that decodes as a
// gateway response ends the search. The endpoint is closed before run()
// returns, so the local port is free again once the caller proceeds.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "comfoq/frame.hpp"
#include "comfoq/settings.hpp"

namespace comfoq {

inline constexpr uint8_t kDiscoveryProbe[] = {0x0A, 0x00};

struct GatewayInfo {
  std::string address;  // may be empty; the sender address is used then
  Uuid uuid{};
  uint32_t version = 0;
};

// Payload schema collaborator.
class SchemaDecoder {
 public:
  virtual ~SchemaDecoder() = default;

  // nullopt when `data` is not a gateway response.
  virtual std::optional<GatewayInfo> decode_discovery(const uint8_t* data, size_t size) const = 0;

  // Hook to fill Frame::kind / Frame::parsed before subscribers see a frame.
  virtual void annotate(Frame&) const {
  }
};

// Decodes DiscoveryOperation messages (proto/discovery.proto).
class ProtobufSchemaDecoder : public SchemaDecoder {
 public:
  std::optional<GatewayInfo> decode_discovery(const uint8_t* data, size_t size) const override;
};

struct DiscoveryResult {
  Uuid local_uuid{};
  Uuid remote_uuid{};
  std::string device;  // gateway IPv4 address
  uint16_t port = 0;
  uint16_t bound_port = 0;  // local UDP port used, released on return
};

class DiscoveryProtocol {
 public:
  explicit DiscoveryProtocol(const SchemaDecoder& decoder) : decoder_(decoder) {
  }

  // Throws DiscoveryFailure on any socket error or when no response arrives
  // within settings.discovery_timeout.
  DiscoveryResult run(const Settings& settings);

 private:
  const SchemaDecoder& decoder_;
};

}  // namespace comfoq
