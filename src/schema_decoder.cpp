// comfoq/schema_decoder.cpp — protobuf decoding of discovery responses.

#include <algorithm>

#include "comfoq/discovery.hpp"
#include "component_logger.h"
#include "discovery.pb.h"

namespace comfoq {

namespace {
const ComponentLogger kLog(ComponentId::Decoder);
}  // namespace

std::optional<GatewayInfo> ProtobufSchemaDecoder::decode_discovery(const uint8_t* data,
                                                                   size_t size) const {
  proto::DiscoveryOperation op;
  if (!op.ParseFromArray(data, static_cast<int>(size))) {
    kLog.debug("datagram of %zu bytes is not a DiscoveryOperation", size);
    return std::nullopt;
  }
  if (!op.has_searchgatewayresponse()) return std::nullopt;

  const auto& resp = op.searchgatewayresponse();
  if (resp.uuid().size() != kUuidSize) {
    kLog.warn("gateway response carries a %zu-byte identity", resp.uuid().size());
    return std::nullopt;
  }

  GatewayInfo info;
  info.address = resp.ipaddress();
  std::copy(resp.uuid().begin(), resp.uuid().end(), info.uuid.begin());
  info.version = resp.version();
  return info;
}

}  // namespace comfoq
