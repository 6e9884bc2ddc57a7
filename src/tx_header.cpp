// comfoq/tx_header.cpp

#include "comfoq/tx_header.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace comfoq {

TxHeader::TxHeader(const Uuid& local, const Uuid& remote) {
  std::copy(local.begin(), local.end(), bytes_.begin() + kLocalUuidOffset);
  std::copy(remote.begin(), remote.end(), bytes_.begin() + kRemoteUuidOffset);
}

std::vector<uint8_t> TxHeader::build(const std::vector<uint8_t>& operation,
                                     const std::vector<uint8_t>& command) const {
  if (operation.size() > std::numeric_limits<uint16_t>::max())
    throw std::length_error("operation does not fit the 16-bit length field");

  const size_t msg_len = 2 * kUuidSize + 2 + operation.size() + command.size();
  if (msg_len > std::numeric_limits<uint32_t>::max())
    throw std::length_error("message does not fit the 32-bit length field");

  std::vector<uint8_t> buf;
  buf.reserve(kSize + operation.size() + command.size());
  buf.insert(buf.end(), bytes_.begin(), bytes_.end());
  buf.insert(buf.end(), operation.begin(), operation.end());
  buf.insert(buf.end(), command.begin(), command.end());

  const auto total = static_cast<uint32_t>(msg_len);
  buf[kTotalLengthOffset + 0] = static_cast<uint8_t>(total >> 24);
  buf[kTotalLengthOffset + 1] = static_cast<uint8_t>(total >> 16);
  buf[kTotalLengthOffset + 2] = static_cast<uint8_t>(total >> 8);
  buf[kTotalLengthOffset + 3] = static_cast<uint8_t>(total);

  const auto op_len = static_cast<uint16_t>(operation.size());
  buf[kOperationLengthOffset + 0] = static_cast<uint8_t>(op_len >> 8);
  buf[kOperationLengthOffset + 1] = static_cast<uint8_t>(op_len);
  return buf;
}

}  // namespace comfoq
