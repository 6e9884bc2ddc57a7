#pragma once
// comfoq/tx_header.hpp — Outbound message header.
//
// Wire format of every outbound message:
//   [ uint32_t BE total ][ local uuid 16 ][ remote uuid 16 ][ uint16_t BE op_len ]
//   [ operation bytes ][ command bytes ]
// where total = 16 + 16 + 2 + |operation| + |command|.
//
// The template is immutable; build() copies it into a fresh buffer and
// writes the two length fields there, so concurrent builds never share state.

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "comfoq/settings.hpp"

namespace comfoq {

class TxHeader {
 public:
  static constexpr size_t kSize = 38;
  static constexpr size_t kTotalLengthOffset = 0;
  static constexpr size_t kLocalUuidOffset = 4;
  static constexpr size_t kRemoteUuidOffset = 20;
  static constexpr size_t kOperationLengthOffset = 36;

  TxHeader(const Uuid& local, const Uuid& remote);

  std::vector<uint8_t> build(const std::vector<uint8_t>& operation,
                             const std::vector<uint8_t>& command) const;

  const std::array<uint8_t, kSize>& bytes() const {
    return bytes_;
  }

 private:
  std::array<uint8_t, kSize> bytes_{};
};

}  // namespace comfoq
