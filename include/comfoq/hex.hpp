#pragma once
// comfoq/hex.hpp — Hex helpers for identity tokens and raw-data dumps.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "comfoq/settings.hpp"

namespace comfoq {

std::string to_hex(const uint8_t* data, size_t size);

inline std::string to_hex(const std::vector<uint8_t>& bytes) {
  return to_hex(bytes.data(), bytes.size());
}

inline std::string to_hex(const Uuid& uuid) {
  return to_hex(uuid.data(), uuid.size());
}

// Accepts 32 hex digits, optionally with '-' separators (UUID notation).
// Throws std::invalid_argument otherwise.
Uuid parse_uuid(std::string_view text);

}  // namespace comfoq
