// comfoq/hex.cpp

#include "comfoq/hex.hpp"

#include <stdexcept>

namespace comfoq {

static constexpr char kDigits[] = "0123456789abcdef";

std::string to_hex(const uint8_t* data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

static int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Uuid parse_uuid(std::string_view text) {
  Uuid out{};
  size_t n = 0;
  int hi = -1;
  for (char c : text) {
    if (c == '-') continue;
    int v = nibble(c);
    if (v < 0) throw std::invalid_argument("invalid hex digit in identity: " + std::string(text));
    if (n == kUuidSize)
      throw std::invalid_argument("identity longer than 16 bytes: " + std::string(text));
    if (hi < 0) {
      hi = v;
    } else {
      out[n++] = static_cast<uint8_t>((hi << 4) | v);
      hi = -1;
    }
  }
  if (n != kUuidSize || hi >= 0)
    throw std::invalid_argument("identity must be 32 hex digits: " + std::string(text));
  return out;
}

}  // namespace comfoq
