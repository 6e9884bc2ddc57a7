#pragma once
// comfoq/frame.hpp — Inbound frame type and the stream splitter.
//
// Wire format of every inbound unit on the TCP stream:
//   [ uint32_t BE length L ][ L bytes ]
//
// A single read may carry several frames, and a frame may straddle two
// reads; the decoder keeps the tail of an incomplete frame until the rest
// arrives.

#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace comfoq {

inline constexpr size_t kLengthPrefixSize = 4;
inline constexpr uint32_t kMaxFrameLength = 1u << 20;

struct Frame {
  uint32_t length = 0;           // declared L from the prefix
  std::vector<uint8_t> payload;  // prefix + L bytes, as received
  std::chrono::system_clock::time_point received_at;
  int kind = -1;  // filled in by a payload decoder, if any
  std::any parsed;
};

class FrameDecoder {
 public:
  FrameDecoder() = default;

  // Appends `size` bytes to the reassembly buffer and returns every frame
  // that is now complete, in stream order. Throws FramingError when a
  // length prefix exceeds kMaxFrameLength; the buffer is dropped in that case.
  // Frames completed ahead of a bad prefix are returned first, and the bad
  // prefix stays buffered so the following call throws.
  std::vector<Frame> feed(const uint8_t* data, size_t size,
                          std::chrono::system_clock::time_point now =
                              std::chrono::system_clock::now());

  std::vector<Frame> feed(const std::vector<uint8_t>& chunk) {
    return feed(chunk.data(), chunk.size());
  }

  // Bytes of an incomplete frame waiting for the next chunk.
  size_t buffered() const {
    return pending_.size();
  }

  void reset() {
    pending_.clear();
  }

 private:
  std::vector<uint8_t> pending_;
};

// Reads a big-endian uint32 at p.
inline uint32_t read_be32(const uint8_t* p) {
  return (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) | (uint32_t{p[2]} << 8) | uint32_t{p[3]};
}

}  // namespace comfoq
