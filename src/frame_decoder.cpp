// comfoq/frame_decoder.cpp

#include "comfoq/frame.hpp"

#include <string>

#include "comfoq/errors.hpp"

namespace comfoq {

std::vector<Frame> FrameDecoder::feed(const uint8_t* data, size_t size,
                                      std::chrono::system_clock::time_point now) {
  pending_.insert(pending_.end(), data, data + size);

  std::vector<Frame> frames;
  size_t offset = 0;
  while (pending_.size() - offset >= kLengthPrefixSize) {
    const uint32_t len = read_be32(pending_.data() + offset);
    if (len > kMaxFrameLength) {
      if (!frames.empty()) break;  // hand these out; the next call raises
      pending_.clear();
      throw FramingError("declared frame length " + std::to_string(len) + " exceeds limit");
    }
    const size_t total = kLengthPrefixSize + len;
    if (pending_.size() - offset < total) break;  // rest arrives with a later chunk

    Frame f;
    f.length = len;
    f.payload.assign(pending_.begin() + offset, pending_.begin() + offset + total);
    f.received_at = now;
    frames.push_back(std::move(f));
    offset += total;
  }

  pending_.erase(pending_.begin(), pending_.begin() + offset);
  return frames;
}

}  // namespace comfoq
