// Stream splitting of the inbound TCP byte stream.

#include <gtest/gtest.h>

#include "comfoq/errors.hpp"
#include "comfoq/frame.hpp"
#include "test_support.h"

using namespace comfoq;
using testing_support::make_frame;

// ── Test: several frames delivered in one read ───────────────────────────────

TEST(FrameDecoder, ConcatenatedFramesInOrder) {
  const std::vector<std::vector<uint8_t>> bodies = {
      {0x01, 0x02, 0x03}, {}, {0xaa}, std::vector<uint8_t>(300, 0x5c)};

  std::vector<uint8_t> chunk;
  for (const auto& b : bodies) {
    auto f = make_frame(b);
    chunk.insert(chunk.end(), f.begin(), f.end());
  }

  FrameDecoder dec;
  auto frames = dec.feed(chunk);

  ASSERT_EQ(frames.size(), bodies.size());
  for (size_t i = 0; i < bodies.size(); ++i) {
    EXPECT_EQ(frames[i].length, bodies[i].size());
    EXPECT_EQ(frames[i].payload, make_frame(bodies[i]));
    EXPECT_EQ(frames[i].kind, -1);
    EXPECT_FALSE(frames[i].parsed.has_value());
  }
  EXPECT_EQ(dec.buffered(), 0u);
}

// ── Test: chunk that is exactly L + 4 bytes ──────────────────────────────────

TEST(FrameDecoder, ExactChunkYieldsOneFrame) {
  FrameDecoder dec;
  auto frames = dec.feed(make_frame({0x10, 0x20, 0x30, 0x40, 0x50}));

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].length, 5u);
  EXPECT_EQ(frames[0].payload.size(), 9u);
  EXPECT_EQ(dec.buffered(), 0u);
}

// ── Test: frame split across two reads is reassembled ───────────────────────

TEST(FrameDecoder, SplitFrameIsReassembled) {
  auto first = make_frame({1, 2, 3, 4, 5, 6});
  auto second = make_frame({7, 8});
  std::vector<uint8_t> stream = first;
  stream.insert(stream.end(), second.begin(), second.end());

  FrameDecoder dec;
  // Cut inside the first frame's length prefix, then inside its body.
  auto a = dec.feed(stream.data(), 2);
  auto b = dec.feed(stream.data() + 2, 5);
  auto c = dec.feed(stream.data() + 7, stream.size() - 7);

  EXPECT_TRUE(a.empty());
  EXPECT_TRUE(b.empty());
  EXPECT_EQ(dec.buffered(), 0u);
  ASSERT_EQ(c.size(), 2u);
  EXPECT_EQ(c[0].payload, first);
  EXPECT_EQ(c[1].payload, second);
}

TEST(FrameDecoder, TrailingPartialFrameStaysBuffered) {
  auto whole = make_frame({9, 9, 9});
  auto partial = make_frame({1, 2, 3, 4});
  std::vector<uint8_t> chunk = whole;
  chunk.insert(chunk.end(), partial.begin(), partial.begin() + 6);

  FrameDecoder dec;
  auto frames = dec.feed(chunk);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(dec.buffered(), 6u);

  dec.reset();
  EXPECT_EQ(dec.buffered(), 0u);
}

// ── Test: absurd length prefix is rejected ───────────────────────────────────

TEST(FrameDecoder, OversizeLengthThrows) {
  std::vector<uint8_t> chunk = {0x7f, 0xff, 0xff, 0xff, 0x00};
  FrameDecoder dec;
  EXPECT_THROW(dec.feed(chunk), FramingError);
  EXPECT_EQ(dec.buffered(), 0u);
}

TEST(FrameDecoder, FramesBeforeOversizeLengthAreKept) {
  std::vector<uint8_t> chunk = {0x00, 0x00, 0x00, 0x01, 0x42, 0x7f, 0xff, 0xff, 0xff};
  FrameDecoder dec;

  auto frames = dec.feed(chunk);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload, make_frame({0x42}));
  EXPECT_EQ(dec.buffered(), 4u);

  EXPECT_THROW(dec.feed(nullptr, 0), FramingError);
  EXPECT_EQ(dec.buffered(), 0u);
}
