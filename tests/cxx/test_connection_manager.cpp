// Connection lifecycle against a loopback TCP peer.

#include <gtest/gtest.h>

#include <thread>

#include "comfoq/connection_manager.hpp"
#include "comfoq/errors.hpp"
#include "test_support.h"

using namespace comfoq;
using namespace std::chrono_literals;
using testing_support::EventRecorder;
using testing_support::make_frame;
using testing_support::StalledListener;
using testing_support::TcpTestServer;

namespace {

ConnectionManager::Options short_timeouts(std::chrono::milliseconds idle = 2000ms) {
  ConnectionManager::Options o;
  o.idle_timeout = idle;
  o.keepalive_interval = 1000ms;
  return o;
}

// A port nobody listens on.
uint16_t closed_port() {
  TcpTestServer probe;
  return probe.port();
}

}  // namespace

// ── Test: connect reaches Connected and publishes "connected" ───────────────

TEST(ConnectionManager, ConnectPublishesConnected) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  EXPECT_EQ(conn.state(), ConnectionState::Disconnected);
  conn.connect("127.0.0.1", server.port());
  ASSERT_GE(server.accept_one(), 0);

  EXPECT_EQ(conn.wait_settled(std::chrono::steady_clock::now() + 5s), ConnectionState::Connected);
  ASSERT_TRUE(rec.wait_for("connected"));
  EXPECT_FALSE(conn.destroyed());
}

// ── Test: inbound frames are split and published in order ───────────────────

TEST(ConnectionManager, InboundFramesPublishedInOrder) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", server.port());
  int peer = server.accept_one();
  ASSERT_GE(peer, 0);
  ASSERT_TRUE(rec.wait_for("connected"));

  auto a = make_frame({0x01, 0x02});
  auto b = make_frame({0x03});
  auto c = make_frame({0x04, 0x05, 0x06});
  std::vector<uint8_t> burst = a;
  burst.insert(burst.end(), b.begin(), b.end());
  burst.insert(burst.end(), c.begin(), c.begin() + 3);  // split inside c's prefix
  TcpTestServer::send_all(peer, burst);
  ASSERT_TRUE(rec.wait_for("received", 2));

  std::this_thread::sleep_for(50ms);
  TcpTestServer::send_all(peer, std::vector<uint8_t>(c.begin() + 3, c.end()));
  ASSERT_TRUE(rec.wait_for("received", 3));

  auto frames = rec.frames();
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0].payload, a);
  EXPECT_EQ(frames[1].payload, b);
  EXPECT_EQ(frames[2].payload, c);
}

// ── Test: idle timeout while connected ───────────────────────────────────────

TEST(ConnectionManager, IdleTimeoutEmitsErrorThenDisconnect) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts(300ms));

  conn.connect("127.0.0.1", server.port());
  int peer = server.accept_one();
  ASSERT_GE(peer, 0);
  ASSERT_TRUE(rec.wait_for("connected"));

  // The manager ends its side on timeout; the peer answers by closing.
  ASSERT_TRUE(TcpTestServer::wait_eof(peer));
  server.close_client(peer);

  ASSERT_TRUE(rec.wait_for("disconnect"));
  std::this_thread::sleep_for(500ms);

  EXPECT_EQ(rec.count("error:timeout"), 1u);
  EXPECT_EQ(rec.count("disconnect"), 1u);
  auto log = rec.log();
  ASSERT_EQ(log.size(), 3u);
  EXPECT_EQ(log[0], "connected");
  EXPECT_EQ(log[1], "error:timeout");
  EXPECT_EQ(log[2], "disconnect");
  EXPECT_EQ(conn.state(), ConnectionState::Disconnected);
  EXPECT_TRUE(conn.destroyed());
}

// ── Test: idle timeout during the handshake is silent ───────────────────────

TEST(ConnectionManager, TimeoutWhileConnectingIsSilent) {
  StalledListener gateway;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts(300ms));

  conn.connect("127.0.0.1", gateway.port());
  EXPECT_EQ(conn.state(), ConnectionState::Connecting);
  EXPECT_EQ(conn.wait_settled(std::chrono::steady_clock::now() + 3s),
            ConnectionState::Disconnected);

  EXPECT_TRUE(conn.destroyed());
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(rec.log().empty());
}

// ── Test: frames ahead of a bad length prefix are still delivered ──────────

TEST(ConnectionManager, OversizePrefixAfterFrameFailsLink) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", server.port());
  int peer = server.accept_one();
  ASSERT_GE(peer, 0);
  ASSERT_TRUE(rec.wait_for("connected"));

  auto good = make_frame({0x42});
  std::vector<uint8_t> burst = good;
  burst.insert(burst.end(), {0x7f, 0xff, 0xff, 0xff});
  TcpTestServer::send_all(peer, burst);

  ASSERT_TRUE(rec.wait_for("disconnect"));
  auto frames = rec.frames();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload, good);
  auto log = rec.log();
  ASSERT_EQ(log.size(), 4u);
  EXPECT_EQ(log[1], "received");
  EXPECT_EQ(log[2].rfind("error:", 0), 0u);
  EXPECT_EQ(log[3], "disconnect");
  EXPECT_TRUE(conn.destroyed());
}

// ── Test: the peer closing ends the handle ──────────────────────────────────

TEST(ConnectionManager, PeerCloseDestroysHandle) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", server.port());
  int peer = server.accept_one();
  ASSERT_GE(peer, 0);
  ASSERT_TRUE(rec.wait_for("connected"));

  server.close_client(peer);
  ASSERT_TRUE(rec.wait_for("disconnect"));

  EXPECT_EQ(rec.count("error:timeout"), 0u);
  EXPECT_TRUE(conn.destroyed());
  EXPECT_THROW(conn.write({0x00}), NotConnectedError);
  EXPECT_THROW(conn.connect("127.0.0.1", server.port()), NotConnectedError);
}

// ── Test: refused connect reports an error and settles destroyed ────────────

TEST(ConnectionManager, RefusedConnectReportsError) {
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", closed_port());
  conn.wait_settled(std::chrono::steady_clock::now() + 5s);

  EXPECT_TRUE(conn.destroyed());
  ASSERT_TRUE(rec.wait_for("disconnect"));
  EXPECT_EQ(rec.count("connected"), 0u);
  auto log = rec.log();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].rfind("error:", 0), 0u);
  EXPECT_EQ(log[1], "disconnect");
}

// ── Test: write before connecting ───────────────────────────────────────────

TEST(ConnectionManager, WriteRequiresConnection) {
  Notifier events;
  ConnectionManager conn(events, short_timeouts());
  EXPECT_THROW(conn.write({0x01, 0x02}), NotConnectedError);
  EXPECT_THROW(conn.connect("not-an-address", 1234), std::invalid_argument);
}

// ── Test: written bytes reach the peer intact ───────────────────────────────

TEST(ConnectionManager, WriteDeliversBytes) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", server.port());
  int peer = server.accept_one();
  ASSERT_GE(peer, 0);
  ASSERT_EQ(conn.wait_settled(std::chrono::steady_clock::now() + 5s), ConnectionState::Connected);

  auto frame = make_frame(std::vector<uint8_t>(200'000, 0x42));
  std::thread writer([&] { conn.write(frame); });
  auto got = TcpTestServer::read_frame(peer);
  writer.join();

  EXPECT_EQ(got, frame);
}

// ── Test: destroy() tears down a live link ──────────────────────────────────

TEST(ConnectionManager, DestroyEmitsDisconnect) {
  TcpTestServer server;
  Notifier events;
  EventRecorder rec(events);
  ConnectionManager conn(events, short_timeouts());

  conn.connect("127.0.0.1", server.port());
  ASSERT_GE(server.accept_one(), 0);
  ASSERT_TRUE(rec.wait_for("connected"));

  conn.destroy();

  EXPECT_TRUE(conn.destroyed());
  EXPECT_EQ(rec.count("disconnect"), 1u);
  EXPECT_EQ(rec.count("error:timeout"), 0u);
}
