#pragma once
// comfoq/connection_manager.hpp — One TCP connection to the gateway.
//
// A ConnectionManager covers exactly one socket lifetime:
//
//   Disconnected --connect()--> Connecting --SO_ERROR==0--> Connected
//   Connected --idle timeout--> Closing (error "timeout", SHUT_WR) --EOF--> destroyed
//   any --socket error--> destroyed (error + disconnect)
//   Connected --EOF--> destroyed (disconnect)
//
// Once destroyed it cannot be reconnected or written to; the owner builds a
// new one. All socket events are handled on a private I/O thread that waits
// in select() on the socket and a wake pipe; notifications are published
// from that thread.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "comfoq/frame.hpp"
#include "comfoq/notifier.hpp"

namespace comfoq {

enum class ConnectionState : uint8_t { Disconnected = 0, Connecting = 1, Connected = 2, Closing = 3 };

const char* to_string(ConnectionState s);

class ConnectionManager {
 public:
  struct Options {
    std::chrono::milliseconds idle_timeout{15'000};
    std::chrono::milliseconds keepalive_interval{5'000};
    // Runs on each decoded frame before it is published.
    std::function<void(Frame&)> annotate;
  };

  ConnectionManager(Notifier& events, Options options);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Starts a non-blocking connect. Throws NotConnectedError when this
  // manager was already used, TransportError when no socket can be created
  // and std::invalid_argument for a malformed host.
  void connect(const std::string& host, uint16_t port);

  // Blocks until every byte is handed to the kernel. Throws
  // NotConnectedError unless Connected, WriteError on failure or when the
  // socket stays unwritable for the idle timeout.
  void write(const std::vector<uint8_t>& data);

  // Graceful close (SHUT_WR); the peer's FIN completes it.
  void end();

  // Immediate teardown. Emits disconnect if the link was up.
  void destroy();

  // Suspends until Connected, destroyed or `deadline`; returns the state.
  ConnectionState wait_settled(std::chrono::steady_clock::time_point deadline);

  ConnectionState state() const;
  bool destroyed() const;

 private:
  Notifier& events_;
  const Options options_;

  int fd_{-1};
  int wake_[2]{-1, -1};
  std::string host_;
  uint16_t port_{0};
  std::thread io_thread_;
  FrameDecoder decoder_;

  mutable std::mutex mu_;
  std::condition_variable state_cv_;
  ConnectionState state_{ConnectionState::Disconnected};
  bool used_{false};
  bool destroyed_{false};
  int pending_error_{0};  // connect() failed synchronously
  std::chrono::steady_clock::time_point last_activity_;

  std::mutex write_mu_;

  void io_loop();
  void touch();
  void set_state(ConnectionState s);

  // Lifecycle handlers, called on the I/O thread only.
  void on_connected();
  void on_timeout();
  void on_socket_error(int err);
  void on_closed(bool had_error);
  void on_end_of_stream();
  void on_inbound_data(const uint8_t* data, size_t size);

  void fail(const std::string& reason, int err);
  void shutdown_write();
  void teardown(bool notify);
};

}  // namespace comfoq
