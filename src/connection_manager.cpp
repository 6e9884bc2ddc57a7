// comfoq/connection_manager.cpp — TCP state machine on a select() I/O thread.

#include "comfoq/connection_manager.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "comfoq/errors.hpp"
#include "comfoq/hex.hpp"
#include "component_logger.h"

namespace comfoq {

namespace {
const ComponentLogger kLog(ComponentId::Connection);

constexpr size_t kReadChunk = 4096;

int millis(std::chrono::steady_clock::duration d) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  return static_cast<int>(std::clamp<long long>(ms, 0, 1'000'000'000));
}
}  // namespace

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected:
      return "disconnected";
    case ConnectionState::Connecting:
      return "connecting";
    case ConnectionState::Connected:
      return "connected";
    case ConnectionState::Closing:
      return "closing";
  }
  return "?";
}

ConnectionManager::ConnectionManager(Notifier& events, Options options)
    : events_(events), options_(options) {
}

ConnectionManager::~ConnectionManager() {
  destroy();
  if (fd_ >= 0) ::close(fd_);
  if (wake_[0] >= 0) ::close(wake_[0]);
  if (wake_[1] >= 0) ::close(wake_[1]);
}

void ConnectionManager::connect(const std::string& host, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
    throw std::invalid_argument("ConnectionManager: not an IPv4 address: " + host);

  {
    std::lock_guard lk(mu_);
    if (used_ || destroyed_)
      throw NotConnectedError("socket handle already used; a new connection is required");
    used_ = true;
  }
  host_ = host;
  port_ = port;

  fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd_ < 0 || ::pipe(wake_) < 0) {
    const int err = errno;
    std::lock_guard lk(mu_);
    destroyed_ = true;
    throw TransportError("ConnectionManager: socket()/pipe() failed", err);
  }

  // Flush writes promptly and probe an idle link.
  int one = 1;
  int keep_s = std::max(1, static_cast<int>(options_.keepalive_interval.count() / 1000));
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0 ||
      ::setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one)) < 0 ||
      ::setsockopt(fd_, IPPROTO_TCP, TCP_KEEPIDLE, &keep_s, sizeof(keep_s)) < 0 ||
      ::setsockopt(fd_, IPPROTO_TCP, TCP_KEEPINTVL, &keep_s, sizeof(keep_s)) < 0) {
    kLog.warn("setsockopt() failed: %s", std::strerror(errno));
  }

  set_state(ConnectionState::Connecting);
  touch();
  kLog.debug("connecting to %s:%u", host_.c_str(), port_);

  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 &&
      errno != EINPROGRESS) {
    std::lock_guard lk(mu_);
    pending_error_ = errno;
  }

  io_thread_ = std::thread(&ConnectionManager::io_loop, this);
}

void ConnectionManager::write(const std::vector<uint8_t>& data) {
  std::lock_guard wlk(write_mu_);

  size_t off = 0;
  while (off < data.size()) {
    {
      std::lock_guard lk(mu_);
      if (state_ != ConnectionState::Connected || destroyed_)
        throw NotConnectedError(std::string("write while ") + to_string(state_));
    }

    ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n > 0) {
      off += static_cast<size_t>(n);
      touch();
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      int pr = ::poll(&pfd, 1, millis(options_.idle_timeout));
      if (pr == 0) throw WriteError("send() stalled", ETIMEDOUT);
      if (pr < 0 && errno != EINTR) throw WriteError("poll()", errno);
      continue;
    }
    throw WriteError("send()", n < 0 ? errno : EPIPE);
  }
}

void ConnectionManager::end() {
  std::lock_guard lk(mu_);
  if (state_ != ConnectionState::Connected) return;
  ::shutdown(fd_, SHUT_WR);
  state_ = ConnectionState::Closing;
  state_cv_.notify_all();
}

void ConnectionManager::destroy() {
  if (io_thread_.joinable() && std::this_thread::get_id() != io_thread_.get_id()) {
    char b = 0;
    (void)::write(wake_[1], &b, 1);
    io_thread_.join();
    return;
  }
  teardown(false);
}

ConnectionState ConnectionManager::wait_settled(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lk(mu_);
  state_cv_.wait_until(lk, deadline,
                       [this] { return state_ == ConnectionState::Connected || destroyed_; });
  return state_;
}

ConnectionState ConnectionManager::state() const {
  std::lock_guard lk(mu_);
  return state_;
}

bool ConnectionManager::destroyed() const {
  std::lock_guard lk(mu_);
  return destroyed_;
}

void ConnectionManager::touch() {
  std::lock_guard lk(mu_);
  last_activity_ = std::chrono::steady_clock::now();
}

void ConnectionManager::set_state(ConnectionState s) {
  {
    std::lock_guard lk(mu_);
    state_ = s;
  }
  state_cv_.notify_all();
}

void ConnectionManager::io_loop() {
  uint8_t buf[kReadChunk];

  int err = 0;
  {
    std::lock_guard lk(mu_);
    err = pending_error_;
  }
  if (err) {
    on_socket_error(err);
    return;
  }

  while (true) {
    ConnectionState st;
    std::chrono::steady_clock::time_point deadline;
    {
      std::lock_guard lk(mu_);
      if (destroyed_) return;
      st = state_;
      deadline = last_activity_ + options_.idle_timeout;
    }

    fd_set rfds, wfds;
    FD_ZERO(&rfds);
    FD_ZERO(&wfds);
    FD_SET(wake_[0], &rfds);
    if (st == ConnectionState::Connecting)
      FD_SET(fd_, &wfds);
    else
      FD_SET(fd_, &rfds);
    int maxfd = std::max(fd_, wake_[0]) + 1;

    auto remaining = std::max(deadline - std::chrono::steady_clock::now(),
                              std::chrono::steady_clock::duration::zero());
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(remaining).count();
    timeval tv{static_cast<time_t>(us / 1'000'000), static_cast<suseconds_t>(us % 1'000'000)};

    int rc = ::select(maxfd, &rfds, &wfds, nullptr, &tv);
    if (rc < 0) {
      if (errno == EINTR) continue;
      on_socket_error(errno);
      return;
    }
    if (FD_ISSET(wake_[0], &rfds)) {
      teardown(st == ConnectionState::Connected || st == ConnectionState::Closing);
      return;
    }

    if (rc == 0) {
      {
        // A write may have refreshed the deadline meanwhile.
        std::lock_guard lk(mu_);
        if (std::chrono::steady_clock::now() < last_activity_ + options_.idle_timeout) continue;
      }
      on_timeout();
      if (destroyed()) return;
      continue;
    }

    if (st == ConnectionState::Connecting && FD_ISSET(fd_, &wfds)) {
      int so_err = 0;
      socklen_t len = sizeof(so_err);
      if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0) so_err = errno;
      if (so_err) {
        on_socket_error(so_err);
        return;
      }
      on_connected();
      continue;
    }

    if (FD_ISSET(fd_, &rfds)) {
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n > 0) {
        touch();
        on_inbound_data(buf, static_cast<size_t>(n));
        if (destroyed()) return;
        continue;
      }
      if (n == 0) {
        on_end_of_stream();
        on_closed(false);
        return;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      on_socket_error(errno);
      return;
    }
  }
}

void ConnectionManager::on_connected() {
  touch();
  kLog.info("connected to %s:%u", host_.c_str(), port_);
  // Subscribers hear `connected` before wait_settled() releases a caller.
  events_.emit_connected();
  set_state(ConnectionState::Connected);
}

void ConnectionManager::on_timeout() {
  const ConnectionState st = state();
  kLog.error("TCP socket timeout while %s", to_string(st));

  switch (st) {
    case ConnectionState::Connected:
      events_.emit_error(ErrorEvent{"timeout", {}});
      shutdown_write();
      set_state(ConnectionState::Closing);
      touch();  // give the peer one more idle period to finish the close
      break;
    case ConnectionState::Closing:
      on_closed(false);
      break;
    case ConnectionState::Connecting:
    case ConnectionState::Disconnected:
      teardown(false);
      break;
  }
}

void ConnectionManager::on_socket_error(int err) {
  kLog.error("socket error: %s", std::strerror(err));
  fail(std::strerror(err), err);
}

void ConnectionManager::fail(const std::string& reason, int err) {
  events_.emit_error(ErrorEvent{reason, std::error_code(err, std::generic_category())});
  shutdown_write();
  on_closed(true);
}

void ConnectionManager::on_closed(bool had_error) {
  if (had_error)
    kLog.error("TCP socket closed with error");
  else
    kLog.info("TCP socket closed");
  teardown(true);
}

void ConnectionManager::on_end_of_stream() {
  kLog.info("TCP socket ended by peer");
}

void ConnectionManager::on_inbound_data(const uint8_t* data, size_t size) {
  try {
    auto frames = decoder_.feed(data, size);
    for (auto& f : frames) {
      if (options_.annotate) options_.annotate(f);
      if (kLog.enabled(Severity::Trace))
        kLog.trace(" <- RX : %s", to_hex(f.payload).c_str());
      events_.emit_received(f);
    }
    // Surfaces a bad prefix left behind the frames just delivered.
    if (!frames.empty() && decoder_.buffered() >= kLengthPrefixSize) decoder_.feed(nullptr, 0);
  } catch (const FramingError& e) {
    kLog.error("%s", e.what());
    fail(e.what(), 0);
  }
}

void ConnectionManager::shutdown_write() {
  std::lock_guard lk(mu_);
  if (!destroyed_ && fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

void ConnectionManager::teardown(bool notify) {
  {
    std::lock_guard lk(mu_);
    if (destroyed_) return;
    destroyed_ = true;
    state_ = ConnectionState::Disconnected;
    // The descriptor itself is released in the destructor, after the I/O
    // thread is joined; shutting it down fails any writer still blocked on it.
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
  }
  state_cv_.notify_all();
  if (notify) events_.emit_disconnect();
}

}  // namespace comfoq
