#pragma once
// comfoq/notifier.hpp — Per-bridge notification fan-out.
//
// Handlers run on the connection's I/O thread, in registration order. They
// must not block for long and must not destroy the owning Bridge.

#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "comfoq/frame.hpp"

namespace comfoq {

struct ErrorEvent {
  std::string reason;    // "timeout" or a description of the socket error
  std::error_code code;  // errno of the failing call, empty for timeouts
};

class Notifier {
 public:
  using ConnectedHandler = std::function<void()>;
  using DisconnectHandler = std::function<void()>;
  using ErrorHandler = std::function<void(const ErrorEvent&)>;
  using ReceivedHandler = std::function<void(const Frame&)>;

  Notifier() = default;

  Notifier(const Notifier&) = delete;
  Notifier& operator=(const Notifier&) = delete;

  void on_connected(ConnectedHandler h);
  void on_disconnect(DisconnectHandler h);
  void on_error(ErrorHandler h);
  void on_received(ReceivedHandler h);

  void emit_connected();
  void emit_disconnect();
  void emit_error(const ErrorEvent& e);
  void emit_received(const Frame& f);

 private:
  std::mutex mu_;
  std::vector<ConnectedHandler> connected_subs_;
  std::vector<DisconnectHandler> disconnect_subs_;
  std::vector<ErrorHandler> error_subs_;
  std::vector<ReceivedHandler> received_subs_;
};

}  // namespace comfoq
