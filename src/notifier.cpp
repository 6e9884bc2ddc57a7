// comfoq/notifier.cpp

#include "comfoq/notifier.hpp"

namespace comfoq {

void Notifier::on_connected(ConnectedHandler h) {
  std::lock_guard lk(mu_);
  connected_subs_.push_back(std::move(h));
}

void Notifier::on_disconnect(DisconnectHandler h) {
  std::lock_guard lk(mu_);
  disconnect_subs_.push_back(std::move(h));
}

void Notifier::on_error(ErrorHandler h) {
  std::lock_guard lk(mu_);
  error_subs_.push_back(std::move(h));
}

void Notifier::on_received(ReceivedHandler h) {
  std::lock_guard lk(mu_);
  received_subs_.push_back(std::move(h));
}

// Snapshot handlers under lock, call them outside.

void Notifier::emit_connected() {
  std::vector<ConnectedHandler> handlers;
  {
    std::lock_guard lk(mu_);
    handlers = connected_subs_;
  }
  for (auto& h : handlers) h();
}

void Notifier::emit_disconnect() {
  std::vector<DisconnectHandler> handlers;
  {
    std::lock_guard lk(mu_);
    handlers = disconnect_subs_;
  }
  for (auto& h : handlers) h();
}

void Notifier::emit_error(const ErrorEvent& e) {
  std::vector<ErrorHandler> handlers;
  {
    std::lock_guard lk(mu_);
    handlers = error_subs_;
  }
  for (auto& h : handlers) h(e);
}

void Notifier::emit_received(const Frame& f) {
  std::vector<ReceivedHandler> handlers;
  {
    std::lock_guard lk(mu_);
    handlers = received_subs_;
  }
  for (auto& h : handlers) h(f);
}

}  // namespace comfoq
