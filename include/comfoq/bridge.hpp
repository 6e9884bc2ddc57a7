#pragma once
// comfoq/bridge.hpp — Bridge to one ComfoAir Q gateway.
//
// Typical use:
//   comfoq::Bridge bridge(settings);
//   bridge.events().on_received([](const comfoq::Frame& f) { ... });
//   bridge.discover();
//   bridge.transmit(operation, command);
//
// transmit() is safe to call from several threads; calls are serialized
// and each one builds its own frame buffer.

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "comfoq/connection_manager.hpp"
#include "comfoq/discovery.hpp"
#include "comfoq/notifier.hpp"
#include "comfoq/settings.hpp"
#include "comfoq/tx_header.hpp"

namespace comfoq {

class Bridge {
 public:
  // Throws std::invalid_argument for inconsistent settings. A remote
  // identity and address supplied here count as already discovered.
  explicit Bridge(Settings settings,
                  std::shared_ptr<const SchemaDecoder> decoder =
                      std::make_shared<ProtobufSchemaDecoder>());
  ~Bridge();

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;

  // Runs the UDP search and records the gateway's address and identity.
  // Settings stay untouched when DiscoveryFailure is thrown.
  DiscoveryResult discover();

  // Sends [header][operation][command], connecting first when needed.
  // Throws NotConnectedError, ConnectionTimeout or WriteError.
  void transmit(const std::vector<uint8_t>& operation, const std::vector<uint8_t>& command);

  // Gracefully drops the current connection, if any.
  void close();

  Settings settings() const;
  // Replaces the configuration; the connection is left alone.
  void set_settings(Settings settings);

  DiscoveryState discovery_state() const;
  bool is_discovered() const {
    return discovery_state() == DiscoveryState::Known;
  }
  bool is_connected() const;

  // Number of socket handles constructed so far.
  uint64_t connection_generation() const;

  Notifier& events() {
    return events_;
  }

 private:
  Notifier events_;
  const std::shared_ptr<const SchemaDecoder> decoder_;

  mutable std::mutex mu_;
  std::condition_variable discovered_cv_;
  Settings settings_;
  DiscoveryState discovery_state_{DiscoveryState::Unknown};
  std::unique_ptr<TxHeader> header_;
  std::shared_ptr<ConnectionManager> conn_;
  uint64_t generation_{0};

  std::mutex tx_mu_;        // one transmit in flight
  std::mutex discover_mu_;  // one discovery in flight

  void apply_settings_locked(Settings settings);
  std::shared_ptr<ConnectionManager> ensure_connected();
};

}  // namespace comfoq
