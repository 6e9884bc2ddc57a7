// comfoq/bridge.cpp

#include "comfoq/bridge.hpp"

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "comfoq/errors.hpp"
#include "comfoq/hex.hpp"
#include "component_logger.h"

namespace comfoq {

namespace {
const ComponentLogger kLog(ComponentId::Bridge);
}  // namespace

Bridge::Bridge(Settings settings, std::shared_ptr<const SchemaDecoder> decoder)
    : decoder_(std::move(decoder)) {
  if (!decoder_) throw std::invalid_argument("Bridge: schema decoder is required");
  settings.validate();

  std::lock_guard lk(mu_);
  apply_settings_locked(std::move(settings));
  if (discovery_state_ == DiscoveryState::Known)
    kLog.debug("gateway identity already known");
  else
    kLog.debug("gateway identity not known -> discovery needed");
}

Bridge::~Bridge() {
  std::shared_ptr<ConnectionManager> conn;
  {
    std::lock_guard lk(mu_);
    conn = std::move(conn_);
  }
  // Joins the I/O thread outside mu_; handlers may still query the bridge.
  conn.reset();
}

void Bridge::apply_settings_locked(Settings settings) {
  settings_ = std::move(settings);
  if (settings_.discovered()) {
    header_ = std::make_unique<TxHeader>(settings_.local_uuid, *settings_.remote_uuid);
    discovery_state_ = DiscoveryState::Known;
    discovered_cv_.notify_all();
  } else {
    header_.reset();
    discovery_state_ = DiscoveryState::Unknown;
  }
}

DiscoveryResult Bridge::discover() {
  std::lock_guard dlk(discover_mu_);

  Settings snapshot;
  DiscoveryState previous;
  {
    std::lock_guard lk(mu_);
    snapshot = settings_;
    previous = discovery_state_;
    discovery_state_ = DiscoveryState::Probing;
  }

  auto restore = [&] {
    std::lock_guard lk(mu_);
    discovery_state_ = previous;
  };

  DiscoveryResult result;
  try {
    result = DiscoveryProtocol(*decoder_).run(snapshot);
  } catch (const DiscoveryFailure& e) {
    restore();
    kLog.error("discovery failed: %s", e.what());
    throw;
  } catch (...) {
    restore();
    throw;
  }

  {
    std::lock_guard lk(mu_);
    settings_.remote_address = result.device;
    settings_.remote_uuid = result.remote_uuid;
    header_ = std::make_unique<TxHeader>(settings_.local_uuid, result.remote_uuid);
    discovery_state_ = DiscoveryState::Known;
  }
  discovered_cv_.notify_all();

  kLog.info("discovery complete");
  return result;
}

std::shared_ptr<ConnectionManager> Bridge::ensure_connected() {
  std::shared_ptr<ConnectionManager> conn;
  std::shared_ptr<ConnectionManager> stale;
  std::string address;
  uint16_t port = 0;
  std::chrono::milliseconds connect_timeout{};
  {
    std::unique_lock lk(mu_);
    if (conn_ && conn_->state() == ConnectionState::Connected) return conn_;

    // The gateway identity is part of every header.
    if (!discovered_cv_.wait_for(lk, settings_.discovery_wait,
                                 [this] { return discovery_state_ == DiscoveryState::Known; }))
      throw NotConnectedError("gateway not discovered");

    // A handle is never reused: one that was torn down, or that is still
    // winding down a previous connection, is replaced.
    if (conn_ && (conn_->destroyed() || conn_->state() != ConnectionState::Disconnected))
      stale = std::move(conn_);
    if (!conn_) {
      ConnectionManager::Options opts;
      opts.idle_timeout = settings_.idle_timeout;
      opts.keepalive_interval = settings_.keepalive_interval;
      opts.annotate = [decoder = decoder_](Frame& f) { decoder->annotate(f); };
      conn_ = std::make_shared<ConnectionManager>(events_, opts);
      ++generation_;
    }
    conn = conn_;
    address = *settings_.remote_address;
    port = settings_.port;
    connect_timeout = settings_.effective_connect_timeout();
  }

  if (stale) {
    stale->destroy();
    stale.reset();
  }

  try {
    conn->connect(address, port);
  } catch (const TransportError& e) {
    throw NotConnectedError(std::string("bridge not connected: ") + e.what());
  }

  const auto st = conn->wait_settled(std::chrono::steady_clock::now() + connect_timeout);
  if (st == ConnectionState::Connected) return conn;
  if (conn->destroyed()) throw NotConnectedError("bridge not connected");

  conn->destroy();
  kLog.error("connect to %s:%u timed out", address.c_str(), port);
  throw ConnectionTimeout("connect to " + address + " timed out", ETIMEDOUT);
}

void Bridge::transmit(const std::vector<uint8_t>& operation, const std::vector<uint8_t>& command) {
  std::lock_guard tx(tx_mu_);

  auto conn = ensure_connected();

  std::vector<uint8_t> txdata;
  {
    std::lock_guard lk(mu_);
    if (!header_) throw NotConnectedError("gateway identity unknown");
    txdata = header_->build(operation, command);
  }

  if (kLog.enabled(Severity::Trace)) kLog.trace(" -> TX : %s", to_hex(txdata).c_str());

  try {
    conn->write(txdata);
  } catch (const BridgeError& e) {
    kLog.error("error sending data -> %s", e.what());
    throw;
  }
}

void Bridge::close() {
  std::shared_ptr<ConnectionManager> conn;
  {
    std::lock_guard lk(mu_);
    conn = conn_;
  }
  if (conn) conn->end();
}

Settings Bridge::settings() const {
  std::lock_guard lk(mu_);
  return settings_;
}

void Bridge::set_settings(Settings settings) {
  settings.validate();
  std::lock_guard lk(mu_);
  apply_settings_locked(std::move(settings));
}

DiscoveryState Bridge::discovery_state() const {
  std::lock_guard lk(mu_);
  return discovery_state_;
}

bool Bridge::is_connected() const {
  std::lock_guard lk(mu_);
  return conn_ && conn_->state() == ConnectionState::Connected;
}

uint64_t Bridge::connection_generation() const {
  std::lock_guard lk(mu_);
  return generation_;
}

}  // namespace comfoq
