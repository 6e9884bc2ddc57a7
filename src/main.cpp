// comfoq_bridge entry point.
//
// Threads:
//   main        — parses options, runs discovery, then waits on g_running
//   logger      — dedicated: prints every log record
//   connection  — inside ConnectionManager: TCP select() loop, publishes frames
//
// The bridge connects on the first transmit; with --ping the CLI sends one
// empty operation after discovery so the link comes up and frames flow.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "comfoq/bridge.hpp"
#include "comfoq/errors.hpp"
#include "comfoq/hex.hpp"
#include "logger.h"

static std::atomic<bool> g_running{true};

static void shutdown(int) {
  g_running.store(false, std::memory_order_release);
  g_running.notify_all();
}

static void usage(const char* argv0) {
  std::fprintf(stderr,
               "usage: %s [options]\n"
               "  --uuid HEX              local identity (32 hex digits)\n"
               "  --comfo-uuid HEX        gateway identity, skips discovery with --address\n"
               "  --address IP            gateway address (unicast discovery)\n"
               "  --port N                gateway port (default %u)\n"
               "  --multicast IP          discovery broadcast/multicast destination\n"
               "  --discovery-port N      local UDP port for discovery (0 = ephemeral)\n"
               "  --idle-timeout-ms N     TCP idle timeout\n"
               "  --ping                  send an empty frame after discovery\n"
               "  --verbose               log details\n"
               "  --debug                 log raw TX/RX bytes\n",
               argv0, comfoq::kDefaultPort);
}

static bool parse_u16(const char* text, uint16_t& out) {
  char* end = nullptr;
  unsigned long v = std::strtoul(text, &end, 10);
  if (!end || *end != '\0' || v > 0xffff) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

struct CliOptions {
  comfoq::Settings settings;
  bool ping = false;
};

// Returns false on a malformed command line.
static bool parse_args(int argc, char** argv, CliOptions& cli) {
  auto& s = cli.settings;
  s.local_uuid = comfoq::parse_uuid("00000000000000000000000000000001");

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

    if (arg == "--verbose") {
      s.verbose = true;
    } else if (arg == "--debug") {
      s.debug = true;
    } else if (arg == "--ping") {
      cli.ping = true;
    } else if (arg == "--uuid" || arg == "--comfo-uuid") {
      const char* v = value();
      if (!v) return false;
      try {
        auto uuid = comfoq::parse_uuid(v);
        if (arg == "--uuid")
          s.local_uuid = uuid;
        else
          s.remote_uuid = uuid;
      } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return false;
      }
    } else if (arg == "--address") {
      const char* v = value();
      if (!v) return false;
      s.remote_address = v;
    } else if (arg == "--multicast") {
      const char* v = value();
      if (!v) return false;
      s.multicast_group = v;
    } else if (arg == "--port") {
      const char* v = value();
      if (!v || !parse_u16(v, s.port)) return false;
    } else if (arg == "--discovery-port") {
      const char* v = value();
      uint16_t p = 0;
      if (!v || !parse_u16(v, p)) return false;
      s.discovery_port = p;
    } else if (arg == "--idle-timeout-ms") {
      const char* v = value();
      if (!v) return false;
      char* end = nullptr;
      long ms = std::strtol(v, &end, 10);
      if (!end || *end != '\0' || ms <= 0) return false;
      s.idle_timeout = std::chrono::milliseconds(ms);
    } else {
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  CliOptions cli;
  if (!parse_args(argc, argv, cli)) {
    usage(argv[0]);
    return 2;
  }

  std::signal(SIGTERM, shutdown);
  std::signal(SIGINT, shutdown);

  // ── Logger thread ─────────────────────────────────────────────────────────
  auto logger = comfoq::create_logger({cli.settings.verbose, cli.settings.debug});
  const comfoq::ComponentLogger log(comfoq::ComponentId::Main);

  int rc = 0;
  try {
    comfoq::Bridge bridge(cli.settings);

    bridge.events().on_connected([&log] { log.info("link up"); });
    bridge.events().on_disconnect([&log] { log.info("link down"); });
    bridge.events().on_error(
        [&log](const comfoq::ErrorEvent& e) { log.warn("link error: %s", e.reason.c_str()); });
    bridge.events().on_received([&log](const comfoq::Frame& f) {
      log.info("frame of %u bytes", f.length);
    });

    if (!bridge.is_discovered()) {
      auto result = bridge.discover();
      std::printf("gateway %s at %s:%u (local %s)\n", comfoq::to_hex(result.remote_uuid).c_str(),
                  result.device.c_str(), result.port, comfoq::to_hex(result.local_uuid).c_str());
      std::fflush(stdout);
    }

    if (cli.ping) bridge.transmit({}, {});

    // ── Main thread: block on g_running (futex, zero CPU) ──────────────────
    g_running.wait(true);
    bridge.close();
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "invalid configuration: %s\n", e.what());
    rc = 2;
  } catch (const comfoq::BridgeError& e) {
    log.error("%s", e.what());
    rc = 1;
  }

  // ── Cleanup ───────────────────────────────────────────────────────────────
  logger.reset();
  return rc;
}
