#pragma once
// logger.h — Asynchronous log sink fed by ComponentLogger.
#include <memory>

#include "component_logger.h"

namespace comfoq {
// Opaque pointer wrapper to prevent dragging `<mutex>` into main
class Logger;
void destroy_logger(Logger* logger);

struct LoggerDeleter {
  void operator()(Logger* p) const {
    destroy_logger(p);
  }
};

using LoggerPtr = std::unique_ptr<Logger, LoggerDeleter>;

struct LogOptions {
  bool verbose = false;  // Debug records ("details")
  bool raw = false;      // Trace records (raw TX/RX hex dumps)
};

// Starts the printer thread and attaches it to ComponentLogger. Destroying
// the returned pointer detaches it and flushes pending records.
LoggerPtr create_logger(const LogOptions& options);

bool logger_accepts(const Logger* logger, Severity severity);
void logger_submit(Logger* logger, const LogPayload& payload);
}  // namespace comfoq
