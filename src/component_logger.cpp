#include "component_logger.h"

#include <cstdio>

#include "logger.h"

namespace comfoq {

std::atomic<Logger*> ComponentLogger::sink_{nullptr};

void ComponentLogger::init(Logger* sink) {
  sink_.store(sink, std::memory_order_release);
}

bool ComponentLogger::enabled(Severity severity) const {
  Logger* sink = sink_.load(std::memory_order_acquire);
  return sink && logger_accepts(sink, severity);
}

void ComponentLogger::log_valist(Severity severity, const char* fmt, va_list args) const {
  Logger* sink = sink_.load(std::memory_order_acquire);
  if (!sink || !logger_accepts(sink, severity)) return;

  LogPayload p{};
  p.time = std::chrono::system_clock::now();
  p.severity = severity;
  p.component = component_;
  std::vsnprintf(p.text, sizeof(p.text), fmt, args);
  logger_submit(sink, p);
}

void ComponentLogger::trace(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Trace, fmt, args);
  va_end(args);
}

void ComponentLogger::debug(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Debug, fmt, args);
  va_end(args);
}

void ComponentLogger::info(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Info, fmt, args);
  va_end(args);
}

void ComponentLogger::warn(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Warn, fmt, args);
  va_end(args);
}

void ComponentLogger::error(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(Severity::Error, fmt, args);
  va_end(args);
}

}  // namespace comfoq
