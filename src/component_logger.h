#pragma once
// component_logger.h — printf-style logging front end tagged per component.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>

namespace comfoq {

enum class Severity : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4 };
enum class ComponentId : uint8_t { Main = 0, Bridge = 1, Connection = 2, Discovery = 3, Decoder = 4 };

struct LogPayload {
  std::chrono::system_clock::time_point time;
  Severity severity;
  ComponentId component;
  char text[256];
};

class Logger;

class ComponentLogger {
 public:
  explicit ComponentLogger(ComponentId component) : component_(component) {
  }

  // Routes every ComponentLogger to `sink`; nullptr detaches. Without a sink
  // all calls are no-ops.
  static void init(Logger* sink);

  // False when the sink would drop `severity`; lets callers skip building
  // expensive arguments such as hex dumps.
  bool enabled(Severity severity) const;

  void trace(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void debug(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void info(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void warn(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void error(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));

 private:
  static std::atomic<Logger*> sink_;
  ComponentId component_;

  void log_valist(Severity severity, const char* fmt, va_list args) const;
};

}  // namespace comfoq
