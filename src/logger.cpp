// src/logger.cpp

#include "logger.h"

#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <queue>
#include <thread>

namespace comfoq {

static constexpr const char* sev_str(Severity s) {
  switch (s) {
    case Severity::Trace:
      return "TRACE";
    case Severity::Debug:
      return "DEBUG";
    case Severity::Info:
      return "INFO";
    case Severity::Warn:
      return "WARN";
    case Severity::Error:
      return "ERROR";
  }
  return "?";
}

static constexpr const char* comp_str(ComponentId c) {
  switch (c) {
    case ComponentId::Main:
      return "main";
    case ComponentId::Bridge:
      return "bridge";
    case ComponentId::Connection:
      return "connection";
    case ComponentId::Discovery:
      return "discovery";
    case ComponentId::Decoder:
      return "decoder";
  }
  return "?";
}

// "2026-10-17 21:18:03.042", local time.
static void format_time(std::chrono::system_clock::time_point t, char* out, size_t size) {
  const auto secs = std::chrono::system_clock::to_time_t(t);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
  std::tm tm{};
  ::localtime_r(&secs, &tm);
  char date[32]{};
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
  std::snprintf(out, size, "%s.%03d", date, static_cast<int>(ms));
}

class Logger {
 public:
  explicit Logger(const LogOptions& options) : options_(options) {
    thread_ = std::thread([this] {
      std::unique_lock lk(mu_);
      while (true) {
        cv_.wait(lk, [this] { return !queue_.empty() || !running_; });
        while (!queue_.empty()) {
          auto p = queue_.front();
          queue_.pop();
          lk.unlock();

          char stamp[48]{};
          format_time(p.time, stamp, sizeof(stamp));
          std::printf("[%s][%s][%s] %s\n", stamp, sev_str(p.severity), comp_str(p.component),
                      p.text);
          std::fflush(stdout);

          lk.lock();
        }
        if (!running_) break;
      }
    });
  }

  ~Logger() {
    {
      std::lock_guard lk(mu_);
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  bool accepts(Severity s) const {
    if (s == Severity::Trace) return options_.raw;
    if (s == Severity::Debug) return options_.verbose;
    return true;
  }

  void submit(const LogPayload& p) {
    {
      std::lock_guard lk(mu_);
      queue_.push(p);
    }
    cv_.notify_one();
  }

 private:
  const LogOptions options_;
  std::queue<LogPayload> queue_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool running_{true};
  std::thread thread_;
};

LoggerPtr create_logger(const LogOptions& options) {
  LoggerPtr logger(new Logger(options));
  ComponentLogger::init(logger.get());
  return logger;
}

void destroy_logger(Logger* logger) {
  ComponentLogger::init(nullptr);
  delete logger;
}

bool logger_accepts(const Logger* logger, Severity severity) {
  return logger->accepts(severity);
}

void logger_submit(Logger* logger, const LogPayload& payload) {
  logger->submit(payload);
}

}  // namespace comfoq
