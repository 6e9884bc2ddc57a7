#pragma once
// comfoq/errors.hpp — Exception hierarchy surfaced to bridge callers.
//
// Transport-level failures are turned into notifications by the
// ConnectionManager; the types below are what transmit()/discover() throw.

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

namespace comfoq {

class BridgeError : public std::runtime_error {
 public:
  explicit BridgeError(const std::string& what, int err = 0)
      : std::runtime_error(err ? what + ": " + std::generic_category().message(err) : what),
        code_(err, std::generic_category()) {
  }

  // errno of the failing syscall, or an empty code.
  const std::error_code& code() const noexcept {
    return code_;
  }

 private:
  std::error_code code_;
};

class DiscoveryFailure : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

class ConnectionTimeout : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

class TransportError : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

class NotConnectedError : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

class WriteError : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

class FramingError : public BridgeError {
 public:
  using BridgeError::BridgeError;
};

}  // namespace comfoq
