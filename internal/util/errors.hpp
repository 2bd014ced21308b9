#pragma once

#include <stdexcept>
#include <string>

namespace household::util {

/*
  Central error types.

  Only CommandError is surfaced to callers of the client facade. The rest
  are caught at component boundaries, logged, and folded into counters or
  degraded-state bookkeeping.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DiscoveryError : public std::runtime_error {
 public:
  explicit DiscoveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SubscriptionError : public std::runtime_error {
 public:
  explicit SubscriptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TopologyInconsistency : public std::runtime_error {
 public:
  explicit TopologyInconsistency(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommandError : public std::runtime_error {
 public:
  enum class Reason {
    kUnknownDevice,
    kDeviceUnreachable,
    kTransportFailure,
  };

  CommandError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const noexcept {
    return reason_;
  }

 private:
  Reason reason_;
};

} // namespace household::util
