#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace household::discovery {

struct Datagram {
  std::string payload;
  std::string sender;
};

/*
  Multicast send/receive primitive. Receive() returns datagrams from both
  unicast search responses and multicast presence announcements.
*/
class DiscoverySocket {
 public:
  virtual ~DiscoverySocket() = default;

  // Throws util::DiscoveryError.
  virtual void SendSearch(const std::string& request) = 0;

  // Blocks up to timeout; nullopt on timeout or after Close().
  virtual std::optional<Datagram> Receive(util::Millis timeout) = 0;

  virtual void Close() = 0;
};

} // namespace household::discovery
