#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include "internal/model/device.hpp"

namespace household::transport {

using ActionArgs   = std::map<std::string, std::string>;
using ActionResult = std::map<std::string, std::string>;

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Outbound control channel.

  action is "Service#Action", e.g. "AVTransport#Play". Timeouts and retries
  are the transport's business; callers see one TransportError.
*/
class ActionTransport {
 public:
  virtual ~ActionTransport() = default;

  virtual ActionResult SendAction(const model::Device& device, const std::string& action, const ActionArgs& args) = 0;
};

} // namespace household::transport
