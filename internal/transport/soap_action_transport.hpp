#pragma once

#include <string>
#include <string_view>

#include "action_transport.hpp"
#include "internal/util/time.hpp"

namespace household::transport {

struct SoapAction {
  std::string service;
  std::string action;
};

// Splits "Service#Action"; throws TransportError when either half is missing.
SoapAction ParseActionName(std::string_view name);

// Control URL path on the player for a service.
std::string ControlPath(std::string_view service);

std::string ServiceType(std::string_view service);

// SOAP envelope for one call. InstanceID, when present, is written first.
std::string BuildEnvelope(const SoapAction& action, const ActionArgs& args);

// Output arguments of <ActionResponse>. Throws TransportError on a SOAP fault
// or a body that is not a response to action.
ActionResult ParseEnvelope(const SoapAction& action, const std::string& body);

/*
  UPnP control over HTTP POST.

  Each call opens one connection to the device, bounded by timeout. Nothing
  is retried.
*/
class SoapActionTransport : public ActionTransport {
 public:
  explicit SoapActionTransport(util::Millis timeout);

  ActionResult SendAction(const model::Device& device, const std::string& action, const ActionArgs& args) override;

 private:
  util::Millis timeout_;
};

} // namespace household::transport
