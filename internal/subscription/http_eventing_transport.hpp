#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "eventing_transport.hpp"

namespace household::subscription {

// "Second-1800" for 1800s.
std::string FormatTimeoutHeader(util::Millis timeout);

// Parses a GENA TIMEOUT header. "infinite" and malformed values yield nullopt.
std::optional<util::Millis> ParseTimeoutHeader(std::string_view value);

/*
  UPnP GENA over HTTP.

  SUBSCRIBE carries CALLBACK and NT for a new subscription and SID for a
  renewal; UNSUBSCRIBE carries SID. Requests go to the device's event URL for
  the category.
*/
class HttpEventingTransport final : public EventingTransport {
 public:
  explicit HttpEventingTransport(util::Millis request_timeout);

  SubscriptionGrant Subscribe(const model::Device& device, model::EventCategory category, const std::string& callback_url,
                              util::Millis requested_timeout) override;

  SubscriptionGrant Renew(const model::Device& device, model::EventCategory category, const std::string& sid,
                          util::Millis requested_timeout) override;

  void Unsubscribe(const model::Device& device, model::EventCategory category, const std::string& sid) override;

 private:
  util::Millis request_timeout_;
};

} // namespace household::subscription
