#pragma once

#include <string>

#include "internal/model/device.hpp"
#include "internal/model/event_category.hpp"
#include "internal/util/time.hpp"

namespace household::subscription {

struct SubscriptionGrant {
  std::string  sid;
  util::Millis timeout{0};
};

/*
  The SUBSCRIBE / renew / UNSUBSCRIBE exchange with one device.

  Every call blocks for at most the transport's request timeout and reports
  failure as util::SubscriptionError.
*/
class EventingTransport {
 public:
  virtual ~EventingTransport() = default;

  virtual SubscriptionGrant Subscribe(const model::Device& device, model::EventCategory category, const std::string& callback_url,
                                      util::Millis requested_timeout) = 0;

  virtual SubscriptionGrant Renew(const model::Device& device, model::EventCategory category, const std::string& sid,
                                  util::Millis requested_timeout) = 0;

  virtual void Unsubscribe(const model::Device& device, model::EventCategory category, const std::string& sid) = 0;
};

} // namespace household::subscription
