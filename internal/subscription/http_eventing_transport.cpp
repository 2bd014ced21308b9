#include "http_eventing_transport.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include <cctype>
#include <charconv>

#include "internal/transport/action_transport.hpp"
#include "internal/transport/http_client.hpp"
#include "internal/util/errors.hpp"

namespace household::subscription {

namespace http = boost::beast::http;

namespace {

bool StartsWithNoCase(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) return false;
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) return false;
  }
  return true;
}

std::string Describe(const model::Device& device, model::EventCategory category) {
  return device.id + "/" + std::string(model::CategoryName(category));
}

transport::HttpRequest NewRequest(http::verb verb, model::EventCategory category) {
  transport::HttpRequest request{verb, std::string(model::EventPath(category)), 11};
  request.set(http::field::connection, "close");
  return request;
}

transport::HttpResponse Exchange(const model::Device& device, model::EventCategory category, transport::HttpRequest request,
                                 util::Millis timeout) {
  transport::HttpResponse response;
  try {
    response = transport::SendHttpRequest(device.host, device.port, std::move(request), timeout);
  } catch (const transport::TransportError& e) {
    throw util::SubscriptionError(Describe(device, category) + ": " + e.what());
  }

  if (response.result() != http::status::ok) {
    throw util::SubscriptionError(Describe(device, category) + ": device answered " + std::to_string(response.result_int()));
  }
  return response;
}

SubscriptionGrant ReadGrant(const model::Device& device, model::EventCategory category, const transport::HttpResponse& response,
                            util::Millis requested_timeout) {
  SubscriptionGrant grant;
  grant.sid = transport::FieldValue(response, "SID");
  if (grant.sid.empty()) {
    throw util::SubscriptionError(Describe(device, category) + ": response carries no SID");
  }
  grant.timeout = ParseTimeoutHeader(transport::FieldValue(response, "TIMEOUT")).value_or(requested_timeout);
  return grant;
}

} // namespace

std::string FormatTimeoutHeader(util::Millis timeout) {
  return "Second-" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
}

std::optional<util::Millis> ParseTimeoutHeader(std::string_view value) {
  constexpr std::string_view kPrefix = "Second-";
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);

  if (!StartsWithNoCase(value, kPrefix)) return std::nullopt;
  value.remove_prefix(kPrefix.size());

  std::int64_t seconds = 0;
  auto [end, ec]       = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc() || end != value.data() + value.size() || seconds <= 0) return std::nullopt;
  return std::chrono::duration_cast<util::Millis>(std::chrono::seconds(seconds));
}

HttpEventingTransport::HttpEventingTransport(util::Millis request_timeout) : request_timeout_(request_timeout) {
}

SubscriptionGrant HttpEventingTransport::Subscribe(const model::Device& device, model::EventCategory category, const std::string& callback_url,
                                                   util::Millis requested_timeout) {
  auto request = NewRequest(http::verb::subscribe, category);
  request.set("CALLBACK", "<" + callback_url + ">");
  request.set("NT", "upnp:event");
  request.set("TIMEOUT", FormatTimeoutHeader(requested_timeout));

  auto response = Exchange(device, category, std::move(request), request_timeout_);
  return ReadGrant(device, category, response, requested_timeout);
}

SubscriptionGrant HttpEventingTransport::Renew(const model::Device& device, model::EventCategory category, const std::string& sid,
                                               util::Millis requested_timeout) {
  auto request = NewRequest(http::verb::subscribe, category);
  request.set("SID", sid);
  request.set("TIMEOUT", FormatTimeoutHeader(requested_timeout));

  auto response = Exchange(device, category, std::move(request), request_timeout_);
  return ReadGrant(device, category, response, requested_timeout);
}

void HttpEventingTransport::Unsubscribe(const model::Device& device, model::EventCategory category, const std::string& sid) {
  auto request = NewRequest(http::verb::unsubscribe, category);
  request.set("SID", sid);

  Exchange(device, category, std::move(request), request_timeout_);
}

} // namespace household::subscription
