#include "soap_action_transport.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include "http_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/xml.hpp"

namespace household::transport {

namespace http = boost::beast::http;

using util::FindChild;
using util::XmlElement;

namespace {

constexpr const char* kInstanceId = "InstanceID";

std::string Escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

void AppendArg(std::string& out, const std::string& name, const std::string& value) {
  out += "<" + name + ">" + Escape(value) + "</" + name + ">";
}

XmlElement ReadXml(const std::string& body) {
  try {
    return util::ParseXml(body);
  } catch (const util::DecodeError& e) {
    throw TransportError(std::string("malformed SOAP body: ") + e.what());
  }
}

std::string DescribeFault(const XmlElement& fault) {
  std::string description;
  if (const auto* text = FindChild(fault, "faultstring")) description = text->text;
  if (const auto* detail = FindChild(fault, "detail")) {
    if (const auto* error = FindChild(*detail, "UPnPError")) {
      if (const auto* code = FindChild(*error, "errorCode")) {
        description += " (UPnP error " + code->text + ")";
      }
    }
  }
  return description.empty() ? "SOAP fault" : description;
}

} // namespace

SoapAction ParseActionName(std::string_view name) {
  auto hash = name.find('#');
  if (hash == std::string_view::npos || hash == 0 || hash + 1 == name.size()) {
    throw TransportError("action must be Service#Action, got '" + std::string(name) + "'");
  }
  return SoapAction{std::string(name.substr(0, hash)), std::string(name.substr(hash + 1))};
}

std::string ControlPath(std::string_view service) {
  if (service == "AVTransport" || service == "RenderingControl" || service == "GroupRenderingControl" ||
      service == "ConnectionManager" || service == "Queue") {
    return "/MediaRenderer/" + std::string(service) + "/Control";
  }
  return "/" + std::string(service) + "/Control";
}

std::string ServiceType(std::string_view service) {
  return "urn:schemas-upnp-org:service:" + std::string(service) + ":1";
}

std::string BuildEnvelope(const SoapAction& action, const ActionArgs& args) {
  std::string out =
      "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
      "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
      "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"><s:Body>";
  out += "<u:" + action.action + " xmlns:u=\"" + ServiceType(action.service) + "\">";

  if (auto it = args.find(kInstanceId); it != args.end()) AppendArg(out, it->first, it->second);
  for (const auto& [name, value] : args) {
    if (name != kInstanceId) AppendArg(out, name, value);
  }

  out += "</u:" + action.action + "></s:Body></s:Envelope>";
  return out;
}

ActionResult ParseEnvelope(const SoapAction& action, const std::string& body) {
  const auto  tree     = ReadXml(body);
  const auto* envelope = FindChild(tree, "Envelope");
  const auto* soap     = envelope ? FindChild(*envelope, "Body") : nullptr;
  if (soap == nullptr) throw TransportError(action.service + "#" + action.action + ": SOAP body has no Envelope/Body");

  if (const auto* fault = FindChild(*soap, "Fault")) {
    throw TransportError(action.service + "#" + action.action + ": " + DescribeFault(*fault));
  }

  const auto* response = FindChild(*soap, action.action + "Response");
  if (response == nullptr) {
    throw TransportError(action.service + "#" + action.action + ": no " + action.action + "Response element");
  }

  ActionResult result;
  for (const auto& child : response->children) {
    result.emplace(std::string(util::LocalName(child.name)), child.text);
  }
  return result;
}

SoapActionTransport::SoapActionTransport(util::Millis timeout) : timeout_(timeout) {
}

ActionResult SoapActionTransport::SendAction(const model::Device& device, const std::string& action, const ActionArgs& args) {
  const auto call = ParseActionName(action);

  HttpRequest request{http::verb::post, ControlPath(call.service), 11};
  request.set(http::field::connection, "close");
  request.set(http::field::content_type, "text/xml; charset=\"utf-8\"");
  request.set("SOAPACTION", "\"" + ServiceType(call.service) + "#" + call.action + "\"");
  request.body() = BuildEnvelope(call, args);
  request.prepare_payload();

  auto response = SendHttpRequest(device.host, device.port, std::move(request), timeout_);

  // Faults arrive as 500 with a SOAP body.
  if (response.result() != http::status::ok && response.result() != http::status::internal_server_error) {
    throw TransportError(device.id + " " + action + ": device answered " + std::to_string(response.result_int()));
  }
  try {
    return ParseEnvelope(call, response.body());
  } catch (const TransportError& e) {
    throw TransportError(device.id + " " + e.what());
  }
}

} // namespace household::transport
