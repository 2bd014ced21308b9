#include "internal/transport/soap_action_transport.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "tests/support/fake_device_server.hpp"

namespace {

namespace http = boost::beast::http;

using household::model::Device;
using household::test_support::FakeDeviceServer;
using household::transport::ActionArgs;
using household::transport::BuildEnvelope;
using household::transport::ControlPath;
using household::transport::FieldValue;
using household::transport::HttpRequest;
using household::transport::ParseActionName;
using household::transport::ParseEnvelope;
using household::transport::SoapAction;
using household::transport::SoapActionTransport;
using household::transport::TransportError;

constexpr const char* kVolumeResponse =
    "<?xml version=\"1.0\"?><s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
    "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"><s:Body>"
    "<u:GetVolumeResponse xmlns:u=\"urn:schemas-upnp-org:service:RenderingControl:1\">"
    "<CurrentVolume>25</CurrentVolume></u:GetVolumeResponse></s:Body></s:Envelope>";

constexpr const char* kFault =
    "<?xml version=\"1.0\"?><s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\"><s:Body><s:Fault>"
    "<faultcode>s:Client</faultcode><faultstring>UPnPError</faultstring>"
    "<detail><UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\"><errorCode>701</errorCode></UPnPError></detail>"
    "</s:Fault></s:Body></s:Envelope>";

template <class Fn>
std::string TransportErrorOf(Fn&& fn) {
  try {
    fn();
  } catch (const TransportError& e) {
    return e.what();
  }
  return {};
}

void TestActionNamesAndPaths() {
  auto action = ParseActionName("AVTransport#Play");
  assert(action.service == "AVTransport" && action.action == "Play");

  assert(!TransportErrorOf([] { ParseActionName("Play"); }).empty());
  assert(!TransportErrorOf([] { ParseActionName("#Play"); }).empty());
  assert(!TransportErrorOf([] { ParseActionName("AVTransport#"); }).empty());

  assert(ControlPath("AVTransport") == "/MediaRenderer/AVTransport/Control");
  assert(ControlPath("GroupRenderingControl") == "/MediaRenderer/GroupRenderingControl/Control");
  assert(ControlPath("ZoneGroupTopology") == "/ZoneGroupTopology/Control");
}

void TestEnvelopeWritesInstanceIdFirstAndEscapes() {
  const auto body = BuildEnvelope(SoapAction{"AVTransport", "SetAVTransportURI"},
                                  ActionArgs{{"CurrentURI", "x-rincon:a&b"}, {"CurrentURIMetaData", ""}, {"InstanceID", "0"}});

  assert(body.find("<u:SetAVTransportURI xmlns:u=\"urn:schemas-upnp-org:service:AVTransport:1\">") != std::string::npos);
  const auto instance = body.find("<InstanceID>0</InstanceID>");
  const auto uri      = body.find("<CurrentURI>x-rincon:a&amp;b</CurrentURI>");
  assert(instance != std::string::npos && uri != std::string::npos);
  assert(instance < uri);
  assert(body.find("<CurrentURIMetaData></CurrentURIMetaData>") != std::string::npos);
}

void TestParseEnvelope() {
  auto result = ParseEnvelope(SoapAction{"RenderingControl", "GetVolume"}, kVolumeResponse);
  assert(result.size() == 1);
  assert(result.at("CurrentVolume") == "25");

  const auto fault = TransportErrorOf([] { ParseEnvelope(SoapAction{"AVTransport", "Play"}, kFault); });
  assert(fault.find("UPnP error 701") != std::string::npos);

  assert(!TransportErrorOf([] { ParseEnvelope(SoapAction{"AVTransport", "Play"}, kVolumeResponse); }).empty());
  assert(!TransportErrorOf([] { ParseEnvelope(SoapAction{"AVTransport", "Play"}, "<s:Envelope"); }).empty());
}

void TestSendActionOverHttp() {
  FakeDeviceServer server([](const HttpRequest& request) {
    if (request.target() == "/MediaRenderer/RenderingControl/Control") {
      return FakeDeviceServer::Reply(http::status::ok, kVolumeResponse);
    }
    if (request.target() == "/MediaRenderer/AVTransport/Control") {
      return FakeDeviceServer::Reply(http::status::internal_server_error, kFault);
    }
    return FakeDeviceServer::Reply(http::status::not_found);
  });

  Device device;
  device.id   = "RINCON_A";
  device.host = "127.0.0.1";
  device.port = server.Port();

  SoapActionTransport transport(std::chrono::seconds(2));
  auto result = transport.SendAction(device, "RenderingControl#GetVolume", {{"InstanceID", "0"}, {"Channel", "Master"}});
  assert(result.at("CurrentVolume") == "25");

  const auto request = server.Requests().front();
  assert(request.method() == http::verb::post);
  assert(FieldValue(request, "SOAPACTION") == "\"urn:schemas-upnp-org:service:RenderingControl:1#GetVolume\"");
  assert(request.body().find("<Channel>Master</Channel>") != std::string::npos);

  const auto fault = TransportErrorOf([&] { transport.SendAction(device, "AVTransport#Play", {{"InstanceID", "0"}, {"Speed", "1"}}); });
  assert(fault.find("RINCON_A") != std::string::npos);
  assert(fault.find("701") != std::string::npos);

  const auto missing = TransportErrorOf([&] { transport.SendAction(device, "AlarmClock#ListAlarms", {}); });
  assert(missing.find("404") != std::string::npos);
}

} // namespace

int main() {
  TestActionNamesAndPaths();
  TestEnvelopeWritesInstanceIdFirstAndEscapes();
  TestParseEnvelope();
  TestSendActionOverHttp();

  std::cout << "household_unit_soap_action_transport: pass\n";
  return 0;
}
