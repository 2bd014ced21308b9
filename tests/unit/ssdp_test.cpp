#include "internal/discovery/ssdp.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace household::discovery;

constexpr const char* kTarget = "urn:schemas-upnp-org:device:ZonePlayer:1";

const std::string kSearchResponse =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age = 1800\r\n"
    "EXT:\r\n"
    "LOCATION: http://192.168.1.20:1400/xml/device_description.xml\r\n"
    "SERVER: Linux UPnP/1.0 Sonos/70.3-35220 (ZPS1)\r\n"
    "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
    "USN: uuid:RINCON_000E58A0B1C201400::urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
    "X-RINCON-HOUSEHOLD: Sonos_HH1\r\n"
    "X-RINCON-BOOTSEQ: 93\r\n"
    "\r\n";

void TestSearchResponseIsParsed() {
  auto announcement = ssdp::ParseMessage(kSearchResponse, kTarget);
  assert(announcement.has_value());
  assert(announcement->kind == ssdp::MessageKind::kSearchResponse);
  assert(announcement->device_id == "RINCON_000E58A0B1C201400");
  assert(announcement->host == "192.168.1.20");
  assert(announcement->port == 1400);
  assert(announcement->household_id == "Sonos_HH1");
  assert(announcement->boot_seq == 93);
  assert(announcement->max_age_seconds == 1800);

  auto device = announcement->ToDevice();
  assert(device.id == "RINCON_000E58A0B1C201400");
  assert(device.host == "192.168.1.20");
  assert(device.port == 1400);
  assert(device.model == "Linux UPnP/1.0 Sonos/70.3-35220 (ZPS1)");
}

void TestAliveAndByeByeNotifications() {
  const std::string alive =
      "NOTIFY * HTTP/1.1\r\n"
      "HOST: 239.255.255.250:1900\r\n"
      "LOCATION: http://192.168.1.21:1400/xml/device_description.xml\r\n"
      "NT: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "NTS: ssdp:alive\r\n"
      "USN: uuid:RINCON_B::urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "\r\n";
  auto parsed = ssdp::ParseMessage(alive, kTarget);
  assert(parsed && parsed->kind == ssdp::MessageKind::kAlive);
  assert(parsed->host == "192.168.1.21");

  const std::string byebye =
      "NOTIFY * HTTP/1.1\r\n"
      "NT: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "NTS: ssdp:byebye\r\n"
      "USN: uuid:RINCON_B::urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "\r\n";
  auto gone = ssdp::ParseMessage(byebye, kTarget);
  assert(gone && gone->kind == ssdp::MessageKind::kByeBye);
  assert(gone->device_id == "RINCON_B");
}

void TestForeignAndMalformedMessagesAreIgnored() {
  const std::string other_device =
      "HTTP/1.1 200 OK\r\n"
      "LOCATION: http://192.168.1.50:80/desc.xml\r\n"
      "ST: urn:schemas-upnp-org:device:MediaServer:1\r\n"
      "USN: uuid:other::urn:schemas-upnp-org:device:MediaServer:1\r\n"
      "\r\n";
  assert(!ssdp::ParseMessage(other_device, kTarget));

  const std::string search_from_peer =
      "M-SEARCH * HTTP/1.1\r\n"
      "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "\r\n";
  assert(!ssdp::ParseMessage(search_from_peer, kTarget));

  const std::string bad_location =
      "HTTP/1.1 200 OK\r\n"
      "LOCATION: https://192.168.1.20/desc.xml\r\n"
      "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "USN: uuid:RINCON_C::urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
      "\r\n";
  assert(!ssdp::ParseMessage(bad_location, kTarget));

  assert(!ssdp::ParseMessage("garbage", kTarget));
}

void TestSearchRequestFormat() {
  auto request = ssdp::BuildSearchRequest("239.255.255.250", 1900, kTarget, 0);
  assert(request.rfind("M-SEARCH * HTTP/1.1\r\n", 0) == 0);
  assert(request.find("HOST: 239.255.255.250:1900\r\n") != std::string::npos);
  assert(request.find("MAN: \"ssdp:discover\"\r\n") != std::string::npos);
  assert(request.find("MX: 1\r\n") != std::string::npos);
  assert(request.find(std::string("ST: ") + kTarget + "\r\n") != std::string::npos);
  assert(request.size() >= 4 && request.substr(request.size() - 4) == "\r\n\r\n");
}

void TestDeviceIdFromUsn() {
  assert(ssdp::DeviceIdFromUsn("uuid:RINCON_X::urn:schemas-upnp-org:device:ZonePlayer:1") == "RINCON_X");
  assert(ssdp::DeviceIdFromUsn("UUID:RINCON_Y") == "RINCON_Y");
}

} // namespace

int main() {
  TestSearchResponseIsParsed();
  TestAliveAndByeByeNotifications();
  TestForeignAndMalformedMessagesAreIgnored();
  TestSearchRequestFormat();
  TestDeviceIdFromUsn();

  std::cout << "household_unit_ssdp: pass\n";
  return 0;
}
