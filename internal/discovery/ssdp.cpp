#include "ssdp.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <sstream>

#include "internal/util/url.hpp"

namespace household::discovery::ssdp {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

template <typename T>
T ParseNumber(std::string_view text) {
  T value{};
  text = Trim(text);
  std::from_chars(text.data(), text.data() + text.size(), value);
  return value;
}

// "max-age = 1800" or "max-age=1800, no-cache"
int ParseMaxAge(std::string_view cache_control) {
  auto lower = Lower(cache_control);
  auto pos   = lower.find("max-age");
  if (pos == std::string::npos) return 0;
  auto eq = lower.find('=', pos);
  if (eq == std::string::npos) return 0;
  return ParseNumber<int>(std::string_view(lower).substr(eq + 1));
}

} // namespace

model::Device Announcement::ToDevice() const {
  model::Device device;
  device.id           = device_id;
  device.host         = host;
  device.port         = port;
  device.location     = location;
  device.household_id = household_id;
  device.model        = server;
  device.boot_seq     = boot_seq;
  return device;
}

std::string BuildSearchRequest(std::string_view multicast_address, std::uint16_t multicast_port, std::string_view search_target,
                               int mx_seconds) {
  std::ostringstream out;
  out << "M-SEARCH * HTTP/1.1\r\n"
      << "HOST: " << multicast_address << ':' << multicast_port << "\r\n"
      << "MAN: \"ssdp:discover\"\r\n"
      << "MX: " << std::max(1, mx_seconds) << "\r\n"
      << "ST: " << search_target << "\r\n"
      << "\r\n";
  return out.str();
}

std::string DeviceIdFromUsn(std::string_view usn) {
  usn = Trim(usn);
  if (StartsWith(Lower(usn.substr(0, 5)), "uuid:")) usn.remove_prefix(5);
  auto sep = usn.find("::");
  return std::string(usn.substr(0, sep));
}

std::optional<Announcement> ParseMessage(std::string_view datagram, std::string_view search_target) {
  auto line_end = datagram.find("\r\n");
  if (line_end == std::string_view::npos) return std::nullopt;

  auto start_line = Trim(datagram.substr(0, line_end));

  Announcement announcement;
  bool         notify = false;
  if (StartsWith(start_line, "HTTP/1.1 200") || StartsWith(start_line, "HTTP/1.0 200")) {
    announcement.kind = MessageKind::kSearchResponse;
  } else if (StartsWith(start_line, "NOTIFY * HTTP/1.")) {
    notify = true;
  } else {
    return std::nullopt;
  }

  std::map<std::string, std::string> headers;
  std::size_t                        pos = line_end + 2;
  while (pos < datagram.size()) {
    auto next = datagram.find("\r\n", pos);
    auto line = datagram.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
    if (line.empty()) break;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      headers[Lower(Trim(line.substr(0, colon)))] = std::string(Trim(line.substr(colon + 1)));
    }
    if (next == std::string_view::npos) break;
    pos = next + 2;
  }

  auto header = [&](const char* name) -> std::string {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  };

  if (notify) {
    const auto nts = Lower(header("nts"));
    if (nts == "ssdp:alive") {
      announcement.kind = MessageKind::kAlive;
    } else if (nts == "ssdp:byebye") {
      announcement.kind = MessageKind::kByeBye;
    } else {
      return std::nullopt;
    }
  }

  const auto target = notify ? header("nt") : header("st");
  if (target != search_target) return std::nullopt;

  announcement.device_id = DeviceIdFromUsn(header("usn"));
  if (announcement.device_id.empty()) return std::nullopt;

  announcement.household_id    = header("x-rincon-household");
  announcement.server          = header("server");
  announcement.boot_seq        = ParseNumber<std::uint32_t>(header("x-rincon-bootseq"));
  announcement.max_age_seconds = ParseMaxAge(header("cache-control"));

  if (announcement.kind == MessageKind::kByeBye) {
    return announcement;
  }

  announcement.location = header("location");
  auto url              = util::ParseHttpUrl(announcement.location);
  if (!url) return std::nullopt;
  announcement.host = url->host;
  announcement.port = url->port;
  return announcement;
}

} // namespace household::discovery::ssdp
