#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace household::transport {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/*
  Sends one request on a fresh connection and reads the response.

  The whole exchange (resolve, connect, write, read) is bounded by timeout.
  Throws TransportError on network failure or timeout; non-2xx responses are
  returned to the caller.
*/
HttpResponse SendHttpRequest(const std::string& host, std::uint16_t port, HttpRequest request, util::Millis timeout);

// Header value as a std::string; empty when absent.
template <class Message>
std::string FieldValue(const Message& message, const char* name) {
  auto value = message[name];
  return std::string(value.data(), value.size());
}

} // namespace household::transport
