#include "http_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "action_transport.hpp"

namespace household::transport {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

HttpResponse SendHttpRequest(const std::string& host, std::uint16_t port, HttpRequest request, util::Millis timeout) {
  asio::io_context   io;
  tcp::resolver      resolver(io);
  beast::tcp_stream  stream(io);
  beast::flat_buffer buffer;
  HttpResponse       response;

  beast::error_code failure;
  const char*       stage = "resolve";
  bool              done  = false;

  request.set(http::field::host, host + ":" + std::to_string(port));
  request.prepare_payload();

  auto fail = [&](beast::error_code ec) {
    failure = ec;
    done    = true;
  };

  stream.expires_after(timeout);
  resolver.async_resolve(host, std::to_string(port), [&](beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec);
    stage = "connect";
    stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
      if (ec) return fail(ec);
      stage = "write";
      http::async_write(stream, request, [&](beast::error_code ec, std::size_t) {
        if (ec) return fail(ec);
        stage = "read";
        http::async_read(stream, buffer, response, [&](beast::error_code ec, std::size_t) {
          if (ec) return fail(ec);
          beast::error_code ignored;
          stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
          done = true;
        });
      });
    });
  });

  io.run_for(timeout);
  if (!done) {
    resolver.cancel();
    stream.cancel();
    io.restart();
    io.run();
    throw TransportError("http " + host + ":" + std::to_string(port) + " timed out during " + stage);
  }

  if (failure) {
    throw TransportError("http " + host + ":" + std::to_string(port) + " " + stage + " failed: " + failure.message());
  }
  return response;
}

} // namespace household::transport
