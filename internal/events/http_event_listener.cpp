#include "http_event_listener.hpp"

#include <boost/asio/ip/udp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <algorithm>
#include <charconv>
#include <optional>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/transport/http_client.hpp"
#include "internal/util/errors.hpp"

namespace household::events {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

using observability::StringField;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(10);

// Address of the interface that routes to the SSDP group. No packet is sent.
std::optional<std::string> DetectLocalAddress() {
  asio::io_context   io;
  asio::ip::udp::socket probe(io);
  boost::system::error_code ec;

  probe.open(asio::ip::udp::v4(), ec);
  if (!ec) probe.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("239.255.255.250"), 1900), ec);
  if (ec) return std::nullopt;

  auto local = probe.local_endpoint(ec);
  if (ec || local.address().is_unspecified()) return std::nullopt;
  return local.address().to_string();
}

class NotifySession : public std::enable_shared_from_this<NotifySession> {
 public:
  NotifySession(tcp::socket socket, std::shared_ptr<const HttpEventListener::Handler> handler)
      : stream_(std::move(socket)), handler_(std::move(handler)) {
  }

  void Run() {
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, request_, [self = shared_from_this()](beast::error_code ec, std::size_t) { self->OnRead(ec); });
  }

 private:
  void OnRead(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      Close();
      return;
    }
    if (ec && ec.category() != http::make_error_code(http::error::bad_method).category()) {
      HOUSEHOLD_LOG_DEBUG("Callback connection dropped", {StringField("error", ec.message())});
      Close();
      return;
    }
    Respond(ec ? http::status::bad_request : Handle());
  }

  http::status Handle() {
    if (request_.method() != http::verb::notify) return http::status::bad_request;

    auto sid = transport::FieldValue(request_, "SID");
    if (sid.empty()) return http::status::bad_request;

    const auto nt  = transport::FieldValue(request_, "NT");
    const auto nts = transport::FieldValue(request_, "NTS");
    if ((!nt.empty() && nt != "upnp:event") || (!nts.empty() && nts != "upnp:propchange")) {
      return http::status::precondition_failed;
    }

    std::uint64_t sequence = 0;
    const auto    seq      = transport::FieldValue(request_, "SEQ");
    if (!seq.empty()) {
      auto [end, parse_ec] = std::from_chars(seq.data(), seq.data() + seq.size(), sequence);
      if (parse_ec != std::errc() || end != seq.data() + seq.size()) return http::status::bad_request;
    }

    try {
      const auto result = (*handler_)(Notification{std::move(sid), sequence, std::move(request_.body())});
      return result == DeliveryResult::kAccepted ? http::status::ok : http::status::precondition_failed;
    } catch (const std::exception& e) {
      HOUSEHOLD_LOG_ERROR("Notification handler failed", {StringField("error", e.what())});
      return http::status::internal_server_error;
    }
  }

  void Respond(http::status status) {
    response_.version(request_.version() == 0 ? 11 : request_.version());
    response_.result(status);
    response_.set(http::field::server, "household");
    response_.keep_alive(false);
    response_.prepare_payload();

    http::async_write(stream_, response_, [self = shared_from_this()](beast::error_code, std::size_t) { self->Close(); });
  }

  void Close() {
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
  }

  beast::tcp_stream                                  stream_;
  beast::flat_buffer                                 buffer_;
  http::request<http::string_body>                   request_;
  http::response<http::string_body>                  response_;
  std::shared_ptr<const HttpEventListener::Handler> handler_;
};

} // namespace

ListenerOptions ListenerOptions::FromConfig(const household::runtime::config::CallbackConfig& config) {
  ListenerOptions options;
  options.bind_address         = config.bind_address();
  options.port                 = static_cast<std::uint16_t>(config.port());
  options.allow_ephemeral_port = config.allow_ephemeral_port();
  options.advertised_host      = config.advertised_host();
  options.threads              = config.threads();
  return options;
}

HttpEventListener::HttpEventListener(ListenerOptions options) : options_(std::move(options)), acceptor_(io_) {
  if (options_.port == 0 && !options_.allow_ephemeral_port) {
    throw util::InvalidConfig("callback port 0 requires allow_ephemeral_port");
  }

  boost::system::error_code ec;
  const auto                address = asio::ip::make_address(options_.bind_address, ec);
  if (ec) {
    throw util::InvalidConfig("invalid callback bind address " + options_.bind_address);
  }

  const tcp::endpoint endpoint(address, options_.port);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw util::InvalidState("cannot listen on " + options_.bind_address + ":" + std::to_string(options_.port) + ": " + ec.message());
  }
  port_ = acceptor_.local_endpoint().port();

  if (!options_.advertised_host.empty()) {
    advertised_host_ = options_.advertised_host;
  } else if (address.is_unspecified()) {
    advertised_host_ = DetectLocalAddress().value_or("127.0.0.1");
  } else {
    advertised_host_ = options_.bind_address;
  }
}

HttpEventListener::~HttpEventListener() {
  Stop();
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

void HttpEventListener::Start(Handler handler) {
  if (running_.exchange(true)) return;

  handler_ = std::make_shared<const Handler>(std::move(handler));
  work_    = std::make_unique<WorkGuard>(io_.get_executor());
  Accept();

  const auto count = std::max<std::size_t>(1, options_.threads);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back([this] { io_.run(); });
  }
  HOUSEHOLD_LOG_INFO("Event callback listener started", {StringField("url", CallbackUrl())});
}

void HttpEventListener::Stop() {
  if (!running_.exchange(false)) return;

  work_.reset();
  io_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();

  boost::system::error_code ignored;
  acceptor_.close(ignored);
  HOUSEHOLD_LOG_INFO("Event callback listener stopped");
}

void HttpEventListener::Accept() {
  acceptor_.async_accept(asio::make_strand(io_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !running_) return;
    if (ec) {
      HOUSEHOLD_LOG_WARN("Callback accept failed", {StringField("error", ec.message())});
    } else {
      std::make_shared<NotifySession>(std::move(socket), handler_)->Run();
    }
    Accept();
  });
}

std::string HttpEventListener::CallbackUrl() const {
  return "http://" + advertised_host_ + ":" + std::to_string(port_) + "/notify";
}

} // namespace household::events
