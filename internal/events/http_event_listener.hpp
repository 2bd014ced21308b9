#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "event_sink.hpp"

namespace household::runtime::config {
class CallbackConfig;
}

namespace household::events {

struct ListenerOptions {
  std::string   bind_address{"0.0.0.0"};
  std::uint16_t port{3400};
  bool          allow_ephemeral_port{false};
  std::string   advertised_host;
  std::size_t   threads{2};

  static ListenerOptions FromConfig(const household::runtime::config::CallbackConfig& config);
};

/*
  Inbound NOTIFY endpoint.

  The socket is bound in the constructor so the callback URL is known before
  any subscription is requested and stays fixed for the listener's lifetime.
  Start() begins accepting on a private io_context; each connection carries
  one request and is closed after the response.

    200  accepted
    400  malformed request
    412  unknown or stale subscription id
*/
class HttpEventListener {
 public:
  using Handler = std::function<DeliveryResult(Notification notification)>;

  explicit HttpEventListener(ListenerOptions options);
  ~HttpEventListener();

  HttpEventListener(const HttpEventListener&)            = delete;
  HttpEventListener& operator=(const HttpEventListener&) = delete;

  void Start(Handler handler);
  void Stop();

  std::string   CallbackUrl() const;
  std::uint16_t Port() const {
    return port_;
  }

 private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  void Accept();

  ListenerOptions                options_;
  boost::asio::io_context        io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::uint16_t                  port_{0};
  std::string                    advertised_host_;

  std::shared_ptr<const Handler> handler_;
  std::unique_ptr<WorkGuard>     work_;
  std::vector<std::thread>       threads_;
  std::atomic<bool>              running_{false};
};

} // namespace household::events
