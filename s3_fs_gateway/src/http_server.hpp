#pragma once

#include "metrics.hpp"
#include "s3_api.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct ListenerOptions {
  std::size_t max_request_body_bytes = std::size_t{5120} * 1024 * 1024;
  // A connection with no read or write progress for this long is closed.
  std::chrono::seconds idle_timeout{60};
  Metrics* metrics = nullptr;
};

// Unauthenticated endpoints answered before the S3 routing: GET /healthz and
// GET /metrics. std::nullopt for every other request.
std::optional<s3::Response> serve_builtin(const s3::Request& req, const Metrics* metrics);

// Accepts connections and runs one keep-alive HTTP/1.1 session per socket.
class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(asio::io_context& ioc, tcp::endpoint endpoint, s3::Api& api, ListenerOptions opts);

  // False when the endpoint could not be opened, bound or listened on.
  bool ok() const { return ok_; }

  void run();
  // Stops accepting; sessions in progress finish their current exchange.
  void stop();

private:
  void accept_next();

  asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  s3::Api& api_;
  ListenerOptions opts_;
  bool ok_ = false;
};

} // namespace server
