#include "http_server.hpp"
#include "logging.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;

namespace {

using Clock = std::chrono::steady_clock;

std::string_view view(beast::string_view s) {
  return std::string_view(s.data(), s.size());
}

s3::Response plain_text(const s3::Request& req, std::string_view content_type, std::string_view body) {
  s3::Response res{http::status::ok, req.version()};
  res.set(http::field::content_type, std::string(content_type));
  res.keep_alive(req.keep_alive());
  res.body().assign(body.begin(), body.end());
  res.prepare_payload();
  return res;
}

class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, s3::Api& api, const ListenerOptions& opts)
      : stream_(std::move(socket)), api_(api), opts_(opts) {}

  void start() {
    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);
    read_next();
  }

private:
  void read_next() {
    parser_.emplace();
    parser_->body_limit(opts_.max_request_body_bytes);
    stream_.expires_after(opts_.idle_timeout);
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t) { self->on_read(ec); });
  }

  void on_read(beast::error_code ec) {
    started_ = Clock::now();
    if (ec == http::error::end_of_stream) return shutdown();
    if (ec == beast::error::timeout) {
      logging::server()->debug("closing idle connection");
      return;
    }
    if (ec == http::error::body_limit) {
      // The rest of the body is still on the wire, so the connection cannot be reused.
      auto& req = parser_->get();
      req.keep_alive(false);
      logging::server()->info("{} {}: body exceeds {} bytes", view(req.method_string()),
                              view(req.target()), opts_.max_request_body_bytes);
      return send(req, s3::make_error(req, http::status::payload_too_large, "EntityTooLarge",
                                      "Your proposed upload exceeds the maximum allowed object size."));
    }
    if (ec) {
      logging::server()->debug("read failed: {}", ec.message());
      return;
    }

    const auto& req = parser_->get();
    if (auto builtin = serve_builtin(req, opts_.metrics)) return send(req, std::move(*builtin));
    send(req, api_.handle(req));
  }

  void send(const s3::Request& req, s3::Response res) {
    if (opts_.metrics) opts_.metrics->IncInFlight();
    res_ = std::move(res);
    method_.assign(req.method_string().data(), req.method_string().size());
    req_bytes_ = req.body().size();
    logging::server()->debug("{} {} -> {}", method_, view(req.target()), res_.result_int());

    const bool close = res_.need_eof();
    stream_.expires_after(opts_.idle_timeout);
    auto self = shared_from_this();
    http::async_write(stream_, res_, [self, close](beast::error_code ec, std::size_t) {
      self->on_write(close, ec);
    });
  }

  void on_write(bool close, beast::error_code ec) {
    if (Metrics* m = opts_.metrics) {
      const double ms = std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
      m->Observe(method_, res_.result_int(), req_bytes_, res_.body().size(), ms);
      m->DecInFlight();
    }
    if (ec) {
      logging::server()->debug("write failed: {}", ec.message());
      return;
    }
    if (close) return shutdown();
    read_next();
  }

  void shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  s3::Api& api_;
  ListenerOptions opts_;
  std::optional<http::request_parser<s3::Request::body_type>> parser_;
  s3::Response res_;
  Clock::time_point started_{};
  std::string method_;
  std::size_t req_bytes_ = 0;
};

} // namespace

std::optional<s3::Response> serve_builtin(const s3::Request& req, const Metrics* metrics) {
  if (req.method() != http::verb::get) return std::nullopt;
  const std::string_view target = view(req.target());
  if (target == "/healthz") return plain_text(req, "text/plain", "ok");
  if (target == "/metrics") {
    return plain_text(req, "text/plain; version=0.0.4", metrics ? metrics->RenderPrometheus() : std::string());
  }
  return std::nullopt;
}

Listener::Listener(asio::io_context& ioc, tcp::endpoint endpoint, s3::Api& api, ListenerOptions opts)
    : ioc_(ioc), acceptor_(asio::make_strand(ioc)), api_(api), opts_(opts) {
  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    logging::server()->error("cannot listen on {}:{}: {}", endpoint.address().to_string(),
                             endpoint.port(), ec.message());
    return;
  }
  ok_ = true;
  logging::server()->info("listening on {}:{}", endpoint.address().to_string(), endpoint.port());
}

void Listener::run() {
  accept_next();
}

void Listener::stop() {
  auto self = shared_from_this();
  asio::post(acceptor_.get_executor(), [self] {
    beast::error_code ec;
    self->acceptor_.close(ec);
  });
}

void Listener::accept_next() {
  auto self = shared_from_this();
  // Each session gets its own strand; handlers of one connection never run concurrently.
  acceptor_.async_accept(
      asio::make_strand(ioc_),
      [self](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return;
        if (ec) {
          logging::server()->warn("accept failed: {}", ec.message());
        } else {
          std::make_shared<Session>(std::move(socket), self->api_, self->opts_)->start();
        }
        self->accept_next();
      });
}

} // namespace server
