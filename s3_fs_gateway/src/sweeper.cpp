#include "sweeper.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace server {

Sweeper::Sweeper(asio::io_context& ioc, multipart::Coordinator& uploads, std::chrono::seconds interval)
  : timer_(asio::make_strand(ioc)), uploads_(uploads), interval_s_(interval.count()) {}

void Sweeper::start() {
  schedule();
}

void Sweeper::stop() {
  stopped_ = true;
  // The timer is not thread-safe; cancel on the strand its handlers run on.
  auto self = shared_from_this();
  asio::post(timer_.get_executor(), [self] { self->timer_.cancel(); });
}

void Sweeper::schedule() {
  timer_.expires_after(std::chrono::seconds(interval_s_.load()));
  auto self = shared_from_this();
  timer_.async_wait([self](boost::system::error_code ec) { self->on_timer(ec); });
}

void Sweeper::on_timer(boost::system::error_code ec) {
  if (ec == asio::error::operation_aborted || stopped_) return;
  if (ec) {
    logging::storage()->warn("multipart sweep timer failed: {}", ec.message());
  } else {
    std::size_t n = uploads_.sweep(util::unix_now_seconds());
    if (n > 0) logging::storage()->info("multipart sweep reclaimed {} upload(s)", n);
  }
  schedule();
}

} // namespace server
