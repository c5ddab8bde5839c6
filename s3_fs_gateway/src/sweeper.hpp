#pragma once

#include "multipart.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace server {

namespace asio = boost::asio;

// Periodically reclaims expired multipart uploads on an io_context.
class Sweeper : public std::enable_shared_from_this<Sweeper> {
public:
  Sweeper(asio::io_context& ioc, multipart::Coordinator& uploads, std::chrono::seconds interval);

  void start();
  void stop();
  void set_interval(std::chrono::seconds interval) { interval_s_.store(interval.count()); }

private:
  void schedule();
  void on_timer(boost::system::error_code ec);

  asio::steady_timer timer_; // bound to a strand
  multipart::Coordinator& uploads_;
  std::atomic<std::int64_t> interval_s_;
  std::atomic<bool> stopped_{false};
};

} // namespace server
