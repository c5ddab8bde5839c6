#include "config.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "meta_index.hpp"
#include "multipart.hpp"
#include "s3_api.hpp"
#include "storage.hpp"
#include "sweeper.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// "host:port" from the command line replaces server.host and server.port.
static bool apply_listen_override(const std::string& listen, config::ServerConfig* server) {
  const size_t colon = listen.rfind(':');
  if (colon == std::string::npos || colon + 1 == listen.size()) return false;
  unsigned port = 0;
  const char* first = listen.data() + colon + 1;
  const char* last = listen.data() + listen.size();
  const auto [end, ec] = std::from_chars(first, last, port);
  if (ec != std::errc{} || end != last || port == 0 || port > 65535) return false;
  server->host = listen.substr(0, colon);
  server->port = static_cast<unsigned short>(port);
  return true;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string listen;
  int threads = 0;

  po::options_description desc("s3_fs_gateway options");
  desc.add_options()
    ("help,h", "Show help")
    ("config,c", po::value<std::string>(&config_path), "Path to the YAML configuration file")
    ("listen", po::value<std::string>(&listen), "Listen address host:port (overrides server.host/port)")
    ("threads", po::value<int>(&threads), "Worker threads (overrides server.threads)");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << "Argument error: " << e.what() << "\n\n" << desc << "\n";
    return 2;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }
  if (config_path.empty()) {
    std::cerr << "--config is required\n\n" << desc << "\n";
    return 2;
  }

  config::Config cfg;
  try {
    cfg = config::load_file(config_path);
  } catch (const config::ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  logging::init(cfg.logging);

  if (!listen.empty()) {
    if (!apply_listen_override(listen, &cfg.server)) {
      std::cerr << "--listen expects host:port with a port in 1..65535, got '" << listen << "'\n";
      return 2;
    }
  }
  if (vm.count("threads")) {
    if (threads <= 0) {
      std::cerr << "--threads must be > 0\n";
      return 2;
    }
    cfg.server.threads = threads;
  }

  boost::system::error_code addr_ec;
  auto address = asio::ip::make_address(cfg.server.host, addr_ec);
  if (addr_ec) {
    std::cerr << "Invalid listen host " << cfg.server.host << ": " << addr_ec.message() << "\n";
    return 2;
  }

  const std::filesystem::path root = cfg.storage.location;
  const std::filesystem::path reserved = root / std::string(storage::kReservedDir);
  std::error_code fs_ec;
  std::filesystem::create_directories(reserved, fs_ec);
  if (fs_ec) {
    logging::server()->critical("cannot create {}: {}", reserved.string(), fs_ec.message());
    return 1;
  }

  server::Metrics metrics;
  storage::Error err;
  auto index = storage::MetaIndex::open((reserved / "meta").string(), &metrics, &err);
  if (!index) {
    logging::server()->critical("{}", err.message);
    return 1;
  }

  storage::FsObjectStore store(root, index.get(), &metrics);
  multipart::Coordinator uploads(&store, index.get(),
                                 static_cast<std::int64_t>(cfg.multipart.expiry_seconds));
  s3::Api api(&store, &uploads, std::make_shared<const s3::Snapshot>(cfg));

  const int nthreads = std::max(1, cfg.server.threads);
  asio::io_context ioc{nthreads};

  server::ListenerOptions opts;
  opts.max_request_body_bytes = cfg.server.max_object_bytes;
  opts.metrics = &metrics;

  auto listener = std::make_shared<server::Listener>(ioc, tcp::endpoint{address, cfg.server.port}, api, opts);
  if (!listener->ok()) return 1;
  listener->run();

  auto sweeper = std::make_shared<server::Sweeper>(
      ioc, uploads, std::chrono::seconds(cfg.multipart.sweep_interval_seconds));
  sweeper->start();

  asio::signal_set signals(ioc, SIGINT, SIGTERM, SIGHUP);
  std::function<void(const boost::system::error_code&, int)> on_signal;
  on_signal = [&](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    if (signo == SIGHUP) {
      logging::server()->info("SIGHUP: reloading {}", config_path);
      try {
        auto next = config::load_file(config_path);
        sweeper->set_interval(std::chrono::seconds(next.multipart.sweep_interval_seconds));
        api.reload(std::make_shared<const s3::Snapshot>(std::move(next)));
      } catch (const config::ConfigError& e) {
        logging::server()->error("reload failed, keeping current configuration: {}", e.what());
      }
      signals.async_wait(on_signal);
      return;
    }
    logging::server()->info("signal {}: shutting down", signo);
    listener->stop();
    sweeper->stop();
    ioc.stop();
  };
  signals.async_wait(on_signal);

  logging::server()->info("serving {} with {} thread(s)", root.string(), nthreads);

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(nthreads));
  for (int i = 0; i < nthreads; ++i) {
    workers.emplace_back([&ioc]{ ioc.run(); });
  }

  for (auto& t : workers) t.join();
  return 0;
}
