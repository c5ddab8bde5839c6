#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace logging {

namespace {

constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e [%n] [%^%l%$] %v";

std::mutex g_mu;
spdlog::sink_ptr g_sink;

spdlog::sink_ptr shared_sink() {
  if (!g_sink) {
    g_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    g_sink->set_pattern(kPattern);
  }
  return g_sink;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, spdlog::level::level_enum lvl) {
  auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
  logger->set_level(lvl);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  return logger;
}

void set_or_create(const std::string& name, const std::string& level) {
  const auto lvl = spdlog::level::from_str(level);
  if (auto existing = spdlog::get(name)) {
    existing->set_level(lvl);
    return;
  }
  make_logger(name, lvl);
}

} // namespace

void init(const config::LoggingConfig& cfg) {
  std::lock_guard<std::mutex> lock(g_mu);
  set_or_create("server", cfg.server);
  set_or_create("storage", cfg.storage);
  set_or_create("auth", cfg.auth);
}

void apply_levels(const config::LoggingConfig& cfg) {
  init(cfg);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
  if (auto logger = spdlog::get(name)) return logger;
  std::lock_guard<std::mutex> lock(g_mu);
  if (auto logger = spdlog::get(name)) return logger;
  // Not initialized (unit tests): warnings and above only.
  return make_logger(name, spdlog::level::warn);
}

} // namespace logging
