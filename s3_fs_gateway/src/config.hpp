#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace config {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Permission {
  std::string action;
  std::string resource;
};

struct Credential {
  std::string access_key;
  std::string secret_key;
  std::vector<Permission> permissions;
};

struct StorageConfig {
  std::string location;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  unsigned short port = 8088;
  int threads = 0; // 0 = hardware concurrency
  std::size_t max_object_bytes = std::size_t{5120} * 1024 * 1024;
  std::string virtual_host_suffix; // e.g. "s3.local"
};

struct MultipartConfig {
  std::uint64_t expiry_seconds = 86400;
  std::uint64_t sweep_interval_seconds = 300;
};

struct LoggingConfig {
  std::string level = "info";
  std::string server = "info";
  std::string storage = "info";
  std::string auth = "info";
};

// Immutable once loaded; a reload builds a new Config and swaps it in.
struct Config {
  StorageConfig storage;
  ServerConfig server;
  std::vector<Credential> credentials;
  MultipartConfig multipart;
  LoggingConfig logging;
};

Config load_file(const std::string& path);
Config load_string(const std::string& yaml);

// Throws ConfigError naming the first invalid field.
void validate(const Config& cfg);

} // namespace config
