#include "config.hpp"

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <string>
#include <thread>
#include <unordered_set>

namespace YAML {

template <>
struct convert<config::Permission> {
  static bool decode(const Node& node, config::Permission& rhs) {
    if (!node.IsMap()) return false;
    rhs.action = node["action"].as<std::string>("");
    rhs.resource = node["resource"].as<std::string>("");
    return true;
  }
};

template <>
struct convert<config::Credential> {
  static bool decode(const Node& node, config::Credential& rhs) {
    if (!node.IsMap()) return false;
    rhs.access_key = node["access_key"].as<std::string>("");
    rhs.secret_key = node["secret_key"].as<std::string>("");
    rhs.permissions.clear();
    if (auto perms = node["permissions"]) {
      if (!perms.IsSequence()) return false;
      for (const auto& p : perms) rhs.permissions.push_back(p.as<config::Permission>());
    }
    return true;
  }
};

template <>
struct convert<config::ServerConfig> {
  static bool decode(const Node& node, config::ServerConfig& rhs) {
    if (!node.IsMap()) return false;
    rhs.host = node["host"].as<std::string>("0.0.0.0");
    rhs.port = node["port"].as<unsigned short>(8088);
    rhs.threads = node["threads"].as<int>(0);
    rhs.max_object_bytes = node["max_object_mb"].as<std::size_t>(5120) * 1024u * 1024u;
    rhs.virtual_host_suffix = node["virtual_host_suffix"].as<std::string>("");
    return true;
  }
};

template <>
struct convert<config::MultipartConfig> {
  static bool decode(const Node& node, config::MultipartConfig& rhs) {
    if (!node.IsMap()) return false;
    rhs.expiry_seconds = node["expiry_seconds"].as<std::uint64_t>(86400);
    rhs.sweep_interval_seconds = node["sweep_interval_seconds"].as<std::uint64_t>(300);
    return true;
  }
};

template <>
struct convert<config::LoggingConfig> {
  static bool decode(const Node& node, config::LoggingConfig& rhs) {
    if (!node.IsMap()) return false;
    rhs.level = node["level"].as<std::string>("info");
    const Node levels = node["levels"];
    rhs.server = levels ? levels["server"].as<std::string>(rhs.level) : rhs.level;
    rhs.storage = levels ? levels["storage"].as<std::string>(rhs.level) : rhs.level;
    rhs.auth = levels ? levels["auth"].as<std::string>(rhs.level) : rhs.level;
    return true;
  }
};

} // namespace YAML

namespace config {

static Config from_node(const YAML::Node& root) {
  if (!root.IsMap()) throw ConfigError("config root must be a mapping");

  Config cfg;
  try {
    if (auto node = root["storage"]) cfg.storage.location = node["location"].as<std::string>("");
    if (auto node = root["server"]) cfg.server = node.as<ServerConfig>();
    if (auto node = root["multipart"]) cfg.multipart = node.as<MultipartConfig>();
    if (auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();
    if (auto node = root["credentials"]) {
      if (!node.IsSequence()) throw ConfigError("credentials must be a list");
      for (const auto& c : node) cfg.credentials.push_back(c.as<Credential>());
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }

  if (cfg.server.threads <= 0) {
    cfg.server.threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  }

  validate(cfg);
  return cfg;
}

Config load_file(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("failed to read config file " + path + ": " + e.what());
  }
  return from_node(root);
}

Config load_string(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("failed to parse config: ") + e.what());
  }
  return from_node(root);
}

namespace {

// spdlog maps unknown names to off, so only the literal "off" may disable a logger.
void check_level(const std::string& field, const std::string& level) {
  if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    throw ConfigError("logging." + field + ": unknown level '" + level + "'");
  }
}

} // namespace

void validate(const Config& cfg) {
  if (cfg.storage.location.empty()) {
    throw ConfigError("storage.location must not be empty");
  }
  if (cfg.server.port == 0) {
    throw ConfigError("server.port must be > 0");
  }
  if (cfg.credentials.empty()) {
    throw ConfigError("at least one credential must be defined");
  }
  std::unordered_set<std::string> seen;
  for (const auto& cred : cfg.credentials) {
    if (cred.access_key.empty() || cred.secret_key.empty()) {
      throw ConfigError("credential access_key and secret_key must not be empty");
    }
    if (!seen.insert(cred.access_key).second) {
      throw ConfigError("duplicate access_key: " + cred.access_key);
    }
    for (const auto& p : cred.permissions) {
      if (p.action.empty() || p.resource.empty()) {
        throw ConfigError("permission action and resource must not be empty (access_key " +
                          cred.access_key + ")");
      }
    }
  }
  if (cfg.multipart.expiry_seconds == 0) {
    throw ConfigError("multipart.expiry_seconds must be > 0");
  }
  if (cfg.multipart.sweep_interval_seconds == 0) {
    throw ConfigError("multipart.sweep_interval_seconds must be > 0");
  }
  check_level("level", cfg.logging.level);
  check_level("levels.server", cfg.logging.server);
  check_level("levels.storage", cfg.logging.storage);
  check_level("levels.auth", cfg.logging.auth);
}

} // namespace config
