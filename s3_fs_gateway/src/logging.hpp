#pragma once

#include "config.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace logging {

// Create the server/storage/auth loggers on a shared stdout sink.
void init(const config::LoggingConfig& cfg);

// Re-apply levels after a configuration reload.
void apply_levels(const config::LoggingConfig& cfg);

std::shared_ptr<spdlog::logger> get(const std::string& name);

inline std::shared_ptr<spdlog::logger> server()  { return get("server"); }
inline std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
inline std::shared_ptr<spdlog::logger> auth()    { return get("auth"); }

} // namespace logging
