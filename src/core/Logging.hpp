#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace axiom::logging {

// Get (or create on first use) a named console logger, e.g. "axiom.worker".
// Every logger shares the same pattern and the level set by set_level().
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Set the level of all existing and future loggers.
// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Throws std::invalid_argument on any other name.
void set_level(const std::string& level);

} // namespace axiom::logging
