#include "Logging.hpp"

#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace axiom::logging {

namespace {

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e - %l - %n - %v";

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    return logger;
}

void set_level(const std::string& level) {
    // from_str maps unknown names to off
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }

    std::lock_guard<std::mutex> lock(registry_mutex());
    spdlog::set_level(parsed);
}

} // namespace axiom::logging
