/**
 * @file Log.cpp
 * @brief Logger setup
 */

#include "recon/Log.hpp"
#include "recon/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace recon {

std::shared_ptr<spdlog::logger> logger() {
    const std::string name(kLoggerName);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(name);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%n] [%^%l%$] %v");
    return created;
}

void set_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        throw SettingsError("log.level", "unknown level '" + name + "'");
    }
    logger()->set_level(level);
}

} // namespace recon
