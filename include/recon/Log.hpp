/**
 * @file Log.hpp
 * @brief Shared spdlog logger
 */

#ifndef RECON_LOG_HPP
#define RECON_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace recon {

/// Name under which the logger is registered with spdlog
inline constexpr std::string_view kLoggerName = "recon";

/**
 * @brief The "recon" logger, created on first use
 *
 * Writes to stderr with a colour sink. The default level is warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level from a name (trace, debug, info, warn, error, off)
 * @throws SettingsError for an unknown name
 */
void set_log_level(const std::string& name);

} // namespace recon

#endif // RECON_LOG_HPP
