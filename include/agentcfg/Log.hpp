/**
 * @file Log.hpp
 * @brief Library logger
 */

#ifndef AGENTCFG_LOG_HPP
#define AGENTCFG_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace agentcfg {

/**
 * @brief Logger shared by all agentcfg components
 *
 * Registered with spdlog as "agentcfg" and writing to stderr. If a logger
 * of that name is already registered (e.g. by the embedding agent) it is
 * reused. Defaults to the "warn" level.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Change the level of the agentcfg logger
 *
 * @param level One of "trace", "debug", "info", "warn", "error",
 *              "critical", "off" (case-insensitive)
 * @throws ConfigError for an unknown level name
 */
void set_log_level(const std::string& level);

} // namespace agentcfg

#endif // AGENTCFG_LOG_HPP
