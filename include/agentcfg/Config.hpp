/**
 * @file Config.hpp
 * @brief End-to-end configuration pipeline
 *
 * Layer precedence, lowest first:
 *   defaults -> config files (command line / directory order) -> flags
 */

#ifndef AGENTCFG_CONFIG_HPP
#define AGENTCFG_CONFIG_HPP

#include "agentcfg/Flags.hpp"
#include "agentcfg/Fragment.hpp"
#include "agentcfg/RuntimeConfig.hpp"

#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Inputs of load()
 */
struct LoadOptions {
    /// Agent command line without the program name.
    std::vector<std::string> args;

    /// Lowest precedence layer.
    ConfigFragment defaults = default_fragment();
};

/**
 * @brief Intermediate and final results of one pipeline run
 */
struct LoadResult {
    Flags flags;
    std::vector<std::string> files;   ///< Config files in load order
    ConfigFragment merged;
    RuntimeConfig config;
};

/**
 * @brief Run the whole pipeline and keep the intermediate values
 *
 * @throws FlagError, FileNotFoundError, ConfigParseError, ValidationError
 */
LoadResult load_verbose(const LoadOptions& opts);

/**
 * @brief Build the runtime configuration from defaults, files and flags
 *
 * @throws FlagError, FileNotFoundError, ConfigParseError, ValidationError
 *
 * Example:
 * ```cpp
 * LoadOptions opts;
 * opts.args = {"-config-dir", "/etc/agent.d", "-bootstrap"};
 * RuntimeConfig cfg = load(opts);
 * ```
 */
RuntimeConfig load(const LoadOptions& opts);

} // namespace agentcfg

#endif // AGENTCFG_CONFIG_HPP
