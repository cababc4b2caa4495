/**
 * @file Loader.hpp
 * @brief Configuration file and directory loading
 *
 * Resolves the paths collected from -config-file / -config-dir into an
 * ordered list of fragments:
 * - A file path is loaded as is
 * - A directory contributes every regular file ending in ".json" or
 *   ".toml", in alphabetical order; subdirectories are not visited
 * - Paths keep their command line order
 */

#ifndef AGENTCFG_LOADER_HPP
#define AGENTCFG_LOADER_HPP

#include "agentcfg/Decode.hpp"
#include "agentcfg/Fragment.hpp"

#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Read entire file into a string
 *
 * @throws FileNotFoundError if the file does not exist or cannot be opened
 */
std::string read_file(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Document format implied by a file name
 *
 * @return Format::Json for ".json", Format::Toml for ".toml",
 *         Format::Auto for anything else
 */
Format format_for_path(const std::string& path);

/**
 * @brief Expand directories into the configuration files they contain
 *
 * @param paths Files and directories in command line order
 * @return Files in load order
 * @throws FileNotFoundError if a path does not exist
 *
 * Example:
 * ```cpp
 * // conf.d/ contains b.json, a.toml, notes.txt
 * expand_config_paths({"base.json", "conf.d"});
 * // {"base.json", "conf.d/a.toml", "conf.d/b.json"}
 * ```
 */
std::vector<std::string> expand_config_paths(const std::vector<std::string>& paths);

/**
 * @brief Load and decode one configuration file
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws ConfigParseError if the file has syntax or type errors
 */
ConfigFragment load_config_file(const std::string& path);

/**
 * @brief Load every file and directory, preserving order
 *
 * @param paths Paths as collected by parse_flags()
 * @return One fragment per configuration file, in load order
 * @throws FileNotFoundError, ConfigParseError
 */
std::vector<ConfigFragment> load_config_files(const std::vector<std::string>& paths);

} // namespace agentcfg

#endif // AGENTCFG_LOADER_HPP
