/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "agentcfg/Loader.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace agentcfg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_config_file_name(const fs::path& p) {
    const std::string ext = to_lower(p.extension().string());
    return ext == ".json" || ext == ".toml";
}

/**
 * @brief Configuration files directly inside dir, sorted by name
 */
std::vector<std::string> list_config_dir(const fs::path& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || !is_config_file_name(entry.path())) {
            continue;
        }
        files.push_back(entry.path().string());
    }
    if (ec) {
        throw ConfigError("Failed to read config directory '" + dir.string() + "': " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // anonymous namespace

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Format format_for_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".toml") return Format::Toml;
    return Format::Auto;
}

std::vector<std::string> expand_config_paths(const std::vector<std::string>& paths) {
    std::vector<std::string> files;
    for (const auto& path : paths) {
        std::error_code ec;
        const fs::file_status status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            throw FileNotFoundError(path);
        }

        if (fs::is_directory(status)) {
            auto entries = list_config_dir(path);
            logger()->debug("config dir {}: {} file(s)", path, entries.size());
            files.insert(files.end(), entries.begin(), entries.end());
        } else {
            files.push_back(path);
        }
    }
    return files;
}

ConfigFragment load_config_file(const std::string& path) {
    logger()->debug("loading config file {}", path);
    return parse_file(read_file(path), format_for_path(path), path);
}

std::vector<ConfigFragment> load_config_files(const std::vector<std::string>& paths) {
    std::vector<ConfigFragment> fragments;
    for (const auto& file : expand_config_paths(paths)) {
        fragments.push_back(load_config_file(file));
    }
    return fragments;
}

} // namespace agentcfg
