#include "agentcfg/Config.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Merge.hpp"
#include "agentcfg/Resolver.hpp"

namespace agentcfg {

LoadResult load_verbose(const LoadOptions& opts) {
    LoadResult result;

    // 1) flags
    result.flags = parse_flags(opts.args);

    // 2) files
    result.files = expand_config_paths(result.flags.config_files);

    // 3) layers: defaults, files, flags
    std::vector<ConfigFragment> layers;
    layers.reserve(result.files.size() + 2);
    layers.push_back(opts.defaults);
    for (const auto& file : result.files) {
        layers.push_back(load_config_file(file));
    }
    layers.push_back(result.flags.file);
    logger()->debug("merging {} configuration layer(s)", layers.size());

    // 4) merge and resolve
    result.merged = merge_all(layers);
    result.config = new_config(result.merged);

    return result;
}

RuntimeConfig load(const LoadOptions& opts) {
    return load_verbose(opts).config;
}

} // namespace agentcfg
