#include "agentcfg/Log.hpp"
#include "agentcfg/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace agentcfg {

std::shared_ptr<spdlog::logger> logger() {
    static auto log = [] {
        if (auto existing = spdlog::get("agentcfg")) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("agentcfg");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return log;
}

void set_log_level(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // from_str() maps unknown names to "off"; reject them instead
    const auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace agentcfg
