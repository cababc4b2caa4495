#include <cxxopts.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "agentcfg/Config.hpp"
#include "agentcfg/Decode.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Flags.hpp"
#include "agentcfg/Log.hpp"

using namespace agentcfg;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("agentcfg", "Resolve agent configuration from defaults, config files and flags");
        options.positional_help("-- AGENT_FLAGS...");

        options.add_options()
            ("merged", "Print the merged fragment instead of the runtime configuration")
            ("no-defaults", "Do not use the compiled-in default layer")
            ("usage", "List the agent flags")
            ("log-level", "Log level (trace, debug, info, warn, error, off)", cxxopts::value<std::string>()->default_value("warn"))
            ("h,help", "Show help");

        // Agent flags are captured as positional strings after "--"
        options.add_options()
            ("agent_args", "Agent flags", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"agent_args"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        set_log_level(result["log-level"].as<std::string>());

        if (result.count("usage")) {
            Flags unused;
            FlagSet fs("agent");
            add_flags(fs, unused);
            std::cout << fs.usage();
            return 0;
        }

        LoadOptions load;
        if (result.count("agent_args")) {
            load.args = result["agent_args"].as<std::vector<std::string>>();
        }
        if (result.count("no-defaults")) {
            load.defaults = ConfigFragment{};
        }

        LoadResult loaded = load_verbose(load);
        for (const auto& file : loaded.files) {
            logger()->info("loaded {}", file);
        }

        if (result.count("merged")) {
            std::cout << fragment_to_value(loaded.merged).dump(2) << "\n";
        } else {
            std::cout << to_json(loaded.config).dump(2) << "\n";
        }
        return 0;

    } catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
