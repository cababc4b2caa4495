/**
 * @file Flags.cpp
 * @brief Flag registry, argument parsing and the agent flag table
 */

#include "agentcfg/Flags.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Parse.hpp"

#include <sstream>
#include <stdexcept>
#include <tuple>

namespace agentcfg {

namespace {

/**
 * @brief Applies one textual value to a bound target
 */
struct ValueSetter {
    const std::string& flag;
    const std::string& value;

    [[noreturn]] void fail(const std::string& what) const {
        throw FlagError(flag, "invalid value \"" + value + "\": " + what);
    }

    void operator()(std::optional<bool>* p) const {
        auto b = parse_bool(value);
        if (!b) fail("not a boolean");
        *p = *b;
    }

    void operator()(std::optional<int>* p) const {
        auto n = parse_int(value);
        if (!n) fail("not an integer");
        *p = *n;
    }

    void operator()(std::optional<Duration>* p) const {
        try {
            *p = parse_duration(value);
        } catch (const DurationError&) {
            fail("not a duration");
        }
    }

    void operator()(std::optional<std::string>* p) const {
        *p = value;
    }

    void operator()(std::vector<std::string>* p) const {
        p->push_back(value);
    }

    void operator()(std::map<std::string, std::string>* p) const {
        auto pos = value.find(':');
        if (pos == std::string::npos) fail("missing ':' in key:value pair");
        (*p)[value.substr(0, pos)] = value.substr(pos + 1);
    }
};

/**
 * @brief Placeholder shown after the flag name in usage()
 */
struct TypeName {
    std::string operator()(std::optional<bool>*) const { return ""; }
    std::string operator()(std::optional<int>*) const { return "int"; }
    std::string operator()(std::optional<Duration>*) const { return "duration"; }
    std::string operator()(std::optional<std::string>*) const { return "string"; }
    std::string operator()(std::vector<std::string>*) const { return "value"; }
    std::string operator()(std::map<std::string, std::string>*) const { return "key:value"; }
};

} // anonymous namespace

// ============================================================================
// FlagSet
// ============================================================================

void FlagSet::add(Target target, std::string name, std::string help) {
    if (name.empty() || name[0] == '-' || name.find('=') != std::string::npos) {
        throw std::logic_error(name_ + ": invalid flag name \"" + name + "\"");
    }
    if (flags_.count(name) > 0) {
        throw std::logic_error(name_ + ": flag redefined: " + name);
    }
    Flag flag{name, std::move(help), target};
    flags_.emplace(std::move(name), std::move(flag));
}

const FlagSet::Flag* FlagSet::lookup(const std::string& name) const {
    auto it = flags_.find(name);
    return it == flags_.end() ? nullptr : &it->second;
}

void FlagSet::parse(const std::vector<std::string>& args) {
    size_t i = 0;
    while (i < args.size()) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            break;  // first positional argument ends flag processing
        }

        size_t dashes = 1;
        if (arg[1] == '-') {
            dashes = 2;
            if (arg.size() == 2) {  // "--"
                ++i;
                break;
            }
        }

        std::string name = arg.substr(dashes);
        if (name.empty() || name[0] == '-' || name[0] == '=') {
            throw FlagError("", "bad flag syntax: " + arg);
        }

        std::optional<std::string> value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
        }
        ++i;

        const Flag* flag = lookup(name);
        if (flag == nullptr) {
            throw FlagError(name, "flag provided but not defined");
        }

        if (std::holds_alternative<std::optional<bool>*>(flag->target)) {
            auto* target = std::get<std::optional<bool>*>(flag->target);
            if (!value && i < args.size()) {
                // "-flag true" / "-flag false": take the next token only
                // if it is a boolean literal
                if (auto b = parse_bool(args[i])) {
                    *target = *b;
                    ++i;
                    continue;
                }
            }
            if (!value) {
                *target = true;
                continue;
            }
        }

        if (!value) {
            if (i >= args.size()) {
                throw FlagError(name, "flag needs an argument");
            }
            value = args[i++];
        }

        std::visit(ValueSetter{name, *value}, flag->target);
    }

    if (i < args.size()) {
        throw FlagError("", "unexpected argument: " + args[i]);
    }
}

std::string FlagSet::usage() const {
    std::ostringstream oss;
    oss << "Usage of " << name_ << ":\n";
    for (const auto& [name, flag] : flags_) {
        oss << "  -" << name;
        const std::string type = std::visit(TypeName{}, flag.target);
        if (!type.empty()) oss << " " << type;
        oss << "\n    \t" << flag.help << "\n";
    }
    return oss.str();
}

// ============================================================================
// Agent flags
// ============================================================================

bool operator==(const Flags& a, const Flags& b) {
    return a.file == b.file
        && std::tie(a.config_files, a.deprecated_datacenter,
                    a.deprecated_atlas_infrastructure, a.deprecated_atlas_join,
                    a.deprecated_atlas_token, a.deprecated_atlas_endpoint)
        == std::tie(b.config_files, b.deprecated_datacenter,
                    b.deprecated_atlas_infrastructure, b.deprecated_atlas_join,
                    b.deprecated_atlas_token, b.deprecated_atlas_endpoint);
}

bool operator!=(const Flags& a, const Flags& b) { return !(a == b); }

void add_flags(FlagSet& fs, Flags& f) {
    // command line flags ordered by flag name
    fs.add(&f.file.advertise_addr_lan, "advertise", "Sets the advertise address to use.");
    fs.add(&f.file.advertise_addr_wan, "advertise-wan", "Sets address to advertise on WAN instead of -advertise address.");
    fs.add(&f.file.bind_addr, "bind", "Sets the bind address for cluster communication.");
    fs.add(&f.file.bootstrap, "bootstrap", "Sets server to bootstrap mode.");
    fs.add(&f.file.bootstrap_expect, "bootstrap-expect", "Sets server to expect bootstrap mode.");
    fs.add(&f.file.client_addr, "client", "Sets the address to bind for client access. This includes RPC, DNS, HTTP and HTTPS (if configured).");
    fs.add(&f.config_files, "config-dir", "Path to a directory to read configuration files from. Every file ending in '.json' or '.toml' is read in alphabetical order. Can be specified multiple times.");
    fs.add(&f.config_files, "config-file", "Path to a JSON or TOML file to read configuration from. Can be specified multiple times.");
    fs.add(&f.file.data_dir, "data-dir", "Path to a data directory to store agent state.");
    fs.add(&f.file.datacenter, "datacenter", "Datacenter of the agent.");
    fs.add(&f.file.dev_mode, "dev", "Starts the agent in development mode.");
    fs.add(&f.file.disable_host_node_id, "disable-host-node-id", "Prevents using information from the host to generate a node ID; a random node ID is generated instead.");
    fs.add(&f.file.disable_keyring_file, "disable-keyring-file", "Disables the backing up of the keyring to a file.");
    fs.add(&f.file.ports.dns, "dns-port", "DNS port to use.");
    fs.add(&f.file.dns_domain, "domain", "Domain to use for DNS interface.");
    fs.add(&f.file.enable_script_checks, "enable-script-checks", "Enables health check scripts.");
    fs.add(&f.file.encrypt_key, "encrypt", "Provides the gossip encryption key.");
    fs.add(&f.file.ports.http, "http-port", "Sets the HTTP API port to listen on.");
    fs.add(&f.file.join_addrs_lan, "join", "Address of an agent to join at start time. Can be specified multiple times.");
    fs.add(&f.file.join_addrs_wan, "join-wan", "Address of an agent to join -wan at start time. Can be specified multiple times.");
    fs.add(&f.file.log_level, "log-level", "Log level of the agent.");
    fs.add(&f.file.node_name, "node", "Name of this node. Must be unique in the cluster.");
    fs.add(&f.file.node_id, "node-id", "A unique ID for this node across space and time. Defaults to a randomly-generated ID that persists in the data-dir.");
    fs.add(&f.file.node_meta, "node-meta", "An arbitrary metadata key/value pair for this node, of the format `key:value`. Can be specified multiple times.");
    fs.add(&f.file.non_voting_server, "non-voting-server", "Makes the server not participate in the Raft quorum and only receive the data replication stream.");
    fs.add(&f.file.pid_file, "pid-file", "Path to file to store agent PID.");
    fs.add(&f.file.rpc_protocol, "protocol", "Sets the protocol version. Defaults to latest.");
    fs.add(&f.file.raft_protocol, "raft-protocol", "Sets the Raft protocol version. Defaults to latest.");
    fs.add(&f.file.dns_recursors, "recursor", "Address of an upstream DNS server. Can be specified multiple times.");
    fs.add(&f.file.rejoin_after_leave, "rejoin", "Ignores a previous leave and attempts to rejoin the cluster.");
    fs.add(&f.file.retry_join_interval_lan, "retry-interval", "Time to wait between join attempts.");
    fs.add(&f.file.retry_join_interval_wan, "retry-interval-wan", "Time to wait between join -wan attempts.");
    fs.add(&f.file.retry_join_lan, "retry-join", "Address of an agent to join at start time with retries enabled. Can be specified multiple times.");
    fs.add(&f.file.retry_join_wan, "retry-join-wan", "Address of an agent to join -wan at start time with retries enabled. Can be specified multiple times.");
    fs.add(&f.file.retry_join_max_attempts_lan, "retry-max", "Maximum number of join attempts. Defaults to 0, which will retry indefinitely.");
    fs.add(&f.file.retry_join_max_attempts_wan, "retry-max-wan", "Maximum number of join -wan attempts. Defaults to 0, which will retry indefinitely.");
    fs.add(&f.file.serf_bind_addr_lan, "serf-lan-bind", "Address to bind Serf LAN listeners to.");
    fs.add(&f.file.serf_bind_addr_wan, "serf-wan-bind", "Address to bind Serf WAN listeners to.");
    fs.add(&f.file.server_mode, "server", "Switches agent to server mode.");
    fs.add(&f.file.enable_syslog, "syslog", "Enables logging to syslog.");
    fs.add(&f.file.enable_ui, "ui", "Enables the built-in static web UI server.");
    fs.add(&f.file.ui_dir, "ui-dir", "Path to directory containing the web UI resources.");

    // deprecated flags ordered by flag name
    fs.add(&f.deprecated_atlas_infrastructure, "atlas", "(deprecated) Sets the Atlas infrastructure name, enables SCADA.");
    fs.add(&f.deprecated_atlas_endpoint, "atlas-endpoint", "(deprecated) The address of the endpoint for Atlas integration.");
    fs.add(&f.deprecated_atlas_join, "atlas-join", "(deprecated) Enables auto-joining the Atlas cluster.");
    fs.add(&f.deprecated_atlas_token, "atlas-token", "(deprecated) Provides the Atlas API token.");
    fs.add(&f.deprecated_datacenter, "dc", "(deprecated) Datacenter of the agent (use 'datacenter' instead).");
    fs.add(&f.file.deprecated_retry_join_azure.tag_name, "retry-join-azure-tag-name", "Azure tag name to filter on for server discovery.");
    fs.add(&f.file.deprecated_retry_join_azure.tag_value, "retry-join-azure-tag-value", "Azure tag value to filter on for server discovery.");
    fs.add(&f.file.deprecated_retry_join_ec2.region, "retry-join-ec2-region", "EC2 Region to discover servers in.");
    fs.add(&f.file.deprecated_retry_join_ec2.tag_key, "retry-join-ec2-tag-key", "EC2 tag key to filter on for server discovery.");
    fs.add(&f.file.deprecated_retry_join_ec2.tag_value, "retry-join-ec2-tag-value", "EC2 tag value to filter on for server discovery.");
    fs.add(&f.file.deprecated_retry_join_gce.credentials_file, "retry-join-gce-credentials-file", "Path to credentials JSON file to use with Google Compute Engine.");
    fs.add(&f.file.deprecated_retry_join_gce.project_name, "retry-join-gce-project-name", "Google Compute Engine project to discover servers in.");
    fs.add(&f.file.deprecated_retry_join_gce.tag_value, "retry-join-gce-tag-value", "Google Compute Engine tag value to filter on for server discovery.");
    fs.add(&f.file.deprecated_retry_join_gce.zone_pattern, "retry-join-gce-zone-pattern", "Google Compute Engine region or zone to discover servers in (regex pattern).");
}

Flags parse_flags(const std::vector<std::string>& args) {
    Flags f;
    FlagSet fs("agent");
    add_flags(fs, f);
    fs.parse(args);

    if (f.deprecated_datacenter) {
        logger()->warn("flag -dc is deprecated, use -datacenter instead");
        if (!f.file.datacenter) {
            f.file.datacenter = f.deprecated_datacenter;
        }
    }
    if (f.deprecated_atlas_infrastructure || f.deprecated_atlas_join ||
        f.deprecated_atlas_token || f.deprecated_atlas_endpoint) {
        logger()->warn("Atlas integration has been removed, the -atlas* flags are ignored");
    }

    return f;
}

} // namespace agentcfg
