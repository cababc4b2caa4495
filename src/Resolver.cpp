/**
 * @file Resolver.cpp
 * @brief Implementation of runtime configuration resolution
 */

#include "agentcfg/Resolver.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"

#include <utility>

namespace agentcfg {

namespace {

constexpr int kMaxPort = 65535;
const std::string kWildcardAddr = "0.0.0.0";

bool bool_val(const std::optional<bool>& b) { return b.value_or(false); }
int int_val(const std::optional<int>& n) { return n.value_or(0); }
std::string string_val(const std::optional<std::string>& s) { return s.value_or(""); }
Duration duration_val(const std::optional<Duration>& d) { return d.value_or(Duration::zero()); }

/**
 * @brief Parse a textual duration field, absent -> 0
 */
Duration duration_val(const char* field, const std::optional<std::string>& s) {
    if (!s) return Duration::zero();
    try {
        return parse_duration(*s);
    } catch (const DurationError& e) {
        throw ValidationError(field, e.what());
    }
}

std::string addr_val(const std::optional<std::string>& s) {
    std::string addr = string_val(s);
    return addr.empty() ? kWildcardAddr : addr;
}

/**
 * @brief Resolve one listener: port value plus one address per bind address
 *
 * Leaves port and addrs untouched when the port is absent or negative.
 */
void resolve_endpoint(const char* field,
                      const std::optional<int>& port,
                      const std::vector<std::string>& bind_addrs,
                      int& port_out,
                      std::vector<std::string>& addrs_out) {
    if (!port) return;
    if (*port > kMaxPort) {
        throw ValidationError(field, "port " + std::to_string(*port) + " out of range");
    }
    port_out = *port;
    if (*port < 0) {
        logger()->debug("{} is negative, listener disabled", field);
        return;
    }
    for (const auto& addr : bind_addrs) {
        addrs_out.push_back(join_host_port(addr, *port));
    }
}

/**
 * @brief Append " key=value" for a present value
 */
void append_param(std::string& out, const char* key, const std::optional<std::string>& v) {
    if (!v) return;
    out += " ";
    out += key;
    out += "=";
    out += *v;
}

std::vector<std::string> discovery_entries(const ConfigFragment& f) {
    std::vector<std::string> out;

    const RetryJoinAzure& azure = f.deprecated_retry_join_azure;
    if (azure != RetryJoinAzure{}) {
        std::string s = "provider=azure";
        append_param(s, "tag_name", azure.tag_name);
        append_param(s, "tag_value", azure.tag_value);
        append_param(s, "subscription_id", azure.subscription_id);
        append_param(s, "tenant_id", azure.tenant_id);
        append_param(s, "client_id", azure.client_id);
        append_param(s, "secret_access_key", azure.secret_access_key);
        out.push_back(std::move(s));
    }

    const RetryJoinEC2& ec2 = f.deprecated_retry_join_ec2;
    if (ec2 != RetryJoinEC2{}) {
        std::string s = "provider=aws";
        append_param(s, "region", ec2.region);
        append_param(s, "tag_key", ec2.tag_key);
        append_param(s, "tag_value", ec2.tag_value);
        append_param(s, "access_key_id", ec2.access_key_id);
        append_param(s, "secret_access_key", ec2.secret_access_key);
        out.push_back(std::move(s));
    }

    const RetryJoinGCE& gce = f.deprecated_retry_join_gce;
    if (gce != RetryJoinGCE{}) {
        std::string s = "provider=gce";
        append_param(s, "project_name", gce.project_name);
        append_param(s, "zone_pattern", gce.zone_pattern);
        append_param(s, "tag_value", gce.tag_value);
        append_param(s, "credentials_file", gce.credentials_file);
        out.push_back(std::move(s));
    }

    return out;
}

} // anonymous namespace

std::string join_host_port(const std::string& host, int port) {
    std::string h = host == kWildcardAddr ? "" : host;
    if (h.find(':') != std::string::npos) {
        h = "[" + h + "]";
    }
    return h + ":" + std::to_string(port);
}

RuntimeConfig new_config(const ConfigFragment& f) {
    RuntimeConfig c;

    c.advertise_addr_lan = string_val(f.advertise_addr_lan);
    c.advertise_addr_wan = string_val(f.advertise_addr_wan);
    if (c.advertise_addr_wan.empty()) {
        c.advertise_addr_wan = c.advertise_addr_lan;
    }
    c.bootstrap = bool_val(f.bootstrap);
    c.bootstrap_expect = int_val(f.bootstrap_expect);
    c.check_update_interval = duration_val("check_update_interval", f.check_update_interval);
    c.client_addr = string_val(f.client_addr);
    c.data_dir = string_val(f.data_dir);
    c.datacenter = string_val(f.datacenter);
    c.dev_mode = bool_val(f.dev_mode);
    c.disable_host_node_id = bool_val(f.disable_host_node_id);
    c.disable_keyring_file = bool_val(f.disable_keyring_file);
    c.dns_domain = string_val(f.dns_domain);
    c.dns_recursors = f.dns_recursors;
    c.enable_script_checks = bool_val(f.enable_script_checks);
    c.enable_syslog = bool_val(f.enable_syslog);
    c.enable_ui = bool_val(f.enable_ui);
    c.encrypt_key = string_val(f.encrypt_key);
    c.log_level = string_val(f.log_level);
    c.node_id = string_val(f.node_id);
    c.node_name = string_val(f.node_name);
    c.non_voting_server = bool_val(f.non_voting_server);
    c.pid_file = string_val(f.pid_file);
    c.raft_protocol = int_val(f.raft_protocol);
    c.rejoin_after_leave = bool_val(f.rejoin_after_leave);
    c.rpc_protocol = int_val(f.rpc_protocol);
    c.serf_bind_addr_lan = string_val(f.serf_bind_addr_lan);
    c.serf_bind_addr_wan = string_val(f.serf_bind_addr_wan);
    c.server_mode = bool_val(f.server_mode);
    c.ui_dir = string_val(f.ui_dir);

    c.join_addrs_lan = f.join_addrs_lan;
    c.join_addrs_wan = f.join_addrs_wan;
    c.node_meta = f.node_meta;

    c.retry_join_interval_lan = duration_val(f.retry_join_interval_lan);
    c.retry_join_interval_wan = duration_val(f.retry_join_interval_wan);
    c.retry_join_max_attempts_lan = int_val(f.retry_join_max_attempts_lan);
    c.retry_join_max_attempts_wan = int_val(f.retry_join_max_attempts_wan);
    c.retry_join_lan = f.retry_join_lan;
    c.retry_join_wan = f.retry_join_wan;
    for (auto& entry : discovery_entries(f)) {
        logger()->warn("retry_join_{{azure,ec2,gce}} settings are deprecated, use retry_join \"{}\"",
                       entry);
        c.retry_join_lan.push_back(std::move(entry));
    }

    // if no bind address is given but ports are specified then we bail.
    // this only affects fragments resolved without the default layer
    // which always has a bind address.
    if (!f.bind_addr && !f.ports.empty()) {
        throw ValidationError("bind_addr", "no bind address specified");
    }

    if (f.bind_addr) {
        c.bind_addrs = {addr_val(f.bind_addr)};
    }

    resolve_endpoint("ports.dns", f.ports.dns, c.bind_addrs, c.dns_port, c.dns_addrs_tcp);
    c.dns_addrs_udp = c.dns_addrs_tcp;  // DNS serves both transports
    resolve_endpoint("ports.http", f.ports.http, c.bind_addrs, c.http_port, c.http_addrs);
    resolve_endpoint("ports.https", f.ports.https, c.bind_addrs, c.https_port, c.https_addrs);
    resolve_endpoint("ports.serf_lan", f.ports.serf_lan, c.bind_addrs, c.serf_port_lan, c.serf_addrs_lan);
    resolve_endpoint("ports.serf_wan", f.ports.serf_wan, c.bind_addrs, c.serf_port_wan, c.serf_addrs_wan);
    resolve_endpoint("ports.server", f.ports.server, c.bind_addrs, c.server_port, c.server_addrs);

    if (f.ports.deprecated_rpc) {
        logger()->warn("ports.rpc is deprecated and ignored");
    }

    logger()->debug("resolved configuration for datacenter '{}' with {} bind address(es)",
                    c.datacenter, c.bind_addrs.size());
    return c;
}

} // namespace agentcfg
