#include "agentcfg/RuntimeConfig.hpp"

#include <tuple>

namespace agentcfg {

namespace {

auto tie_simple(const RuntimeConfig& c) {
    return std::tie(c.advertise_addr_lan, c.advertise_addr_wan, c.bootstrap,
                    c.bootstrap_expect, c.check_update_interval, c.client_addr,
                    c.data_dir, c.datacenter, c.dev_mode, c.disable_host_node_id,
                    c.disable_keyring_file, c.dns_domain, c.dns_recursors,
                    c.enable_script_checks, c.enable_syslog, c.enable_ui,
                    c.encrypt_key, c.log_level, c.node_id, c.node_name,
                    c.non_voting_server, c.pid_file, c.raft_protocol,
                    c.rejoin_after_leave, c.rpc_protocol, c.serf_bind_addr_lan,
                    c.serf_bind_addr_wan, c.server_mode, c.ui_dir);
}

auto tie_derived(const RuntimeConfig& c) {
    return std::tie(c.bind_addrs, c.join_addrs_lan, c.join_addrs_wan,
                    c.retry_join_interval_lan, c.retry_join_interval_wan,
                    c.retry_join_lan, c.retry_join_wan,
                    c.retry_join_max_attempts_lan, c.retry_join_max_attempts_wan,
                    c.dns_port, c.dns_addrs_tcp, c.dns_addrs_udp,
                    c.http_port, c.http_addrs, c.https_port, c.https_addrs,
                    c.serf_port_lan, c.serf_addrs_lan, c.serf_port_wan, c.serf_addrs_wan,
                    c.server_port, c.server_addrs, c.node_meta);
}

} // anonymous namespace

bool operator==(const RuntimeConfig& a, const RuntimeConfig& b) {
    return tie_simple(a) == tie_simple(b) && tie_derived(a) == tie_derived(b);
}

bool operator!=(const RuntimeConfig& a, const RuntimeConfig& b) {
    return !(a == b);
}

Value to_json(const RuntimeConfig& c) {
    Value j = Value::object();

    j["advertise_addr_lan"] = c.advertise_addr_lan;
    j["advertise_addr_wan"] = c.advertise_addr_wan;
    j["bootstrap"] = c.bootstrap;
    j["bootstrap_expect"] = c.bootstrap_expect;
    j["check_update_interval"] = format_duration(c.check_update_interval);
    j["client_addr"] = c.client_addr;
    j["data_dir"] = c.data_dir;
    j["datacenter"] = c.datacenter;
    j["dev_mode"] = c.dev_mode;
    j["disable_host_node_id"] = c.disable_host_node_id;
    j["disable_keyring_file"] = c.disable_keyring_file;
    j["dns_domain"] = c.dns_domain;
    j["dns_recursors"] = c.dns_recursors;
    j["enable_script_checks"] = c.enable_script_checks;
    j["enable_syslog"] = c.enable_syslog;
    j["enable_ui"] = c.enable_ui;
    j["encrypt_key"] = c.encrypt_key.empty() ? "" : "hidden";
    j["log_level"] = c.log_level;
    j["node_id"] = c.node_id;
    j["node_name"] = c.node_name;
    j["non_voting_server"] = c.non_voting_server;
    j["pid_file"] = c.pid_file;
    j["raft_protocol"] = c.raft_protocol;
    j["rejoin_after_leave"] = c.rejoin_after_leave;
    j["rpc_protocol"] = c.rpc_protocol;
    j["serf_bind_addr_lan"] = c.serf_bind_addr_lan;
    j["serf_bind_addr_wan"] = c.serf_bind_addr_wan;
    j["server_mode"] = c.server_mode;
    j["ui_dir"] = c.ui_dir;

    j["bind_addrs"] = c.bind_addrs;
    j["join_addrs_lan"] = c.join_addrs_lan;
    j["join_addrs_wan"] = c.join_addrs_wan;

    j["retry_join_interval_lan"] = format_duration(c.retry_join_interval_lan);
    j["retry_join_interval_wan"] = format_duration(c.retry_join_interval_wan);
    j["retry_join_lan"] = c.retry_join_lan;
    j["retry_join_wan"] = c.retry_join_wan;
    j["retry_join_max_attempts_lan"] = c.retry_join_max_attempts_lan;
    j["retry_join_max_attempts_wan"] = c.retry_join_max_attempts_wan;

    j["dns_port"] = c.dns_port;
    j["dns_addrs_tcp"] = c.dns_addrs_tcp;
    j["dns_addrs_udp"] = c.dns_addrs_udp;
    j["http_port"] = c.http_port;
    j["http_addrs"] = c.http_addrs;
    j["https_port"] = c.https_port;
    j["https_addrs"] = c.https_addrs;
    j["serf_port_lan"] = c.serf_port_lan;
    j["serf_addrs_lan"] = c.serf_addrs_lan;
    j["serf_port_wan"] = c.serf_port_wan;
    j["serf_addrs_wan"] = c.serf_addrs_wan;
    j["server_port"] = c.server_port;
    j["server_addrs"] = c.server_addrs;

    j["node_meta"] = c.node_meta;
    return j;
}

} // namespace agentcfg
