/**
 * @file Fragment.cpp
 * @brief Fragment equality and the compiled-in default layer
 */

#include "agentcfg/Fragment.hpp"

#include <tuple>

namespace agentcfg {

namespace {

auto tie_fields(const Ports& p) {
    return std::tie(p.dns, p.http, p.https, p.serf_lan, p.serf_wan, p.server,
                    p.deprecated_rpc);
}

auto tie_fields(const RetryJoinAzure& r) {
    return std::tie(r.tag_name, r.tag_value, r.subscription_id, r.tenant_id,
                    r.client_id, r.secret_access_key);
}

auto tie_fields(const RetryJoinEC2& r) {
    return std::tie(r.region, r.tag_key, r.tag_value, r.access_key_id,
                    r.secret_access_key);
}

auto tie_fields(const RetryJoinGCE& r) {
    return std::tie(r.project_name, r.zone_pattern, r.tag_value, r.credentials_file);
}

auto tie_scalars_head(const ConfigFragment& f) {
    return std::tie(f.advertise_addr_lan, f.advertise_addr_wan, f.bind_addr,
                    f.bootstrap, f.bootstrap_expect, f.check_update_interval,
                    f.client_addr, f.dns_domain, f.dns_recursors, f.data_dir,
                    f.datacenter, f.dev_mode, f.disable_host_node_id,
                    f.disable_keyring_file, f.enable_script_checks,
                    f.enable_syslog, f.enable_ui, f.encrypt_key,
                    f.join_addrs_lan, f.join_addrs_wan, f.log_level);
}

auto tie_scalars_tail(const ConfigFragment& f) {
    return std::tie(f.node_id, f.node_meta, f.node_name, f.non_voting_server,
                    f.pid_file, f.rpc_protocol, f.raft_protocol,
                    f.rejoin_after_leave, f.retry_join_interval_lan,
                    f.retry_join_interval_wan, f.retry_join_lan,
                    f.retry_join_max_attempts_lan, f.retry_join_max_attempts_wan,
                    f.retry_join_wan, f.serf_bind_addr_lan, f.serf_bind_addr_wan,
                    f.server_mode, f.ui_dir);
}

} // anonymous namespace

bool Ports::empty() const {
    return *this == Ports{};
}

bool operator==(const Ports& a, const Ports& b) { return tie_fields(a) == tie_fields(b); }
bool operator!=(const Ports& a, const Ports& b) { return !(a == b); }

bool operator==(const RetryJoinAzure& a, const RetryJoinAzure& b) { return tie_fields(a) == tie_fields(b); }
bool operator!=(const RetryJoinAzure& a, const RetryJoinAzure& b) { return !(a == b); }

bool operator==(const RetryJoinEC2& a, const RetryJoinEC2& b) { return tie_fields(a) == tie_fields(b); }
bool operator!=(const RetryJoinEC2& a, const RetryJoinEC2& b) { return !(a == b); }

bool operator==(const RetryJoinGCE& a, const RetryJoinGCE& b) { return tie_fields(a) == tie_fields(b); }
bool operator!=(const RetryJoinGCE& a, const RetryJoinGCE& b) { return !(a == b); }

bool operator==(const ConfigFragment& a, const ConfigFragment& b) {
    return tie_scalars_head(a) == tie_scalars_head(b)
        && tie_scalars_tail(a) == tie_scalars_tail(b)
        && a.ports == b.ports
        && a.deprecated_retry_join_azure == b.deprecated_retry_join_azure
        && a.deprecated_retry_join_ec2 == b.deprecated_retry_join_ec2
        && a.deprecated_retry_join_gce == b.deprecated_retry_join_gce;
}

bool operator!=(const ConfigFragment& a, const ConfigFragment& b) { return !(a == b); }

ConfigFragment default_fragment() {
    using namespace std::chrono_literals;

    ConfigFragment f;
    f.bind_addr = "0.0.0.0";
    f.bootstrap = false;
    f.check_update_interval = "5m";
    f.client_addr = "127.0.0.1";
    f.datacenter = "dc1";
    f.dns_domain = "consul.";
    f.log_level = "INFO";
    f.raft_protocol = 3;
    f.rpc_protocol = 2;
    f.retry_join_interval_lan = Duration(30s);
    f.retry_join_interval_wan = Duration(30s);
    f.server_mode = false;

    f.ports.dns = 8600;
    f.ports.http = 8500;
    f.ports.serf_lan = 8301;
    f.ports.serf_wan = 8302;
    f.ports.server = 8300;
    return f;
}

} // namespace agentcfg
