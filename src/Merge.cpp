/**
 * @file Merge.cpp
 * @brief Implementation of layered fragment merge
 */

#include "agentcfg/Merge.hpp"

namespace agentcfg {

namespace {

template <typename T>
void merge_scalar(std::optional<T>& acc, const std::optional<T>& v) {
    if (v.has_value()) {
        acc = v;
    }
}

void merge_list(std::vector<std::string>& acc, const std::vector<std::string>& v) {
    acc.insert(acc.end(), v.begin(), v.end());
}

void merge_map(std::map<std::string, std::string>& acc,
               const std::map<std::string, std::string>& v) {
    if (!v.empty()) {
        acc = v;
    }
}

void merge_group(Ports& acc, const Ports& v) {
    merge_scalar(acc.dns, v.dns);
    merge_scalar(acc.http, v.http);
    merge_scalar(acc.https, v.https);
    merge_scalar(acc.serf_lan, v.serf_lan);
    merge_scalar(acc.serf_wan, v.serf_wan);
    merge_scalar(acc.server, v.server);
    merge_scalar(acc.deprecated_rpc, v.deprecated_rpc);
}

void merge_group(RetryJoinAzure& acc, const RetryJoinAzure& v) {
    merge_scalar(acc.tag_name, v.tag_name);
    merge_scalar(acc.tag_value, v.tag_value);
    merge_scalar(acc.subscription_id, v.subscription_id);
    merge_scalar(acc.tenant_id, v.tenant_id);
    merge_scalar(acc.client_id, v.client_id);
    merge_scalar(acc.secret_access_key, v.secret_access_key);
}

void merge_group(RetryJoinEC2& acc, const RetryJoinEC2& v) {
    merge_scalar(acc.region, v.region);
    merge_scalar(acc.tag_key, v.tag_key);
    merge_scalar(acc.tag_value, v.tag_value);
    merge_scalar(acc.access_key_id, v.access_key_id);
    merge_scalar(acc.secret_access_key, v.secret_access_key);
}

void merge_group(RetryJoinGCE& acc, const RetryJoinGCE& v) {
    merge_scalar(acc.project_name, v.project_name);
    merge_scalar(acc.zone_pattern, v.zone_pattern);
    merge_scalar(acc.tag_value, v.tag_value);
    merge_scalar(acc.credentials_file, v.credentials_file);
}

} // anonymous namespace

ConfigFragment merge(const ConfigFragment& base, const ConfigFragment& override_val) {
    ConfigFragment result = base;
    const ConfigFragment& v = override_val;

    merge_scalar(result.advertise_addr_lan, v.advertise_addr_lan);
    merge_scalar(result.advertise_addr_wan, v.advertise_addr_wan);
    merge_scalar(result.bind_addr, v.bind_addr);
    merge_scalar(result.bootstrap, v.bootstrap);
    merge_scalar(result.bootstrap_expect, v.bootstrap_expect);
    merge_scalar(result.check_update_interval, v.check_update_interval);
    merge_scalar(result.client_addr, v.client_addr);
    merge_scalar(result.dns_domain, v.dns_domain);
    merge_list(result.dns_recursors, v.dns_recursors);
    merge_scalar(result.data_dir, v.data_dir);
    merge_scalar(result.datacenter, v.datacenter);
    merge_scalar(result.dev_mode, v.dev_mode);
    merge_scalar(result.disable_host_node_id, v.disable_host_node_id);
    merge_scalar(result.disable_keyring_file, v.disable_keyring_file);
    merge_scalar(result.enable_script_checks, v.enable_script_checks);
    merge_scalar(result.enable_syslog, v.enable_syslog);
    merge_scalar(result.enable_ui, v.enable_ui);
    merge_scalar(result.encrypt_key, v.encrypt_key);
    merge_list(result.join_addrs_lan, v.join_addrs_lan);
    merge_list(result.join_addrs_wan, v.join_addrs_wan);
    merge_scalar(result.log_level, v.log_level);
    merge_scalar(result.node_id, v.node_id);
    merge_map(result.node_meta, v.node_meta);
    merge_scalar(result.node_name, v.node_name);
    merge_scalar(result.non_voting_server, v.non_voting_server);
    merge_scalar(result.pid_file, v.pid_file);
    merge_group(result.ports, v.ports);
    merge_scalar(result.rpc_protocol, v.rpc_protocol);
    merge_scalar(result.raft_protocol, v.raft_protocol);
    merge_scalar(result.rejoin_after_leave, v.rejoin_after_leave);
    merge_scalar(result.retry_join_interval_lan, v.retry_join_interval_lan);
    merge_scalar(result.retry_join_interval_wan, v.retry_join_interval_wan);
    merge_list(result.retry_join_lan, v.retry_join_lan);
    merge_scalar(result.retry_join_max_attempts_lan, v.retry_join_max_attempts_lan);
    merge_scalar(result.retry_join_max_attempts_wan, v.retry_join_max_attempts_wan);
    merge_list(result.retry_join_wan, v.retry_join_wan);
    merge_scalar(result.serf_bind_addr_lan, v.serf_bind_addr_lan);
    merge_scalar(result.serf_bind_addr_wan, v.serf_bind_addr_wan);
    merge_scalar(result.server_mode, v.server_mode);
    merge_scalar(result.ui_dir, v.ui_dir);

    merge_group(result.deprecated_retry_join_azure, v.deprecated_retry_join_azure);
    merge_group(result.deprecated_retry_join_ec2, v.deprecated_retry_join_ec2);
    merge_group(result.deprecated_retry_join_gce, v.deprecated_retry_join_gce);

    return result;
}

ConfigFragment merge_all(const std::vector<ConfigFragment>& fragments) {
    if (fragments.empty()) {
        return ConfigFragment{};
    }

    ConfigFragment result = fragments[0];
    for (size_t i = 1; i < fragments.size(); ++i) {
        result = merge(result, fragments[i]);
    }

    return result;
}

} // namespace agentcfg
