/**
 * @file Fragment.hpp
 * @brief Sparse configuration fragment contributed by one layer
 *
 * A fragment is what a single configuration source (compiled-in defaults,
 * one configuration document, or the command line) contributes. Every
 * scalar is wrapped in std::optional so that "not mentioned" can be told
 * apart from "explicitly set to the zero value":
 *
 * - std::nullopt       -> the layer did not mention the field
 * - std::optional(v)   -> the layer set the field to v (even false/0/"")
 *
 * Lists and maps carry no separate presence bit; an empty container means
 * the layer contributed nothing.
 *
 * Fragments are plain values. They are combined by merge_all() and turned
 * into a RuntimeConfig by new_config().
 */

#ifndef AGENTCFG_FRAGMENT_HPP
#define AGENTCFG_FRAGMENT_HPP

#include "agentcfg/Duration.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Listener ports of the agent
 */
struct Ports {
    std::optional<int> dns;
    std::optional<int> http;
    std::optional<int> https;
    std::optional<int> serf_lan;
    std::optional<int> serf_wan;
    std::optional<int> server;

    /// Accepted for compatibility, ignored by the resolver.
    std::optional<int> deprecated_rpc;

    /**
     * @brief True if no port was mentioned by the layer
     */
    bool empty() const;
};

/// Azure cloud auto-join settings (deprecated, see retry_join).
struct RetryJoinAzure {
    std::optional<std::string> tag_name;
    std::optional<std::string> tag_value;
    std::optional<std::string> subscription_id;
    std::optional<std::string> tenant_id;
    std::optional<std::string> client_id;
    std::optional<std::string> secret_access_key;
};

/// EC2 cloud auto-join settings (deprecated, see retry_join).
struct RetryJoinEC2 {
    std::optional<std::string> region;
    std::optional<std::string> tag_key;
    std::optional<std::string> tag_value;
    std::optional<std::string> access_key_id;
    std::optional<std::string> secret_access_key;
};

/// Google Compute Engine auto-join settings (deprecated, see retry_join).
struct RetryJoinGCE {
    std::optional<std::string> project_name;
    std::optional<std::string> zone_pattern;
    std::optional<std::string> tag_value;
    std::optional<std::string> credentials_file;
};

/**
 * @brief One layer of agent configuration
 */
struct ConfigFragment {
    std::optional<std::string> advertise_addr_lan;
    std::optional<std::string> advertise_addr_wan;
    std::optional<std::string> bind_addr;
    std::optional<bool> bootstrap;
    std::optional<int> bootstrap_expect;
    /// Parsed as a duration by the resolver.
    std::optional<std::string> check_update_interval;
    std::optional<std::string> client_addr;
    std::optional<std::string> dns_domain;
    std::vector<std::string> dns_recursors;
    std::optional<std::string> data_dir;
    std::optional<std::string> datacenter;
    std::optional<bool> dev_mode;
    std::optional<bool> disable_host_node_id;
    std::optional<bool> disable_keyring_file;
    std::optional<bool> enable_script_checks;
    std::optional<bool> enable_syslog;
    std::optional<bool> enable_ui;
    std::optional<std::string> encrypt_key;
    std::vector<std::string> join_addrs_lan;
    std::vector<std::string> join_addrs_wan;
    std::optional<std::string> log_level;
    std::optional<std::string> node_id;
    std::map<std::string, std::string> node_meta;
    std::optional<std::string> node_name;
    std::optional<bool> non_voting_server;
    std::optional<std::string> pid_file;
    Ports ports;
    std::optional<int> rpc_protocol;
    std::optional<int> raft_protocol;
    std::optional<bool> rejoin_after_leave;
    std::optional<Duration> retry_join_interval_lan;
    std::optional<Duration> retry_join_interval_wan;
    std::vector<std::string> retry_join_lan;
    std::optional<int> retry_join_max_attempts_lan;
    std::optional<int> retry_join_max_attempts_wan;
    std::vector<std::string> retry_join_wan;
    std::optional<std::string> serf_bind_addr_lan;
    std::optional<std::string> serf_bind_addr_wan;
    std::optional<bool> server_mode;
    std::optional<std::string> ui_dir;

    RetryJoinAzure deprecated_retry_join_azure;
    RetryJoinEC2 deprecated_retry_join_ec2;
    RetryJoinGCE deprecated_retry_join_gce;
};

bool operator==(const Ports& a, const Ports& b);
bool operator!=(const Ports& a, const Ports& b);
bool operator==(const RetryJoinAzure& a, const RetryJoinAzure& b);
bool operator!=(const RetryJoinAzure& a, const RetryJoinAzure& b);
bool operator==(const RetryJoinEC2& a, const RetryJoinEC2& b);
bool operator!=(const RetryJoinEC2& a, const RetryJoinEC2& b);
bool operator==(const RetryJoinGCE& a, const RetryJoinGCE& b);
bool operator!=(const RetryJoinGCE& a, const RetryJoinGCE& b);
bool operator==(const ConfigFragment& a, const ConfigFragment& b);
bool operator!=(const ConfigFragment& a, const ConfigFragment& b);

/**
 * @brief Compiled-in default layer
 *
 * Always the first (lowest precedence) element handed to merge_all().
 * Sets a wildcard bind address and the standard listener ports; HTTPS is
 * left unset and therefore disabled.
 */
ConfigFragment default_fragment();

} // namespace agentcfg

#endif // AGENTCFG_FRAGMENT_HPP
