/**
 * @file RuntimeConfig.hpp
 * @brief Fully resolved agent configuration
 */

#ifndef AGENTCFG_RUNTIMECONFIG_HPP
#define AGENTCFG_RUNTIMECONFIG_HPP

#include "agentcfg/Duration.hpp"
#include "agentcfg/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Runtime configuration consumed by the agent
 *
 * Every field holds a concrete value. Fields the merged fragment left
 * absent carry the zero value of their type. Produced once by new_config().
 */
struct RuntimeConfig {
    // simple values

    std::string advertise_addr_lan;
    std::string advertise_addr_wan;
    bool bootstrap = false;
    int bootstrap_expect = 0;
    Duration check_update_interval{0};
    std::string client_addr;
    std::string data_dir;
    std::string datacenter;
    bool dev_mode = false;
    bool disable_host_node_id = false;
    bool disable_keyring_file = false;
    std::string dns_domain;
    std::vector<std::string> dns_recursors;
    bool enable_script_checks = false;
    bool enable_syslog = false;
    bool enable_ui = false;
    std::string encrypt_key;
    std::string log_level;
    std::string node_id;
    std::string node_name;
    bool non_voting_server = false;
    std::string pid_file;
    int raft_protocol = 0;
    bool rejoin_after_leave = false;
    int rpc_protocol = 0;
    std::string serf_bind_addr_lan;
    std::string serf_bind_addr_wan;
    bool server_mode = false;
    std::string ui_dir;

    // address values

    std::vector<std::string> bind_addrs;
    std::vector<std::string> join_addrs_lan;
    std::vector<std::string> join_addrs_wan;

    // retry join values

    Duration retry_join_interval_lan{0};
    Duration retry_join_interval_wan{0};
    std::vector<std::string> retry_join_lan;
    std::vector<std::string> retry_join_wan;
    int retry_join_max_attempts_lan = 0;
    int retry_join_max_attempts_wan = 0;

    // server endpoint values

    int dns_port = 0;
    std::vector<std::string> dns_addrs_tcp;
    std::vector<std::string> dns_addrs_udp;

    int http_port = 0;
    std::vector<std::string> http_addrs;

    int https_port = 0;
    std::vector<std::string> https_addrs;

    int serf_port_lan = 0;
    std::vector<std::string> serf_addrs_lan;

    int serf_port_wan = 0;
    std::vector<std::string> serf_addrs_wan;

    int server_port = 0;
    std::vector<std::string> server_addrs;

    // other values

    std::map<std::string, std::string> node_meta;
};

bool operator==(const RuntimeConfig& a, const RuntimeConfig& b);
bool operator!=(const RuntimeConfig& a, const RuntimeConfig& b);

/**
 * @brief Serialize for diagnostics
 *
 * Durations use format_duration(); a non-empty encrypt_key is masked.
 */
Value to_json(const RuntimeConfig& config);

} // namespace agentcfg

#endif // AGENTCFG_RUNTIMECONFIG_HPP
