/**
 * @file test_resolver.cpp
 * @brief Tests for runtime configuration resolution (GoogleTest)
 */

#include <gtest/gtest.h>
#include "agentcfg/Errors.hpp"
#include "agentcfg/Resolver.hpp"

using namespace agentcfg;
using namespace std::chrono_literals;

// ============================================================================
// join_host_port
// ============================================================================

TEST(JoinHostPort, Basic) {
    EXPECT_EQ(join_host_port("10.0.0.1", 8500), "10.0.0.1:8500");
    EXPECT_EQ(join_host_port("localhost", 1), "localhost:1");
}

TEST(JoinHostPort, WildcardRendersEmptyHost) {
    EXPECT_EQ(join_host_port("0.0.0.0", 123), ":123");
    EXPECT_EQ(join_host_port("", 123), ":123");
}

TEST(JoinHostPort, IPv6IsBracketed) {
    EXPECT_EQ(join_host_port("::1", 8600), "[::1]:8600");
    EXPECT_EQ(join_host_port("fe80::1%eth0", 53), "[fe80::1%eth0]:53");
}

// ============================================================================
// Simple values
// ============================================================================

TEST(NewConfig, EmptyFragmentGivesZeroValues) {
    RuntimeConfig c = new_config(ConfigFragment{});
    EXPECT_TRUE(c == RuntimeConfig{});
    EXPECT_TRUE(c.bind_addrs.empty());
}

TEST(NewConfig, CopiesScalarsAndLists) {
    ConfigFragment f;
    f.bootstrap = true;
    f.datacenter = "east";
    f.raft_protocol = 3;
    f.retry_join_interval_wan = Duration(1min);
    f.join_addrs_wan = {"w"};
    f.node_meta = {{"k", "v"}};

    RuntimeConfig c = new_config(f);
    EXPECT_TRUE(c.bootstrap);
    EXPECT_EQ(c.datacenter, "east");
    EXPECT_EQ(c.raft_protocol, 3);
    EXPECT_EQ(c.retry_join_interval_wan, Duration(1min));
    EXPECT_EQ(c.join_addrs_wan, (std::vector<std::string>{"w"}));
    EXPECT_EQ(c.node_meta, f.node_meta);
}

TEST(NewConfig, AdvertiseWanFallsBackToLan) {
    ConfigFragment f;
    f.advertise_addr_lan = "10.0.0.1";
    EXPECT_EQ(new_config(f).advertise_addr_wan, "10.0.0.1");

    f.advertise_addr_wan = "1.2.3.4";
    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.advertise_addr_lan, "10.0.0.1");
    EXPECT_EQ(c.advertise_addr_wan, "1.2.3.4");
}

TEST(NewConfig, CheckUpdateInterval) {
    ConfigFragment f;
    f.check_update_interval = "5m";
    EXPECT_EQ(new_config(f).check_update_interval, Duration(5min));

    f.check_update_interval = "soon";
    EXPECT_THROW(new_config(f), ValidationError);
}

// ============================================================================
// Endpoint derivation
// ============================================================================

TEST(NewConfig, DerivesListenerAddresses) {
    ConfigFragment f;
    f.bind_addr = "0.0.0.0";
    f.ports.dns = 123;
    f.ports.http = 8500;

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.bind_addrs, (std::vector<std::string>{"0.0.0.0"}));
    EXPECT_EQ(c.dns_port, 123);
    EXPECT_EQ(c.dns_addrs_tcp, (std::vector<std::string>{":123"}));
    EXPECT_EQ(c.dns_addrs_udp, (std::vector<std::string>{":123"}));
    EXPECT_EQ(c.http_port, 8500);
    EXPECT_EQ(c.http_addrs, (std::vector<std::string>{":8500"}));
    EXPECT_EQ(c.https_port, 0);
    EXPECT_TRUE(c.https_addrs.empty());
}

TEST(NewConfig, SpecificBindAddress) {
    ConfigFragment f;
    f.bind_addr = "10.0.0.1";
    f.ports.server = 8300;
    f.ports.serf_lan = 8301;
    f.ports.serf_wan = 8302;

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.server_addrs, (std::vector<std::string>{"10.0.0.1:8300"}));
    EXPECT_EQ(c.serf_addrs_lan, (std::vector<std::string>{"10.0.0.1:8301"}));
    EXPECT_EQ(c.serf_addrs_wan, (std::vector<std::string>{"10.0.0.1:8302"}));
    EXPECT_EQ(c.serf_port_wan, 8302);
}

TEST(NewConfig, EmptyBindAddressIsWildcard) {
    ConfigFragment f;
    f.bind_addr = "";
    f.ports.http = 1;

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.bind_addrs, (std::vector<std::string>{"0.0.0.0"}));
    EXPECT_EQ(c.http_addrs, (std::vector<std::string>{":1"}));
}

TEST(NewConfig, IPv6BindAddress) {
    ConfigFragment f;
    f.bind_addr = "::";
    f.ports.dns = 8600;
    EXPECT_EQ(new_config(f).dns_addrs_tcp, (std::vector<std::string>{"[::]:8600"}));
}

TEST(NewConfig, BindAddressWithoutPorts) {
    ConfigFragment f;
    f.bind_addr = "10.0.0.1";

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.bind_addrs, (std::vector<std::string>{"10.0.0.1"}));
    EXPECT_TRUE(c.http_addrs.empty());
    EXPECT_EQ(c.http_port, 0);
}

TEST(NewConfig, PortsWithoutBindAddressFail) {
    ConfigFragment f;
    f.ports.dns = 123;
    try {
        new_config(f);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "invalid configuration: bind_addr: no bind address specified");
    }
}

TEST(NewConfig, DeprecatedRpcPortAlsoNeedsBindAddress) {
    ConfigFragment f;
    f.ports.deprecated_rpc = 8400;
    EXPECT_THROW(new_config(f), ValidationError);

    f.bind_addr = "0.0.0.0";
    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.bind_addrs, (std::vector<std::string>{"0.0.0.0"}));
}

TEST(NewConfig, NegativePortDisablesListener) {
    ConfigFragment f;
    f.bind_addr = "0.0.0.0";
    f.ports.dns = -1;
    f.ports.http = 8500;

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.dns_port, -1);
    EXPECT_TRUE(c.dns_addrs_tcp.empty());
    EXPECT_TRUE(c.dns_addrs_udp.empty());
    EXPECT_EQ(c.http_addrs, (std::vector<std::string>{":8500"}));
}

TEST(NewConfig, PortOutOfRange) {
    ConfigFragment f;
    f.bind_addr = "0.0.0.0";
    f.ports.https = 65536;
    EXPECT_THROW(new_config(f), ValidationError);

    f.ports.https = 65535;
    EXPECT_EQ(new_config(f).https_addrs, (std::vector<std::string>{":65535"}));
}

// ============================================================================
// Deprecated cloud auto-join
// ============================================================================

TEST(NewConfig, CloudGroupsBecomeRetryJoinEntries) {
    ConfigFragment f;
    f.retry_join_lan = {"10.0.0.5"};
    f.deprecated_retry_join_ec2.region = "us-east-1";
    f.deprecated_retry_join_ec2.tag_key = "k";
    f.deprecated_retry_join_ec2.tag_value = "v";
    f.deprecated_retry_join_gce.project_name = "p";

    RuntimeConfig c = new_config(f);
    EXPECT_EQ(c.retry_join_lan, (std::vector<std::string>{
        "10.0.0.5",
        "provider=aws region=us-east-1 tag_key=k tag_value=v",
        "provider=gce project_name=p",
    }));
    EXPECT_TRUE(c.retry_join_wan.empty());
}

TEST(NewConfig, AzureGroup) {
    ConfigFragment f;
    f.deprecated_retry_join_azure.tag_name = "n";
    f.deprecated_retry_join_azure.tenant_id = "t";
    EXPECT_EQ(new_config(f).retry_join_lan,
              (std::vector<std::string>{"provider=azure tag_name=n tenant_id=t"}));
}

// ============================================================================
// Defaults
// ============================================================================

TEST(NewConfig, DefaultFragment) {
    RuntimeConfig expected;
    expected.bind_addrs = {"0.0.0.0"};
    expected.check_update_interval = Duration(5min);
    expected.client_addr = "127.0.0.1";
    expected.datacenter = "dc1";
    expected.dns_domain = "consul.";
    expected.log_level = "INFO";
    expected.raft_protocol = 3;
    expected.rpc_protocol = 2;
    expected.retry_join_interval_lan = Duration(30s);
    expected.retry_join_interval_wan = Duration(30s);
    expected.dns_port = 8600;
    expected.dns_addrs_tcp = {":8600"};
    expected.dns_addrs_udp = {":8600"};
    expected.http_port = 8500;
    expected.http_addrs = {":8500"};
    expected.serf_port_lan = 8301;
    expected.serf_addrs_lan = {":8301"};
    expected.serf_port_wan = 8302;
    expected.serf_addrs_wan = {":8302"};
    expected.server_port = 8300;
    expected.server_addrs = {":8300"};

    RuntimeConfig c = new_config(default_fragment());
    EXPECT_TRUE(c == expected) << to_json(c).dump(2);
}

// ============================================================================
// JSON rendering
// ============================================================================

TEST(RuntimeConfigJson, FormatsDurationsAndHidesKey) {
    ConfigFragment f = default_fragment();
    f.encrypt_key = "secret";

    Value j = to_json(new_config(f));
    EXPECT_EQ(j["check_update_interval"], "5m0s");
    EXPECT_EQ(j["retry_join_interval_lan"], "30s");
    EXPECT_EQ(j["encrypt_key"], "hidden");
    EXPECT_EQ(j["http_addrs"], Value::array({":8500"}));
    EXPECT_EQ(j["https_port"], 0);
}
