/**
 * @file test_config.cpp
 * @brief End-to-end tests of the configuration pipeline (GoogleTest)
 *
 * Each case layers a default fragment, zero or more documents and a
 * command line, then checks the resolved RuntimeConfig.
 */

#include <gtest/gtest.h>
#include "agentcfg/Config.hpp"
#include "agentcfg/Decode.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Merge.hpp"
#include "agentcfg/Resolver.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

using namespace agentcfg;
using namespace std::chrono_literals;

namespace {

struct PipelineCase {
    std::string desc;
    Format format = Format::Auto;
    ConfigFragment def;
    std::vector<std::string> files;
    std::vector<std::string> flags;
    RuntimeConfig expected;
};

RuntimeConfig run_pipeline(const PipelineCase& tc) {
    std::vector<ConfigFragment> layers{tc.def};
    for (const auto& text : tc.files) {
        layers.push_back(parse_file(text, tc.format, "inline"));
    }
    layers.push_back(parse_flags(tc.flags).file);
    return new_config(merge_all(layers));
}

RuntimeConfig dns_on_wildcard() {
    RuntimeConfig c;
    c.bind_addrs = {"0.0.0.0"};
    c.dns_port = 123;
    c.dns_addrs_tcp = {":123"};
    c.dns_addrs_udp = {":123"};
    return c;
}

RuntimeConfig with_bootstrap(bool value) {
    RuntimeConfig c;
    c.bootstrap = value;
    return c;
}

RuntimeConfig with_datacenter(const std::string& dc) {
    RuntimeConfig c;
    c.datacenter = dc;
    return c;
}

RuntimeConfig with_join(std::vector<std::string> addrs) {
    RuntimeConfig c;
    c.join_addrs_lan = std::move(addrs);
    return c;
}

RuntimeConfig with_node_meta(std::map<std::string, std::string> meta) {
    RuntimeConfig c;
    c.node_meta = std::move(meta);
    return c;
}

RuntimeConfig with_check_update_interval() {
    RuntimeConfig c;
    c.check_update_interval = 5min;
    return c;
}

RuntimeConfig default_config() {
    RuntimeConfig c;
    c.bind_addrs = {"0.0.0.0"};
    c.check_update_interval = 5min;
    c.client_addr = "127.0.0.1";
    c.datacenter = "dc1";
    c.dns_domain = "consul.";
    c.log_level = "INFO";
    c.raft_protocol = 3;
    c.rpc_protocol = 2;
    c.retry_join_interval_lan = 30s;
    c.retry_join_interval_wan = 30s;
    c.dns_port = 8600;
    c.dns_addrs_tcp = {":8600"};
    c.dns_addrs_udp = {":8600"};
    c.http_port = 8500;
    c.http_addrs = {":8500"};
    c.serf_port_lan = 8301;
    c.serf_addrs_lan = {":8301"};
    c.serf_port_wan = 8302;
    c.serf_addrs_wan = {":8302"};
    c.server_port = 8300;
    c.server_addrs = {":8300"};
    return c;
}

/**
 * @brief Directory name unique per test and per instance
 */
std::string unique_dir_name(const std::string& prefix) {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::random_device rd;
    std::string name = prefix;
    if (info != nullptr) {
        name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
    }
    return name + std::to_string(rd());
}

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      unique_dir_name("agentcfg_config_dir_")) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        const fs::path p = path_ / name;
        fs::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // anonymous namespace

// ============================================================================
// Layered pipeline
// ============================================================================

TEST(Pipeline, Table) {
    const std::vector<PipelineCase> cases = {
        {"default config", Format::Auto, default_fragment(), {}, {}, default_config()},

        // command line flags
        {"flag bind", Format::Auto, {}, {}, {"-bind", "1.2.3.4"},
         [] { RuntimeConfig c; c.bind_addrs = {"1.2.3.4"}; return c; }()},
        {"flag bootstrap", Format::Auto, {}, {}, {"-bootstrap"}, with_bootstrap(true)},
        {"flag datacenter", Format::Auto, {}, {}, {"-datacenter", "a"}, with_datacenter("a")},
        {"flag dns port", Format::Auto, {}, {}, {"-dns-port", "123", "-bind", "0.0.0.0"},
         dns_on_wildcard()},
        {"flag join", Format::Auto, {}, {}, {"-join", "a", "-join", "b"}, with_join({"a", "b"})},
        {"flag node meta", Format::Auto, {}, {}, {"-node-meta", "a:b", "-node-meta", "c:d"},
         with_node_meta({{"a", "b"}, {"c", "d"}})},

        // json documents
        {"json bootstrap", Format::Json, {}, {R"({"bootstrap":true})"}, {}, with_bootstrap(true)},
        {"json check_update_interval", Format::Json, {}, {R"({"check_update_interval":"5m"})"}, {},
         with_check_update_interval()},
        {"json datacenter", Format::Json, {}, {R"({"datacenter":"a"})"}, {}, with_datacenter("a")},
        {"json dns port", Format::Json, {}, {R"({"bind_addr":"0.0.0.0","ports":{"dns":123}})"}, {},
         dns_on_wildcard()},
        {"json start_join", Format::Json, {}, {R"({"start_join":["a"]})", R"({"start_join":["b"]})"}, {},
         with_join({"a", "b"})},
        {"json node_meta", Format::Json, {}, {R"({"node_meta":{"a":"b"}})"}, {},
         with_node_meta({{"a", "b"}})},
        {"json node_meta replaced", Format::Json, {},
         {R"({"node_meta":{"a":"b"}})", R"({"node_meta":{"c":"d"}})"}, {},
         with_node_meta({{"c", "d"}})},

        // toml documents
        {"toml bootstrap", Format::Toml, {}, {"bootstrap = true"}, {}, with_bootstrap(true)},
        {"toml check_update_interval", Format::Toml, {}, {"check_update_interval = \"5m\""}, {},
         with_check_update_interval()},
        {"toml datacenter", Format::Toml, {}, {"datacenter = \"a\""}, {}, with_datacenter("a")},
        {"toml dns port", Format::Toml, {}, {"bind_addr = \"0.0.0.0\"\n[ports]\ndns = 123\n"}, {},
         dns_on_wildcard()},
        {"toml start_join", Format::Toml, {}, {"start_join = [\"a\"]", "start_join = [\"b\"]"}, {},
         with_join({"a", "b"})},
        {"toml node_meta", Format::Toml, {}, {"[node_meta]\na = \"b\""}, {},
         with_node_meta({{"a", "b"}})},
        {"toml node_meta replaced", Format::Toml, {},
         {"[node_meta]\na = \"b\"", "node_meta = { c = \"d\" }"}, {},
         with_node_meta({{"c", "d"}})},

        // precedence rules
        {"json later file wins", Format::Json, {},
         {R"({"bootstrap":true})", R"({"bootstrap":false})"}, {}, with_bootstrap(false)},
        {"json flag wins", Format::Json, {}, {R"({"bootstrap":true})"}, {"-bootstrap=false"},
         with_bootstrap(false)},
        {"toml later file wins", Format::Toml, {}, {"bootstrap=true", "bootstrap=false"}, {},
         with_bootstrap(false)},
        {"toml flag wins", Format::Toml, {}, {"bootstrap=true"}, {"-bootstrap=false"},
         with_bootstrap(false)},
    };

    for (const auto& tc : cases) {
        SCOPED_TRACE(tc.desc);
        RuntimeConfig got = run_pipeline(tc);
        EXPECT_TRUE(got == tc.expected) << to_json(got).dump(2);
    }
}

TEST(Pipeline, PortsWithoutBindAddress) {
    PipelineCase tc;
    tc.flags = {"-dns-port", "123"};
    EXPECT_THROW(run_pipeline(tc), ValidationError);
}

TEST(Pipeline, DefaultsSupplyBindAddress) {
    PipelineCase tc;
    tc.def = default_fragment();
    tc.flags = {"-dns-port", "123"};

    RuntimeConfig c = run_pipeline(tc);
    EXPECT_EQ(c.dns_port, 123);
    EXPECT_EQ(c.dns_addrs_udp, (std::vector<std::string>{":123"}));
}

TEST(Pipeline, Deterministic) {
    PipelineCase tc;
    tc.def = default_fragment();
    tc.files = {R"({"start_join":["a"],"node_meta":{"k":"v"}})"};
    tc.flags = {"-join", "b", "-server"};
    EXPECT_TRUE(run_pipeline(tc) == run_pipeline(tc));
}

// ============================================================================
// load()
// ============================================================================

TEST(Load, NoArgumentsGivesDefaults) {
    EXPECT_TRUE(load(LoadOptions{}) == default_config());
}

TEST(Load, FilesDirectoriesAndFlags) {
    TempDir dir;
    const std::string first = dir.write("first.json",
                                        R"({"datacenter": "east", "start_join": ["a"]})");
    dir.write("conf.d/10-ports.toml", "[ports]\nhttp = 9500\n");
    dir.write("conf.d/20-join.json", R"({"start_join": ["b"], "datacenter": "west"})");
    dir.write("conf.d/README.md", "not a config file");

    LoadOptions opts;
    opts.args = {"-config-file", first, "-config-dir", dir.path() + "/conf.d",
                 "-join", "c", "-bootstrap"};

    LoadResult r = load_verbose(opts);
    ASSERT_EQ(r.files.size(), 3u);
    EXPECT_EQ(r.files[0], first);

    EXPECT_EQ(r.config.datacenter, "west");
    EXPECT_EQ(r.config.join_addrs_lan, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(r.config.http_port, 9500);
    EXPECT_EQ(r.config.http_addrs, (std::vector<std::string>{":9500"}));
    EXPECT_EQ(r.config.dns_port, 8600);
    EXPECT_TRUE(r.config.bootstrap);
    EXPECT_EQ(r.merged.ports.http, std::optional<int>(9500));
}

TEST(Load, WithoutDefaults) {
    TempDir dir;
    const std::string file = dir.write("a.json", R"({"bind_addr": "10.0.0.1", "ports": {"dns": 53}})");

    LoadOptions opts;
    opts.defaults = ConfigFragment{};
    opts.args = {"-config-file", file};

    RuntimeConfig c = load(opts);
    EXPECT_EQ(c.bind_addrs, (std::vector<std::string>{"10.0.0.1"}));
    EXPECT_EQ(c.dns_addrs_tcp, (std::vector<std::string>{"10.0.0.1:53"}));
    EXPECT_EQ(c.http_port, 0);
    EXPECT_TRUE(c.datacenter.empty());
}

TEST(Load, Errors) {
    TempDir dir;
    LoadOptions opts;

    opts.args = {"-config-file", dir.path() + "/missing.json"};
    EXPECT_THROW(load(opts), FileNotFoundError);

    opts.args = {"-config-file", dir.write("bad.json", R"({"bootstrap": 1})")};
    EXPECT_THROW(load(opts), ConfigParseError);

    opts.args = {"-no-such-flag"};
    EXPECT_THROW(load(opts), FlagError);

    opts.args = {"-http-port", "70000"};
    EXPECT_THROW(load(opts), ValidationError);
}
