/**
 * @file Decode.cpp
 * @brief JSON/TOML document decoding into fragments
 *
 * The key layout is declared once in describe() and walked by two
 * visitors: Reader (document -> fragment) and Writer (fragment -> document).
 */

#include "agentcfg/Decode.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>

namespace agentcfg {

namespace {

// ============================================================================
// Key layout
// ============================================================================

template <typename V, typename P>
void describe_ports(V& v, P& p) {
    v.field("dns", p.dns);
    v.field("http", p.http);
    v.field("https", p.https);
    v.field("serf_lan", p.serf_lan);
    v.field("serf_wan", p.serf_wan);
    v.field("server", p.server);
    v.field("rpc", p.deprecated_rpc);
}

template <typename V, typename R>
void describe_azure(V& v, R& r) {
    v.field("tag_name", r.tag_name);
    v.field("tag_value", r.tag_value);
    v.field("subscription_id", r.subscription_id);
    v.field("tenant_id", r.tenant_id);
    v.field("client_id", r.client_id);
    v.field("secret_access_key", r.secret_access_key);
}

template <typename V, typename R>
void describe_ec2(V& v, R& r) {
    v.field("region", r.region);
    v.field("tag_key", r.tag_key);
    v.field("tag_value", r.tag_value);
    v.field("access_key_id", r.access_key_id);
    v.field("secret_access_key", r.secret_access_key);
}

template <typename V, typename R>
void describe_gce(V& v, R& r) {
    v.field("project_name", r.project_name);
    v.field("zone_pattern", r.zone_pattern);
    v.field("tag_value", r.tag_value);
    v.field("credentials_file", r.credentials_file);
}

template <typename V, typename F>
void describe(V& v, F& f) {
    v.field("advertise_addr", f.advertise_addr_lan);
    v.field("advertise_addr_wan", f.advertise_addr_wan);
    v.field("bind_addr", f.bind_addr);
    v.field("bootstrap", f.bootstrap);
    v.field("bootstrap_expect", f.bootstrap_expect);
    v.field("check_update_interval", f.check_update_interval);
    v.field("client_addr", f.client_addr);
    v.field("domain", f.dns_domain);
    v.field("recursors", f.dns_recursors);
    v.field("data_dir", f.data_dir);
    v.field("datacenter", f.datacenter);
    v.field("dev_mode", f.dev_mode);
    v.field("disable_host_node_id", f.disable_host_node_id);
    v.field("disable_keyring_file", f.disable_keyring_file);
    v.field("enable_script_checks", f.enable_script_checks);
    v.field("enable_syslog", f.enable_syslog);
    v.field("ui", f.enable_ui);
    v.field("encrypt", f.encrypt_key);
    v.field("start_join", f.join_addrs_lan);
    v.field("start_join_wan", f.join_addrs_wan);
    v.field("log_level", f.log_level);
    v.field("node_id", f.node_id);
    v.field("node_meta", f.node_meta);
    v.field("node_name", f.node_name);
    v.field("non_voting_server", f.non_voting_server);
    v.field("pid_file", f.pid_file);
    v.group("ports", f.ports, [](auto& g, auto& p) { describe_ports(g, p); });
    v.field("protocol", f.rpc_protocol);
    v.field("raft_protocol", f.raft_protocol);
    v.field("rejoin_after_leave", f.rejoin_after_leave);
    v.field("retry_interval", f.retry_join_interval_lan);
    v.field("retry_interval_wan", f.retry_join_interval_wan);
    v.field("retry_join", f.retry_join_lan);
    v.field("retry_max", f.retry_join_max_attempts_lan);
    v.field("retry_max_wan", f.retry_join_max_attempts_wan);
    v.field("retry_join_wan", f.retry_join_wan);
    v.field("serf_lan_bind", f.serf_bind_addr_lan);
    v.field("serf_wan_bind", f.serf_bind_addr_wan);
    v.field("server", f.server_mode);
    v.field("ui_dir", f.ui_dir);
    v.group("retry_join_azure", f.deprecated_retry_join_azure,
            [](auto& g, auto& r) { describe_azure(g, r); });
    v.group("retry_join_ec2", f.deprecated_retry_join_ec2,
            [](auto& g, auto& r) { describe_ec2(g, r); });
    v.group("retry_join_gce", f.deprecated_retry_join_gce,
            [](auto& g, auto& r) { describe_gce(g, r); });
}

// ============================================================================
// Reader
// ============================================================================

class Reader {
public:
    Reader(const Value& obj, const std::string& source, std::string prefix)
        : obj_(obj), source_(source), prefix_(std::move(prefix)) {}

    void field(const char* key, std::optional<std::string>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_string()) mismatch(key, "string", *v);
        out = v->get<std::string>();
    }

    void field(const char* key, std::optional<bool>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_boolean()) mismatch(key, "boolean", *v);
        out = v->get<bool>();
    }

    void field(const char* key, std::optional<int>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_number_integer()) mismatch(key, "integer", *v);
        if (v->is_number_unsigned()) {
            const auto u = v->get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                out_of_range(key, *v);
            }
            out = static_cast<int>(u);
            return;
        }
        const auto n = v->get<std::int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            out_of_range(key, *v);
        }
        out = static_cast<int>(n);
    }

    void field(const char* key, std::optional<Duration>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_string()) mismatch(key, "duration string", *v);
        try {
            out = parse_duration(v->get<std::string>());
        } catch (const DurationError& e) {
            throw ConfigParseError(source_, path(key) + ": " + e.what());
        }
    }

    void field(const char* key, std::vector<std::string>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_array()) mismatch(key, "array of strings", *v);
        std::vector<std::string> items;
        for (const auto& item : *v) {
            if (!item.is_string()) mismatch(key, "array of strings", item);
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
    }

    void field(const char* key, std::map<std::string, std::string>& out) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_object()) mismatch(key, "object", *v);
        std::map<std::string, std::string> entries;
        for (auto it = v->begin(); it != v->end(); ++it) {
            if (!it.value().is_string()) {
                mismatch((std::string(key) + "." + it.key()).c_str(), "string", it.value());
            }
            entries[it.key()] = it.value().get<std::string>();
        }
        out = std::move(entries);
    }

    template <typename G, typename Fn>
    void group(const char* key, G& out, Fn fn) {
        const Value* v = find(key);
        if (v == nullptr) return;
        if (!v->is_object()) mismatch(key, "object", *v);
        Reader sub(*v, source_, path(key));
        fn(sub, out);
        sub.finish();
    }

    /**
     * @brief Warn about keys no field consumed
     */
    void finish() const {
        for (auto it = obj_.begin(); it != obj_.end(); ++it) {
            if (seen_.count(it.key()) == 0) {
                logger()->warn("{}: ignoring unknown configuration key '{}'",
                               source_, path(it.key().c_str()));
            }
        }
    }

private:
    const Value& obj_;
    const std::string& source_;
    std::string prefix_;
    std::set<std::string> seen_;

    const Value* find(const char* key) {
        seen_.insert(key);
        auto it = obj_.find(key);
        if (it == obj_.end() || it->is_null()) return nullptr;
        return &*it;
    }

    std::string path(const char* key) const {
        return prefix_.empty() ? std::string(key) : prefix_ + "." + key;
    }

    [[noreturn]] void mismatch(const char* key, const std::string& expected, const Value& got) const {
        throw ConfigParseError(source_, path(key) + ": expected " + expected +
                                        ", got " + type_name(got));
    }

    [[noreturn]] void out_of_range(const char* key, const Value& got) const {
        throw ConfigParseError(source_, path(key) + ": integer out of range: " + got.dump());
    }
};

// ============================================================================
// Writer
// ============================================================================

struct Writer {
    Value out = Value::object();

    template <typename T>
    void field(const char* key, const std::optional<T>& v) {
        if (v) out[key] = *v;
    }

    void field(const char* key, const std::optional<Duration>& v) {
        if (v) out[key] = format_duration(*v);
    }

    void field(const char* key, const std::vector<std::string>& v) {
        if (!v.empty()) out[key] = v;
    }

    void field(const char* key, const std::map<std::string, std::string>& v) {
        if (!v.empty()) out[key] = v;
    }

    template <typename G, typename Fn>
    void group(const char* key, const G& g, Fn fn) {
        Writer sub;
        fn(sub, g);
        if (!sub.out.empty()) out[key] = std::move(sub.out);
    }
};

// ============================================================================
// TOML -> Value
// ============================================================================

Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value parse_json_text(const std::string& text, const std::string& source) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(source, e.what());
    }
}

Value parse_toml_text(const std::string& text, const std::string& source) {
    try {
        toml::table table = toml::parse(text, source);
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line
                << ", column " << e.source().begin.column
                << ": " << e.description();
        throw ConfigParseError(source, details.str());
    }
}

} // anonymous namespace

Format detect_format(const std::string& text) {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '{' ? Format::Json : Format::Toml;
    }
    return Format::Toml;
}

ConfigFragment parse_file(const std::string& text, Format format, const std::string& source) {
    if (format == Format::Auto) {
        format = detect_format(text);
    }

    const Value doc = format == Format::Json ? parse_json_text(text, source)
                                             : parse_toml_text(text, source);
    return fragment_from_value(doc, source);
}

ConfigFragment fragment_from_value(const Value& doc, const std::string& source) {
    if (!doc.is_object()) {
        throw ConfigParseError(source, "document root must be an object, got " + type_name(doc));
    }

    ConfigFragment f;
    Reader reader(doc, source, "");
    describe(reader, f);
    reader.finish();
    return f;
}

Value fragment_to_value(const ConfigFragment& fragment) {
    Writer writer;
    describe(writer, fragment);
    return writer.out;
}

} // namespace agentcfg
