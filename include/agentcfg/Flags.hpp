/**
 * @file Flags.hpp
 * @brief Command line surface of the agent
 *
 * FlagSet is a registry binding flag names to locations inside a Flags
 * value. Each binding target is one of a closed set of field kinds, and
 * the kind decides how repeated occurrences accumulate:
 *
 * | Target                              | Occurrence behavior            |
 * |-------------------------------------|--------------------------------|
 * | std::optional<bool>*                | set (bare flag means true)     |
 * | std::optional<int>*                 | set, last occurrence wins      |
 * | std::optional<Duration>*            | set, last occurrence wins      |
 * | std::optional<std::string>*         | set, last occurrence wins      |
 * | std::vector<std::string>*           | append                         |
 * | std::map<std::string, std::string>* | insert "key:value", by key     |
 *
 * Accepted syntax: `-name value`, `-name=value`, `--name` variants of both,
 * and for booleans additionally the bare `-name` and `-name true|false`
 * (the next token is only consumed if it is a boolean literal).
 */

#ifndef AGENTCFG_FLAGS_HPP
#define AGENTCFG_FLAGS_HPP

#include "agentcfg/Duration.hpp"
#include "agentcfg/Fragment.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentcfg {

/**
 * @brief Registry of typed command line flags
 *
 * Targets are raw pointers owned by the caller; they must outlive the
 * FlagSet. Registration happens once, parsing may run any number of times
 * and writes through the bound pointers.
 */
class FlagSet {
public:
    using Target = std::variant<
        std::optional<bool>*,
        std::optional<int>*,
        std::optional<Duration>*,
        std::optional<std::string>*,
        std::vector<std::string>*,
        std::map<std::string, std::string>*>;

    struct Flag {
        std::string name;
        std::string help;
        Target target;
    };

    explicit FlagSet(std::string name) : name_(std::move(name)) {}

    /**
     * @brief Register a flag
     *
     * @param target Location updated when the flag occurs
     * @param name Flag name without leading dashes
     * @param help One-line description for usage()
     * @throws std::logic_error if name is empty, malformed or already taken
     */
    void add(Target target, std::string name, std::string help);

    /**
     * @brief Parse arguments, updating the bound targets
     *
     * @param args Arguments without the program name
     * @throws FlagError for unknown flags, missing or malformed values, and
     *         for any argument left over after flag processing
     */
    void parse(const std::vector<std::string>& args);

    /**
     * @brief Look up a registered flag
     * @return Pointer to the flag, or nullptr if unknown
     */
    const Flag* lookup(const std::string& name) const;

    /**
     * @brief Render help text, one entry per flag, sorted by name
     */
    std::string usage() const;

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::map<std::string, Flag> flags_;
};

/**
 * @brief Result of parsing the agent command line
 */
struct Flags {
    /// Configuration set by flags; the highest precedence layer.
    ConfigFragment file;

    /// Paths from -config-file and -config-dir, in command line order.
    std::vector<std::string> config_files;

    std::optional<std::string> deprecated_datacenter;
    std::optional<std::string> deprecated_atlas_infrastructure;
    std::optional<bool> deprecated_atlas_join;
    std::optional<std::string> deprecated_atlas_token;
    std::optional<std::string> deprecated_atlas_endpoint;
};

bool operator==(const Flags& a, const Flags& b);
bool operator!=(const Flags& a, const Flags& b);

/**
 * @brief Register every agent flag on fs, bound to fields of f
 */
void add_flags(FlagSet& fs, Flags& f);

/**
 * @brief Parse the agent command line
 *
 * Deprecated flags are accepted: `-dc` fills `datacenter` unless
 * `-datacenter` was also given, the Atlas flags are ignored with a warning.
 *
 * @param args Arguments without the program name
 * @return Parsed flags
 * @throws FlagError on any parse failure; nothing is returned in that case
 *
 * Examples:
 * ```cpp
 * parse_flags({"-bootstrap"}).file.bootstrap;                  // true
 * parse_flags({"-bootstrap", "false"}).file.bootstrap;         // false
 * parse_flags({"-join", "a", "-join", "b"}).file.join_addrs_lan; // {"a","b"}
 * parse_flags({"-config-file", "a", "-config-dir", "b"}).config_files;
 * // {"a", "b"}
 * ```
 */
Flags parse_flags(const std::vector<std::string>& args);

} // namespace agentcfg

#endif // AGENTCFG_FLAGS_HPP
