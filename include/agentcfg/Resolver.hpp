/**
 * @file Resolver.hpp
 * @brief Merged fragment to runtime configuration
 *
 * Resolution steps, stopping at the first error:
 * 1. Scalars are unwrapped; absent fields become the type's zero value.
 * 2. check_update_interval is parsed as a duration.
 * 3. A fragment that mentions ports but no bind address is rejected.
 * 4. bind_addrs is derived from bind_addr (empty string -> "0.0.0.0").
 * 5. For every port that is set, listener addresses are derived as
 *    host:port for each bind address; the wildcard renders as ":port".
 *    A negative port disables the listener.
 * 6. Deprecated cloud auto-join settings become retry_join entries.
 */

#ifndef AGENTCFG_RESOLVER_HPP
#define AGENTCFG_RESOLVER_HPP

#include "agentcfg/Fragment.hpp"
#include "agentcfg/RuntimeConfig.hpp"

#include <string>

namespace agentcfg {

/**
 * @brief Build the runtime configuration from the merged fragment
 *
 * @param fragment Result of merge_all() over every layer
 * @return Fully populated runtime configuration
 * @throws ValidationError on semantic errors (ports without bind address,
 *         port numbers above 65535, malformed check_update_interval)
 *
 * @note A negative port is kept in the *_port field but produces no
 *       listener addresses; it is not joined literally (no ":-1").
 *
 * Examples:
 * ```cpp
 * ConfigFragment f;
 * f.bind_addr = "0.0.0.0";
 * f.ports.dns = 123;
 * auto c = new_config(f);
 * // c.dns_addrs_tcp == {":123"}, c.dns_addrs_udp == {":123"}
 *
 * f.bind_addr.reset();
 * new_config(f);  // throws ValidationError: no bind address specified
 * ```
 */
RuntimeConfig new_config(const ConfigFragment& fragment);

/**
 * @brief Join host and port into an address
 *
 * "0.0.0.0" renders as an empty host; hosts containing ':' are bracketed.
 *
 * Examples:
 * - ("0.0.0.0", 53)    -> ":53"
 * - ("10.0.0.1", 8500) -> "10.0.0.1:8500"
 * - ("::1", 8500)      -> "[::1]:8500"
 */
std::string join_host_port(const std::string& host, int port);

} // namespace agentcfg

#endif // AGENTCFG_RESOLVER_HPP
