/**
 * @file Merge.hpp
 * @brief Layered merge of configuration fragments
 *
 * Each field kind composes differently across layers:
 * - Scalars: a present value in the higher layer replaces the lower one
 * - Lists:   entries of the higher layer are appended (lists only grow)
 * - Maps:    a non-empty map in the higher layer replaces the lower map
 *            wholesale; keys are not merged individually
 * - Groups:  merged field by field with the rules above
 *
 * An empty list cannot clear entries contributed by a lower layer.
 */

#ifndef AGENTCFG_MERGE_HPP
#define AGENTCFG_MERGE_HPP

#include "agentcfg/Fragment.hpp"

#include <vector>

namespace agentcfg {

/**
 * @brief Merge two fragments
 *
 * @param base Lower precedence fragment
 * @param override_val Higher precedence fragment
 * @return New fragment; neither input is modified
 *
 * Examples:
 * ```cpp
 * ConfigFragment a, b;
 * a.bootstrap = true;            b.bootstrap = false;
 * a.join_addrs_lan = {"x"};      b.join_addrs_lan = {"y"};
 * a.node_meta = {{"a", "b"}};    b.node_meta = {{"c", "d"}};
 *
 * auto m = merge(a, b);
 * // m.bootstrap == false
 * // m.join_addrs_lan == {"x", "y"}
 * // m.node_meta == {{"c", "d"}}
 * ```
 */
ConfigFragment merge(const ConfigFragment& base, const ConfigFragment& override_val);

/**
 * @brief Fold fragments left to right
 *
 * @param fragments Fragments ordered from lowest to highest precedence
 *                  (defaults first, command line flags last)
 * @return Merged fragment, or an all-absent fragment if the input is empty
 *
 * Never throws: every field-kind rule is defined for every input.
 */
ConfigFragment merge_all(const std::vector<ConfigFragment>& fragments);

} // namespace agentcfg

#endif // AGENTCFG_MERGE_HPP
