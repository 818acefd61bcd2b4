#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wpdb::prefix {

/**
 * @brief Effective table prefix for a site
 *
 * Absent, 1 or non-positive site ids address the main site and yield `base`.
 * Sub-sites (id >= 2) yield `base + id + "_"`, e.g. ("wp_", 3) -> "wp_3_".
 */
[[nodiscard]] std::string resolve_prefix(const std::string& base, std::optional<int> site_id);

/**
 * @brief Physical table name for a bare or fully qualified name
 *
 * ("wp_", "wp_posts") -> "wp_posts", ("wp_", "posts") -> "wp_posts".
 */
[[nodiscard]] std::string resolve_table(const std::string& prefix, const std::string& name);

/**
 * @brief Prefixes of every site present in a table listing
 *
 * Always contains `base`; adds `base + digits + "_"` for each name that
 * begins with base followed by digits and an underscore. Sorted, unique.
 */
[[nodiscard]] std::vector<std::string> detect_site_prefixes(
    const std::string& base, const std::vector<std::string>& table_names);

/**
 * @brief LIKE pattern matching every table under `prefix`
 *
 * `_`, `%` and `\` inside the prefix are escaped so "wp_" does not also
 * match "wpx...".
 */
[[nodiscard]] std::string like_pattern(const std::string& prefix);

} // namespace wpdb::prefix
