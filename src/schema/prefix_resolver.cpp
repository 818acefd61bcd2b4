#include "schema/prefix_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>

namespace wpdb::prefix {

std::string resolve_prefix(const std::string& base, std::optional<int> site_id) {
    if (site_id.has_value() && *site_id > 1) {
        return std::format("{}{}_", base, *site_id);
    }
    return base;
}

std::string resolve_table(const std::string& prefix, const std::string& name) {
    if (name.starts_with(prefix)) {
        return name;
    }
    return prefix + name;
}

std::vector<std::string> detect_site_prefixes(
    const std::string& base, const std::vector<std::string>& table_names) {

    std::set<std::string> prefixes{base};

    for (const auto& table : table_names) {
        if (!table.starts_with(base)) continue;

        size_t pos = base.size();
        const size_t digits_start = pos;
        while (pos < table.size() && std::isdigit(static_cast<unsigned char>(table[pos]))) {
            ++pos;
        }
        if (pos == digits_start || pos >= table.size() || table[pos] != '_') continue;

        prefixes.insert(table.substr(0, pos + 1));
    }

    return {prefixes.begin(), prefixes.end()};
}

std::string like_pattern(const std::string& prefix) {
    std::string pattern;
    pattern.reserve(prefix.size() + 4);
    for (const char c : prefix) {
        if (c == '_' || c == '%' || c == '\\') pattern += '\\';
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace wpdb::prefix
