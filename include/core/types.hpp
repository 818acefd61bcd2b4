#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wpdb {

// ============================================================================
// Column Values
// ============================================================================

using Bytes = std::vector<uint8_t>;

/**
 * @brief Temporal value already rendered in ISO-8601 form
 * ("2024-01-15", "2024-01-15T10:30:00", "10:30:00")
 */
struct Timestamp {
    std::string iso;

    bool operator==(const Timestamp&) const = default;
};

/**
 * @brief Closed set of scalar kinds a column value may take
 *
 * monostate is SQL NULL. Decimals arrive as double.
 */
using Value = std::variant<std::monostate, std::string, int64_t, double, bool, Bytes, Timestamp>;

[[nodiscard]] inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

// ============================================================================
// Rows
// ============================================================================

/**
 * @brief Ordered column-name -> value mapping
 */
struct Row {
    std::vector<std::pair<std::string, Value>> fields;

    void add(std::string column, Value value) {
        fields.emplace_back(std::move(column), std::move(value));
    }

    [[nodiscard]] const Value* get(std::string_view column) const {
        for (const auto& [name, value] : fields) {
            if (name == column) return &value;
        }
        return nullptr;
    }

    // Text value of a column, empty when absent, NULL or not text
    [[nodiscard]] std::string get_string(std::string_view column) const {
        const Value* v = get(column);
        if (v == nullptr) return {};
        if (const auto* s = std::get_if<std::string>(v)) return *s;
        return {};
    }

    [[nodiscard]] size_t size() const { return fields.size(); }
    [[nodiscard]] bool empty() const { return fields.empty(); }
};

using RowSet = std::vector<Row>;

/**
 * @brief Rows returned by one execution plus the truncation flag
 */
struct QueryRows {
    RowSet rows;
    bool has_more = false;
};

// ============================================================================
// Bound Parameters
// ============================================================================

/**
 * @brief Positional parameter bound to a `?` placeholder
 */
using QueryParam = std::variant<std::monostate, std::string, int64_t, double>;

using QueryParams = std::vector<QueryParam>;

} // namespace wpdb
