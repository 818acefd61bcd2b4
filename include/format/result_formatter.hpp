#pragma once

#include "catalog/catalog_inspector.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wpdb {

enum class OutputFormat { JSON, CSV };

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view name);

/**
 * @brief Renders row sets and errors for callers
 *
 * Values are reduced to JSON-safe scalars: bytes become UTF-8 text when
 * valid and "<binary N bytes>" otherwise, temporals their ISO-8601 text.
 * JSON objects keep column order.
 */
class ResultFormatter {
public:
    using json = nlohmann::ordered_json;

    [[nodiscard]] static json value_to_json(const Value& value);

    /**
     * @brief Text form used in CSV cells (NULL is the empty string)
     */
    [[nodiscard]] static std::string value_to_text(const Value& value);

    [[nodiscard]] static json rows_to_json(const RowSet& rows);

    /**
     * @brief CSV with a header taken from the first row; "" for no rows
     */
    [[nodiscard]] static std::string rows_to_csv(const RowSet& rows);

    /**
     * @brief {row_count, has_more, limit, rows} or plain CSV
     */
    [[nodiscard]] static std::string query_response(
        const QueryRows& result, size_t limit, OutputFormat format);

    /**
     * @brief JSON array of rows or CSV
     */
    [[nodiscard]] static std::string rows_response(const RowSet& rows, OutputFormat format);

    /**
     * @brief {table, columns, indexes}; CSV carries the columns only
     */
    [[nodiscard]] static std::string describe_response(
        const TableDescription& description, OutputFormat format);

    /**
     * @brief {base_prefix, sites: [{site_id, prefix}]} or CSV
     */
    [[nodiscard]] static std::string sites_response(
        const std::string& base_prefix, const std::vector<std::string>& prefixes,
        OutputFormat format);

    /**
     * @brief {"error": <public message>, "code": <stable code>}
     */
    [[nodiscard]] static std::string error_response(const Error& error);

    [[nodiscard]] static bool is_valid_utf8(const Bytes& bytes);

private:
    static std::string dump(const json& doc);
};

} // namespace wpdb
