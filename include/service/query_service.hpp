#pragma once

#include "core/error.hpp"
#include "db/database_context.hpp"
#include "format/result_formatter.hpp"
#include "security/sql_validator.hpp"
#include <optional>
#include <string>

namespace wpdb {

/**
 * @brief Formatted reply to one request
 *
 * `body` is the rendered result on success and the {error, code} envelope
 * otherwise.
 */
struct ServiceResponse {
    ErrorCode code = ErrorCode::NONE;
    std::string body;

    [[nodiscard]] bool ok() const { return code == ErrorCode::NONE; }
};

/**
 * @brief Request handling: validate, resolve, execute, format
 *
 * Caller SQL always passes the SqlValidator before it can reach the
 * executor. Catalog requests only pass caller input as bound values.
 * Every failure comes back as an error envelope with a stable code.
 */
class QueryService {
public:
    explicit QueryService(const ContextSlot& slot);

    QueryService(const ContextSlot& slot, const SqlValidator::Config& validator_config);

    [[nodiscard]] ServiceResponse run_query(
        const std::string& sql, size_t limit, OutputFormat format) const;

    [[nodiscard]] ServiceResponse list_tables(
        std::optional<int> site_id, const std::string& like_filter, OutputFormat format) const;

    [[nodiscard]] ServiceResponse describe_table(
        std::optional<int> site_id, const std::string& table, OutputFormat format) const;

    [[nodiscard]] ServiceResponse list_sites(OutputFormat format) const;

private:
    [[nodiscard]] static ServiceResponse failure(const Error& error);

    const ContextSlot& slot_;
    SqlValidator validator_;
};

} // namespace wpdb
