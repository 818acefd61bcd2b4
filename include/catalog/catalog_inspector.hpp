#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iquery_executor.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wpdb {

/**
 * @brief Column and index listing of one table
 */
struct TableDescription {
    std::string table;      // physical name after prefix resolution
    RowSet columns;         // COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY, COLUMN_DEFAULT, EXTRA
    RowSet indexes;         // INDEX_NAME, COLUMN_NAME, NON_UNIQUE, SEQ_IN_INDEX
};

/**
 * @brief information_schema queries scoped to one schema and base prefix
 *
 * All SQL issued here is built internally with bound parameters and goes
 * straight to the executor; caller input only ever reaches it as a value.
 */
class CatalogInspector {
public:
    CatalogInspector(std::shared_ptr<IQueryExecutor> executor,
                     std::string schema,
                     std::string base_prefix);

    /**
     * @brief Tables of a site (or matching a caller LIKE filter)
     *
     * Columns: TABLE_NAME, ENGINE, TABLE_ROWS, data_kb, index_kb.
     * A non-empty `like_filter` replaces the site prefix match.
     */
    [[nodiscard]] Result<QueryRows> list_tables(
        std::optional<int> site_id, const std::string& like_filter = "") const;

    /**
     * @brief Columns and indexes of a table; TABLE_NOT_FOUND when it has no columns
     * @param table Bare name ("posts") or physical name ("wp_posts")
     */
    [[nodiscard]] Result<TableDescription> describe_table(
        std::optional<int> site_id, const std::string& table) const;

    /**
     * @brief Prefixes of every site in the schema, main site first
     */
    [[nodiscard]] Result<std::vector<std::string>> list_sites() const;

    /**
     * @brief Find the base table prefix from the *options tables
     *
     * The shortest name ending in "options" wins ("wp_options" over
     * "wp_2_options"); "wp_" when there is none.
     */
    [[nodiscard]] static Result<std::string> detect_prefix(
        IQueryExecutor& executor, const std::string& schema);

    [[nodiscard]] const std::string& base_prefix() const { return base_prefix_; }
    [[nodiscard]] const std::string& schema() const { return schema_; }

private:
    std::shared_ptr<IQueryExecutor> executor_;
    std::string schema_;
    std::string base_prefix_;
};

} // namespace wpdb
