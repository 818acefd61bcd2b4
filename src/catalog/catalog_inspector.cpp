#include "catalog/catalog_inspector.hpp"
#include "schema/prefix_resolver.hpp"
#include "core/utils.hpp"
#include <format>
#include <limits>

namespace wpdb {

namespace {

// Catalog listings take as many rows as the executor ceiling allows
constexpr size_t kAllRows = std::numeric_limits<size_t>::max();

constexpr std::string_view kOptionsSuffix = "options";
constexpr std::string_view kDefaultPrefix = "wp_";

constexpr const char* kListTablesSql =
    "SELECT TABLE_NAME, ENGINE, TABLE_ROWS, "
    "ROUND(DATA_LENGTH / 1024, 2) AS data_kb, "
    "ROUND(INDEX_LENGTH / 1024, 2) AS index_kb "
    "FROM information_schema.TABLES "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME LIKE ? "
    "ORDER BY TABLE_NAME";

constexpr const char* kColumnsSql =
    "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY, COLUMN_DEFAULT, EXTRA "
    "FROM information_schema.COLUMNS "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
    "ORDER BY ORDINAL_POSITION";

constexpr const char* kIndexesSql =
    "SELECT INDEX_NAME, COLUMN_NAME, NON_UNIQUE, SEQ_IN_INDEX "
    "FROM information_schema.STATISTICS "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
    "ORDER BY INDEX_NAME, SEQ_IN_INDEX";

constexpr const char* kTableNamesSql =
    "SELECT TABLE_NAME FROM information_schema.TABLES "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME LIKE ? "
    "ORDER BY TABLE_NAME";

constexpr const char* kOptionsTablesSql =
    "SELECT TABLE_NAME FROM information_schema.TABLES "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME LIKE '%options'";

std::vector<std::string> table_names(const RowSet& rows) {
    std::vector<std::string> names;
    names.reserve(rows.size());
    for (const auto& row : rows) {
        auto name = row.get_string("TABLE_NAME");
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

} // namespace

CatalogInspector::CatalogInspector(
    std::shared_ptr<IQueryExecutor> executor,
    std::string schema,
    std::string base_prefix)
    : executor_(std::move(executor)),
      schema_(std::move(schema)),
      base_prefix_(std::move(base_prefix)) {}

Result<QueryRows> CatalogInspector::list_tables(
    std::optional<int> site_id, const std::string& like_filter) const {

    const std::string pattern = like_filter.empty()
        ? prefix::like_pattern(prefix::resolve_prefix(base_prefix_, site_id))
        : like_filter;

    return executor_->execute(kListTablesSql, QueryParams{schema_, pattern}, kAllRows);
}

Result<TableDescription> CatalogInspector::describe_table(
    std::optional<int> site_id, const std::string& table) const {

    TableDescription description;
    description.table = prefix::resolve_table(prefix::resolve_prefix(base_prefix_, site_id), table);

    const QueryParams params{schema_, description.table};

    auto columns = executor_->execute(kColumnsSql, params, kAllRows);
    if (columns.is_error()) {
        return Result<TableDescription>::error(columns.error());
    }
    if (columns.value().rows.empty()) {
        return Result<TableDescription>::error(
            ErrorCode::TABLE_NOT_FOUND, std::format("Table '{}' not found.", description.table));
    }

    auto indexes = executor_->execute(kIndexesSql, params, kAllRows);
    if (indexes.is_error()) {
        return Result<TableDescription>::error(indexes.error());
    }

    description.columns = std::move(columns.value().rows);
    description.indexes = std::move(indexes.value().rows);
    return Result<TableDescription>::ok(std::move(description));
}

Result<std::vector<std::string>> CatalogInspector::list_sites() const {
    const std::string pattern = prefix::like_pattern(base_prefix_);

    auto rows = executor_->execute(kTableNamesSql, QueryParams{schema_, pattern}, kAllRows);
    if (rows.is_error()) {
        return Result<std::vector<std::string>>::error(rows.error());
    }
    if (rows.value().has_more) {
        utils::log::warn(std::format(
            "Site listing for schema '{}' truncated at {} tables",
            schema_, rows.value().rows.size()));
    }

    return Result<std::vector<std::string>>::ok(
        prefix::detect_site_prefixes(base_prefix_, table_names(rows.value().rows)));
}

Result<std::string> CatalogInspector::detect_prefix(
    IQueryExecutor& executor, const std::string& schema) {

    auto rows = executor.execute(kOptionsTablesSql, QueryParams{schema}, kAllRows);
    if (rows.is_error()) {
        return Result<std::string>::error(rows.error());
    }

    std::optional<std::string> best;
    for (const auto& name : table_names(rows.value().rows)) {
        if (!name.ends_with(kOptionsSuffix)) continue;
        auto candidate = name.substr(0, name.size() - kOptionsSuffix.size());
        if (!best || candidate.size() < best->size()
            || (candidate.size() == best->size() && candidate < *best)) {
            best = std::move(candidate);
        }
    }

    if (!best) {
        utils::log::warn(std::format(
            "No *options table in schema '{}'; falling back to prefix '{}'",
            schema, kDefaultPrefix));
        return Result<std::string>::ok(std::string(kDefaultPrefix));
    }
    return Result<std::string>::ok(std::move(*best));
}

} // namespace wpdb
