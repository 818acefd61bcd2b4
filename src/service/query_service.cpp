#include "service/query_service.hpp"
#include "catalog/catalog_inspector.hpp"
#include "core/utils.hpp"
#include <format>

namespace wpdb {

namespace {

CatalogInspector make_inspector(const DatabaseContext& context) {
    return CatalogInspector(context.executor(), context.schema(), context.table_prefix());
}

} // namespace

QueryService::QueryService(const ContextSlot& slot)
    : QueryService(slot, SqlValidator::Config{}) {}

QueryService::QueryService(const ContextSlot& slot, const SqlValidator::Config& validator_config)
    : slot_(slot),
      validator_(validator_config) {}

ServiceResponse QueryService::failure(const Error& error) {
    return ServiceResponse{error.code, ResultFormatter::error_response(error)};
}

ServiceResponse QueryService::run_query(
    const std::string& sql, size_t limit, OutputFormat format) const {

    const auto outcome = validator_.validate(sql);
    if (outcome.is_rejected()) {
        const auto& rejection = outcome.rejection();
        utils::log::warn(std::format("Rejected query ({}): {}",
                                     reject_reason_to_string(rejection.reason),
                                     rejection.matched.empty() ? "-" : rejection.matched));
        return failure(Error{ErrorCode::VALIDATION_REJECTED, rejection.message()});
    }

    auto context = slot_.get();
    if (context.is_error()) {
        return failure(context.error());
    }

    const auto& executor = context.value()->executor();
    auto result = executor->execute(sql, QueryParams{}, limit);
    if (result.is_error()) {
        return failure(result.error());
    }

    return ServiceResponse{ErrorCode::NONE, ResultFormatter::query_response(
        result.value(), executor->effective_limit(limit), format)};
}

ServiceResponse QueryService::list_tables(
    std::optional<int> site_id, const std::string& like_filter, OutputFormat format) const {

    auto context = slot_.get();
    if (context.is_error()) {
        return failure(context.error());
    }

    auto result = make_inspector(*context.value()).list_tables(site_id, like_filter);
    if (result.is_error()) {
        return failure(result.error());
    }
    return ServiceResponse{ErrorCode::NONE,
                           ResultFormatter::rows_response(result.value().rows, format)};
}

ServiceResponse QueryService::describe_table(
    std::optional<int> site_id, const std::string& table, OutputFormat format) const {

    auto context = slot_.get();
    if (context.is_error()) {
        return failure(context.error());
    }

    auto result = make_inspector(*context.value()).describe_table(site_id, table);
    if (result.is_error()) {
        return failure(result.error());
    }
    return ServiceResponse{ErrorCode::NONE,
                           ResultFormatter::describe_response(result.value(), format)};
}

ServiceResponse QueryService::list_sites(OutputFormat format) const {
    auto context = slot_.get();
    if (context.is_error()) {
        return failure(context.error());
    }

    const auto& ctx = *context.value();
    auto result = make_inspector(ctx).list_sites();
    if (result.is_error()) {
        return failure(result.error());
    }
    return ServiceResponse{ErrorCode::NONE,
                           ResultFormatter::sites_response(ctx.table_prefix(), result.value(), format)};
}

} // namespace wpdb
