#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <chrono>
#include <string>

namespace wpdb {

/**
 * @brief Abstract query executor interface
 *
 * The query service and catalog inspector hold shared_ptr<IQueryExecutor>;
 * tests substitute a scripted one.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a statement and return at most `limit` rows
     * @param sql Statement text (already validated, or internally built)
     * @param params Positional parameters for `?` placeholders
     * @param limit Requested row limit, clamped to the configured ceiling
     * @return Rows plus has_more, or a tagged execution error
     */
    [[nodiscard]] virtual Result<QueryRows> execute(
        const std::string& sql, const QueryParams& params, size_t limit) = 0;

    /**
     * @brief Limit actually applied for a requested one
     */
    [[nodiscard]] virtual size_t effective_limit(size_t requested) const = 0;

    /**
     * @brief Wait up to `wait` for statements abandoned after a timeout,
     *        then reap them
     * @return true if none was still running when `wait` ran out
     */
    virtual bool drain(std::chrono::milliseconds wait) = 0;
};

} // namespace wpdb
