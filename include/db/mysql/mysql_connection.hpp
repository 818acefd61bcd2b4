#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace wpdb {

/**
 * @brief MySQL connection implementing IDbConnection
 *
 * Wraps MYSQL* handle (MariaDB Connector/C or libmysqlclient).
 * All MySQL C API calls are encapsulated here.
 *
 * Statements without parameters go through the text protocol; statements
 * with parameters are prepared so values are never spliced into SQL text.
 * Both paths read rows unbuffered and stop after max_rows.
 */
class MysqlConnection : public IDbConnection {
public:
    explicit MysqlConnection(MYSQL* conn);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    DbResultSet execute(const std::string& sql, const QueryParams& params, size_t max_rows) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

    /**
     * @brief Classify a client/server error number
     */
    [[nodiscard]] static DbFailure classify_error(unsigned int error_number);

    /**
     * @brief Session statement setting the execution-time ceiling, and its value
     * @param server_version mysql_get_server_info() text; MariaDB is detected from it
     */
    [[nodiscard]] static std::pair<std::string, QueryParam> timeout_statement(
        std::string_view server_version, uint32_t timeout_ms);

private:
    DbResultSet execute_text(const std::string& sql, size_t max_rows);
    DbResultSet execute_prepared(const std::string& sql, const QueryParams& params, size_t max_rows);

    // Builds a failed result from the handle's last error
    DbResultSet connection_failure();
    DbResultSet statement_failure(MYSQL_STMT* stmt);
    DbResultSet failure(unsigned int error_number, const char* message);

    enum class TimeoutSupport { UNKNOWN, SUPPORTED, UNSUPPORTED };

    MYSQL* conn_;
    bool lost_ = false;
    TimeoutSupport timeout_support_ = TimeoutSupport::UNKNOWN;
    std::optional<uint32_t> current_timeout_ms_;   // last value the session accepted
};

/**
 * @brief MySQL connection factory
 *
 * Creates MysqlConnection instances using mysql_real_connect, over TCP or
 * the local socket named in ConnectionParams.
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    MysqlConnectionFactory();

    std::unique_ptr<IDbConnection> create(const ConnectionParams& params) override;
};

} // namespace wpdb
