#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <mysql/errmsg.h>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace wpdb {

namespace {

// Server-side execution-time ceiling exceeded (MySQL ER_QUERY_TIMEOUT,
// MariaDB ER_STATEMENT_TIMEOUT)
constexpr unsigned int kMysqlQueryTimeout = 3024;
constexpr unsigned int kMariadbStatementTimeout = 1969;

// my_bool in MariaDB Connector/C, bool in libmysqlclient 8
using BindFlag = std::remove_pointer_t<decltype(std::declval<MYSQL_BIND>().is_null)>;

struct StmtCloser {
    void operator()(MYSQL_STMT* stmt) const { mysql_stmt_close(stmt); }
};
using StmtHandle = std::unique_ptr<MYSQL_STMT, StmtCloser>;

struct ResultFreer {
    void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
using ResultHandle = std::unique_ptr<MYSQL_RES, ResultFreer>;

// The client library keeps per-thread state; executor workers are fresh
// threads that never called mysql_init themselves.
struct ThreadAttach {
    ThreadAttach() { mysql_thread_init(); }
    ~ThreadAttach() { mysql_thread_end(); }
};

void ensure_thread_attached() {
    thread_local ThreadAttach attach;
}

} // namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbFailure MysqlConnection::classify_error(unsigned int error_number) {
    switch (error_number) {
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
            return DbFailure::CONNECTION;
        case kMysqlQueryTimeout:
        case kMariadbStatementTimeout:
            return DbFailure::TIMEOUT;
        default:
            return DbFailure::QUERY;
    }
}

std::pair<std::string, QueryParam> MysqlConnection::timeout_statement(
    std::string_view server_version, uint32_t timeout_ms) {
    // MySQL 5.7.8+: max_execution_time in ms. MariaDB 10.1+: max_statement_time in s.
    if (server_version.find("MariaDB") != std::string_view::npos) {
        return {"SET SESSION max_statement_time = ?", static_cast<double>(timeout_ms) / 1000.0};
    }
    return {"SET SESSION MAX_EXECUTION_TIME = ?", static_cast<int64_t>(timeout_ms)};
}

DbResultSet MysqlConnection::execute(
    const std::string& sql, const QueryParams& params, size_t max_rows) {

    if (!conn_) {
        return DbResultSet::failed(DbFailure::CONNECTION, 0, "Connection is closed");
    }
    ensure_thread_attached();

    if (params.empty()) {
        return execute_text(sql, max_rows);
    }
    return execute_prepared(sql, params, max_rows);
}

DbResultSet MysqlConnection::execute_text(const std::string& sql, size_t max_rows) {
    if (mysql_real_query(conn_, sql.data(), sql.size()) != 0) {
        return connection_failure();
    }

    ResultHandle res(mysql_use_result(conn_));
    if (!res) {
        // Statement without a result set (SET, ...) or a fetch error
        if (mysql_field_count(conn_) == 0) {
            DbResultSet result;
            result.success = true;
            return result;
        }
        return connection_failure();
    }

    DbResultSet result;
    const unsigned int num_fields = mysql_num_fields(res.get());
    const MYSQL_FIELD* fields = mysql_fetch_fields(res.get());

    std::vector<ColumnTypeInfo> types;
    types.reserve(num_fields);
    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name, fields[i].name_length);
        types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    while (result.rows.size() < max_rows) {
        MYSQL_ROW row = mysql_fetch_row(res.get());
        if (row == nullptr) {
            if (mysql_errno(conn_) != 0) {
                return connection_failure();
            }
            break;
        }
        const unsigned long* lengths = mysql_fetch_lengths(res.get());

        Row decoded;
        decoded.fields.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i] == nullptr) {
                decoded.add(result.column_names[i], std::monostate{});
            } else {
                decoded.add(result.column_names[i],
                            MysqlTypeMap::decode(types[i], row[i], lengths[i]));
            }
        }
        result.rows.push_back(std::move(decoded));
    }

    // Freeing an unbuffered result discards the rows nobody asked for
    res.reset();
    if (mysql_errno(conn_) != 0) {
        return connection_failure();
    }

    result.success = true;
    return result;
}

DbResultSet MysqlConnection::execute_prepared(
    const std::string& sql, const QueryParams& params, size_t max_rows) {

    StmtHandle stmt(mysql_stmt_init(conn_));
    if (!stmt) {
        return connection_failure();
    }

    if (mysql_stmt_prepare(stmt.get(), sql.data(), sql.size()) != 0) {
        return statement_failure(stmt.get());
    }

    if (mysql_stmt_param_count(stmt.get()) != params.size()) {
        return DbResultSet::failed(DbFailure::QUERY, 0, std::format(
            "Statement expects {} parameter(s), {} given",
            mysql_stmt_param_count(stmt.get()), params.size()));
    }

    // Bind parameters (storage must outlive mysql_stmt_execute)
    const size_t n = params.size();
    std::vector<MYSQL_BIND> binds(n);
    std::vector<int64_t> ints(n);
    std::vector<double> doubles(n);
    std::vector<unsigned long> lengths(n);

    for (size_t i = 0; i < n; ++i) {
        MYSQL_BIND& b = binds[i];
        std::memset(&b, 0, sizeof(b));
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                b.buffer_type = MYSQL_TYPE_NULL;
            } else if constexpr (std::is_same_v<T, std::string>) {
                lengths[i] = static_cast<unsigned long>(v.size());
                b.buffer_type = MYSQL_TYPE_STRING;
                b.buffer = const_cast<char*>(v.data());
                b.buffer_length = lengths[i];
                b.length = &lengths[i];
            } else if constexpr (std::is_same_v<T, int64_t>) {
                ints[i] = v;
                b.buffer_type = MYSQL_TYPE_LONGLONG;
                b.buffer = &ints[i];
            } else {
                doubles[i] = v;
                b.buffer_type = MYSQL_TYPE_DOUBLE;
                b.buffer = &doubles[i];
            }
        }, params[i]);
    }

    if (mysql_stmt_bind_param(stmt.get(), binds.data()) != 0
        || mysql_stmt_execute(stmt.get()) != 0) {
        return statement_failure(stmt.get());
    }

    ResultHandle meta(mysql_stmt_result_metadata(stmt.get()));
    if (!meta) {
        if (mysql_stmt_errno(stmt.get()) != 0) {
            return statement_failure(stmt.get());
        }
        DbResultSet result;
        result.success = true;
        return result;
    }

    DbResultSet result;
    const unsigned int num_fields = mysql_num_fields(meta.get());
    const MYSQL_FIELD* fields = mysql_fetch_fields(meta.get());

    std::vector<ColumnTypeInfo> types;
    types.reserve(num_fields);
    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name, fields[i].name_length);
        types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    // Every column is fetched as text into a zero-length buffer first; the
    // reported length then sizes the real fetch.
    std::vector<MYSQL_BIND> out(num_fields);
    std::vector<unsigned long> out_lengths(num_fields);
    auto nulls = std::make_unique<BindFlag[]>(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        std::memset(&out[i], 0, sizeof(MYSQL_BIND));
        out[i].buffer_type = MYSQL_TYPE_STRING;
        out[i].length = &out_lengths[i];
        out[i].is_null = &nulls[i];
    }
    if (mysql_stmt_bind_result(stmt.get(), out.data()) != 0) {
        return statement_failure(stmt.get());
    }

    while (result.rows.size() < max_rows) {
        const int rc = mysql_stmt_fetch(stmt.get());
        if (rc == MYSQL_NO_DATA) {
            break;
        }
        if (rc != 0 && rc != MYSQL_DATA_TRUNCATED) {
            return statement_failure(stmt.get());
        }

        Row decoded;
        decoded.fields.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (nulls[i]) {
                decoded.add(result.column_names[i], std::monostate{});
                continue;
            }
            std::string buffer(out_lengths[i], '\0');
            if (!buffer.empty()) {
                unsigned long fetched = 0;
                MYSQL_BIND column;
                std::memset(&column, 0, sizeof(column));
                column.buffer_type = MYSQL_TYPE_STRING;
                column.buffer = buffer.data();
                column.buffer_length = static_cast<unsigned long>(buffer.size());
                column.length = &fetched;
                if (mysql_stmt_fetch_column(stmt.get(), &column, i, 0) != 0) {
                    return statement_failure(stmt.get());
                }
            }
            decoded.add(result.column_names[i],
                        MysqlTypeMap::decode(types[i], buffer.data(), buffer.size()));
        }
        result.rows.push_back(std::move(decoded));
    }

    if (mysql_stmt_free_result(stmt.get()) != 0) {
        return statement_failure(stmt.get());
    }

    result.success = true;
    return result;
}

DbResultSet MysqlConnection::connection_failure() {
    return failure(mysql_errno(conn_), mysql_error(conn_));
}

DbResultSet MysqlConnection::statement_failure(MYSQL_STMT* stmt) {
    return failure(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
}

DbResultSet MysqlConnection::failure(unsigned int error_number, const char* message) {
    const DbFailure kind = classify_error(error_number);
    if (kind == DbFailure::CONNECTION) {
        lost_ = true;
    }
    return DbResultSet::failed(kind, error_number, message ? message : "");
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || lost_) {
        return false;
    }
    ensure_thread_attached();

    // Fast ping check
    if (mysql_ping(conn_) != 0) {
        return false;
    }

    // Run health check query if provided
    if (!health_check_query.empty()) {
        const auto result = execute_text(health_check_query, 1);
        return result.success;
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr && !lost_;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_ || timeout_support_ == TimeoutSupport::UNSUPPORTED) {
        return false;
    }
    if (current_timeout_ms_ == timeout_ms) {
        return true;
    }

    const char* server = mysql_get_server_info(conn_);
    const auto [sql, value] = timeout_statement(server ? server : "", timeout_ms);
    const auto result = execute(sql, QueryParams{value}, 0);

    if (!result.success) {
        if (result.failure != DbFailure::CONNECTION) {
            // Server lacks the variable; don't retry on this connection
            timeout_support_ = TimeoutSupport::UNSUPPORTED;
        }
        utils::log::warn(std::format("Failed to set session execution timeout on {}: {}",
                                     server ? server : "unknown server", result.error_message));
        return false;
    }

    timeout_support_ = TimeoutSupport::SUPPORTED;
    current_timeout_ms_ = timeout_ms;
    return true;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

MysqlConnectionFactory::MysqlConnectionFactory() {
    // mysql_init initializes the library lazily, which is not thread-safe
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            utils::log::error("mysql_library_init failed");
        }
    });
}

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(const ConnectionParams& params) {
    ensure_thread_attached();

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    const unsigned int timeout = static_cast<unsigned int>(params.connect_timeout.count());
    if (mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout) != 0) {
        utils::log::warn("Failed to set MySQL connect timeout");
    }

    // An abandoned statement must eventually return to its worker thread
    if (params.read_timeout.count() > 0) {
        const unsigned int io_timeout = static_cast<unsigned int>(params.read_timeout.count());
        if (mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &io_timeout) != 0
            || mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &io_timeout) != 0) {
            utils::log::warn("Failed to set MySQL read/write timeout");
        }
    }

    // Set character set to UTF-8
    if (mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4") != 0) {
        utils::log::warn("Failed to set MySQL character set to utf8mb4");
    }

    // A socket path selects the local transport; host and port are unused then
    const char* host = params.uses_socket() ? nullptr : params.host.c_str();
    const unsigned int port = params.uses_socket() ? 0 : params.port;
    const char* socket = params.uses_socket() ? params.socket.c_str() : nullptr;

    MYSQL* result = mysql_real_connect(
        conn,
        host,
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        port,
        socket,
        0         // client flags (no CLIENT_MULTI_STATEMENTS)
    );

    if (!result) {
        utils::log::error(std::format("MySQL connection to {} failed: {}",
                                      params.describe(), mysql_error(conn)));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

} // namespace wpdb
