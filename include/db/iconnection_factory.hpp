#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <string>

namespace wpdb {

/**
 * @brief Everything needed to open one connection
 *
 * Transport is either TCP (host/port) or a local socket. A non-empty
 * `socket` selects the socket and host/port are ignored.
 */
struct ConnectionParams {
    std::string host = "127.0.0.1";
    uint16_t port = 3306;
    std::string socket;
    std::string user = "root";
    std::string password;
    std::string database = "wordpress";
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{0};   // socket read/write bound, 0 = none

    [[nodiscard]] bool uses_socket() const { return !socket.empty(); }

    // user@host:port/db or user@socket (socket)/db; never includes the password
    [[nodiscard]] std::string describe() const {
        if (uses_socket()) {
            return std::format("{}@{} (socket)/{}", user, socket, database);
        }
        return std::format("{}@{}:{}/{}", user, host, port, database);
    }
};

/**
 * @brief Abstract factory for creating database connections
 *
 * The MySQL backend wraps mysql_real_connect; tests supply mocks.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const ConnectionParams& params) = 0;
};

} // namespace wpdb
