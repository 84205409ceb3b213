#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;             // five-character SQLSTATE when the server sent one

    bool timed_out = false;           // statement cancelled by statement_timeout or client deadline
    bool connection_broken = false;   // session is unusable afterwards

    std::vector<std::string> column_names;
    std::vector<Row> rows;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a read statement
     * @param sql SQL text
     * @param max_rows Copy at most this many rows out of the native result
     * @return Result set, or failure with timeout/broken flags set
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, size_t max_rows) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlgate
