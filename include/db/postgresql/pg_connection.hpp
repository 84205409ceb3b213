#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>

namespace sqlgate {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 *
 * Statements run asynchronously (PQsendQuery) so the client can enforce
 * its own deadline on top of the server's statement_timeout and cancel
 * a statement the server failed to stop.
 */
class PgConnection : public IDbConnection {
public:
    /// Extra wait past statement_timeout before the client cancels on its own
    static constexpr std::chrono::milliseconds kCancelGrace{1000};

    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

    /**
     * @brief SQLSTATE classification
     */
    static bool is_timeout_sqlstate(const std::string& sqlstate);
    static bool is_broken_sqlstate(const std::string& sqlstate);

private:
    enum class WaitStatus { READY, DEADLINE, FAILED };

    /**
     * @brief Wait on the socket until the result is ready or the deadline passes
     */
    WaitStatus wait_for_result(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Ask the server to cancel the running statement
     */
    void cancel_running();

    /**
     * @brief Copy a PGRES_TUPLES_OK result, at most max_rows rows
     */
    static void copy_tuples(PGresult* res, size_t max_rows, DbResultSet& out);

    /**
     * @brief Fill error fields from a failed PGresult
     */
    void fill_error(PGresult* res, DbResultSet& out) const;

    PGconn* conn_;
    std::chrono::milliseconds query_timeout_{0};
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb and puts every
 * session in read-only mode before handing it out.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace sqlgate
