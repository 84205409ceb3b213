#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <format>

namespace sqlgate {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, size_t max_rows) {
    DbResultSet result;

    if (!conn_) {
        result.error_message = "Connection is null";
        result.connection_broken = true;
        return result;
    }

    const auto deadline = query_timeout_.count() > 0
        ? std::chrono::steady_clock::now() + query_timeout_ + kCancelGrace
        : std::chrono::steady_clock::time_point::max();

    if (!PQsendQuery(conn_, sql.c_str())) {
        result.error_message = PQerrorMessage(conn_);
        result.connection_broken = !is_connected();
        return result;
    }

    const auto status = wait_for_result(deadline);
    if (status != WaitStatus::READY) {
        if (status == WaitStatus::DEADLINE) {
            utils::log::warn(std::format(
                "Statement exceeded client deadline ({}ms + grace), cancelling",
                query_timeout_.count()));
            cancel_running();
            result.timed_out = true;
            result.error_message = "canceling statement due to statement timeout";
            // Give the server one grace period to acknowledge the cancel
            const auto drain_deadline = std::chrono::steady_clock::now() + kCancelGrace;
            if (wait_for_result(drain_deadline) != WaitStatus::READY) {
                result.connection_broken = true;
                return result;
            }
        } else {
            result.error_message = PQerrorMessage(conn_);
            result.connection_broken = true;
            return result;
        }
    }

    // Consume every result; only the first carries the statement outcome
    bool first = true;
    while (PGresult* res = PQgetResult(conn_)) {
        if (first && !result.timed_out) {
            const ExecStatusType st = PQresultStatus(res);
            if (st == PGRES_TUPLES_OK) {
                copy_tuples(res, max_rows, result);
                result.success = true;
            } else if (st == PGRES_COMMAND_OK) {
                result.success = true;
            } else {
                fill_error(res, result);
            }
        }
        first = false;
        PQclear(res);
    }

    if (!is_connected()) {
        result.connection_broken = true;
        if (result.success) {
            result.success = false;
            result.error_message = "connection lost";
        }
    }
    return result;
}

PgConnection::WaitStatus PgConnection::wait_for_result(
    std::chrono::steady_clock::time_point deadline) {

    while (PQisBusy(conn_)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitStatus::DEADLINE;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int wait_ms = static_cast<int>(std::clamp<int64_t>(remaining.count(), 1, 1000));

        pollfd pfd{};
        pfd.fd = PQsocket(conn_);
        pfd.events = POLLIN;
        if (pfd.fd < 0) {
            return WaitStatus::FAILED;
        }

        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WaitStatus::FAILED;
        }
        if (rc > 0 && !PQconsumeInput(conn_)) {
            return WaitStatus::FAILED;
        }
    }
    return WaitStatus::READY;
}

void PgConnection::cancel_running() {
    PGcancel* cancel = PQgetCancel(conn_);
    if (!cancel) {
        return;
    }
    char errbuf[256];
    if (!PQcancel(cancel, errbuf, sizeof(errbuf))) {
        utils::log::warn(std::format("PQcancel failed: {}", errbuf));
    }
    PQfreeCancel(cancel);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    if (success) {
        query_timeout_ = std::chrono::milliseconds(timeout_ms);
    }
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PgConnection::is_timeout_sqlstate(const std::string& sqlstate) {
    return sqlstate == "57014";   // query_canceled
}

bool PgConnection::is_broken_sqlstate(const std::string& sqlstate) {
    // Class 08: connection exception; 57P01..57P03: admin/crash shutdown, cannot connect now
    return sqlstate.starts_with("08") ||
           sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03";
}

void PgConnection::copy_tuples(PGresult* res, size_t max_rows, DbResultSet& out) {
    const int ncols = PQnfields(res);
    out.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        out.column_names.emplace_back(PQfname(res, i));
    }

    const size_t nrows = std::min(static_cast<size_t>(PQntuples(res)), max_rows);
    out.rows.reserve(nrows);

    for (size_t i = 0; i < nrows; i++) {
        const int r = static_cast<int>(i);
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, r, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, r, j),
                                             static_cast<size_t>(PQgetlength(res, r, j))));
            }
        }
        out.rows.push_back(std::move(row));
    }
}

void PgConnection::fill_error(PGresult* res, DbResultSet& out) const {
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    out.sqlstate = state ? state : "";

    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    out.error_message = primary ? primary : PQerrorMessage(conn_);

    out.timed_out = is_timeout_sqlstate(out.sqlstate);
    out.connection_broken = is_broken_sqlstate(out.sqlstate) || !is_connected();
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    // Every transaction on this session is read-only, whatever the caller sends
    PGresult* res = PQexec(conn, "SET default_transaction_read_only = on");
    const bool read_only = res && PQresultStatus(res) == PGRES_COMMAND_OK;
    if (res) PQclear(res);
    if (!read_only) {
        utils::log::error(std::format("Failed to make session read-only: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlgate
