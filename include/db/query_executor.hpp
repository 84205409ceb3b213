#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Runs accepted statements against the pool
 *
 * One checkout per call. The outcome decides the checkin health flag:
 * - success: healthy
 * - timeout: unhealthy (session state after a cancel is not trusted)
 * - error: unhealthy only if the session looks broken
 *
 * Callers pass statements and identifiers that have already been
 * validated; this class does no validation of its own.
 */
class QueryExecutor {
public:
    /// Upper bound on rows read back by metadata queries
    static constexpr size_t kMaxMetadataRows = 4096;

    QueryExecutor(std::shared_ptr<ConnectionPool> pool, std::chrono::milliseconds checkout_timeout);

    /**
     * @brief Execute a read with a server-side row bound
     * @param sql Caller's statement, terminator already stripped
     * @param limit Effective row limit; the server never produces more
     */
    [[nodiscard]] Result<QueryRows> run_select(const std::string& sql, size_t limit);

    /**
     * @brief Columns of the first table on the search path named `identifier`
     */
    [[nodiscard]] Result<TableSchema> describe_table(std::string_view identifier);

    /**
     * @brief Tables and views outside the system schemas
     */
    [[nodiscard]] Result<std::vector<TableEntry>> list_tables(size_t max_rows);

    // SQL builders (exposed for tests)
    [[nodiscard]] static std::string bounded_sql(const std::string& sql, size_t limit);
    [[nodiscard]] static std::string describe_sql(std::string_view identifier);
    [[nodiscard]] static std::string list_tables_sql(size_t max_rows);

    struct Stats {
        uint64_t executions;
        uint64_t failures;
        uint64_t timeouts;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Result<DbResultSet> run(const std::string& sql, size_t max_rows);

    std::shared_ptr<ConnectionPool> pool_;
    std::chrono::milliseconds checkout_timeout_;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace sqlgate
