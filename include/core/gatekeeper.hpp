#pragma once

#include "audit/audit_emitter.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/request_lifecycle.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/query_executor.hpp"
#include "security/complexity_guard.hpp"
#include "security/statement_classifier.hpp"
#include "server/rate_limiter.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Request orchestrator
 *
 * Flow per request:
 * 1. Row-limit check (QUERY only)
 * 2. Classify (StatementClassifier, then ComplexityGuard) or validate the
 *    table identifier
 * 3. Rate limit
 * 4. Execute through the pool with a server-side LIMIT
 * 5. Audit (always, exactly once)
 *
 * Rejections never touch the rate limiter or the pool. All components are
 * owned here; there is no process-wide state.
 */
class Gatekeeper {
public:
    /// Longest statement text copied into an audit record
    static constexpr size_t kMaxAuditSubject = 4096;

    /**
     * @brief Production wiring: libpq connections and a FileSink on audit.output_file
     * @throws ConfigurationError if the config fails validation
     * @throws std::runtime_error if the audit file cannot be opened
     */
    explicit Gatekeeper(const GatekeeperConfig& config);

    /**
     * @brief Wiring with caller-supplied connection factory and audit sinks
     * @throws ConfigurationError if the config fails validation
     */
    Gatekeeper(const GatekeeperConfig& config,
               std::shared_ptr<IConnectionFactory> factory,
               std::vector<std::unique_ptr<IAuditSink>> audit_sinks);

    ~Gatekeeper();

    Gatekeeper(const Gatekeeper&) = delete;
    Gatekeeper& operator=(const Gatekeeper&) = delete;

    /**
     * @brief Run a read-only statement
     *
     * At most min(limit, limits.max_rows) rows are produced; an absent
     * limit means limits.default_rows. truncated is set when the row count
     * reached that bound.
     */
    [[nodiscard]] Result<QueryRows> execute_query(const std::string& client_id,
                                                  std::string_view statement,
                                                  const RequestedLimit& limit);

    /**
     * @brief Column metadata in ordinal order
     *
     * The name must pass StatementClassifier::validate_identifier before
     * any database access.
     */
    [[nodiscard]] Result<TableSchema> describe_table(const std::string& client_id,
                                                     std::string_view table_name);

    /// Tables and views outside the system schemas, capped at limits.max_rows
    [[nodiscard]] Result<std::vector<TableEntry>> list_tables(const std::string& client_id);

    /// Read-only view of the caller's rate-limit window
    [[nodiscard]] ClientRateStatus rate_limit_status(const std::string& client_id) const;

    /// Block until every audit record so far is on disk; false if a sink is behind
    bool flush_audit();

    /**
     * @brief Wait for in-flight requests, stop the pool, then drain and
     * close the audit sinks. Idempotent.
     */
    void shutdown();

    struct Stats {
        uint64_t total_requests;
        uint64_t rejected;
        uint64_t rate_limited;
        uint64_t succeeded;
        uint64_t failed;
        uint64_t timed_out;
        uint64_t audit_failures;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const GatekeeperConfig& config() const { return config_; }
    [[nodiscard]] ConnectionPool& pool() { return *pool_; }
    [[nodiscard]] AuditEmitter& audit() { return *audit_; }
    [[nodiscard]] FixedWindowRateLimiter& rate_limiter() { return *rate_limiter_; }

private:
    static GatekeeperConfig validated(const GatekeeperConfig& config);

    [[nodiscard]] size_t effective_limit(const RequestedLimit& limit) const;

    AuditEvent begin_event(const RequestLifecycle& lc, std::string subject) const;

    /// Terminal step shared by every path: record the event, then AUDITED -> DONE
    void finish(RequestLifecycle& lc, AuditEvent& event);

    template <typename T>
    Result<T> reject(RequestLifecycle& lc, AuditEvent& event, ReasonCode reason, std::string detail);

    template <typename T>
    Result<T> rate_limited(RequestLifecycle& lc, AuditEvent& event, const RateLimitResult& rl);

    template <typename T, typename U>
    Result<T> execution_failed(RequestLifecycle& lc, AuditEvent& event, const Result<U>& result);

    GatekeeperConfig config_;

    std::unique_ptr<AuditEmitter> audit_;
    StatementClassifier classifier_;
    ComplexityGuard complexity_guard_;
    std::unique_ptr<FixedWindowRateLimiter> rate_limiter_;
    std::shared_ptr<ConnectionPool> pool_;
    std::unique_ptr<QueryExecutor> executor_;

    // Held shared by every request from its shut-down check to its audit record
    std::shared_mutex lifecycle_mutex_;
    std::atomic<bool> shut_down_{false};

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> audit_failures_{0};
};

} // namespace sqlgate
