#include "core/gatekeeper.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

namespace {

std::string clip_subject(std::string text) {
    if (text.size() > Gatekeeper::kMaxAuditSubject) {
        text.resize(Gatekeeper::kMaxAuditSubject);
        text += "...";
    }
    return text;
}

Outcome outcome_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::POOL_EXHAUSTED: return Outcome::POOL_EXHAUSTED;
        case ErrorCategory::QUERY_TIMEOUT:  return Outcome::QUERY_TIMEOUT;
        default:                            return Outcome::EXECUTION_ERROR;
    }
}

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

GatekeeperConfig Gatekeeper::validated(const GatekeeperConfig& config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Invalid gatekeeper configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw ConfigurationError(combined);
    }
    GatekeeperConfig out = config;
    out.database.connection_string = ConfigLoader::build_conninfo(config.database);
    return out;
}

Gatekeeper::Gatekeeper(const GatekeeperConfig& config)
    : config_(validated(config)),
      audit_(std::make_unique<AuditEmitter>(config_.audit)),
      classifier_(config_.validation),
      complexity_guard_(config_.complexity),
      rate_limiter_(std::make_unique<FixedWindowRateLimiter>(config_.rate_limiting)),
      pool_(std::make_shared<ConnectionPool>(config_.database,
                                             std::make_shared<PgConnectionFactory>())),
      executor_(std::make_unique<QueryExecutor>(pool_, config_.database.checkout_timeout)) {
    utils::log::info(std::format("Gatekeeper ready: database {} max_rows={}",
        ConfigLoader::redact_conninfo(config_.database.connection_string),
        config_.limits.max_rows));
}

Gatekeeper::Gatekeeper(const GatekeeperConfig& config,
                       std::shared_ptr<IConnectionFactory> factory,
                       std::vector<std::unique_ptr<IAuditSink>> audit_sinks)
    : config_(validated(config)),
      audit_(std::make_unique<AuditEmitter>(config_.audit, std::move(audit_sinks))),
      classifier_(config_.validation),
      complexity_guard_(config_.complexity),
      rate_limiter_(std::make_unique<FixedWindowRateLimiter>(config_.rate_limiting)),
      pool_(std::make_shared<ConnectionPool>(config_.database, std::move(factory))),
      executor_(std::make_unique<QueryExecutor>(pool_, config_.database.checkout_timeout)) {}

Gatekeeper::~Gatekeeper() {
    shutdown();
}

void Gatekeeper::shutdown() {
    {
        // Waits for requests already past the shut-down check to be audited
        std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
        bool expected = false;
        if (!shut_down_.compare_exchange_strong(expected, true)) {
            return;
        }
    }
    pool_->shutdown();
    audit_->shutdown();
    utils::log::info(std::format("Gatekeeper stopped after {} requests",
        total_requests_.load(std::memory_order_relaxed)));
}

bool Gatekeeper::flush_audit() {
    return audit_->flush();
}

Gatekeeper::Stats Gatekeeper::get_stats() const {
    return Stats{
        .total_requests = total_requests_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .rate_limited = rate_limited_.load(std::memory_order_relaxed),
        .succeeded = succeeded_.load(std::memory_order_relaxed),
        .failed = failed_.load(std::memory_order_relaxed),
        .timed_out = timed_out_.load(std::memory_order_relaxed),
        .audit_failures = audit_failures_.load(std::memory_order_relaxed),
    };
}

ClientRateStatus Gatekeeper::rate_limit_status(const std::string& client_id) const {
    return rate_limiter_->client_status(client_id);
}

// ============================================================================
// Lifecycle helpers
// ============================================================================

size_t Gatekeeper::effective_limit(const RequestedLimit& limit) const {
    if (limit.kind == RequestedLimit::Kind::INTEGER) {
        return std::min(static_cast<size_t>(limit.value), config_.limits.max_rows);
    }
    return std::min(config_.limits.default_rows, config_.limits.max_rows);
}

AuditEvent Gatekeeper::begin_event(const RequestLifecycle& lc, std::string subject) const {
    const auto& req = lc.request();
    AuditEvent event;
    event.client_id = req.client_id;
    event.operation = req.operation;
    event.subject = clip_subject(std::move(subject));
    if (req.requested_limit.kind != RequestedLimit::Kind::ABSENT) {
        event.requested_limit = clip_subject(req.requested_limit.raw);
    }
    event.received_at = req.received_at;
    return event;
}

void Gatekeeper::finish(RequestLifecycle& lc, AuditEvent& event) {
    event.final_state = lc.outcome_state();
    event.timestamp = std::chrono::system_clock::now();
    event.duration = lc.elapsed();

    if (!audit_->record(std::move(event))) {
        audit_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Audit record lost for client '{}' (path {})",
            lc.request().client_id, lc.path_string()));
    }
    lc.advance(RequestState::AUDITED);
    lc.advance(RequestState::DONE);
    utils::log::debug(std::format("Request from '{}' done: {}",
        lc.request().client_id, lc.path_string()));
}

template <typename T>
Result<T> Gatekeeper::reject(RequestLifecycle& lc, AuditEvent& event,
                             ReasonCode reason, std::string detail) {
    lc.advance(RequestState::REJECTED);
    rejected_.fetch_add(1, std::memory_order_relaxed);

    utils::log::warn(std::format("Rejected {} from client '{}': {} ({})",
        operation_to_string(event.operation), event.client_id,
        reason_code_to_string(reason), detail));

    event.reason = reason;
    event.outcome = Outcome::REJECTED;
    finish(lc, event);

    GatekeeperError err;
    err.category = ErrorCategory::VALIDATION;
    err.reason = reason;
    err.message = std::move(detail);
    return Result<T>::error(std::move(err));
}

template <typename T>
Result<T> Gatekeeper::rate_limited(RequestLifecycle& lc, AuditEvent& event,
                                   const RateLimitResult& rl) {
    lc.advance(RequestState::RATE_LIMITED);
    rate_limited_.fetch_add(1, std::memory_order_relaxed);

    event.outcome = Outcome::RATE_LIMITED;
    finish(lc, event);

    GatekeeperError err;
    err.category = ErrorCategory::RATE_LIMIT;
    err.message = std::format("rate limit of {} requests per window exceeded", rl.limit);
    err.blocked_until = rl.blocked_until;
    err.retry_after = rl.retry_after;
    return Result<T>::error(std::move(err));
}

template <typename T, typename U>
Result<T> Gatekeeper::execution_failed(RequestLifecycle& lc, AuditEvent& event,
                                       const Result<U>& result) {
    const auto& err = result.error();
    if (err.category == ErrorCategory::QUERY_TIMEOUT) {
        lc.advance(RequestState::TIMED_OUT);
        timed_out_.fetch_add(1, std::memory_order_relaxed);
    } else {
        lc.advance(RequestState::FAILED);
        failed_.fetch_add(1, std::memory_order_relaxed);
    }

    event.outcome = outcome_for(err.category);
    event.error_message = err.message;
    finish(lc, event);
    return Result<T>::error(err);
}

// ============================================================================
// Operations
// ============================================================================

Result<QueryRows> Gatekeeper::execute_query(const std::string& client_id,
                                            std::string_view statement,
                                            const RequestedLimit& limit) {
    std::shared_lock<std::shared_mutex> in_flight(lifecycle_mutex_);
    if (shut_down_.load(std::memory_order_acquire)) {
        return Result<QueryRows>::error(ErrorCategory::EXECUTION, "gatekeeper is shut down");
    }
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    RequestLifecycle lc(Request{client_id, Operation::QUERY, std::string(statement),
                                limit, std::chrono::system_clock::now()});
    AuditEvent event = begin_event(lc, StatementClassifier::redact(statement));

    // Limit is checked before the statement is even looked at
    if (!limit.is_valid()) {
        return reject<QueryRows>(lc, event, ReasonCode::INVALID_LIMIT,
            "limit must be a non-negative integer");
    }

    lc.advance(RequestState::CLASSIFYING);
    auto verdict = classifier_.classify(statement);
    if (verdict.allowed) {
        verdict = complexity_guard_.check(verdict.normalized_text);
    }
    if (!verdict.allowed) {
        return reject<QueryRows>(lc, event, verdict.reason, std::move(verdict.detail));
    }

    const auto rl = rate_limiter_->check(client_id);
    if (!rl.allowed) {
        return rate_limited<QueryRows>(lc, event, rl);
    }

    lc.advance(RequestState::EXECUTING);
    const size_t rows_limit = effective_limit(limit);
    auto result = executor_->run_select(StatementClassifier::executable_text(statement), rows_limit);
    if (result.is_error()) {
        return execution_failed<QueryRows>(lc, event, result);
    }

    lc.advance(RequestState::SUCCEEDED);
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    event.row_count = result.value().row_count;
    event.truncated = result.value().truncated;
    finish(lc, event);
    return result;
}

Result<TableSchema> Gatekeeper::describe_table(const std::string& client_id,
                                               std::string_view table_name) {
    std::shared_lock<std::shared_mutex> in_flight(lifecycle_mutex_);
    if (shut_down_.load(std::memory_order_acquire)) {
        return Result<TableSchema>::error(ErrorCategory::EXECUTION, "gatekeeper is shut down");
    }
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    RequestLifecycle lc(Request{client_id, Operation::DESCRIBE, std::string(table_name),
                                RequestedLimit::none(), std::chrono::system_clock::now()});
    AuditEvent event = begin_event(lc, std::string(table_name));

    lc.advance(RequestState::CLASSIFYING);
    auto verdict = classifier_.validate_identifier(table_name);
    if (!verdict.allowed) {
        return reject<TableSchema>(lc, event, verdict.reason, std::move(verdict.detail));
    }

    const auto rl = rate_limiter_->check(client_id);
    if (!rl.allowed) {
        return rate_limited<TableSchema>(lc, event, rl);
    }

    lc.advance(RequestState::EXECUTING);
    auto result = executor_->describe_table(verdict.normalized_text);
    if (result.is_error()) {
        return execution_failed<TableSchema>(lc, event, result);
    }

    lc.advance(RequestState::SUCCEEDED);
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    event.row_count = result.value().columns.size();
    finish(lc, event);
    return result;
}

Result<std::vector<TableEntry>> Gatekeeper::list_tables(const std::string& client_id) {
    using R = Result<std::vector<TableEntry>>;
    std::shared_lock<std::shared_mutex> in_flight(lifecycle_mutex_);
    if (shut_down_.load(std::memory_order_acquire)) {
        return R::error(ErrorCategory::EXECUTION, "gatekeeper is shut down");
    }
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    RequestLifecycle lc(Request{client_id, Operation::LIST_TABLES, {},
                                RequestedLimit::none(), std::chrono::system_clock::now()});
    AuditEvent event = begin_event(lc, "*");

    // Nothing caller-supplied to classify
    lc.advance(RequestState::CLASSIFYING);

    const auto rl = rate_limiter_->check(client_id);
    if (!rl.allowed) {
        return rate_limited<std::vector<TableEntry>>(lc, event, rl);
    }

    lc.advance(RequestState::EXECUTING);
    auto result = executor_->list_tables(config_.limits.max_rows);
    if (result.is_error()) {
        return execution_failed<std::vector<TableEntry>>(lc, event, result);
    }

    lc.advance(RequestState::SUCCEEDED);
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    event.row_count = result.value().size();
    event.truncated = event.row_count == config_.limits.max_rows;
    finish(lc, event);
    return result;
}

} // namespace sqlgate
