#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sqlgate {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Operation {
    QUERY,
    DESCRIBE,
    LIST_TABLES
};

/**
 * @brief Verdict reason codes produced by validation
 *
 * INVALID_LIMIT is raised before classification (row-limit argument),
 * TOO_COMPLEX by the complexity guard; the rest by the classifier.
 */
enum class ReasonCode {
    OK,
    NOT_SELECT,
    STACKED_STATEMENT,
    FORBIDDEN_KEYWORD,
    INVALID_IDENTIFIER,
    TOO_COMPLEX,
    INVALID_LIMIT
};

/**
 * @brief Per-request lifecycle states
 *
 * RECEIVED -> CLASSIFYING -> (REJECTED | RATE_LIMITED | EXECUTING)
 *          -> (SUCCEEDED | FAILED | TIMED_OUT) -> AUDITED -> DONE
 */
enum class RequestState {
    RECEIVED,
    CLASSIFYING,
    REJECTED,
    RATE_LIMITED,
    EXECUTING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    AUDITED,
    DONE
};

/**
 * @brief Stable machine-readable outcome written to the audit trail
 */
enum class Outcome {
    OK,
    REJECTED,
    RATE_LIMITED,
    QUERY_TIMEOUT,
    POOL_EXHAUSTED,
    EXECUTION_ERROR
};

// ============================================================================
// Request
// ============================================================================

/**
 * @brief Caller-supplied row limit, validated before classification
 *
 * A transport hands over whatever it received: nothing, an integer, or
 * the raw text of a value that was not an integer ("all", 1.5, ...).
 */
struct RequestedLimit {
    enum class Kind { ABSENT, INTEGER, INVALID };

    Kind kind = Kind::ABSENT;
    int64_t value = 0;
    std::string raw;

    [[nodiscard]] static RequestedLimit none() { return {}; }

    [[nodiscard]] static RequestedLimit of(int64_t v) {
        RequestedLimit l;
        l.kind = Kind::INTEGER;
        l.value = v;
        l.raw = std::to_string(v);
        return l;
    }

    [[nodiscard]] static RequestedLimit invalid(std::string raw_text) {
        RequestedLimit l;
        l.kind = Kind::INVALID;
        l.raw = std::move(raw_text);
        return l;
    }

    [[nodiscard]] bool is_valid() const {
        return kind == Kind::ABSENT || (kind == Kind::INTEGER && value >= 0);
    }
};

struct Request {
    std::string client_id;
    Operation operation = Operation::QUERY;
    std::string raw_text;
    RequestedLimit requested_limit;
    std::chrono::system_clock::time_point received_at;
};

// ============================================================================
// Validation
// ============================================================================

struct ValidationVerdict {
    bool allowed = false;
    ReasonCode reason = ReasonCode::NOT_SELECT;
    std::string normalized_text;
    std::string detail;

    [[nodiscard]] static ValidationVerdict ok(std::string normalized) {
        return {true, ReasonCode::OK, std::move(normalized), {}};
    }

    [[nodiscard]] static ValidationVerdict reject(ReasonCode reason, std::string detail,
                                                  std::string normalized = {}) {
        return {false, reason, std::move(normalized), std::move(detail)};
    }
};

// ============================================================================
// Results
// ============================================================================

using Cell = std::optional<std::string>;   // nullopt == SQL NULL
using Row = std::vector<Cell>;

struct QueryRows {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    size_t row_count = 0;
    bool truncated = false;
};

struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
    int position = 0;
    std::optional<std::string> default_value;
};

struct TableSchema {
    std::string table_name;
    std::string schema_name;
    std::vector<ColumnInfo> columns;
};

struct TableEntry {
    std::string schema_name;
    std::string table_name;
    std::string table_type;
};

// ============================================================================
// Audit
// ============================================================================

struct AuditEvent {
    std::string audit_id;
    uint64_t sequence_num = 0;

    std::string client_id;
    Operation operation = Operation::QUERY;
    std::string subject;                 // redacted statement or table name
    std::string requested_limit;         // raw text, empty if absent

    ReasonCode reason = ReasonCode::OK;
    Outcome outcome = Outcome::OK;
    RequestState final_state = RequestState::RECEIVED;

    size_t row_count = 0;
    bool truncated = false;
    std::string error_message;           // execution-stage failures only

    std::chrono::system_clock::time_point received_at;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::microseconds duration{0};

    // Hash chain (filled by the writer thread)
    std::string record_hash;
    std::string previous_hash;
};

// ============================================================================
// String conversions
// ============================================================================

inline const char* operation_to_string(Operation op) {
    switch (op) {
        case Operation::QUERY:       return "QUERY";
        case Operation::DESCRIBE:    return "DESCRIBE";
        case Operation::LIST_TABLES: return "LIST_TABLES";
        default: return "UNKNOWN";
    }
}

inline const char* reason_code_to_string(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::OK:                 return "OK";
        case ReasonCode::NOT_SELECT:         return "NOT_SELECT";
        case ReasonCode::STACKED_STATEMENT:  return "STACKED_STATEMENT";
        case ReasonCode::FORBIDDEN_KEYWORD:  return "FORBIDDEN_KEYWORD";
        case ReasonCode::INVALID_IDENTIFIER: return "INVALID_IDENTIFIER";
        case ReasonCode::TOO_COMPLEX:        return "TOO_COMPLEX";
        case ReasonCode::INVALID_LIMIT:      return "INVALID_LIMIT";
        default: return "UNKNOWN";
    }
}

inline const char* request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::RECEIVED:     return "RECEIVED";
        case RequestState::CLASSIFYING:  return "CLASSIFYING";
        case RequestState::REJECTED:     return "REJECTED";
        case RequestState::RATE_LIMITED: return "RATE_LIMITED";
        case RequestState::EXECUTING:    return "EXECUTING";
        case RequestState::SUCCEEDED:    return "SUCCEEDED";
        case RequestState::FAILED:       return "FAILED";
        case RequestState::TIMED_OUT:    return "TIMED_OUT";
        case RequestState::AUDITED:      return "AUDITED";
        case RequestState::DONE:         return "DONE";
        default: return "UNKNOWN";
    }
}

inline const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::OK:              return "OK";
        case Outcome::REJECTED:        return "REJECTED";
        case Outcome::RATE_LIMITED:    return "RATE_LIMITED";
        case Outcome::QUERY_TIMEOUT:   return "QUERY_TIMEOUT";
        case Outcome::POOL_EXHAUSTED:  return "POOL_EXHAUSTED";
        case Outcome::EXECUTION_ERROR: return "EXECUTION_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Stable outcome code, e.g. "OK", "REJECTED:FORBIDDEN_KEYWORD"
 */
inline std::string outcome_code(Outcome outcome, ReasonCode reason) {
    if (outcome == Outcome::REJECTED) {
        return std::string("REJECTED:") + reason_code_to_string(reason);
    }
    return outcome_to_string(outcome);
}

} // namespace sqlgate
