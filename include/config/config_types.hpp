#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlgate {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    // libpq conninfo; assembled from the discrete fields below when empty
    std::string connection_string;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string dbname;
    std::string user;
    std::string password;
    std::string application_name = "sql-gatekeeper";

    size_t min_connections = 2;
    size_t max_connections = 10;
    std::chrono::milliseconds checkout_timeout{5000};
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds query_timeout{30000};
    std::chrono::milliseconds idle_timeout{300000};   // 0 disables reaping
    std::chrono::milliseconds maintenance_interval{1000};
    std::string health_check_query = "SELECT 1";
    std::chrono::milliseconds health_check_after{10000};  // idle longer than this is probed before reuse
};

struct LimitsConfig {
    size_t max_rows = 1000;        // server-enforced ceiling
    size_t default_rows = 100;     // used when the caller gives no limit
};

struct ComplexityConfig {
    size_t max_length = 5000;
    size_t max_joins = 10;
    size_t max_nesting_depth = 5;
    size_t max_union_branches = 5;
};

struct ValidationConfig {
    size_t max_identifier_length = 128;
    std::vector<std::string> extra_denied_keywords;
    std::vector<std::string> extra_denied_functions;
    std::vector<std::string> denied_identifier_prefixes = {"pg_", "information_schema"};
};

struct RateLimitConfig {
    bool enabled = true;
    uint32_t max_requests = 100;
    std::chrono::milliseconds window{60000};
    std::chrono::seconds idle_eviction{600};
};

struct AuditConfig {
    std::string output_file = "audit.jsonl";
    std::chrono::milliseconds batch_flush_interval{100};
    bool integrity_enabled = true;
    bool fsync_on_flush = true;
};

struct LoggingConfig {
    std::string level = "info";
};

struct GatekeeperConfig {
    DatabaseConfig database;
    LimitsConfig limits;
    ComplexityConfig complexity;
    ValidationConfig validation;
    RateLimitConfig rate_limiting;
    AuditConfig audit;
    LoggingConfig logging;
};

} // namespace sqlgate
