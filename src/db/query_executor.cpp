#include "db/query_executor.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <system_error>
#include <format>

namespace sqlgate {

namespace {

// information_schema.columns result layout
enum DescribeColumn : size_t {
    COL_SCHEMA = 0,
    COL_TABLE,
    COL_NAME,
    COL_TYPE,
    COL_NULLABLE,
    COL_POSITION,
    COL_DEFAULT,
    COL_COUNT
};

int parse_int(const Cell& cell) {
    int v = 0;
    if (!cell) return 0;
    const auto [ptr, ec] = std::from_chars(cell->data(), cell->data() + cell->size(), v);
    return ec == std::errc{} ? v : 0;
}

} // anonymous namespace

QueryExecutor::QueryExecutor(std::shared_ptr<ConnectionPool> pool,
                             std::chrono::milliseconds checkout_timeout)
    : pool_(std::move(pool)),
      checkout_timeout_(checkout_timeout) {}

// ============================================================================
// SQL builders
// ============================================================================

std::string QueryExecutor::bounded_sql(const std::string& sql, size_t limit) {
    // Newlines keep a trailing line comment in the caller's text from
    // swallowing the closing parenthesis
    return std::format("SELECT * FROM (\n{}\n) AS sqlgate_bounded LIMIT {}", sql, limit);
}

std::string QueryExecutor::describe_sql(std::string_view identifier) {
    // identifier has passed validate_identifier: [A-Za-z_][A-Za-z0-9_$#]*
    return std::format(
        "SELECT c.table_schema, c.table_name, c.column_name, "
        "CASE WHEN c.data_type IN ('USER-DEFINED', 'ARRAY') "
        "THEN c.udt_name::text ELSE c.data_type::text END, "
        "c.is_nullable, c.ordinal_position, c.column_default "
        "FROM information_schema.columns c "
        "WHERE lower(c.table_name) = lower('{0}') "
        "AND c.table_schema::name = ANY (current_schemas(false)) "
        "ORDER BY array_position(current_schemas(false), c.table_schema::name), "
        "(c.table_name <> '{0}'), c.table_name, c.ordinal_position",
        identifier);
}

std::string QueryExecutor::list_tables_sql(size_t max_rows) {
    return std::format(
        "SELECT table_schema, table_name, table_type "
        "FROM information_schema.tables "
        "WHERE table_schema NOT IN ('pg_catalog', 'information_schema') "
        "ORDER BY table_schema, table_name "
        "LIMIT {}",
        max_rows);
}

// ============================================================================
// Operations
// ============================================================================

Result<QueryRows> QueryExecutor::run_select(const std::string& sql, size_t limit) {
    auto db = run(bounded_sql(sql, limit), limit);
    if (db.is_error()) {
        return Result<QueryRows>::error(db.error());
    }

    auto& rs = db.value();
    QueryRows rows;
    rows.columns = std::move(rs.column_names);
    rows.rows = std::move(rs.rows);
    rows.row_count = rows.rows.size();
    rows.truncated = rows.row_count == limit;
    return Result<QueryRows>::ok(std::move(rows));
}

Result<TableSchema> QueryExecutor::describe_table(std::string_view identifier) {
    auto db = run(describe_sql(identifier), kMaxMetadataRows);
    if (db.is_error()) {
        return Result<TableSchema>::error(db.error());
    }

    const auto& rs = db.value();
    if (rs.rows.empty() || rs.rows.front().size() < COL_COUNT) {
        return Result<TableSchema>::error(ErrorCategory::EXECUTION,
            "table not found or no access");
    }

    TableSchema schema;
    schema.schema_name = rs.rows.front()[COL_SCHEMA].value_or("");
    schema.table_name = rs.rows.front()[COL_TABLE].value_or("");

    // First (schema, table) on the search path wins
    for (const auto& row : rs.rows) {
        if (row.size() < COL_COUNT ||
            row[COL_SCHEMA].value_or("") != schema.schema_name ||
            row[COL_TABLE].value_or("") != schema.table_name) {
            continue;
        }
        ColumnInfo col;
        col.name = row[COL_NAME].value_or("");
        col.type = row[COL_TYPE].value_or("");
        col.nullable = row[COL_NULLABLE].value_or("YES") == "YES";
        col.position = parse_int(row[COL_POSITION]);
        col.default_value = row[COL_DEFAULT];
        schema.columns.push_back(std::move(col));
    }
    return Result<TableSchema>::ok(std::move(schema));
}

Result<std::vector<TableEntry>> QueryExecutor::list_tables(size_t max_rows) {
    auto db = run(list_tables_sql(max_rows), max_rows);
    if (db.is_error()) {
        return Result<std::vector<TableEntry>>::error(db.error());
    }

    std::vector<TableEntry> tables;
    tables.reserve(db.value().rows.size());
    for (const auto& row : db.value().rows) {
        if (row.size() < 3) continue;
        tables.push_back(TableEntry{
            row[0].value_or(""), row[1].value_or(""), row[2].value_or("")});
    }
    return Result<std::vector<TableEntry>>::ok(std::move(tables));
}

QueryExecutor::Stats QueryExecutor::get_stats() const {
    return Stats{
        .executions = executions_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
        .timeouts = timeouts_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Execution
// ============================================================================

Result<DbResultSet> QueryExecutor::run(const std::string& sql, size_t max_rows) {
    auto checkout = pool_->checkout(checkout_timeout_);
    if (checkout.is_error()) {
        return Result<DbResultSet>::error(checkout.error());
    }

    PooledConnection conn = std::move(checkout.value());
    executions_.fetch_add(1, std::memory_order_relaxed);

    auto rs = conn->execute(sql, max_rows);

    if (rs.timed_out) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        conn.release(false);
        return Result<DbResultSet>::error(ErrorCategory::QUERY_TIMEOUT,
            std::format("statement cancelled after {}ms", pool_->config().query_timeout.count()));
    }

    if (!rs.success) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        conn.release(!rs.connection_broken);
        utils::log::warn(std::format("Statement failed (sqlstate={}): {}",
            rs.sqlstate.empty() ? "-" : rs.sqlstate, rs.error_message));
        return Result<DbResultSet>::error(ErrorCategory::EXECUTION,
            rs.error_message.empty() ? std::string("database error") : rs.error_message);
    }

    conn.release(true);
    return Result<DbResultSet>::ok(std::move(rs));
}

} // namespace sqlgate
