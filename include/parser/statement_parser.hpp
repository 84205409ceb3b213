#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Lightweight statement-shape model produced from the PostgreSQL grammar
 *
 * Only the facts the classifier needs: how many statements, what kind
 * the first one is, and whether anything in the tree writes or locks.
 */
struct StatementShape {
    bool parsed = false;
    std::string error_message;

    size_t statement_count = 0;
    std::string statement_kind;          // e.g. "SelectStmt"

    bool has_into = false;               // SELECT ... INTO creates a table
    bool has_locking_clause = false;     // FOR UPDATE / FOR SHARE
    bool has_write_node = false;         // INSERT/UPDATE/DELETE/MERGE anywhere

    std::vector<std::string> function_names;  // upper-case, unqualified
};

/**
 * @brief libpg_query wrapper
 *
 * Parses with the real PostgreSQL parser and walks the JSON tree.
 * A parse failure leaves parsed == false; callers treat it as a rejection.
 */
class StatementParser {
public:
    [[nodiscard]] static StatementShape parse(const std::string& sql);
};

} // namespace sqlgate
