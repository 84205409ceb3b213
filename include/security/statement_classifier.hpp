#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "parser/sql_lexer.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sqlgate {

/**
 * @brief Allow-list-first read-only statement classifier
 *
 * A statement is accepted only if, in order:
 *   1. it lexes cleanly (quotes, comments, parentheses all closed),
 *   2. it is a single statement (one trailing ';' tolerated),
 *   3. its first token is SELECT,
 *   4. no deny-listed keyword, dollar-quoted body, system package or
 *      denied function appears at any depth,
 *   5. the PostgreSQL parser sees exactly one SelectStmt with no INTO,
 *      no locking clause and no write node anywhere in the tree.
 *
 * Anything that cannot be classified with confidence is rejected.
 * Classification never touches the database.
 */
class StatementClassifier {
public:
    StatementClassifier() : StatementClassifier(ValidationConfig{}) {}
    explicit StatementClassifier(const ValidationConfig& config);

    [[nodiscard]] ValidationVerdict classify(std::string_view raw_text) const;

    /**
     * @brief Validate a describeTable argument
     *
     * Must match [A-Za-z_][A-Za-z0-9_$#]* within max_identifier_length
     * and must not start with a denied system-catalog prefix.
     */
    [[nodiscard]] ValidationVerdict validate_identifier(std::string_view name) const;

    /// Single-line rendering with literals replaced by '?', for audit records
    [[nodiscard]] static std::string redact(std::string_view raw_text);

    /// Caller's text with one trailing ';' (and anything after it) removed
    [[nodiscard]] static std::string executable_text(std::string_view raw_text);

private:
    [[nodiscard]] ValidationVerdict check_tokens(const std::vector<SqlToken>& tokens,
                                                 std::string normalized) const;
    [[nodiscard]] ValidationVerdict check_shape(std::string_view raw_text,
                                                std::string normalized) const;
    [[nodiscard]] bool is_denied_function(const std::string& upper_name) const;

    std::unordered_set<std::string> denied_keywords_;
    std::unordered_set<std::string> denied_functions_;
    std::vector<std::string> denied_identifier_prefixes_;
    size_t max_identifier_length_;
};

} // namespace sqlgate
