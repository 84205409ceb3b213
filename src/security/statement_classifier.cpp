#include "security/statement_classifier.hpp"
#include "parser/ast_keys.hpp"
#include "parser/statement_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

namespace {

// Procedural block delimiters and anything that writes, locks or changes
// session state. END is absent on purpose: CASE ... END is a plain read.
const std::vector<std::string> kDeniedKeywords = {
    "INSERT", "UPDATE", "DELETE", "MERGE", "DROP", "ALTER", "CREATE",
    "TRUNCATE", "GRANT", "REVOKE", "CALL", "EXECUTE", "EXEC",
    "BEGIN", "DECLARE", "DO",
    "INTO", "COPY", "LOCK",
    "SET", "RESET", "VACUUM", "COMMIT", "ROLLBACK", "SAVEPOINT",
    "PREPARE", "LISTEN", "NOTIFY", "WAITFOR",
};

const std::vector<std::string> kDeniedFunctions = {
    // Sleep / resource exhaustion
    "PG_SLEEP", "PG_SLEEP_FOR", "PG_SLEEP_UNTIL",
    // Server filesystem
    "PG_READ_FILE", "PG_READ_BINARY_FILE", "PG_LS_DIR", "PG_STAT_FILE",
    "LO_IMPORT", "LO_EXPORT", "LO_UNLINK", "LO_CREATE", "LO_PUT", "LO_FROM_BYTEA",
    // Remote execution
    "DBLINK", "DBLINK_EXEC", "DBLINK_CONNECT",
    // Session / server control
    "SET_CONFIG", "PG_TERMINATE_BACKEND", "PG_CANCEL_BACKEND",
    "PG_RELOAD_CONF", "PG_ROTATE_LOGFILE",
    "PG_CREATE_RESTORE_POINT", "PG_SWITCH_WAL", "PG_PROMOTE",
    // Functions with write side effects
    "NEXTVAL", "SETVAL", "TXID_CURRENT",
    "PG_ADVISORY_LOCK", "PG_ADVISORY_XACT_LOCK", "PG_TRY_ADVISORY_LOCK",
    "PG_NOTIFY", "PG_LOGICAL_EMIT_MESSAGE",
    "PG_CREATE_LOGICAL_REPLICATION_SLOT", "PG_CREATE_PHYSICAL_REPLICATION_SLOT",
    "PG_DROP_REPLICATION_SLOT",
    // Arbitrary-query wrappers
    "QUERY_TO_XML", "QUERY_TO_XML_AND_XMLSCHEMA", "CURSOR_TO_XML",
    // Other dialects' escalation primitives
    "LOAD_FILE", "SYS_CONTEXT", "EXTRACTVALUE", "JAVA_CALL",
};

// System package prefixes (Oracle-style privilege escalation)
constexpr std::string_view kDeniedPackagePrefixes[] = {"DBMS_", "UTL_"};

// FOR UPDATE / FOR SHARE / FOR NO KEY UPDATE / FOR KEY SHARE
bool is_locking_for(const std::vector<SqlToken>& tokens, size_t i) {
    if (!tokens[i].is_word("FOR") || i + 1 >= tokens.size()) return false;
    const auto& next = tokens[i + 1];
    return next.is_word("SHARE") || next.is_word("KEY") || next.is_word("NO");
}

// Name as written, without the surrounding double quotes
std::string bare_name(const SqlToken& tok) {
    if (tok.kind == TokenKind::QUOTED_IDENT && tok.text.size() >= 2) {
        return utils::to_upper(std::string_view(tok.text).substr(1, tok.text.size() - 2));
    }
    return tok.upper;
}

bool is_identifier_char(char c, bool first) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_') return true;
    if (first) return false;
    return (c >= '0' && c <= '9') || c == '$' || c == '#';
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

StatementClassifier::StatementClassifier(const ValidationConfig& config)
    : denied_keywords_(kDeniedKeywords.begin(), kDeniedKeywords.end()),
      denied_functions_(kDeniedFunctions.begin(), kDeniedFunctions.end()),
      max_identifier_length_(config.max_identifier_length) {

    for (const auto& kw : config.extra_denied_keywords) {
        denied_keywords_.insert(utils::to_upper(utils::trim(kw)));
    }
    for (const auto& fn : config.extra_denied_functions) {
        denied_functions_.insert(utils::to_upper(utils::trim(fn)));
    }
    denied_identifier_prefixes_.reserve(config.denied_identifier_prefixes.size());
    for (const auto& p : config.denied_identifier_prefixes) {
        if (!p.empty()) denied_identifier_prefixes_.emplace_back(p);
    }
}

// ============================================================================
// classify
// ============================================================================

ValidationVerdict StatementClassifier::classify(std::string_view raw_text) const {
    auto lexed = SqlLexer::tokenize(raw_text);
    if (!lexed.success) {
        return ValidationVerdict::reject(ReasonCode::NOT_SELECT,
            std::format("cannot tokenize statement: {}", lexed.error_message));
    }

    auto& tokens = lexed.tokens;
    if (tokens.empty()) {
        return ValidationVerdict::reject(ReasonCode::NOT_SELECT, "empty statement");
    }

    // One trailing terminator is tolerated
    if (tokens.back().kind == TokenKind::SEMICOLON) {
        tokens.pop_back();
        if (tokens.empty()) {
            return ValidationVerdict::reject(ReasonCode::NOT_SELECT, "empty statement");
        }
    }

    std::string normalized = SqlLexer::render(tokens, false);

    if (!tokens.front().is_word("SELECT")) {
        return ValidationVerdict::reject(ReasonCode::NOT_SELECT,
            std::format("statement must start with SELECT, found '{}'", tokens.front().text),
            std::move(normalized));
    }

    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::SEMICOLON) {
            return ValidationVerdict::reject(ReasonCode::STACKED_STATEMENT,
                std::format("statement terminator at offset {} followed by more input",
                            tok.offset),
                std::move(normalized));
        }
    }

    auto verdict = check_tokens(tokens, normalized);
    if (!verdict.allowed) {
        return verdict;
    }

    return check_shape(raw_text, std::move(normalized));
}

ValidationVerdict StatementClassifier::check_tokens(const std::vector<SqlToken>& tokens,
                                                    std::string normalized) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];

        if (tok.kind == TokenKind::DOLLAR_STRING) {
            return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                "dollar-quoted body", std::move(normalized));
        }

        if (tok.kind == TokenKind::WORD) {
            if (denied_keywords_.contains(tok.upper)) {
                return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                    std::format("keyword {}", tok.upper), std::move(normalized));
            }
            if (is_locking_for(tokens, i)) {
                return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                    std::format("locking clause FOR {}", tokens[i + 1].upper),
                    std::move(normalized));
            }
            for (const auto prefix : kDeniedPackagePrefixes) {
                if (tok.upper.starts_with(prefix)) {
                    return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                        std::format("system package {}", tok.upper), std::move(normalized));
                }
            }
            if (tok.upper == "SYS" && i + 1 < tokens.size() &&
                tokens[i + 1].kind == TokenKind::DOT) {
                return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                    "system package SYS", std::move(normalized));
            }
        }

        // name( ... ), including schema-qualified and quoted names
        if ((tok.kind == TokenKind::WORD || tok.kind == TokenKind::QUOTED_IDENT) &&
            i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::LPAREN) {
            const auto name = bare_name(tok);
            if (is_denied_function(name)) {
                return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                    std::format("function {}", name), std::move(normalized));
            }
        }
    }
    return ValidationVerdict::ok(std::move(normalized));
}

ValidationVerdict StatementClassifier::check_shape(std::string_view raw_text,
                                                   std::string normalized) const {
    const auto shape = StatementParser::parse(std::string(raw_text));

    if (!shape.parsed) {
        return ValidationVerdict::reject(ReasonCode::NOT_SELECT,
            std::format("unparseable statement: {}", shape.error_message),
            std::move(normalized));
    }
    if (shape.statement_count != 1) {
        return ValidationVerdict::reject(ReasonCode::STACKED_STATEMENT,
            std::format("{} statements", shape.statement_count), std::move(normalized));
    }
    if (shape.statement_kind != ast::kSelectStmt) {
        return ValidationVerdict::reject(ReasonCode::NOT_SELECT,
            std::format("statement kind {}", shape.statement_kind), std::move(normalized));
    }
    if (shape.has_into) {
        return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
            "SELECT INTO", std::move(normalized));
    }
    if (shape.has_locking_clause) {
        return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
            "locking clause", std::move(normalized));
    }
    if (shape.has_write_node) {
        return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
            "data-modifying statement in query", std::move(normalized));
    }
    for (const auto& fn : shape.function_names) {
        if (is_denied_function(fn)) {
            return ValidationVerdict::reject(ReasonCode::FORBIDDEN_KEYWORD,
                std::format("function {}", fn), std::move(normalized));
        }
    }
    return ValidationVerdict::ok(std::move(normalized));
}

bool StatementClassifier::is_denied_function(const std::string& upper_name) const {
    if (denied_functions_.contains(upper_name)) return true;
    return std::any_of(std::begin(kDeniedPackagePrefixes), std::end(kDeniedPackagePrefixes),
        [&](std::string_view p) { return upper_name.starts_with(p); });
}

// ============================================================================
// Identifiers
// ============================================================================

ValidationVerdict StatementClassifier::validate_identifier(std::string_view name) const {
    if (name.empty()) {
        return ValidationVerdict::reject(ReasonCode::INVALID_IDENTIFIER, "empty identifier");
    }
    if (name.size() > max_identifier_length_) {
        return ValidationVerdict::reject(ReasonCode::INVALID_IDENTIFIER,
            std::format("identifier longer than {} characters", max_identifier_length_));
    }
    for (size_t i = 0; i < name.size(); ++i) {
        if (!is_identifier_char(name[i], i == 0)) {
            return ValidationVerdict::reject(ReasonCode::INVALID_IDENTIFIER,
                std::format("invalid character at position {}", i));
        }
    }
    for (const auto& prefix : denied_identifier_prefixes_) {
        if (utils::starts_with_icase(name, prefix)) {
            return ValidationVerdict::reject(ReasonCode::INVALID_IDENTIFIER,
                std::format("system catalog prefix '{}'", prefix));
        }
    }
    return ValidationVerdict::ok(std::string(name));
}

// ============================================================================
// Rendering helpers
// ============================================================================

std::string StatementClassifier::redact(std::string_view raw_text) {
    const auto lexed = SqlLexer::tokenize(raw_text);
    if (!lexed.success) {
        return std::format("<unlexable: {} bytes>", raw_text.size());
    }
    return SqlLexer::render(lexed.tokens, true);
}

std::string StatementClassifier::executable_text(std::string_view raw_text) {
    const auto lexed = SqlLexer::tokenize(raw_text);
    if (lexed.success && !lexed.tokens.empty() &&
        lexed.tokens.back().kind == TokenKind::SEMICOLON) {
        return std::string(raw_text.substr(0, lexed.tokens.back().offset));
    }
    return std::string(raw_text);
}

} // namespace sqlgate
