#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

enum class TokenKind {
    WORD,            // unquoted identifier or keyword
    QUOTED_IDENT,    // "identifier"
    STRING,          // 'literal', E'literal', B'..', X'..'
    DOLLAR_STRING,   // $tag$ body $tag$
    NUMBER,
    PARAM,           // $1
    OPERATOR,
    LPAREN,
    RPAREN,
    COMMA,
    DOT,
    SEMICOLON
};

struct SqlToken {
    TokenKind kind;
    std::string text;    // original spelling
    std::string upper;   // upper-cased spelling (WORD only)
    size_t offset = 0;   // byte offset in the source
    int depth = 0;       // parenthesis depth the token sits at

    [[nodiscard]] bool is_word(std::string_view w) const {
        return kind == TokenKind::WORD && upper == w;
    }
};

/**
 * @brief Single-pass SQL tokenizer (PostgreSQL lexical rules)
 *
 * Comments are dropped. Block comments nest, as in PostgreSQL.
 * Standard strings treat backslash literally; E'' strings honour
 * backslash escapes. Any unterminated construct or unbalanced
 * parenthesis is a lexical error, so callers can fail closed.
 */
class SqlLexer {
public:
    struct LexResult {
        bool success = false;
        std::string error_message;
        std::vector<SqlToken> tokens;
    };

    [[nodiscard]] static LexResult tokenize(std::string_view sql);

    /**
     * @brief Re-render tokens on a single line
     * @param redact_literals Replace strings and numbers with '?'
     */
    [[nodiscard]] static std::string render(const std::vector<SqlToken>& tokens,
                                            bool redact_literals);

private:
    enum class State {
        NORMAL,
        IN_SINGLE_QUOTE,
        IN_DOUBLE_QUOTE,
        IN_DOLLAR_QUOTE,
        IN_BLOCK_COMMENT,
        IN_LINE_COMMENT
    };
};

} // namespace sqlgate
