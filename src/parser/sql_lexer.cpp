#include "parser/sql_lexer.hpp"

#include <cstdint>
#include <format>

namespace sqlgate {

// ============================================================================
// Character classification (locale-independent, one table load per byte)
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER = 0,
    CC_SPACE = 1,
    CC_DIGIT = 2,
    CC_ALPHA = 4,   // letters and bytes >= 0x80 (UTF-8 identifiers)
    CC_IDENT = 8,   // '_' and '$'
    CC_OP    = 16,
};

struct CharTable {
    uint8_t cls[256];

    constexpr CharTable() : cls{} {
        for (int i = 0; i < 256; ++i) cls[i] = CC_OTHER;
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE; cls['\n'] = CC_SPACE;
        cls['\r'] = CC_SPACE; cls['\f'] = CC_SPACE; cls['\v'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 0x80; i <= 0xFF; ++i) cls[i] = CC_ALPHA;
        cls['_'] = CC_IDENT;
        cls['$'] = CC_IDENT;
        for (const char c : std::string_view("+-*/<>=~!@#%^&|`?:[]")) {
            cls[static_cast<unsigned char>(c)] = CC_OP;
        }
    }
};

constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { return CT.cls[c] == CC_ALPHA || c == '_'; }
inline bool ct_ident_cont(unsigned char c)  {
    const auto v = CT.cls[c];
    return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT;
}
inline bool ct_op(unsigned char c)          { return CT.cls[c] == CC_OP; }

inline char upper_ascii(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
}

SqlLexer::LexResult failure(std::string message) {
    SqlLexer::LexResult r;
    r.success = false;
    r.error_message = std::move(message);
    return r;
}

} // anonymous namespace

// ============================================================================
// Tokenizer
// ============================================================================

SqlLexer::LexResult SqlLexer::tokenize(std::string_view sql) {
    LexResult result;
    auto& tokens = result.tokens;
    tokens.reserve(sql.size() / 4 + 1);

    State state = State::NORMAL;
    int depth = 0;
    int comment_depth = 0;
    bool escape_string = false;
    size_t start = 0;
    std::string_view dollar_tag;

    auto push = [&](TokenKind kind, size_t from, size_t to) {
        SqlToken tok{kind, std::string(sql.substr(from, to - from)), {}, from, depth};
        if (kind == TokenKind::WORD) {
            tok.upper.reserve(tok.text.size());
            for (const char ch : tok.text) tok.upper += upper_ascii(ch);
        }
        tokens.emplace_back(std::move(tok));
    };

    const size_t len = sql.size();
    size_t i = 0;
    while (i < len) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const auto next = (i + 1 < len) ? static_cast<unsigned char>(sql[i + 1]) : '\0';

        switch (state) {
            case State::NORMAL: {
                if (ct_space(c)) { ++i; break; }

                if (c == '-' && next == '-') {
                    state = State::IN_LINE_COMMENT;
                    i += 2;
                    break;
                }
                if (c == '/' && next == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    comment_depth = 1;
                    i += 2;
                    break;
                }
                if (c == '\'') {
                    state = State::IN_SINGLE_QUOTE;
                    escape_string = false;
                    start = i++;
                    break;
                }
                if (c == '"') {
                    state = State::IN_DOUBLE_QUOTE;
                    start = i++;
                    break;
                }

                if (c == '$') {
                    if (ct_digit(next)) {
                        size_t j = i + 1;
                        while (j < len && ct_digit(static_cast<unsigned char>(sql[j]))) ++j;
                        push(TokenKind::PARAM, i, j);
                        i = j;
                        break;
                    }
                    size_t j = i + 1;
                    if (j < len && ct_ident_start(static_cast<unsigned char>(sql[j]))) {
                        while (j < len && sql[j] != '$' &&
                               ct_ident_cont(static_cast<unsigned char>(sql[j]))) ++j;
                    }
                    if (j < len && sql[j] == '$') {
                        dollar_tag = sql.substr(i, j - i + 1);
                        state = State::IN_DOLLAR_QUOTE;
                        start = i;
                        i = j + 1;
                        break;
                    }
                    return failure(std::format("unexpected '$' at offset {}", i));
                }

                if (ct_digit(c) || (c == '.' && ct_digit(next))) {
                    size_t j = i;
                    while (j < len && (ct_digit(static_cast<unsigned char>(sql[j])) || sql[j] == '.')) ++j;
                    if (j < len && (sql[j] == 'e' || sql[j] == 'E')) {
                        size_t k = j + 1;
                        if (k < len && (sql[k] == '+' || sql[k] == '-')) ++k;
                        if (k < len && ct_digit(static_cast<unsigned char>(sql[k]))) {
                            while (k < len && ct_digit(static_cast<unsigned char>(sql[k]))) ++k;
                            j = k;
                        }
                    }
                    push(TokenKind::NUMBER, i, j);
                    i = j;
                    break;
                }

                if (ct_ident_start(c)) {
                    size_t j = i + 1;
                    while (j < len && ct_ident_cont(static_cast<unsigned char>(sql[j]))) ++j;

                    // Prefixed string constants: E'..', B'..', X'..', N'..'
                    if (j == i + 1 && j < len && sql[j] == '\'') {
                        const char p = upper_ascii(static_cast<char>(c));
                        if (p == 'E' || p == 'B' || p == 'X' || p == 'N') {
                            state = State::IN_SINGLE_QUOTE;
                            escape_string = (p == 'E');
                            start = i;
                            i = j + 1;
                            break;
                        }
                    }
                    push(TokenKind::WORD, i, j);
                    i = j;
                    break;
                }

                if (c == '(') {
                    push(TokenKind::LPAREN, i, i + 1);
                    ++depth;
                    ++i;
                    break;
                }
                if (c == ')') {
                    --depth;
                    if (depth < 0) {
                        return failure(std::format("unbalanced ')' at offset {}", i));
                    }
                    push(TokenKind::RPAREN, i, i + 1);
                    ++i;
                    break;
                }
                if (c == ',') { push(TokenKind::COMMA, i, i + 1); ++i; break; }
                if (c == '.') { push(TokenKind::DOT, i, i + 1); ++i; break; }
                if (c == ';') { push(TokenKind::SEMICOLON, i, i + 1); ++i; break; }

                if (ct_op(c)) {
                    size_t j = i + 1;
                    while (j < len && ct_op(static_cast<unsigned char>(sql[j]))) {
                        const char a = sql[j];
                        const char b = (j + 1 < len) ? sql[j + 1] : '\0';
                        if ((a == '-' && b == '-') || (a == '/' && b == '*')) break;
                        ++j;
                    }
                    push(TokenKind::OPERATOR, i, j);
                    i = j;
                    break;
                }

                return failure(std::format("unexpected character 0x{:02x} at offset {}",
                                           static_cast<unsigned>(c), i));
            }

            case State::IN_SINGLE_QUOTE:
                if (c == '\\' && escape_string) {
                    i += 2;
                } else if (c == '\'') {
                    if (next == '\'') {
                        i += 2;
                    } else {
                        push(TokenKind::STRING, start, i + 1);
                        state = State::NORMAL;
                        ++i;
                    }
                } else {
                    ++i;
                }
                break;

            case State::IN_DOUBLE_QUOTE:
                if (c == '"') {
                    if (next == '"') {
                        i += 2;
                    } else {
                        push(TokenKind::QUOTED_IDENT, start, i + 1);
                        state = State::NORMAL;
                        ++i;
                    }
                } else {
                    ++i;
                }
                break;

            case State::IN_DOLLAR_QUOTE:
                if (sql.substr(i, dollar_tag.size()) == dollar_tag) {
                    i += dollar_tag.size();
                    push(TokenKind::DOLLAR_STRING, start, i);
                    state = State::NORMAL;
                } else {
                    ++i;
                }
                break;

            case State::IN_BLOCK_COMMENT:
                if (c == '/' && next == '*') {
                    ++comment_depth;
                    i += 2;
                } else if (c == '*' && next == '/') {
                    --comment_depth;
                    i += 2;
                    if (comment_depth == 0) state = State::NORMAL;
                } else {
                    ++i;
                }
                break;

            case State::IN_LINE_COMMENT:
                if (c == '\n') state = State::NORMAL;
                ++i;
                break;
        }
    }

    switch (state) {
        case State::IN_SINGLE_QUOTE:  return failure("unterminated string literal");
        case State::IN_DOUBLE_QUOTE:  return failure("unterminated quoted identifier");
        case State::IN_DOLLAR_QUOTE:  return failure("unterminated dollar-quoted string");
        case State::IN_BLOCK_COMMENT: return failure("unterminated block comment");
        default: break;
    }
    if (depth != 0) {
        return failure("unbalanced '('");
    }

    result.success = true;
    return result;
}

// ============================================================================
// Rendering
// ============================================================================

std::string SqlLexer::render(const std::vector<SqlToken>& tokens, bool redact_literals) {
    std::string out;
    bool suppress_space = true;

    for (const auto& tok : tokens) {
        const bool tight_before = tok.kind == TokenKind::COMMA ||
                                  tok.kind == TokenKind::RPAREN ||
                                  tok.kind == TokenKind::DOT ||
                                  tok.kind == TokenKind::SEMICOLON;
        if (!suppress_space && !tight_before) {
            out += ' ';
        }

        switch (tok.kind) {
            case TokenKind::WORD:
                out += tok.upper;
                break;
            case TokenKind::STRING:
            case TokenKind::DOLLAR_STRING:
            case TokenKind::NUMBER:
                out += redact_literals ? std::string("?") : tok.text;
                break;
            default:
                out += tok.text;
                break;
        }

        suppress_space = tok.kind == TokenKind::LPAREN || tok.kind == TokenKind::DOT;
    }
    return out;
}

} // namespace sqlgate
