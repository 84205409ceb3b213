#include "security/complexity_guard.hpp"
#include "parser/sql_lexer.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace sqlgate {

bool ComplexityGuard::measure(std::string_view text, Measurements& out) {
    out = Measurements{};
    out.length = text.size();

    const auto lexed = SqlLexer::tokenize(text);
    if (!lexed.success) {
        return false;
    }
    const auto& tokens = lexed.tokens;

    // One entry per open paren: true when it opens a subquery
    std::vector<bool> parens;
    size_t subquery_levels = 0;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        switch (tok.kind) {
            case TokenKind::LPAREN: {
                const bool subquery = i + 1 < tokens.size() &&
                    (tokens[i + 1].is_word("SELECT") || tokens[i + 1].is_word("WITH"));
                parens.push_back(subquery);
                if (subquery) {
                    ++subquery_levels;
                    out.nesting_depth = std::max(out.nesting_depth, subquery_levels);
                }
                break;
            }
            case TokenKind::RPAREN:
                if (!parens.empty()) {
                    if (parens.back()) --subquery_levels;
                    parens.pop_back();
                }
                break;
            case TokenKind::WORD:
                if (tok.upper == "JOIN") {
                    ++out.joins;
                } else if (tok.upper == "UNION" || tok.upper == "INTERSECT" ||
                           tok.upper == "EXCEPT") {
                    ++out.union_branches;
                }
                break;
            default:
                break;
        }
    }
    return true;
}

ValidationVerdict ComplexityGuard::check(std::string_view normalized_text) const {
    std::string text(normalized_text);

    if (normalized_text.size() > config_.max_length) {
        return ValidationVerdict::reject(ReasonCode::TOO_COMPLEX,
            std::format("length {} exceeds max_length {}",
                        normalized_text.size(), config_.max_length),
            std::move(text));
    }

    Measurements m;
    if (!measure(normalized_text, m)) {
        return ValidationVerdict::reject(ReasonCode::TOO_COMPLEX,
            "statement cannot be measured", std::move(text));
    }

    if (m.joins > config_.max_joins) {
        return ValidationVerdict::reject(ReasonCode::TOO_COMPLEX,
            std::format("{} joins exceed max_joins {}", m.joins, config_.max_joins),
            std::move(text));
    }
    if (m.nesting_depth > config_.max_nesting_depth) {
        return ValidationVerdict::reject(ReasonCode::TOO_COMPLEX,
            std::format("nesting depth {} exceeds max_nesting_depth {}",
                        m.nesting_depth, config_.max_nesting_depth),
            std::move(text));
    }
    if (m.union_branches > config_.max_union_branches) {
        return ValidationVerdict::reject(ReasonCode::TOO_COMPLEX,
            std::format("{} set-operation branches exceed max_union_branches {}",
                        m.union_branches, config_.max_union_branches),
            std::move(text));
    }

    return ValidationVerdict::ok(std::move(text));
}

} // namespace sqlgate
