#include "parser/statement_parser.hpp"
#include "parser/ast_keys.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include <pg_query.h>
}

#include <nlohmann/json.hpp>

#include <format>

using json = nlohmann::json;

namespace sqlgate {

namespace {

// Last element of funcname: [{"String":{"sval":"pg_catalog"}},{"String":{"sval":"pg_sleep"}}]
std::string function_name(const json& funccall) {
    const auto it = funccall.find(std::string(ast::kFuncname));
    if (it == funccall.end() || !it->is_array() || it->empty()) {
        return {};
    }
    const json& last = it->back();
    const auto str = last.find(std::string(ast::kString));
    if (str == last.end() || !str->is_object()) {
        return {};
    }
    for (const auto key : {ast::kSval, ast::kStr}) {
        const auto v = str->find(std::string(key));
        if (v != str->end() && v->is_string()) {
            return utils::to_upper(v->get<std::string>());
        }
    }
    return {};
}

bool is_write_node(const std::string& key) {
    for (const auto w : ast::kWriteNodes) {
        if (key == w) return true;
    }
    return false;
}

// Recursive walk over every object and array in the tree
void walk(const json& node, StatementShape& shape) {
    if (node.is_array()) {
        for (const auto& child : node) {
            walk(child, shape);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == ast::kIntoClause && !value.is_null()) {
            shape.has_into = true;
        } else if (key == ast::kLockingClause && !value.is_null()) {
            shape.has_locking_clause = true;
        } else if (is_write_node(key)) {
            shape.has_write_node = true;
        } else if (key == ast::kFuncCall && value.is_object()) {
            auto name = function_name(value);
            if (!name.empty()) {
                shape.function_names.emplace_back(std::move(name));
            }
        }
        walk(value, shape);
    }
}

} // anonymous namespace

StatementShape StatementParser::parse(const std::string& sql) {
    StatementShape shape;

    PgQueryParseResult parse_result = pg_query_parse(sql.c_str());

    if (parse_result.error) {
        shape.error_message = parse_result.error->message
            ? parse_result.error->message
            : std::string(ast::kUnknownParseError);
        pg_query_free_parse_result(parse_result);
        return shape;
    }

    json root;
    try {
        root = json::parse(parse_result.parse_tree ? parse_result.parse_tree : "{}");
    } catch (const json::parse_error& e) {
        pg_query_free_parse_result(parse_result);
        shape.error_message = std::format("Malformed parse tree: {}", e.what());
        return shape;
    }
    pg_query_free_parse_result(parse_result);

    const auto stmts = root.find(std::string(ast::kStmts));
    if (stmts == root.end() || !stmts->is_array() || stmts->empty()) {
        shape.error_message = "No statement found";
        return shape;
    }

    shape.statement_count = stmts->size();

    const json& first = (*stmts)[0];
    const auto stmt = first.find(std::string(ast::kStmt));
    if (stmt != first.end() && stmt->is_object() && !stmt->empty()) {
        shape.statement_kind = stmt->begin().key();
    }

    walk(*stmts, shape);
    shape.parsed = true;
    return shape;
}

} // namespace sqlgate
