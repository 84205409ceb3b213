#pragma once

#include <string_view>

namespace sqlgate::ast {

// libpg_query JSON node types and fields
inline constexpr std::string_view kStmts          = "stmts";
inline constexpr std::string_view kStmt           = "stmt";
inline constexpr std::string_view kSelectStmt     = "SelectStmt";
inline constexpr std::string_view kIntoClause     = "intoClause";
inline constexpr std::string_view kLockingClause  = "lockingClause";
inline constexpr std::string_view kFuncCall       = "FuncCall";
inline constexpr std::string_view kFuncname       = "funcname";
inline constexpr std::string_view kString         = "String";
inline constexpr std::string_view kSval           = "sval";   // libpg_query >= 15
inline constexpr std::string_view kStr            = "str";    // older releases

// Statements that write, found anywhere in the tree (data-modifying CTEs)
inline constexpr std::string_view kWriteNodes[] = {
    "InsertStmt", "UpdateStmt", "DeleteStmt", "MergeStmt"
};

inline constexpr std::string_view kUnknownParseError = "Unknown parse error";

} // namespace sqlgate::ast
