#include "server/line_protocol.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <limits>

namespace sqlgate {

namespace {

using json = nlohmann::json;

json error_body(const GatekeeperError& err) {
    json e = {
        {"code", err.code()},
        {"category", error_category_to_string(err.category)},
        {"message", err.message},
    };
    if (err.category == ErrorCategory::VALIDATION) {
        e["reason"] = reason_code_to_string(err.reason);
    }
    if (err.category == ErrorCategory::RATE_LIMIT) {
        e["retry_after_ms"] = err.retry_after.count();
        if (err.blocked_until) {
            e["blocked_until"] = utils::format_timestamp(*err.blocked_until);
        }
    }
    return e;
}

json bad_request(std::string message) {
    return {
        {"ok", false},
        {"error", {{"code", "BAD_REQUEST"}, {"message", std::move(message)}}},
    };
}

json cell_to_json(const Cell& cell) {
    return cell ? json(*cell) : json(nullptr);
}

std::string string_member(const json& request, const char* key) {
    const auto it = request.find(key);
    if (it == request.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

json query_payload(const QueryRows& rows) {
    json out = {{"ok", true}, {"columns", rows.columns}};
    json data = json::array();
    for (const auto& row : rows.rows) {
        json r = json::array();
        for (const auto& cell : row) {
            r.push_back(cell_to_json(cell));
        }
        data.push_back(std::move(r));
    }
    out["rows"] = std::move(data);
    out["row_count"] = rows.row_count;
    out["truncated"] = rows.truncated;
    return out;
}

json describe_payload(const TableSchema& schema) {
    json columns = json::array();
    for (const auto& col : schema.columns) {
        columns.push_back({
            {"name", col.name},
            {"type", col.type},
            {"nullable", col.nullable},
            {"position", col.position},
            {"default", col.default_value ? json(*col.default_value) : json(nullptr)},
        });
    }
    return {
        {"ok", true},
        {"table", schema.table_name},
        {"schema", schema.schema_name},
        {"columns", std::move(columns)},
    };
}

json tables_payload(const std::vector<TableEntry>& tables) {
    json list = json::array();
    for (const auto& t : tables) {
        list.push_back({{"schema", t.schema_name}, {"name", t.table_name}, {"type", t.table_type}});
    }
    return {{"ok", true}, {"tables", std::move(list)}};
}

json status_payload(const ClientRateStatus& status) {
    json out = {
        {"ok", true},
        {"known", status.known},
        {"count", status.count},
        {"limit", status.limit},
        {"window_remaining_ms", status.window_remaining.count()},
    };
    out["blocked_until"] = status.blocked_until
        ? json(utils::format_timestamp(*status.blocked_until))
        : json(nullptr);
    return out;
}

template <typename T, typename F>
json respond(const Result<T>& result, F&& payload) {
    if (result.is_error()) {
        return {{"ok", false}, {"error", error_body(result.error())}};
    }
    return payload(result.value());
}

} // anonymous namespace

RequestedLimit LineProtocolHandler::limit_from_json(const json& request) {
    const auto it = request.find("limit");
    if (it == request.end() || it->is_null()) {
        return RequestedLimit::none();
    }
    if (it->is_number_integer() && !it->is_number_unsigned()) {
        return RequestedLimit::of(it->get<int64_t>());
    }
    if (it->is_number_unsigned()) {
        const auto v = it->get<uint64_t>();
        if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return RequestedLimit::of(static_cast<int64_t>(v));
        }
    }
    return RequestedLimit::invalid(it->dump());
}

json LineProtocolHandler::dispatch(const json& request) {
    const std::string op = string_member(request, "op");
    const std::string client_id = string_member(request, "client_id");

    if (op.empty()) {
        return bad_request("missing \"op\"");
    }
    if (client_id.empty()) {
        return bad_request("missing \"client_id\"");
    }

    if (op == "query") {
        const auto statement = string_member(request, "statement");
        return respond(gatekeeper_.execute_query(client_id, statement, limit_from_json(request)),
                       query_payload);
    }
    if (op == "describe") {
        const auto table = string_member(request, "table");
        return respond(gatekeeper_.describe_table(client_id, table), describe_payload);
    }
    if (op == "list_tables") {
        return respond(gatekeeper_.list_tables(client_id), tables_payload);
    }
    if (op == "rate_limit_status") {
        return status_payload(gatekeeper_.rate_limit_status(client_id));
    }
    return bad_request(std::format("unknown op \"{}\"", op));
}

std::string LineProtocolHandler::handle_line(std::string_view line) {
    json request = json::parse(line, nullptr, /*allow_exceptions=*/false);
    json response;

    if (request.is_discarded() || !request.is_object()) {
        utils::log::warn("Discarding request line that is not a JSON object");
        response = bad_request("request must be a JSON object");
    } else {
        response = dispatch(request);
        if (const auto it = request.find("id"); it != request.end()) {
            response["id"] = *it;
        }
    }
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace sqlgate
