#pragma once

#include "core/gatekeeper.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief One JSON request per line in, one JSON response per line out
 *
 * Request:  {"id": any, "op": "query"|"describe"|"list_tables"|"rate_limit_status",
 *            "client_id": str, "statement": str, "limit": int, "table": str}
 * Response: {"id": ..., "ok": true, ...payload} or
 *           {"id": ..., "ok": false, "error": {"code", "category", "message", ...}}
 *
 * A line that is not a JSON object, or names an unknown op, gets a
 * BAD_REQUEST response and never reaches the Gatekeeper.
 */
class LineProtocolHandler {
public:
    explicit LineProtocolHandler(Gatekeeper& gatekeeper) : gatekeeper_(gatekeeper) {}

    /// Handle one request line; the result carries no trailing newline
    [[nodiscard]] std::string handle_line(std::string_view line);

    /**
     * @brief Map the JSON "limit" member to a RequestedLimit
     *
     * Missing or null is ABSENT; an integer in int64 range is INTEGER;
     * anything else (string, float, bool, huge unsigned) is INVALID with
     * its JSON text.
     */
    [[nodiscard]] static RequestedLimit limit_from_json(const nlohmann::json& request);

private:
    nlohmann::json dispatch(const nlohmann::json& request);

    Gatekeeper& gatekeeper_;
};

} // namespace sqlgate
