#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief TOML configuration loader
 *
 * Supports `include = ["base.toml"]` (deep merge, the including file
 * wins, circular includes rejected) and `${VAR}` environment expansion in
 * every string value. Sections: [database], [limits], [complexity],
 * [validation], [rate_limiting], [audit], [logging].
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatekeeperConfig config;

        static LoadResult ok(GatekeeperConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gatekeeper.toml
     * @return LoadResult with parsed and validated config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Range checks; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatekeeperConfig& config);

    /**
     * @brief Non-fatal findings worth logging at startup
     *
     * Weak or short password, default user name, very long timeouts,
     * and ambient protections (rate limiting, hash chain, fsync) turned off.
     */
    [[nodiscard]] static std::vector<std::string> security_warnings(const GatekeeperConfig& config);

    /**
     * @brief libpq conninfo for the database section
     *
     * Returns connection_string unchanged when set; otherwise assembles
     * one from the discrete fields with every value quoted.
     */
    [[nodiscard]] static std::string build_conninfo(const DatabaseConfig& db);

    /// "secret-pw" -> "se*****pw"; values of 4 characters or fewer are fully masked
    [[nodiscard]] static std::string mask_sensitive_value(std::string_view value);

    /// Masks the value of every password= pair in a conninfo string
    [[nodiscard]] static std::string redact_conninfo(std::string_view conninfo);

private:
    static GatekeeperConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(GatekeeperConfig config);

    static DatabaseConfig extract_database(const toml::table& root);
    static LimitsConfig extract_limits(const toml::table& root);
    static ComplexityConfig extract_complexity(const toml::table& root);
    static ValidationConfig extract_validation(const toml::table& root);
    static RateLimitConfig extract_rate_limiting(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
};

} // namespace sqlgate
