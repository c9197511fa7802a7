#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace hookrelay {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads relay.toml into a RelayConfig
 *
 * String values may reference ${ENV_VAR}. A top-level `include` (string or
 * array) pulls in other files relative to the including file; the including
 * file wins on conflicts and arrays of tables are concatenated.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RelayConfig config;

        static LoadResult ok(RelayConfig cfg) {
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
     * @param config_path Path to relay.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return Every violation found, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RelayConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static IdempotencyConfig extract_idempotency(const toml::table& root);
    static DeliveryConfig extract_delivery(const toml::table& root);
    static IncomingConfig extract_incoming(const toml::table& root);
    static std::vector<UserConfig> extract_users(const toml::table& root);

    static RelayConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RelayConfig config);
};

} // namespace hookrelay
