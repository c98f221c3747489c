#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlgate {

// ============================================================================
// Section Configs (mirror the TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 8;
    size_t max_sql_length = 102400;
};

struct RemoteConfig {
    std::string base_url = "https://api.cloudflare.com";
    std::string api_prefix = "/client/v4";
    int timeout_ms = 30000;
};

struct CacheConfig {
    bool enabled = true;
    std::chrono::seconds ttl{300};
    size_t max_entries = 5000;
    size_t num_shards = 16;
};

/// Empty vectors mean "use the built-in defaults"
struct ClassifierConfig {
    std::vector<std::string> signatures;
    std::vector<std::vector<std::string>> conjunctions;
};

struct BrowseConfig {
    int64_t default_limit = 50;
    int64_t max_limit = 100;
};

struct LoggingConfig {
    std::string level = "info";     // info | warn | error
};

/// Optional credential installed as the active one at startup
struct BootstrapCredential {
    std::string name;
    std::string account_id;
    std::string api_token;
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    ServerConfig server;
    RemoteConfig remote;
    CacheConfig cache;
    ClassifierConfig classifier;
    BrowseConfig browse;
    LoggingConfig logging;
    std::optional<BootstrapCredential> credential;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
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
     * @param config_path Path to sqlgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// ${VAR} → environment value (empty when unset). Throws on an unclosed ${.
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    /// Range checks; one message per violation
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);
};

} // namespace sqlgate
