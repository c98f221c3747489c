#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::array& arr) {
    std::vector<std::string> result;
    result.reserve(arr.size());
    for (const auto& elem : arr) {
        if (const auto* s = elem.as_string()) {
            result.emplace_back(s->get());
        }
    }
    return result;
}

/// Signatures are matched against lowercased text
std::vector<std::string> lowered(std::vector<std::string> values) {
    for (auto& v : values) {
        v = utils::to_lower(v);
    }
    return values;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root, std::vector<std::string>& errors) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);

    const int64_t port = s["port"].value_or(int64_t{8080});
    if (port < 1 || port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", port));
    } else {
        cfg.port = static_cast<uint16_t>(port);
    }

    const int64_t threads = s["threads"].value_or(int64_t{8});
    if (threads < 1) {
        errors.push_back(std::format("server.threads must be > 0, got {}", threads));
    } else {
        cfg.threads = static_cast<size_t>(threads);
    }

    const int64_t max_sql = s["max_sql_length"].value_or(int64_t{102400});
    if (max_sql < 1) {
        errors.push_back(std::format("server.max_sql_length must be > 0, got {}", max_sql));
    } else {
        cfg.max_sql_length = static_cast<size_t>(max_sql);
    }
    return cfg;
}

RemoteConfig extract_remote(const toml::table& root, std::vector<std::string>& errors) {
    RemoteConfig cfg;
    const auto* remote = root["remote"].as_table();
    if (!remote) return cfg;
    const auto& r = *remote;

    cfg.base_url = r["base_url"].value_or(cfg.base_url);
    cfg.api_prefix = r["api_prefix"].value_or(cfg.api_prefix);

    const auto timeout = r["timeout_ms"].value_or(int64_t{cfg.timeout_ms});
    if (timeout < 1 || timeout > std::numeric_limits<int>::max()) {
        errors.push_back(std::format("remote.timeout_ms must be 1-{}, got {}",
                                     std::numeric_limits<int>::max(), timeout));
    } else {
        cfg.timeout_ms = static_cast<int>(timeout);
    }
    return cfg;
}

CacheConfig extract_cache(const toml::table& root, std::vector<std::string>& errors) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.enabled = c["enabled"].value_or(true);
    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(int64_t{300}));

    const auto max_entries = c["max_entries"].value_or(static_cast<int64_t>(cfg.max_entries));
    if (max_entries < 1) {
        errors.push_back(std::format("cache.max_entries must be > 0, got {}", max_entries));
    } else {
        cfg.max_entries = static_cast<size_t>(max_entries);
    }

    const auto num_shards = c["num_shards"].value_or(static_cast<int64_t>(cfg.num_shards));
    if (num_shards < 1) {
        errors.push_back(std::format("cache.num_shards must be > 0, got {}", num_shards));
    } else {
        cfg.num_shards = static_cast<size_t>(num_shards);
    }
    return cfg;
}

ClassifierConfig extract_classifier(const toml::table& root) {
    ClassifierConfig cfg;
    const auto* classifier = root["classifier"].as_table();
    if (!classifier) return cfg;
    const auto& c = *classifier;

    if (const auto* sigs = c["signatures"].as_array()) {
        cfg.signatures = lowered(toml_string_array(*sigs));
    }
    if (const auto* conj = c["conjunctions"].as_array()) {
        for (const auto& elem : *conj) {
            if (const auto* terms = elem.as_array()) {
                auto parsed = lowered(toml_string_array(*terms));
                if (!parsed.empty()) {
                    cfg.conjunctions.push_back(std::move(parsed));
                }
            }
        }
    }
    return cfg;
}

BrowseConfig extract_browse(const toml::table& root) {
    BrowseConfig cfg;
    const auto* browse = root["browse"].as_table();
    if (!browse) return cfg;
    const auto& b = *browse;

    cfg.default_limit = b["default_limit"].value_or(cfg.default_limit);
    cfg.max_limit = b["max_limit"].value_or(cfg.max_limit);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

std::optional<BootstrapCredential> extract_credential(const toml::table& root) {
    const auto* creds = root["credentials"].as_table();
    if (!creds) return std::nullopt;
    const auto& c = *creds;

    BootstrapCredential cred;
    cred.name = c["name"].value_or("default"s);
    cred.account_id = c["account_id"].value_or(""s);
    cred.api_token = c["api_token"].value_or(""s);

    // Unset env vars expand to "", which means "no bootstrap credential"
    if (cred.account_id.empty() && cred.api_token.empty()) return std::nullopt;
    return cred;
}

ConfigLoader::LoadResult extract_and_validate(const toml::table& tbl) {
    std::vector<std::string> errors;

    GatewayConfig config;
    config.server = extract_server(tbl, errors);
    config.remote = extract_remote(tbl, errors);
    config.cache = extract_cache(tbl, errors);
    config.classifier = extract_classifier(tbl);
    config.browse = extract_browse(tbl);
    config.logging = extract_logging(tbl);
    config.credential = extract_credential(tbl);

    for (auto& err : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.remote.base_url.empty()) {
        errors.push_back("remote.base_url must not be empty");
    }
    if (config.remote.timeout_ms <= 0) {
        errors.push_back(std::format("remote.timeout_ms must be > 0, got {}",
                                     config.remote.timeout_ms));
    }

    if (config.cache.ttl.count() <= 0) {
        errors.push_back(std::format("cache.ttl_seconds must be > 0, got {}",
                                     config.cache.ttl.count()));
    }
    if (config.cache.max_entries == 0) {
        errors.push_back("cache.max_entries must be > 0");
    }
    if (config.cache.num_shards == 0) {
        errors.push_back("cache.num_shards must be > 0");
    }

    if (config.browse.max_limit < 1 || config.browse.max_limit > 100) {
        errors.push_back(std::format("browse.max_limit must be 1-100, got {}",
                                     config.browse.max_limit));
    }
    if (config.browse.default_limit < 1 || config.browse.default_limit > config.browse.max_limit) {
        errors.push_back(std::format("browse.default_limit must be 1-{}, got {}",
                                     config.browse.max_limit, config.browse.default_limit));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.credential) {
        if (config.credential->account_id.empty()) {
            errors.push_back("credentials.account_id required when api_token is set");
        }
        if (config.credential->api_token.empty()) {
            errors.push_back("credentials.api_token required when account_id is set");
        }
    }

    return errors;
}

} // namespace sqlgate
