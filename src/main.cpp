#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "cache/result_cache.hpp"
#include "catalog/database_registry.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "gateway/query_gateway.hpp"
#include "gateway/table_browse_planner.hpp"
#include "remote/d1_sql_client.hpp"
#include "server/api_handler.hpp"
#include "server/http_server.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace sqlgate;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("sqlgate starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/sqlgate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        GatewayConfig cfg;
        if (config_result.success) {
            cfg = std::move(config_result.config);
            utils::log::info("Config loaded");
        } else {
            utils::log::warn(std::format("{} - using defaults", config_result.error_message));
        }
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/5] Remote SQL client + classifier
        // =====================================================================
        utils::log::info(std::format("[2/5] Remote SQL client: {}{} (timeout {}ms)",
            cfg.remote.base_url, cfg.remote.api_prefix, cfg.remote.timeout_ms));

        D1SqlClient::Config client_config;
        client_config.base_url = cfg.remote.base_url;
        client_config.api_prefix = cfg.remote.api_prefix;
        client_config.timeout_ms = static_cast<uint32_t>(cfg.remote.timeout_ms);
        auto client = std::make_shared<D1SqlClient>(client_config);

        ErrorClassifier::Config classifier_config;
        if (!cfg.classifier.signatures.empty()) {
            classifier_config.signatures = cfg.classifier.signatures;
        }
        if (!cfg.classifier.conjunctions.empty()) {
            classifier_config.conjunctions = cfg.classifier.conjunctions;
        }
        auto classifier = std::make_shared<ErrorClassifier>(classifier_config);
        utils::log::info(std::format("Error classifier: {} signatures, {} conjunctions",
            classifier_config.signatures.size(), classifier_config.conjunctions.size()));

        // =====================================================================
        // [3/5] Result cache
        // =====================================================================
        ResultCache::Config cache_config;
        cache_config.enabled = cfg.cache.enabled;
        cache_config.ttl = cfg.cache.ttl;
        cache_config.max_entries = cfg.cache.max_entries;
        cache_config.num_shards = cfg.cache.num_shards;
        auto cache = std::make_shared<ResultCache>(cache_config);
        utils::log::info(std::format("[3/5] Result cache: {} (ttl={}s, max_entries={}, shards={})",
            cache->is_enabled() ? "enabled" : "disabled", cache->ttl().count(),
            cache_config.max_entries, cache_config.num_shards));

        // =====================================================================
        // [4/5] Credentials, registry, gateway
        // =====================================================================
        auto credentials = std::make_shared<CredentialStore>();
        if (cfg.credential) {
            const auto record = credentials->add(cfg.credential->name,
                                                 cfg.credential->account_id,
                                                 cfg.credential->api_token);
            utils::log::info(std::format("[4/5] Bootstrap credential '{}' active", record.name));
        } else {
            utils::log::info("[4/5] No bootstrap credential; add one via POST /api/api-keys");
        }

        auto registry = std::make_shared<DatabaseRegistry>();
        auto gateway = std::make_shared<QueryGateway>(
            client, credentials, cache, classifier, registry);

        TableBrowsePlanner::Config planner_config;
        planner_config.max_limit = cfg.browse.max_limit;
        auto planner = std::make_shared<TableBrowsePlanner>(
            client, credentials, classifier, planner_config);

        // =====================================================================
        // [5/5] HTTP server
        // =====================================================================
        ApiHandler::Config api_config;
        api_config.max_body_length = cfg.server.max_sql_length;
        api_config.default_limit = cfg.browse.default_limit;
        api_config.max_limit = cfg.browse.max_limit;
        auto handler = std::make_shared<ApiHandler>(
            client, credentials, classifier, gateway, planner, api_config);

        g_server = std::make_shared<HttpServer>(
            handler, cfg.server.host, cfg.server.port, cfg.server.threads);

        utils::log::info(std::format("[5/5] Server ready on http://{}:{}",
            cfg.server.host, cfg.server.port));

        // Blocks until stop()
        g_server->start();

        const auto stats = gateway->get_stats();
        utils::log::info(std::format(
            "Shutdown: {} queries, {} cache hits, {} remote calls, {} user errors, {} system errors",
            stats.requests, stats.cache_hits, stats.remote_calls,
            stats.user_errors, stats.system_errors));

        const auto cache_stats = cache->get_stats();
        const auto browse_stats = planner->get_stats();
        const auto client_stats = client->get_stats();
        const auto http_stats = g_server->get_http_stats();
        utils::log::info(std::format(
            "Cache: {} hits, {} misses, {} evictions, {} entries",
            cache_stats.hits, cache_stats.misses, cache_stats.evictions,
            cache_stats.current_entries));
        utils::log::info(std::format(
            "Browse: {} requests, {} rejected, {} tables not found",
            browse_stats.requests, browse_stats.validation_rejections,
            browse_stats.tables_not_found));
        utils::log::info(std::format(
            "Remote: {} requests, {} transport failures; HTTP: {} requests, {} handler exceptions",
            client_stats.requests, client_stats.transport_failures,
            http_stats.requests, http_stats.handler_exceptions));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
