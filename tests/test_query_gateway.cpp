#include <catch2/catch_test_macros.hpp>
#include "gateway/query_gateway.hpp"
#include "cache/result_cache.hpp"
#include "catalog/database_registry.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "parser/fingerprinter.hpp"
#include "mocks/mock_remote_sql_client.hpp"

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

struct GatewayFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<MockRemoteSqlClient> client = std::make_shared<MockRemoteSqlClient>();
    std::shared_ptr<CredentialStore> credentials = std::make_shared<CredentialStore>();
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<DatabaseRegistry> registry = std::make_shared<DatabaseRegistry>();
    std::shared_ptr<QueryGateway> gateway;

    explicit GatewayFixture(bool with_credential = true) {
        ResultCache::Config cfg;
        cfg.clock = [c = clock] { return c->now(); };
        cache = std::make_shared<ResultCache>(cfg);
        gateway = std::make_shared<QueryGateway>(
            client, credentials, cache, std::make_shared<ErrorClassifier>(), registry);
        if (with_credential) {
            (void)credentials->add("primary", "acct-1", "token-1");
        }
    }
};

RemoteFailure application_failure(std::string message) {
    return RemoteFailure::application({std::move(message)});
}

} // anonymous namespace

TEST_CASE("QueryGateway: identical queries are served from cache", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({make_row({{"id", int64_t{1}}, {"name", std::string("Alice")}}),
                        make_row({{"id", int64_t{2}}, {"name", std::string("Bob")}})});

    const QueryRequest request{"db-1", "SELECT * FROM users"};

    const auto first = f.gateway->run_query(request);
    REQUIRE(first.is_ok());
    CHECK_FALSE(first.value().from_cache);
    CHECK(first.value().row_count == 2);

    const auto second = f.gateway->run_query(request);
    REQUIRE(second.is_ok());
    CHECK(second.value().from_cache);
    CHECK(second.value().rows == first.value().rows);
    CHECK(second.value().row_count == first.value().row_count);
    CHECK(second.value().elapsed_ms == first.value().elapsed_ms);

    CHECK(f.client->execute_count() == 1);

    const auto stats = f.gateway->get_stats();
    CHECK(stats.requests == 2);
    CHECK(stats.cache_hits == 1);
    CHECK(stats.remote_calls == 1);
}

TEST_CASE("QueryGateway: remote call carries the credential and statement", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({});

    REQUIRE(f.gateway->run_query({"db-42", "SELECT 1"}).is_ok());
    CHECK(f.client->last_database() == "db-42");
    CHECK(f.client->last_credential().account_id == "acct-1");
    CHECK(f.client->last_credential().api_token == "token-1");
    REQUIRE(f.client->executed_sql().size() == 1);
    CHECK(f.client->executed_sql().front() == "SELECT 1");
}

TEST_CASE("QueryGateway: stale entries trigger a new remote call", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({make_row({{"n", int64_t{1}}})});
    const QueryRequest request{"db-1", "SELECT n FROM t"};

    REQUIRE(f.gateway->run_query(request).is_ok());

    f.clock->advance(std::chrono::seconds(299));
    const auto fresh = f.gateway->run_query(request);
    REQUIRE(fresh.is_ok());
    CHECK(fresh.value().from_cache);
    CHECK(f.client->execute_count() == 1);

    f.clock->advance(std::chrono::seconds(1));
    const auto stale = f.gateway->run_query(request);
    REQUIRE(stale.is_ok());
    CHECK_FALSE(stale.value().from_cache);
    CHECK(f.client->execute_count() == 2);
}

TEST_CASE("QueryGateway: whitespace differences are distinct queries", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({});

    REQUIRE(f.gateway->run_query({"db-1", "SELECT 1"}).is_ok());
    REQUIRE(f.gateway->run_query({"db-1", "SELECT  1"}).is_ok());
    REQUIRE(f.gateway->run_query({"db-1", "select 1"}).is_ok());
    CHECK(f.client->execute_count() == 3);
}

TEST_CASE("QueryGateway: cache entries are scoped per database", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({make_row({{"n", int64_t{1}}})});

    REQUIRE(f.gateway->run_query({"db-a", "SELECT n FROM t"}).is_ok());
    const auto other = f.gateway->run_query({"db-b", "SELECT n FROM t"});
    REQUIRE(other.is_ok());
    CHECK_FALSE(other.value().from_cache);
    CHECK(f.client->execute_count() == 2);
}

TEST_CASE("QueryGateway: user errors are classified and never cached", "[gateway]") {
    GatewayFixture f;
    f.client->set_execute_failure(application_failure("no such table: users"));
    const QueryRequest request{"db-1", "SELECT * FROM users"};

    const auto result = f.gateway->run_query(request);
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::USER);
    CHECK(result.error_message() == "no such table: users");
    CHECK(http_status_for(result.error_kind()) == 400);

    const auto fp = QueryFingerprinter::fingerprint(request.sql_text);
    CHECK_FALSE(f.cache->get(fp, request.database_id).has_value());

    // A repeat goes back to the remote service
    const auto again = f.gateway->run_query(request);
    REQUIRE(again.is_error());
    CHECK(f.client->execute_count() == 2);
    CHECK(f.gateway->get_stats().user_errors == 2);
}

TEST_CASE("QueryGateway: authentication failures are system errors", "[gateway]") {
    GatewayFixture f;
    f.client->set_execute_failure(RemoteFailure::transport(403, "Forbidden"));

    const auto result = f.gateway->run_query({"db-1", "SELECT 1"});
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::SYSTEM);
    CHECK(http_status_for(result.error_kind()) == 500);
    CHECK(result.error().status_code == 403);
    CHECK(f.gateway->get_stats().system_errors == 1);
}

TEST_CASE("QueryGateway: unrecognized remote messages are system errors", "[gateway]") {
    GatewayFixture f;
    f.client->set_execute_failure(application_failure("D1 storage is overloaded"));

    const auto result = f.gateway->run_query({"db-1", "SELECT 1"});
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::SYSTEM);
}

TEST_CASE("QueryGateway: validation happens before any remote call", "[gateway]") {
    GatewayFixture f;

    SECTION("Empty SQL") {
        const auto result = f.gateway->run_query({"db-1", ""});
        REQUIRE(result.is_error());
        CHECK(result.error_kind() == ErrorKind::VALIDATION);
        CHECK(result.error_message() == "Query is required");
    }

    SECTION("Empty database id") {
        const auto result = f.gateway->run_query({"", "SELECT 1"});
        REQUIRE(result.is_error());
        CHECK(result.error_kind() == ErrorKind::VALIDATION);
    }

    CHECK(f.client->total_calls() == 0);
}

TEST_CASE("QueryGateway: no active credential", "[gateway]") {
    GatewayFixture f(false);

    const auto result = f.gateway->run_query({"db-1", "SELECT 1"});
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::NO_ACTIVE_CREDENTIAL);
    CHECK(http_status_for(result.error_kind()) == 400);
    CHECK(f.client->total_calls() == 0);
}

TEST_CASE("QueryGateway: changed row count is passed through", "[gateway]") {
    GatewayFixture f;
    f.client->set_rows({}, 3);

    const auto result = f.gateway->run_query({"db-1", "DELETE FROM t WHERE x = 1"});
    REQUIRE(result.is_ok());
    CHECK(result.value().row_count == 0);
    REQUIRE(result.value().changed_row_count.has_value());
    CHECK(*result.value().changed_row_count == 3);
}

TEST_CASE("QueryGateway: disabled cache always calls the remote service", "[gateway]") {
    auto client = std::make_shared<MockRemoteSqlClient>();
    auto credentials = std::make_shared<CredentialStore>();
    (void)credentials->add("primary", "acct-1", "token-1");
    ResultCache::Config cfg;
    cfg.enabled = false;
    QueryGateway gateway(client, credentials, std::make_shared<ResultCache>(cfg),
                         std::make_shared<ErrorClassifier>());

    REQUIRE(gateway.run_query({"db-1", "SELECT 1"}).is_ok());
    const auto second = gateway.run_query({"db-1", "SELECT 1"});
    REQUIRE(second.is_ok());
    CHECK_FALSE(second.value().from_cache);
    CHECK(client->execute_count() == 2);
}

TEST_CASE("QueryGateway: list_databases mirrors into the registry", "[gateway]") {
    GatewayFixture f;
    f.client->set_databases({
        DatabaseInfo{"db-1", "users", "2024-01-01T00:00:00Z", "production", "WEUR"},
        DatabaseInfo{"db-2", "analytics", "", "", ""}
    });

    const auto result = f.gateway->list_databases();
    REQUIRE(result.is_ok());
    CHECK(result.value().size() == 2);
    CHECK(f.registry->size() == 2);

    const auto entry = f.registry->find("db-1");
    REQUIRE(entry.has_value());
    CHECK(entry->info.name == "users");
    CHECK(entry->account_id == "acct-1");
}

TEST_CASE("QueryGateway: list_databases failure is classified", "[gateway]") {
    GatewayFixture f;
    f.client->set_list_failure(RemoteFailure::transport(401, "Unauthorized"));

    const auto result = f.gateway->list_databases();
    REQUIRE(result.is_error());
    CHECK(result.error_kind() == ErrorKind::SYSTEM);
    CHECK(f.registry->size() == 0);
}

TEST_CASE("QueryGateway: describe_schema", "[gateway]") {
    GatewayFixture f;

    SECTION("Returns the live schema") {
        f.client->set_schema({SchemaObject{"orders", SchemaObjectKind::TABLE, "CREATE TABLE orders (id)"}});
        const auto result = f.gateway->describe_schema("db-1");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().size() == 1);
        CHECK(result.value().front().name == "orders");
        CHECK(f.client->last_database() == "db-1");
    }

    SECTION("Empty id is rejected without a remote call") {
        const auto result = f.gateway->describe_schema("");
        REQUIRE(result.is_error());
        CHECK(result.error_kind() == ErrorKind::VALIDATION);
        CHECK(f.client->schema_count() == 0);
    }

    SECTION("Remote failure is classified") {
        f.client->set_schema_failure(RemoteFailure::transport(0, "connection refused"));
        const auto result = f.gateway->describe_schema("db-1");
        REQUIRE(result.is_error());
        CHECK(result.error_kind() == ErrorKind::SYSTEM);
    }
}
