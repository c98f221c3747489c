#include <catch2/catch_test_macros.hpp>
#include "server/api_handler.hpp"
#include "server/http_constants.hpp"
#include "cache/result_cache.hpp"
#include "classifier/error_classifier.hpp"
#include "credentials/credential_store.hpp"
#include "gateway/query_gateway.hpp"
#include "gateway/table_browse_planner.hpp"
#include "core/json.hpp"
#include "mocks/mock_remote_sql_client.hpp"

#include <string>

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

struct HandlerFixture {
    std::shared_ptr<MockRemoteSqlClient> client = std::make_shared<MockRemoteSqlClient>();
    std::shared_ptr<CredentialStore> credentials = std::make_shared<CredentialStore>();
    std::shared_ptr<ErrorClassifier> classifier = std::make_shared<ErrorClassifier>();
    std::shared_ptr<QueryGateway> gateway = std::make_shared<QueryGateway>(
        client, credentials, std::make_shared<ResultCache>(), classifier);
    std::shared_ptr<TableBrowsePlanner> planner = std::make_shared<TableBrowsePlanner>(
        client, credentials, classifier);
    ApiHandler handler;

    explicit HandlerFixture(ApiHandler::Config config = {}, bool with_credential = true)
        : handler(client, credentials, classifier, gateway, planner, config) {
        if (with_credential) {
            (void)credentials->add("primary", "acct-1", "token-1");
        }
        client->set_schema({SchemaObject{"orders", SchemaObjectKind::TABLE, "CREATE TABLE orders (id)"}});
    }
};

json::Json body_of(const ApiResponse& response) {
    auto parsed = json::parse(response.body);
    REQUIRE(parsed.has_value());
    return std::move(*parsed);
}

std::string header_of(const ApiResponse& response, const std::string& name) {
    for (const auto& [key, value] : response.headers) {
        if (key == name) return value;
    }
    return {};
}

} // anonymous namespace

TEST_CASE("ApiHandler: health", "[api]") {
    HandlerFixture f;
    const auto response = f.handler.health();
    CHECK(response.status == 200);
    CHECK(json::string_field(body_of(response), "status") == "ok");
}

// ============================================================================
// Query
// ============================================================================

TEST_CASE("ApiHandler: query success and cache flag", "[api][query]") {
    HandlerFixture f;
    f.client->set_rows({make_row({{"id", int64_t{1}}, {"name", std::string("Alice")}})});

    const auto first = f.handler.run_query("db-1", R"({"query": "SELECT * FROM users"})");
    REQUIRE(first.status == 200);
    CHECK(first.content_type == http::kJsonContentType);
    const auto body = body_of(first);
    REQUIRE(json::field(body, "results") != nullptr);
    REQUIRE(json::field(body, "results")->is_array());
    CHECK(json::field(body, "results")->get_array().size() == 1);
    CHECK(json::int_field(body, "rowCount") == 1);
    CHECK(json::bool_field(body, "cached") == false);
    CHECK(json::field(body, "changes") == nullptr);
    const auto elapsed = json::string_field(body, "executionTime");
    REQUIRE(elapsed.has_value());
    CHECK(elapsed->ends_with("ms"));

    const auto second = f.handler.run_query("db-1", R"({"query": "SELECT * FROM users"})");
    REQUIRE(second.status == 200);
    CHECK(json::bool_field(body_of(second), "cached") == true);
    CHECK(f.client->execute_count() == 1);
}

TEST_CASE("ApiHandler: result columns keep their order", "[api][query][rows]") {
    HandlerFixture f;
    f.client->set_rows({make_row({{"name", std::string("Alice")}, {"id", int64_t{1}}})});

    SECTION("Query results") {
        const auto response = f.handler.run_query("db-1", R"({"query": "SELECT name, id FROM users"})");
        REQUIRE(response.status == 200);
        const auto name_pos = response.body.find(R"("name":"Alice")");
        const auto id_pos = response.body.find(R"("id":1)");
        REQUIRE(name_pos != std::string::npos);
        REQUIRE(id_pos != std::string::npos);
        CHECK(name_pos < id_pos);
        CHECK(json::int_field(body_of(response), "rowCount") == 1);
    }

    SECTION("Table rows") {
        const auto response = f.handler.table_rows("db-1", "orders", std::nullopt, std::nullopt);
        REQUIRE(response.status == 200);
        CHECK(response.body.find(R"([{"name":"Alice","id":1}])") != std::string::npos);
        CHECK(json::int_field(body_of(response), "pageSize") == 50);
    }
}

TEST_CASE("ApiHandler: query accepts the sql field", "[api][query]") {
    HandlerFixture f;
    f.client->set_rows({}, 2);

    const auto response = f.handler.run_query("db-1", R"({"sql": "UPDATE t SET x = 1"})");
    REQUIRE(response.status == 200);
    CHECK(json::int_field(body_of(response), "changes") == 2);
    REQUIRE(f.client->executed_sql().size() == 1);
    CHECK(f.client->executed_sql().front() == "UPDATE t SET x = 1");
}

TEST_CASE("ApiHandler: query user error passes the message through", "[api][query]") {
    HandlerFixture f;
    f.client->set_execute_failure(RemoteFailure::application({"no such table: users"}));

    const auto response = f.handler.run_query("db-1", R"({"query": "SELECT * FROM users"})");
    CHECK(response.status == 400);
    const auto body = body_of(response);
    CHECK(json::string_field(body, "message") == "no such table: users");
    CHECK(json::int_field(body, "rowCount") == 0);
    REQUIRE(json::field(body, "results") != nullptr);
    CHECK(json::field(body, "results")->get_array().empty());
}

TEST_CASE("ApiHandler: query system error hides remote detail", "[api][query]") {
    HandlerFixture f;
    f.client->set_execute_failure(RemoteFailure::transport(403, "Forbidden"));

    const auto response = f.handler.run_query("db-1", R"({"query": "SELECT 1"})");
    CHECK(response.status == 500);
    CHECK(json::string_field(body_of(response), "message") == http::kQuerySystemMessage);
    CHECK(response.body.find("Forbidden") == std::string::npos);
}

TEST_CASE("ApiHandler: query request validation", "[api][query]") {
    SECTION("Malformed JSON") {
        HandlerFixture f;
        const auto response = f.handler.run_query("db-1", "{not json");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "Invalid JSON: empty or malformed");
        CHECK(f.client->total_calls() == 0);
    }

    SECTION("Empty body") {
        HandlerFixture f;
        CHECK(f.handler.run_query("db-1", "").status == 400);
    }

    SECTION("Missing statement") {
        HandlerFixture f;
        const auto response = f.handler.run_query("db-1", R"({"other": 1})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "Query is required");
    }

    SECTION("Body too long") {
        HandlerFixture f(ApiHandler::Config{.max_body_length = 32});
        const auto response = f.handler.run_query(
            "db-1", R"({"query": "SELECT * FROM a_rather_long_table_name"})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "SQL too long: max 32 bytes");
        CHECK(f.client->total_calls() == 0);
    }

    SECTION("No active credential") {
        HandlerFixture f({}, false);
        const auto response = f.handler.run_query("db-1", R"({"query": "SELECT 1"})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "No active API key configured");
    }
}

// ============================================================================
// Table rows
// ============================================================================

TEST_CASE("ApiHandler: table rows with default paging", "[api][rows]") {
    HandlerFixture f;
    f.client->set_rows({make_row({{"id", int64_t{1}}})});

    const auto response = f.handler.table_rows("db-1", "orders", std::nullopt, std::nullopt);
    REQUIRE(response.status == 200);
    const auto body = body_of(response);
    CHECK(json::int_field(body, "rowCount") == 1);
    CHECK(json::int_field(body, "pageSize") == 50);
    REQUIRE(json::field(body, "rows") != nullptr);
    CHECK(json::field(body, "rows")->get_array().size() == 1);

    REQUIRE(f.client->executed_sql().size() == 1);
    CHECK(f.client->executed_sql().front() == "SELECT * FROM \"orders\" LIMIT 50 OFFSET 0");
}

TEST_CASE("ApiHandler: table rows parses paging parameters", "[api][rows]") {
    HandlerFixture f;
    f.client->set_rows({});

    const auto response = f.handler.table_rows("db-1", "orders", " 10 ", "30");
    REQUIRE(response.status == 200);
    CHECK(json::int_field(body_of(response), "pageSize") == 10);
    CHECK(f.client->executed_sql().front() == "SELECT * FROM \"orders\" LIMIT 10 OFFSET 30");
}

TEST_CASE("ApiHandler: table rows rejects bad paging", "[api][rows]") {
    HandlerFixture f;

    SECTION("Non-numeric limit") {
        const auto response = f.handler.table_rows("db-1", "orders", "ten", std::nullopt);
        CHECK(response.status == 400);
        const auto body = body_of(response);
        CHECK(json::string_field(body, "message") == "Limit must be a number between 1 and 100");
        CHECK(json::int_field(body, "pageSize") == 0);
        CHECK(json::int_field(body, "rowCount") == 0);
    }

    SECTION("Limit out of range") {
        const auto response = f.handler.table_rows("db-1", "orders", "101", std::nullopt);
        CHECK(response.status == 400);
        CHECK(json::int_field(body_of(response), "pageSize") == 0);
    }

    SECTION("Negative offset") {
        const auto response = f.handler.table_rows("db-1", "orders", "10", "-1");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") ==
              "Offset must be a non-negative number");
    }

    SECTION("Non-numeric offset") {
        CHECK(f.handler.table_rows("db-1", "orders", "10", "1.5").status == 400);
    }

    CHECK(f.client->total_calls() == 0);
}

TEST_CASE("ApiHandler: table rows for an unknown table", "[api][rows]") {
    HandlerFixture f;

    const auto response = f.handler.table_rows("db-1", "missing", "20", std::nullopt);
    CHECK(response.status == 400);
    const auto body = body_of(response);
    CHECK(json::string_field(body, "message") == "Table 'missing' does not exist");
    CHECK(json::int_field(body, "pageSize") == 20);
    CHECK(f.client->execute_count() == 0);
}

TEST_CASE("ApiHandler: table rows system error", "[api][rows]") {
    HandlerFixture f;
    f.client->set_execute_failure(RemoteFailure::transport(502, "Bad Gateway"));

    const auto response = f.handler.table_rows("db-1", "orders", std::nullopt, std::nullopt);
    CHECK(response.status == 500);
    CHECK(json::string_field(body_of(response), "message") == http::kBrowseSystemMessage);
}

// ============================================================================
// Discovery
// ============================================================================

TEST_CASE("ApiHandler: list databases", "[api][discovery]") {
    HandlerFixture f;
    f.client->set_databases({DatabaseInfo{"db-1", "users", "2024-01-01T00:00:00Z", "production", "WEUR"}});

    const auto response = f.handler.list_databases();
    REQUIRE(response.status == 200);
    const auto body = body_of(response);
    REQUIRE(body.is_array());
    REQUIRE(body.get_array().size() == 1);
    const auto& db = body.get_array().front();
    CHECK(json::string_field(db, "uuid") == "db-1");
    CHECK(json::string_field(db, "id") == "db-1");
    CHECK(json::string_field(db, "name") == "users");
    CHECK(json::string_field(db, "running_in_region") == "WEUR");
}

TEST_CASE("ApiHandler: list databases failure", "[api][discovery]") {
    HandlerFixture f;
    f.client->set_list_failure(RemoteFailure::transport(401, "Unauthorized"));

    const auto response = f.handler.list_databases();
    CHECK(response.status == 500);
    CHECK(json::string_field(body_of(response), "message") == "Failed to fetch databases");
}

TEST_CASE("ApiHandler: describe schema", "[api][discovery]") {
    HandlerFixture f;

    const auto response = f.handler.describe_schema("db-1");
    REQUIRE(response.status == 200);
    const auto body = body_of(response);
    REQUIRE(body.is_array());
    REQUIRE(body.get_array().size() == 1);
    const auto& obj = body.get_array().front();
    CHECK(json::string_field(obj, "name") == "orders");
    CHECK(json::string_field(obj, "type") == "table");
    CHECK(json::string_field(obj, "sql") == "CREATE TABLE orders (id)");
}

// ============================================================================
// API keys
// ============================================================================

TEST_CASE("ApiHandler: create api key", "[api][keys]") {
    HandlerFixture f({}, false);

    SECTION("Missing fields") {
        const auto response = f.handler.create_api_key(R"({"name": "ops", "accountId": "acct-9"})");
        CHECK(response.status == 400);
        CHECK(f.client->list_count() == 0);
        CHECK(f.credentials->list().empty());
    }

    SECTION("Rejected by the remote service") {
        f.client->set_list_failure(RemoteFailure::transport(403, "Forbidden"));
        const auto response = f.handler.create_api_key(
            R"({"name": "ops", "accountId": "acct-9", "cloudflareToken": "token-9"})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "Invalid account id or API token");
        CHECK(f.client->list_count() == 1);
        CHECK(f.client->last_credential().account_id == "acct-9");
        CHECK(f.credentials->list().empty());
    }

    SECTION("Other probe failures") {
        f.client->set_list_failure(RemoteFailure::transport(0, "connection refused"));
        const auto response = f.handler.create_api_key(
            R"({"name": "ops", "accountId": "acct-9", "cloudflareToken": "token-9"})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "Failed to create API key");
        CHECK_FALSE(f.credentials->get_active().has_value());
    }

    SECTION("Accepted") {
        const auto response = f.handler.create_api_key(
            R"({"name": "ops", "accountId": "acct-9", "cloudflareToken": "token-9"})");
        REQUIRE(response.status == 200);
        CHECK(response.body.find("token-9") == std::string::npos);
        const auto body = body_of(response);
        CHECK(json::string_field(body, "name") == "ops");
        CHECK(json::string_field(body, "accountId") == "acct-9");
        CHECK(json::bool_field(body, "isActive") == true);
        CHECK(json::string_field(body, "id").has_value());

        REQUIRE(f.credentials->get_active().has_value());
        CHECK(f.credentials->get_active()->api_token == "token-9");
    }
}

TEST_CASE("ApiHandler: list and delete api keys", "[api][keys]") {
    HandlerFixture f;
    const auto second = f.credentials->add("backup", "acct-2", "secret-token");

    const auto listed = f.handler.list_api_keys();
    REQUIRE(listed.status == 200);
    CHECK(listed.body.find("secret-token") == std::string::npos);
    CHECK(listed.body.find("token-1") == std::string::npos);
    const auto body = body_of(listed);
    REQUIRE(body.is_array());
    CHECK(body.get_array().size() == 2);

    CHECK(f.handler.delete_api_key("no-such-id").status == 404);

    const auto deleted = f.handler.delete_api_key(second.id);
    CHECK(deleted.status == 200);
    CHECK(json::bool_field(body_of(deleted), "success") == true);
    CHECK(f.credentials->list().size() == 1);
    CHECK_FALSE(f.credentials->get_active().has_value());
}

// ============================================================================
// Export
// ============================================================================

TEST_CASE("ApiHandler: export", "[api][export]") {
    HandlerFixture f;

    SECTION("CSV") {
        const auto response = f.handler.export_data(
            R"({"format": "csv", "data": [{"id": 1, "name": "a,b"}], "filename": "orders.csv"})");
        REQUIRE(response.status == 200);
        CHECK(response.content_type == http::kCsvContentType);
        CHECK(response.body == "id,name\n1,\"a,b\"");
        CHECK(header_of(response, "Content-Disposition") == "attachment; filename=orders.csv");
    }

    SECTION("CSV header follows the first row's key order") {
        const auto response = f.handler.export_data(
            R"({"format": "csv", "data": [{"name": "x", "id": 2}, {"name": "y", "id": 3}]})");
        REQUIRE(response.status == 200);
        CHECK(response.body == "name,id\nx,2\ny,3");
    }

    SECTION("JSON keeps the caller's key order") {
        const auto response = f.handler.export_data(
            R"({"format": "json", "data": [{"name": "x", "id": 2}]})");
        REQUIRE(response.status == 200);
        CHECK(response.body == R"([{"name": "x", "id": 2}])");
    }

    SECTION("CSV default filename") {
        const auto response = f.handler.export_data(R"({"format": "csv", "data": []})");
        REQUIRE(response.status == 200);
        CHECK(response.body.empty());
        CHECK(header_of(response, "Content-Disposition") == "attachment; filename=export.csv");
    }

    SECTION("JSON") {
        const auto response = f.handler.export_data(
            R"({"format": "json", "data": [{"id": 1}]})");
        REQUIRE(response.status == 200);
        CHECK(response.content_type == http::kJsonContentType);
        CHECK(header_of(response, "Content-Disposition") == "attachment; filename=export.json");
        const auto body = body_of(response);
        REQUIRE(body.is_array());
        CHECK(body.get_array().size() == 1);
    }

    SECTION("Filename cannot inject header content") {
        const auto response = f.handler.export_data(
            R"({"format": "csv", "data": [], "filename": "a\r\nX-Evil: 1;\"b.csv"})");
        REQUIRE(response.status == 200);
        CHECK(header_of(response, "Content-Disposition") == "attachment; filename=aX-Evil: 1b.csv");
    }

    SECTION("Unsupported format") {
        const auto response = f.handler.export_data(R"({"format": "xml", "data": []})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") == "Unsupported format");
    }

    SECTION("Data must be an array") {
        CHECK(f.handler.export_data(R"({"format": "csv", "data": {"id": 1}})").status == 400);
    }

    SECTION("CSV rows must be objects") {
        const auto response = f.handler.export_data(R"({"format": "csv", "data": [1, 2]})");
        CHECK(response.status == 400);
        CHECK(json::string_field(body_of(response), "message") ==
              "Export data must be an array of objects");
    }
}
