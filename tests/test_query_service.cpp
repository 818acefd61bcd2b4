#include <catch2/catch_test_macros.hpp>
#include "service/query_service.hpp"
#include "mocks/mock_connection.hpp"

using namespace wpdb;
using namespace wpdb::testing;
using namespace std::chrono_literals;
using json = nlohmann::ordered_json;

namespace {

struct ServiceFixture {
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>();
    ContextSlot slot;

    ServiceFixture() {
        GatewayConfig config;
        config.database.connection.database = "wordpress";
        config.database.table_prefix = "wp_";
        config.database.max_connections = 2;
        config.query.max_rows = 10;
        auto context = DatabaseContext::create(config, factory);
        REQUIRE(context.is_ok());
        REQUIRE(slot.set(context.value()));
    }

    ~ServiceFixture() { slot.shutdown(1000ms); }

    MockDatabase& db() { return factory->db(); }
};

} // namespace

TEST_CASE("QueryService: rejected SQL never reaches the database", "[service]") {
    ServiceFixture f;
    const QueryService service(f.slot);

    const auto before = f.db().executions.load();
    const auto response = service.run_query("SELECT 1; DROP TABLE wp_users", 10, OutputFormat::JSON);

    CHECK(response.code == ErrorCode::VALIDATION_REJECTED);
    CHECK(f.db().executions.load() == before);

    const auto doc = json::parse(response.body);
    CHECK(doc["error"] == "Multiple SQL statements are not allowed.");
    CHECK(doc["code"] == "validation_error");
}

TEST_CASE("QueryService: validation runs before the context is needed", "[service]") {
    const ContextSlot empty;
    const QueryService service(empty);

    const auto response = service.run_query("DELETE FROM wp_posts", 10, OutputFormat::JSON);
    CHECK(response.code == ErrorCode::VALIDATION_REJECTED);
}

TEST_CASE("QueryService: requests before startup get NOT_INITIALIZED", "[service]") {
    const ContextSlot empty;
    const QueryService service(empty);

    CHECK(service.run_query("SELECT 1", 10, OutputFormat::JSON).code == ErrorCode::NOT_INITIALIZED);
    CHECK(service.list_tables(std::nullopt, "", OutputFormat::JSON).code == ErrorCode::NOT_INITIALIZED);
    CHECK(service.describe_table(std::nullopt, "posts", OutputFormat::JSON).code == ErrorCode::NOT_INITIALIZED);

    const auto response = service.list_sites(OutputFormat::JSON);
    CHECK(response.code == ErrorCode::NOT_INITIALIZED);
    CHECK(json::parse(response.body)["code"] == "not_initialized");
}

TEST_CASE("QueryService: approved SQL runs unchanged with the effective limit", "[service]") {
    ServiceFixture f;
    f.db().on_rows("FROM wp_posts", make_rows(25));
    const QueryService service(f.slot);

    const std::string sql = "/* report */ SELECT id FROM wp_posts";
    const auto response = service.run_query(sql, 500, OutputFormat::JSON);
    REQUIRE(response.ok());

    const auto doc = json::parse(response.body);
    CHECK(doc["row_count"] == 10);
    CHECK(doc["has_more"] == true);
    CHECK(doc["limit"] == 10);

    // The original text, comments included, is what executes
    const auto history = f.db().history();
    REQUIRE_FALSE(history.empty());
    CHECK(history.back().sql == sql);
}

TEST_CASE("QueryService: CSV query output", "[service]") {
    ServiceFixture f;
    f.db().on_rows("FROM wp_posts", make_rows(2));
    const QueryService service(f.slot);

    const auto response = service.run_query("SELECT id FROM wp_posts", 5, OutputFormat::CSV);
    REQUIRE(response.ok());
    CHECK(response.body == "id\r\n1\r\n2\r\n");
}

TEST_CASE("QueryService: execution errors are sanitized", "[service]") {
    ServiceFixture f;
    f.db().on_failure("wp_secret", DbFailure::QUERY, 1142,
                      "SELECT command denied to user 'wp'@'10.0.0.5' for table 'wp_secret'");
    const QueryService service(f.slot);

    const auto response = service.run_query("SELECT * FROM wp_secret", 5, OutputFormat::JSON);
    CHECK(response.code == ErrorCode::QUERY_ERROR);
    CHECK(response.body.find("10.0.0.5") == std::string::npos);
    CHECK(json::parse(response.body)["error"] == "Database query failed.");
}

TEST_CASE("QueryService: list_tables for a sub-site", "[service]") {
    ServiceFixture f;
    f.db().on_rows("AS data_kb", make_name_rows("TABLE_NAME", {"wp_2_options", "wp_2_posts"}));
    const QueryService service(f.slot);

    const auto response = service.list_tables(2, "", OutputFormat::JSON);
    REQUIRE(response.ok());

    const auto doc = json::parse(response.body);
    REQUIRE(doc.size() == 2);
    CHECK(doc[0]["TABLE_NAME"] == "wp_2_options");

    const auto history = f.db().history();
    REQUIRE_FALSE(history.empty());
    REQUIRE(history.back().params.size() == 2);
    CHECK(std::get<std::string>(history.back().params[1]) == "wp\\_2\\_%");
}

TEST_CASE("QueryService: describe unknown table", "[service]") {
    ServiceFixture f;
    const QueryService service(f.slot);

    const auto response = service.describe_table(std::nullopt, "missing", OutputFormat::JSON);
    CHECK(response.code == ErrorCode::TABLE_NOT_FOUND);

    const auto doc = json::parse(response.body);
    CHECK(doc["error"] == "Table 'wp_missing' not found.");
    CHECK(doc["code"] == "table_not_found");
}

TEST_CASE("QueryService: describe a table", "[service]") {
    ServiceFixture f;
    f.db().on_rows("information_schema.COLUMNS", make_name_rows("COLUMN_NAME", {"ID", "post_title"}));
    const QueryService service(f.slot);

    const auto response = service.describe_table(std::nullopt, "posts", OutputFormat::JSON);
    REQUIRE(response.ok());

    const auto doc = json::parse(response.body);
    CHECK(doc["table"] == "wp_posts");
    CHECK(doc["columns"].size() == 2);
    CHECK(doc["indexes"].empty());
}

TEST_CASE("QueryService: list_sites", "[service]") {
    ServiceFixture f;
    f.db().on_rows("TABLE_NAME LIKE ? ORDER BY",
                   make_name_rows("TABLE_NAME", {"wp_2_options", "wp_options"}));
    const QueryService service(f.slot);

    const auto response = service.list_sites(OutputFormat::JSON);
    REQUIRE(response.ok());

    const auto doc = json::parse(response.body);
    CHECK(doc["base_prefix"] == "wp_");
    REQUIRE(doc["sites"].size() == 2);
    CHECK(doc["sites"][0]["site_id"] == 1);
    CHECK(doc["sites"][1]["prefix"] == "wp_2_");
}

TEST_CASE("QueryService: requests after shutdown get NOT_INITIALIZED", "[service]") {
    ServiceFixture f;
    const QueryService service(f.slot);
    REQUIRE(f.slot.shutdown(1000ms));

    CHECK(service.run_query("SELECT 1", 1, OutputFormat::JSON).code == ErrorCode::NOT_INITIALIZED);
}
