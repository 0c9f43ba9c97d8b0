#include <catch2/catch_test_macros.hpp>
#include "tools/sql_tool_service.hpp"
#include "mocks/mock_backend.hpp"

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

struct ServiceFixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>(db);
    std::shared_ptr<ConnectionRegistry> registry = make_registry(backend);
    std::shared_ptr<WriteGate> gate = std::make_shared<WriteGate>();
    std::shared_ptr<ResultShaper> shaper = std::make_shared<ResultShaper>();
    std::shared_ptr<WriteAuditLog> audit = std::make_shared<WriteAuditLog>();
    SqlToolService service{registry, gate, shaper, audit};

    std::string open() {
        auto created = service.create_connection(make_request());
        REQUIRE(created.is_ok());
        return created.value().handle;
    }
};

} // namespace

// ============================================================================
// End-to-end flows
// ============================================================================

TEST_CASE("Service: closed handle is unknown to later queries", "[service][e2e]") {
    ServiceFixture f;
    const auto handle = f.open();

    const auto listed = f.service.list_connections();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].handle == handle);

    CHECK(f.service.close_connection(handle));

    auto result = f.service.query_with_connection(handle, "select 1");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNKNOWN_HANDLE);
    CHECK(f.service.list_connections().empty());
}

TEST_CASE("Service: removed verb is refused and not audited", "[service][e2e]") {
    ServiceFixture f;
    const auto handle = f.open();

    CHECK(f.service.enable_write_operations());
    CHECK(f.service.remove_allowed_write_command("update"));

    auto result = f.service.execute_update_with_connection(handle, "UPDATE t SET x=1");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::STATEMENT_NOT_ALLOWED);
    CHECK(result.error_message() == "SQL verb not allowed: update");
    CHECK(f.db->executes == 0);
    CHECK(f.service.list_write_audit(100).empty());
}

TEST_CASE("Service: row and field caps shape a read", "[service][e2e]") {
    ServiceFixture f;
    const auto handle = f.open();

    const std::string fifty(50, 'x');
    f.db->columns = {ColumnTypeInfo("body", GenericColumnType::TEXT, 0)};
    f.db->rows = {{fifty}, {fifty}};

    REQUIRE(f.service.set_max_query_rows(1).is_ok());
    REQUIRE(f.service.set_max_field_length(20).is_ok());

    auto result = f.service.query_with_connection(handle, "SELECT body FROM notes");
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    const auto& text = *result.value()[0][0].value.data;
    CHECK(text == std::string(20, 'x') + "...(truncated,len=50)");
    CHECK(text.ends_with("len=50)"));
}

// ============================================================================
// Write path
// ============================================================================

TEST_CASE("Service: writes disabled is checked before the verb", "[service][write]") {
    ServiceFixture f;
    const auto handle = f.open();

    auto result = f.service.execute_update_with_connection(handle, "GRANT ALL ON *.* TO x");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::WRITES_DISABLED);
    CHECK(f.db->executes == 0);
}

TEST_CASE("Service: successful write returns affected rows and is audited", "[service][write]") {
    ServiceFixture f;
    const auto handle = f.open();
    f.service.enable_write_operations();
    f.db->exec_result = DbExecResult{true, "", 3};

    auto result = f.service.execute_update_with_connection(handle, "  delete from t where id < 4");
    REQUIRE(result.is_ok());
    CHECK(result.value() == 3);
    CHECK(f.db->executes == 1);

    const auto entries = f.service.list_write_audit(10);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].handle == handle);
    CHECK(entries[0].verb == "delete");
    CHECK(entries[0].affected_rows == 3);

    CHECK(f.service.clear_write_audit() == 1);
    CHECK(f.service.list_write_audit(10).empty());
}

TEST_CASE("Service: driver failure on write is not audited", "[service][write]") {
    ServiceFixture f;
    const auto handle = f.open();
    f.service.enable_write_operations();
    f.db->exec_result = DbExecResult{false, "Duplicate entry '1' for key 'PRIMARY'", 0};

    auto result = f.service.execute_update_with_connection(handle, "INSERT INTO t VALUES (1)");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::EXECUTION_FAILED);
    CHECK(result.error_message() == "Update failed: Duplicate entry '1' for key 'PRIMARY'");
    CHECK(f.service.list_write_audit(10).empty());
}

TEST_CASE("Service: newly whitelisted verb is accepted", "[service][write]") {
    ServiceFixture f;
    const auto handle = f.open();
    f.service.enable_write_operations();

    auto refused = f.service.execute_update_with_connection(handle, "MERGE INTO t USING s ON 1=1");
    CHECK(refused.error_code() == ErrorCode::STATEMENT_NOT_ALLOWED);

    CHECK(f.service.add_allowed_write_command("MERGE"));
    auto accepted = f.service.execute_update_with_connection(handle, "MERGE INTO t USING s ON 1=1");
    CHECK(accepted.is_ok());
}

// ============================================================================
// Catalog helpers
// ============================================================================

TEST_CASE("Service: list_all_tables_name joins the first column", "[service][catalog]") {
    ServiceFixture f;
    const auto handle = f.open();
    f.db->columns = {ColumnTypeInfo("table_name", GenericColumnType::VARCHAR, 0)};
    f.db->rows = {{std::string("orders")}, {std::string("users")}, {std::nullopt}};

    auto result = f.service.list_all_tables_name(handle);
    REQUIRE(result.is_ok());
    CHECK(result.value() == "orders,users");

    const auto statements = f.db->seen_statements();
    REQUIRE_FALSE(statements.empty());
    CHECK(statements.back() == "SELECT table_name FROM mock_tables");
}

TEST_CASE("Service: get_table_schema quotes the table name", "[service][catalog]") {
    ServiceFixture f;
    const auto handle = f.open();
    f.db->columns = {
        ColumnTypeInfo("COLUMN_NAME", GenericColumnType::VARCHAR, 0),
        ColumnTypeInfo("DATA_TYPE", GenericColumnType::VARCHAR, 0),
        ColumnTypeInfo("IS_NULLABLE", GenericColumnType::VARCHAR, 0),
        ColumnTypeInfo("COLUMN_DEFAULT", GenericColumnType::VARCHAR, 0),
    };
    f.db->rows = {{std::string("id"), std::string("int"), std::string("NO"), std::nullopt}};

    auto result = f.service.get_table_schema(handle, "o'rders");
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    CHECK(result.value()[0][0].label == "COLUMN_NAME");
    CHECK(f.db->seen_statements().back().ends_with("WHERE table_name = 'o''rders'"));

    auto blank = f.service.get_table_schema(handle, "  ");
    REQUIRE(blank.is_error());
    CHECK(blank.error_code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("Service: catalog helpers check the handle first", "[service][catalog]") {
    ServiceFixture f;
    CHECK(f.service.list_all_tables_name("nope").error_code() == ErrorCode::UNKNOWN_HANDLE);
    CHECK(f.service.get_table_schema("nope", "").error_code() == ErrorCode::UNKNOWN_HANDLE);
    CHECK(f.service.execute_update_with_connection("nope", "insert").error_code() == ErrorCode::UNKNOWN_HANDLE);
}

TEST_CASE("Service: result limit config reflects setters", "[service][limits]") {
    ServiceFixture f;
    auto limits = f.service.get_result_limit_config();
    CHECK(limits.max_query_rows == 200);
    CHECK(limits.max_field_length == 256);

    REQUIRE(f.service.set_max_query_rows(50).is_ok());
    REQUIRE(f.service.set_max_field_length(64).is_ok());
    limits = f.service.get_result_limit_config();
    CHECK(limits.max_query_rows == 50);
    CHECK(limits.max_field_length == 64);
}
