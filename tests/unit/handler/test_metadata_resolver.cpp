//===----------------------------------------------------------------------===//
//                         SqlBridge Server - Unit Tests
//
// tests/unit/handler/test_metadata_resolver.cpp
//
// Unit tests for the metadata requests
//===----------------------------------------------------------------------===//

#include "handler/request_handler.hpp"
#include "handler/fake_query_engine.hpp"
#include <cassert>
#include <iostream>

using namespace sqlbridge;
using namespace sqlbridge::test;

struct MetaFixture {
    std::shared_ptr<FakeQueryEngine> engine = std::make_shared<FakeQueryEngine>();
    std::shared_ptr<ShutdownGate> gate = std::make_shared<ShutdownGate>();
    std::unique_ptr<RequestHandler> handler;

    MetaFixture() {
        auto users = MakeTable("PUBLIC", "USERS", {"ID", "NAME", "EMAIL"}, {"ID"});
        IndexDescriptor by_email;
        by_email.name = "USERS_EMAIL_IDX";
        by_email.unique = true;
        by_email.fields = {"EMAIL"};
        by_email.ascending = {true};
        users.indexes.push_back(by_email);

        auto profile = MakeTable("PUBLIC", "USER_PROFILE", {"USER_ID", "BIO"});
        auto orders = MakeTable("SALES", "ORDERS", {"ORDER_ID", "LINE", "AMOUNT"}, {"ORDER_ID", "LINE"});
        orders.key_field_name = "ORDERS_KEY";
        auto auser = MakeTable("SALES", "AUSER", {"ID"});

        engine->AddTable("users_cache", users);
        engine->AddTable("users_cache", profile);
        engine->AddTable("sales_cache", orders);
        engine->AddTable("sales_cache", auser);
        // Same table reachable through a second cache
        engine->AddTable("replica_cache", users);

        handler = std::make_unique<RequestHandler>(engine, gate, HandlerConfig());
    }

    Response Send(RequestBody body) {
        return handler->Handle(Request(1, std::move(body)));
    }
};

void TestTables() {
    std::cout << "  Testing tables..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaTablesRequest{"", ""});
    assert(response.IsSuccess());
    const auto& tables = response.As<MetaTablesResult>()->tables;

    // USERS appears once although two caches expose it
    assert(tables.size() == 4);
    assert((tables[0] == TableMeta{"PUBLIC", "USERS", "TABLE"}));
    assert((tables[1] == TableMeta{"PUBLIC", "USER_PROFILE", "TABLE"}));
    assert((tables[2] == TableMeta{"SALES", "ORDERS", "TABLE"}));
    assert((tables[3] == TableMeta{"SALES", "AUSER", "TABLE"}));

    std::cout << "    PASSED" << std::endl;
}

void TestTablePatterns() {
    std::cout << "  Testing table patterns..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaTablesRequest{"", "USER%"});
    const auto& tables = response.As<MetaTablesResult>()->tables;
    assert(tables.size() == 2);
    assert(tables[0].table_name == "USERS");
    assert(tables[1].table_name == "USER_PROFILE");

    response = f.Send(MetaTablesRequest{"SAL_S", ""});
    assert(response.As<MetaTablesResult>()->tables.size() == 2);

    response = f.Send(MetaTablesRequest{"PUBLIC", "ORDERS"});
    assert(response.IsSuccess());
    assert(response.As<MetaTablesResult>()->tables.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestColumns() {
    std::cout << "  Testing columns..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaColumnsRequest{"PUBLIC", "USERS", ""});
    const auto& columns = response.As<MetaColumnsResult>()->columns;
    assert(columns.size() == 3);
    assert((columns[0] == ColumnMeta{"PUBLIC", "USERS", "ID", "INTEGER"}));
    assert(columns[2].column_name == "EMAIL");

    response = f.Send(MetaColumnsRequest{"", "", "%ID"});
    const auto& ids = response.As<MetaColumnsResult>()->columns;
    assert(ids.size() == 4);
    assert(ids[0].column_name == "ID" && ids[0].table_name == "USERS");
    assert(ids[1].column_name == "USER_ID");
    assert(ids[2].column_name == "ORDER_ID");
    assert(ids[3].column_name == "ID" && ids[3].table_name == "AUSER");

    std::cout << "    PASSED" << std::endl;
}

void TestIndexes() {
    std::cout << "  Testing indexes..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaIndexesRequest{"", ""});
    const auto& indexes = response.As<MetaIndexesResult>()->indexes;
    assert(indexes.size() == 1);
    assert(indexes[0].schema_name == "PUBLIC");
    assert(indexes[0].table_name == "USERS");
    assert(indexes[0].index.name == "USERS_EMAIL_IDX");
    assert(indexes[0].index.unique);
    assert(indexes[0].index.fields == std::vector<std::string>{"EMAIL"});

    response = f.Send(MetaIndexesRequest{"SALES", ""});
    assert(response.As<MetaIndexesResult>()->indexes.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestPrimaryKeys() {
    std::cout << "  Testing primary keys..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaPrimaryKeysRequest{"", ""});
    const auto& keys = response.As<MetaPrimaryKeysResult>()->primary_keys;
    assert(keys.size() == 4);

    assert(keys[0].table_name == "USERS");
    assert(keys[0].key_name == "PK_PUBLIC_USERS");
    assert(keys[0].fields == std::vector<std::string>{"ID"});

    // No key-marked fields: implicit key column
    assert(keys[1].table_name == "USER_PROFILE");
    assert(keys[1].key_name == "PK_PUBLIC_USER_PROFILE");
    assert(keys[1].fields == std::vector<std::string>{"_KEY"});

    // Declared key name, composite key in field order
    assert(keys[2].table_name == "ORDERS");
    assert(keys[2].key_name == "ORDERS_KEY");
    assert((keys[2].fields == std::vector<std::string>{"ORDER_ID", "LINE"}));

    assert(keys[3].key_name == "PK_SALES_AUSER");
    assert(keys[3].fields == std::vector<std::string>{"_KEY"});

    std::cout << "    PASSED" << std::endl;
}

void TestSchemas() {
    std::cout << "  Testing schemas..." << std::endl;

    MetaFixture f;
    auto response = f.Send(MetaSchemasRequest{""});
    assert((response.As<MetaSchemasResult>()->schemas == std::vector<std::string>{"PUBLIC", "SALES"}));

    response = f.Send(MetaSchemasRequest{"P%"});
    assert((response.As<MetaSchemasResult>()->schemas == std::vector<std::string>{"PUBLIC"}));

    response = f.Send(MetaSchemasRequest{"NONE"});
    assert(response.IsSuccess());
    assert(response.As<MetaSchemasResult>()->schemas.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestParams() {
    std::cout << "  Testing parameters..." << std::endl;

    MetaFixture f;
    ParameterMeta first;
    first.position = 1;
    first.type_name = "INTEGER";
    ParameterMeta second;
    second.position = 2;
    second.type_name = "DECIMAL(10,2)";
    second.precision = 10;
    second.scale = 2;
    f.engine->SetParams("SELECT * FROM USERS WHERE ID = ? AND SCORE > ?", {first, second});

    auto response = f.Send(MetaParamsRequest{"", "SELECT * FROM USERS WHERE ID = ? AND SCORE > ?"});
    assert(response.IsSuccess());
    const auto& params = response.As<MetaParamsResult>()->params;
    assert(params.size() == 2);
    assert(params[0] == first);
    assert(params[1].position == 2);
    assert(params[1].precision == 10);
    assert(params[1].scale == 2);

    // Empty schema resolves to the default schema
    assert(f.engine->GetPreparedSchemas().back() == DEFAULT_SCHEMA);

    // Nothing is executed
    assert(f.engine->GetSubmitted().empty());

    response = f.Send(MetaParamsRequest{"PUBLIC", "SELEC nonsense"});
    assert(!response.IsSuccess());
    assert(response.error.find("Failed to parse query") != std::string::npos);
    assert(f.engine->GetPreparedSchemas().back() == "PUBLIC");

    std::cout << "    PASSED" << std::endl;
}

void TestLargeReplicatedCatalog() {
    std::cout << "  Testing deduplication over a large replicated catalog..." << std::endl;

    auto engine = std::make_shared<FakeQueryEngine>();
    auto gate = std::make_shared<ShutdownGate>();

    // 300 tables of 10 columns, each exposed through 20 caches
    std::vector<std::string> fields;
    for (int c = 0; c < 10; c++) {
        fields.push_back("C" + std::to_string(c));
    }
    for (int cache = 0; cache < 20; cache++) {
        for (int t = 0; t < 300; t++) {
            engine->AddTable("cache_" + std::to_string(cache),
                             MakeTable("S" + std::to_string(t % 3), "T" + std::to_string(t), fields, {"C0"}));
        }
    }
    RequestHandler handler(engine, gate, HandlerConfig());

    auto tables = handler.Handle(Request(1, MetaTablesRequest{"", ""}));
    assert(tables.IsSuccess());
    const auto& table_list = tables.As<MetaTablesResult>()->tables;
    assert(table_list.size() == 300);
    assert(table_list[0].table_name == "T0");
    assert(table_list[299].table_name == "T299");

    auto columns = handler.Handle(Request(2, MetaColumnsRequest{"", "", ""}));
    assert(columns.IsSuccess());
    assert(columns.As<MetaColumnsResult>()->columns.size() == 3000);

    auto keys = handler.Handle(Request(3, MetaPrimaryKeysRequest{"", ""}));
    assert(keys.As<MetaPrimaryKeysResult>()->primary_keys.size() == 300);

    auto schemas = handler.Handle(Request(4, MetaSchemasRequest{""}));
    const auto& schema_list = schemas.As<MetaSchemasResult>()->schemas;
    assert(schema_list.size() == 3);
    assert(schema_list[0] == "S0" && schema_list[1] == "S1" && schema_list[2] == "S2");

    std::cout << "    PASSED" << std::endl;
}

void TestCatalogFailure() {
    std::cout << "  Testing catalog failure..." << std::endl;

    MetaFixture f;
    f.engine->FailCatalog("IO Error: catalog unavailable");

    for (auto body : std::vector<RequestBody>{MetaTablesRequest{}, MetaColumnsRequest{},
                                             MetaIndexesRequest{}, MetaPrimaryKeysRequest{},
                                             MetaSchemasRequest{}}) {
        auto response = f.Send(body);
        assert(!response.IsSuccess());
        assert(response.error == "IO Error: catalog unavailable");
    }

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Metadata Unit Tests ===" << std::endl;

    std::cout << "\n1. Tables and columns:" << std::endl;
    TestTables();
    TestTablePatterns();
    TestColumns();

    std::cout << "\n2. Indexes and keys:" << std::endl;
    TestIndexes();
    TestPrimaryKeys();

    std::cout << "\n3. Schemas and parameters:" << std::endl;
    TestSchemas();
    TestParams();

    std::cout << "\n4. Large catalog:" << std::endl;
    TestLargeReplicatedCatalog();

    std::cout << "\n5. Failures:" << std::endl;
    TestCatalogFailure();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
