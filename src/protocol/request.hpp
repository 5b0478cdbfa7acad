//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// protocol/request.hpp
//
// Decoded client requests. The transport hands the handler one Request per
// inbound message; the body is a closed set of request kinds.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/query_engine.hpp"
#include <optional>
#include <variant>

namespace sqlbridge {

//===----------------------------------------------------------------------===//
// Query requests
//===----------------------------------------------------------------------===//

struct ExecuteRequest {
    std::string schema;  // empty = default schema
    int32_t page_size = DEFAULT_PAGE_SIZE;
    int32_t max_rows = 0;  // 0 = unbounded
    std::string sql;
    std::vector<duckdb::Value> args;
    StatementShape expected_type = StatementShape::ANY;
};

struct FetchRequest {
    uint64_t query_id = 0;
    int32_t page_size = DEFAULT_PAGE_SIZE;
};

struct CloseRequest {
    uint64_t query_id = 0;
};

struct QueryMetaRequest {
    uint64_t query_id = 0;
};

// One batch entry; no sql text means "same sql as the previous entry"
struct BatchQuery {
    std::optional<std::string> sql;
    std::vector<duckdb::Value> args;
};

struct BatchExecuteRequest {
    std::string schema;
    std::vector<BatchQuery> queries;
};

//===----------------------------------------------------------------------===//
// Metadata requests (empty pattern matches everything)
//===----------------------------------------------------------------------===//

struct MetaTablesRequest {
    std::string schema_pattern;
    std::string table_pattern;
};

struct MetaColumnsRequest {
    std::string schema_pattern;
    std::string table_pattern;
    std::string column_pattern;
};

struct MetaIndexesRequest {
    std::string schema_pattern;
    std::string table_pattern;
};

struct MetaParamsRequest {
    std::string schema;
    std::string sql;
};

struct MetaPrimaryKeysRequest {
    std::string schema_pattern;
    std::string table_pattern;
};

struct MetaSchemasRequest {
    std::string schema_pattern;
};

//===----------------------------------------------------------------------===//
// Request
//===----------------------------------------------------------------------===//

using RequestBody = std::variant<
    ExecuteRequest,
    FetchRequest,
    CloseRequest,
    QueryMetaRequest,
    BatchExecuteRequest,
    MetaTablesRequest,
    MetaColumnsRequest,
    MetaIndexesRequest,
    MetaParamsRequest,
    MetaPrimaryKeysRequest,
    MetaSchemasRequest>;

struct Request {
    uint64_t request_id = 0;  // diagnostics only
    RequestBody body;

    Request() = default;
    Request(uint64_t id, RequestBody body_p) : request_id(id), body(std::move(body_p)) {}
};

const char* RequestKindName(const RequestBody& body);

// One-line summary for logs, e.g. "Execute [reqId=7, sql=SELECT 1, args=0]"
std::string RequestToString(const Request& request);

} // namespace sqlbridge
