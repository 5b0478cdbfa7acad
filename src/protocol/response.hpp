//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// protocol/response.hpp
//
// Typed responses; exactly one per request
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/query_engine.hpp"
#include <variant>

namespace sqlbridge {

enum class ResponseStatus : uint8_t {
    SUCCESS = 0,
    FAILED = 1
};

//===----------------------------------------------------------------------===//
// Query payloads
//===----------------------------------------------------------------------===//

struct QueryExecuteResult {
    uint64_t query_id = 0;
    bool is_query = true;
    std::vector<Row> items;  // first page, query results only
    std::vector<ResultColumnMeta> columns;  // query results only
    bool last = true;
    int64_t update_count = 0;  // update results only
};

struct QueryFetchResult {
    std::vector<Row> items;
    bool last = true;
};

struct QueryMetadataResult {
    uint64_t query_id = 0;
    std::vector<ResultColumnMeta> columns;
};

struct BatchExecuteResult {
    // One count per statement that succeeded, in order
    std::vector<int64_t> update_counts;
};

//===----------------------------------------------------------------------===//
// Metadata payloads
//===----------------------------------------------------------------------===//

struct TableMeta {
    std::string schema_name;
    std::string table_name;
    std::string table_type;

    bool operator==(const TableMeta& other) const {
        return schema_name == other.schema_name && table_name == other.table_name &&
               table_type == other.table_type;
    }
};

struct ColumnMeta {
    std::string schema_name;
    std::string table_name;
    std::string column_name;
    std::string type_name;

    bool operator==(const ColumnMeta& other) const {
        return schema_name == other.schema_name && table_name == other.table_name &&
               column_name == other.column_name && type_name == other.type_name;
    }
};

struct IndexMeta {
    std::string schema_name;
    std::string table_name;
    IndexDescriptor index;

    bool operator==(const IndexMeta& other) const {
        return schema_name == other.schema_name && table_name == other.table_name &&
               index == other.index;
    }
};

struct PrimaryKeyMeta {
    std::string schema_name;
    std::string table_name;
    std::string key_name;
    std::vector<std::string> fields;

    bool operator==(const PrimaryKeyMeta& other) const {
        return schema_name == other.schema_name && table_name == other.table_name &&
               key_name == other.key_name && fields == other.fields;
    }
};

struct MetaTablesResult {
    std::vector<TableMeta> tables;
};

struct MetaColumnsResult {
    std::vector<ColumnMeta> columns;
};

struct MetaIndexesResult {
    std::vector<IndexMeta> indexes;
};

struct MetaParamsResult {
    std::vector<ParameterMeta> params;
};

struct MetaPrimaryKeysResult {
    std::vector<PrimaryKeyMeta> primary_keys;
};

struct MetaSchemasResult {
    std::vector<std::string> schemas;
};

//===----------------------------------------------------------------------===//
// Response
//===----------------------------------------------------------------------===//

using ResponsePayload = std::variant<
    std::monostate,
    QueryExecuteResult,
    QueryFetchResult,
    QueryMetadataResult,
    BatchExecuteResult,
    MetaTablesResult,
    MetaColumnsResult,
    MetaIndexesResult,
    MetaParamsResult,
    MetaPrimaryKeysResult,
    MetaSchemasResult>;

struct Response {
    ResponseStatus status = ResponseStatus::SUCCESS;
    std::string error;  // empty on success
    ResponsePayload payload;

    static Response Success(ResponsePayload payload_p = {}) {
        Response response;
        response.payload = std::move(payload_p);
        return response;
    }

    static Response Failed(std::string error_p, ResponsePayload payload_p = {}) {
        Response response;
        response.status = ResponseStatus::FAILED;
        response.error = std::move(error_p);
        response.payload = std::move(payload_p);
        return response;
    }

    bool IsSuccess() const { return status == ResponseStatus::SUCCESS; }

    // nullptr if the payload holds another type
    template <typename T>
    const T* As() const { return std::get_if<T>(&payload); }
};

} // namespace sqlbridge
