//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/metadata_resolver.hpp
//
// Catalog introspection: tables, columns, indexes, primary keys, schemas
// and statement parameters, filtered by SQL wildcard patterns
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/query_engine.hpp"
#include "handler/sql_pattern.hpp"
#include "protocol/request.hpp"
#include "protocol/response.hpp"

namespace sqlbridge {

class MetadataResolver {
public:
    // Table type reported for every catalog table
    static constexpr const char* TABLE_TYPE = "TABLE";

    // Key column reported for tables without key-marked fields
    static constexpr const char* IMPLICIT_KEY_FIELD = "_KEY";

    explicit MetadataResolver(QueryEngine& engine);

    Response GetTables(const Request& request, const MetaTablesRequest& meta);
    Response GetColumns(const Request& request, const MetaColumnsRequest& meta);
    Response GetIndexes(const Request& request, const MetaIndexesRequest& meta);
    Response GetParams(const Request& request, const MetaParamsRequest& meta);
    Response GetPrimaryKeys(const Request& request, const MetaPrimaryKeysRequest& meta);
    Response GetSchemas(const Request& request, const MetaSchemasRequest& meta);

private:
    // Calls fn for every table of every public cache whose schema and table
    // names match. The same table may be visited through several caches.
    template <typename F>
    void ForEachTable(const SqlPattern& schema_pattern, const SqlPattern& table_pattern, F&& fn);

    Response Failure(const Request& request, const char* what, const std::exception& e);

private:
    QueryEngine& engine_;
};

} // namespace sqlbridge
