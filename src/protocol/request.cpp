//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// protocol/request.cpp
//===----------------------------------------------------------------------===//

#include "protocol/request.hpp"
#include <sstream>

namespace sqlbridge {

namespace {

// Long statements are cut in log lines
std::string Abbreviate(const std::string& sql) {
    static constexpr size_t MAX_SQL_IN_SUMMARY = 256;
    if (sql.size() <= MAX_SQL_IN_SUMMARY) {
        return sql;
    }
    return sql.substr(0, MAX_SQL_IN_SUMMARY) + "...";
}

} // anonymous namespace

const char* RequestKindName(const RequestBody& body) {
    return std::visit(Overloaded{
        [](const ExecuteRequest&) { return "Execute"; },
        [](const FetchRequest&) { return "Fetch"; },
        [](const CloseRequest&) { return "Close"; },
        [](const QueryMetaRequest&) { return "QueryMeta"; },
        [](const BatchExecuteRequest&) { return "BatchExecute"; },
        [](const MetaTablesRequest&) { return "MetaTables"; },
        [](const MetaColumnsRequest&) { return "MetaColumns"; },
        [](const MetaIndexesRequest&) { return "MetaIndexes"; },
        [](const MetaParamsRequest&) { return "MetaParams"; },
        [](const MetaPrimaryKeysRequest&) { return "MetaPrimaryKeys"; },
        [](const MetaSchemasRequest&) { return "MetaSchemas"; },
    }, body);
}

std::string RequestToString(const Request& request) {
    std::ostringstream out;
    out << RequestKindName(request.body) << " [reqId=" << request.request_id;

    std::visit(Overloaded{
        [&out](const ExecuteRequest& r) {
            out << ", schema=" << r.schema << ", pageSize=" << r.page_size
                << ", maxRows=" << r.max_rows << ", expected=" << StatementShapeToString(r.expected_type)
                << ", sql=" << Abbreviate(r.sql) << ", args=" << r.args.size();
        },
        [&out](const FetchRequest& r) {
            out << ", queryId=" << r.query_id << ", pageSize=" << r.page_size;
        },
        [&out](const CloseRequest& r) { out << ", queryId=" << r.query_id; },
        [&out](const QueryMetaRequest& r) { out << ", queryId=" << r.query_id; },
        [&out](const BatchExecuteRequest& r) {
            out << ", schema=" << r.schema << ", queries=" << r.queries.size();
        },
        [&out](const MetaTablesRequest& r) {
            out << ", schemaPattern=" << r.schema_pattern << ", tablePattern=" << r.table_pattern;
        },
        [&out](const MetaColumnsRequest& r) {
            out << ", schemaPattern=" << r.schema_pattern << ", tablePattern=" << r.table_pattern
                << ", columnPattern=" << r.column_pattern;
        },
        [&out](const MetaIndexesRequest& r) {
            out << ", schemaPattern=" << r.schema_pattern << ", tablePattern=" << r.table_pattern;
        },
        [&out](const MetaParamsRequest& r) {
            out << ", schema=" << r.schema << ", sql=" << Abbreviate(r.sql);
        },
        [&out](const MetaPrimaryKeysRequest& r) {
            out << ", schemaPattern=" << r.schema_pattern << ", tablePattern=" << r.table_pattern;
        },
        [&out](const MetaSchemasRequest& r) { out << ", schemaPattern=" << r.schema_pattern; },
    }, request.body);

    out << "]";
    return out.str();
}

} // namespace sqlbridge
