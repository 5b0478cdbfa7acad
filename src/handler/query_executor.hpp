//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/query_executor.hpp
//
// Execute, Fetch, Close and QueryMeta: statement submission and the query
// cursor lifecycle of one handler
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/handler_config.hpp"
#include "cursor/cursor_registry.hpp"
#include "engine/query_engine.hpp"
#include "protocol/request.hpp"
#include "protocol/response.hpp"

namespace sqlbridge {

// Session flags as passed to the engine with every statement
StatementFlags ToStatementFlags(const HandlerConfig& config);

// Empty schema means the default schema
std::string ResolveSchema(const std::string& schema);

// Affected-row count of an update result. The result must be exactly one row
// holding one integral cell, anything else throws ContractViolation.
int64_t UpdateCountOf(const std::vector<Row>& rows);

// Reads the count of an update result and closes it. Two rows are read so a
// multi-row result is rejected whatever the client page size.
int64_t ReadUpdateCount(RowCursor& rows);

class QueryExecutor {
public:
    QueryExecutor(QueryEngine& engine, CursorRegistry& registry, const HandlerConfig& config);

    Response Execute(const Request& request, const ExecuteRequest& execute);
    Response Fetch(const Request& request, const FetchRequest& fetch);
    Response Close(const Request& request, const CloseRequest& close);
    Response QueryMeta(const Request& request, const QueryMetaRequest& meta);

private:
    // Capacity message, empty if another cursor may be opened
    std::string CheckCapacity() const;

    // Failure path of Execute: unregister the id and release a half-built cursor
    void Discard(uint64_t query_id, const QueryCursorPtr& cursor);

    bool ShouldClose(bool last, bool is_query) const {
        return last && (!is_query || config_.auto_close_cursors);
    }

private:
    QueryEngine& engine_;
    CursorRegistry& registry_;
    const HandlerConfig& config_;
};

} // namespace sqlbridge
