//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/query_executor.cpp
//===----------------------------------------------------------------------===//

#include "handler/query_executor.hpp"
#include "cursor/query_id_generator.hpp"
#include "logging/logger.hpp"

namespace sqlbridge {

namespace {

std::string InvalidFetchSize(int32_t page_size) {
    return "Invalid fetch size : [fetchSize=" + std::to_string(page_size) + "]";
}

} // anonymous namespace

StatementFlags ToStatementFlags(const HandlerConfig& config) {
    StatementFlags flags;
    flags.distributed_joins = config.distributed_joins;
    flags.enforce_join_order = config.enforce_join_order;
    flags.collocated = config.collocated;
    flags.replicated_only = config.replicated_only;
    flags.lazy = config.lazy;
    return flags;
}

std::string ResolveSchema(const std::string& schema) {
    return schema.empty() ? std::string(DEFAULT_SCHEMA) : schema;
}

int64_t ReadUpdateCount(RowCursor& rows) {
    auto page = rows.FetchPage(2);
    rows.Close();
    return UpdateCountOf(page);
}

int64_t UpdateCountOf(const std::vector<Row>& rows) {
    if (rows.size() != 1 || rows[0].size() != 1) {
        throw ContractViolation("Invalid result set for not-SELECT query. [rows=" +
                                std::to_string(rows.size()) + ", columns=" +
                                std::to_string(rows.empty() ? 0 : rows[0].size()) + "]");
    }

    const auto& cell = rows[0][0];
    if (cell.IsNull() || !cell.type().IsIntegral()) {
        throw ContractViolation("Invalid result set for not-SELECT query. [type=" +
                                cell.type().ToString() + "]");
    }
    return cell.GetValue<int64_t>();
}

QueryExecutor::QueryExecutor(QueryEngine& engine, CursorRegistry& registry, const HandlerConfig& config)
    : engine_(engine), registry_(registry), config_(config) {
}

std::string QueryExecutor::CheckCapacity() const {
    if (config_.max_open_cursors == 0) {
        return std::string();
    }
    size_t current = registry_.Size();
    if (current < config_.max_open_cursors) {
        return std::string();
    }
    return "Too many open cursors (either close other open cursors or increase the limit through "
           "max_open_cursors) [maximum=" + std::to_string(config_.max_open_cursors) +
           ", current=" + std::to_string(current) + "]";
}

void QueryExecutor::Discard(uint64_t query_id, const QueryCursorPtr& cursor) {
    registry_.Remove(query_id);
    if (!cursor) {
        return;
    }
    try {
        cursor->Close();
    } catch (const std::exception& e) {
        LOG_WARN("handler", "Failed to close query cursor " + std::to_string(query_id) + ": " + e.what());
    }
}

Response QueryExecutor::Execute(const Request& request, const ExecuteRequest& execute) {
    auto capacity_error = CheckCapacity();
    if (!capacity_error.empty()) {
        LOG_DEBUG("handler", capacity_error);
        return Response::Failed(capacity_error);
    }

    uint64_t query_id = QueryIdGenerator::Next();
    QueryCursorPtr cursor;

    try {
        if (execute.page_size <= 0) {
            return Response::Failed(InvalidFetchSize(execute.page_size));
        }

        Statement statement;
        statement.sql = execute.sql;
        statement.args = execute.args;
        statement.schema = ResolveSchema(execute.schema);
        statement.shape = execute.expected_type;
        statement.flags = ToStatementFlags(config_);
        statement.page_size = execute.page_size;

        auto rows = engine_.Submit(statement);

        QueryExecuteResult result;
        result.query_id = query_id;
        result.is_query = rows->IsQuery();

        if (!result.is_query) {
            // Update counts are read whole, page size and max rows do not apply
            result.update_count = ReadUpdateCount(*rows);
            result.last = true;
            DLOG_DEBUG("handler", "Executed update {} (count={})", query_id, result.update_count);
            return Response::Success(std::move(result));
        }

        result.columns = rows->GetColumns();
        cursor = std::make_shared<QueryCursor>(query_id, execute.page_size, execute.max_rows,
                                               std::move(rows));
        result.items = cursor->FetchPage();
        result.last = !cursor->HasNext();

        if (ShouldClose(result.last, result.is_query)) {
            cursor->Close();
        } else if (!registry_.Insert(query_id, cursor)) {
            throw ContractViolation("Query id already registered: " + std::to_string(query_id));
        }

        DLOG_DEBUG("handler", "Executed query {} (query={}, last={}, rows={})", query_id,
                   result.is_query, result.last, result.items.size());
        return Response::Success(std::move(result));
    } catch (const ContractViolation& e) {
        Discard(query_id, cursor);
        LOG_FATAL("handler", "Internal error executing query [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what());
    } catch (const std::exception& e) {
        Discard(query_id, cursor);
        LOG_ERROR("handler", "Failed to execute SQL query [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what());
    } catch (...) {
        Discard(query_id, cursor);
        throw;
    }
}

Response QueryExecutor::Fetch(const Request& request, const FetchRequest& fetch) {
    auto cursor = registry_.Get(fetch.query_id);
    if (!cursor) {
        return Response::Failed("Failed to find query cursor with ID: " + std::to_string(fetch.query_id));
    }
    if (fetch.page_size <= 0) {
        return Response::Failed(InvalidFetchSize(fetch.page_size));
    }

    try {
        cursor->SetPageSize(fetch.page_size);

        QueryFetchResult result;
        result.items = cursor->FetchPage();
        result.last = !cursor->HasNext();

        if (ShouldClose(result.last, cursor->IsQuery())) {
            registry_.Remove(fetch.query_id);
            cursor->Close();
        }
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        LOG_ERROR("handler", "Failed to fetch SQL query result [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what());
    }
}

Response QueryExecutor::Close(const Request& request, const CloseRequest& close) {
    auto cursor = registry_.Remove(close.query_id);
    if (!cursor) {
        return Response::Failed("Failed to find query cursor with ID: " + std::to_string(close.query_id));
    }

    try {
        cursor->Close();
        return Response::Success();
    } catch (const std::exception& e) {
        LOG_ERROR("handler", "Failed to close SQL query [reqId=" + std::to_string(request.request_id) +
                  ", queryId=" + std::to_string(close.query_id) + "]: " + e.what());
        return Response::Failed(e.what());
    }
}

Response QueryExecutor::QueryMeta(const Request& request, const QueryMetaRequest& meta) {
    auto cursor = registry_.Get(meta.query_id);
    if (!cursor) {
        return Response::Failed("Failed to find query with ID: " + std::to_string(meta.query_id));
    }

    try {
        QueryMetadataResult result;
        result.query_id = meta.query_id;
        result.columns = cursor->GetColumns();
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        LOG_ERROR("handler", "Failed to read SQL query metadata [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what());
    }
}

} // namespace sqlbridge
