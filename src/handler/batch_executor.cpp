//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/batch_executor.cpp
//===----------------------------------------------------------------------===//

#include "handler/batch_executor.hpp"
#include "handler/query_executor.hpp"
#include "logging/logger.hpp"

namespace sqlbridge {

BatchExecutor::BatchExecutor(QueryEngine& engine, const HandlerConfig& config)
    : engine_(engine), config_(config) {
}

int64_t BatchExecutor::ExecuteUpdate(const std::string& schema, const std::string& sql,
                                     const std::vector<duckdb::Value>& args) {
    Statement statement;
    statement.sql = sql;
    statement.args = args;
    statement.schema = schema;
    statement.shape = StatementShape::UPDATE_ONLY;
    statement.flags = ToStatementFlags(config_);

    auto cursor = engine_.Submit(statement);
    if (cursor->IsQuery()) {
        cursor->Close();
        throw ContractViolation("Batch statement produced a query result: " + sql);
    }

    return ReadUpdateCount(*cursor);
}

Response BatchExecutor::ExecuteBatch(const Request& request, const BatchExecuteRequest& batch) {
    std::string schema = ResolveSchema(batch.schema);

    BatchExecuteResult result;
    result.update_counts.reserve(batch.queries.size());

    try {
        const std::string* sql = nullptr;

        for (const auto& query : batch.queries) {
            if (query.sql && !query.sql->empty()) {
                sql = &*query.sql;
            }
            if (!sql) {
                throw EngineException("Batch query has no SQL text [position=" +
                                      std::to_string(result.update_counts.size()) + "]");
            }

            result.update_counts.push_back(ExecuteUpdate(schema, *sql, query.args));
        }

        DLOG_DEBUG("batch", "Executed batch of {} statements", result.update_counts.size());
        return Response::Success(std::move(result));
    } catch (const ContractViolation& e) {
        LOG_FATAL("batch", "Internal error executing batch query [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what(), std::move(result));
    } catch (const std::exception& e) {
        LOG_ERROR("batch", "Failed to execute batch query [reqId=" + std::to_string(request.request_id) +
                  ", req=" + RequestToString(request) + "]: " + e.what());
        return Response::Failed(e.what(), std::move(result));
    }
}

} // namespace sqlbridge
