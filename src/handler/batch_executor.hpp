//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/batch_executor.hpp
//
// BatchExecute: ordered update statements, stops at the first failure
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/handler_config.hpp"
#include "engine/query_engine.hpp"
#include "protocol/request.hpp"
#include "protocol/response.hpp"

namespace sqlbridge {

class BatchExecutor {
public:
    BatchExecutor(QueryEngine& engine, const HandlerConfig& config);

    // Entries without sql text reuse the last sql text seen earlier in the
    // batch. On failure the response is FAILED and still carries the counts
    // of the statements that succeeded before it.
    Response ExecuteBatch(const Request& request, const BatchExecuteRequest& batch);

private:
    int64_t ExecuteUpdate(const std::string& schema, const std::string& sql,
                          const std::vector<duckdb::Value>& args);

private:
    QueryEngine& engine_;
    const HandlerConfig& config_;
};

} // namespace sqlbridge
