//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// engine/duckdb_query_engine.hpp
//
// QueryEngine backed by an embedded DuckDB instance
//===----------------------------------------------------------------------===//

#pragma once

#include "engine/query_engine.hpp"
#include "duckdb.hpp"

namespace sqlbridge {

class DuckDBQueryEngine : public QueryEngine {
public:
    explicit DuckDBQueryEngine(std::shared_ptr<duckdb::DuckDB> db_p);
    ~DuckDBQueryEngine() override = default;

    // Non-copyable
    DuckDBQueryEngine(const DuckDBQueryEngine&) = delete;
    DuckDBQueryEngine& operator=(const DuckDBQueryEngine&) = delete;

    std::unique_ptr<RowCursor> Submit(const Statement& statement) override;

    std::vector<ParameterMeta> PrepareParams(const std::string& schema,
                                             const std::string& sql) override;

    // Attached databases that are not internal (system, temp)
    std::vector<std::string> ListPublicCaches() override;

    // Base tables of one attached database with columns, keys and indexes
    std::vector<TableDescriptor> TypesFor(const std::string& cache_name) override;

private:
    // Fresh connection with the default schema and optimizer settings applied.
    // Every submitted statement gets its own connection because a streaming
    // result is invalidated by the next query on the same connection.
    std::unique_ptr<duckdb::Connection> OpenConnection(const std::string& schema,
                                                       const StatementFlags& flags);

    // Run a catalog query and collect all rows
    std::vector<Row> CatalogQuery(duckdb::Connection& conn,
                                  const std::string& sql,
                                  duckdb::vector<duckdb::Value> params);

private:
    std::shared_ptr<duckdb::DuckDB> db_;
};

} // namespace sqlbridge
