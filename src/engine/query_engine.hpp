//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// engine/query_engine.hpp
//
// Narrow interface to the SQL engine: submit a statement and get back a
// paginated row cursor or an update count, prepare parameter metadata, and
// read the table catalog.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>

namespace sqlbridge {

//===----------------------------------------------------------------------===//
// Statement
//===----------------------------------------------------------------------===//

// Statement kind the client expects
enum class StatementShape : uint8_t {
    ANY = 0,
    SELECT_ONLY = 1,
    UPDATE_ONLY = 2
};

const char* StatementShapeToString(StatementShape shape);

struct StatementFlags {
    bool distributed_joins = false;
    bool enforce_join_order = false;
    bool collocated = false;
    bool replicated_only = false;
    bool lazy = false;
};

struct Statement {
    std::string sql;
    std::vector<duckdb::Value> args;
    std::string schema;
    StatementShape shape = StatementShape::ANY;
    StatementFlags flags;
    int32_t page_size = DEFAULT_PAGE_SIZE;
};

//===----------------------------------------------------------------------===//
// Result metadata
//===----------------------------------------------------------------------===//

struct ResultColumnMeta {
    std::string schema_name;
    std::string table_name;
    std::string column_name;
    duckdb::LogicalType type;
    bool nullable = true;
};

struct ParameterMeta {
    int32_t position = 0;  // 1-based
    std::string type_name;
    int32_t precision = 0;
    int32_t scale = 0;
    bool nullable = true;

    bool operator==(const ParameterMeta& other) const {
        return position == other.position && type_name == other.type_name &&
               precision == other.precision && scale == other.scale &&
               nullable == other.nullable;
    }
};

//===----------------------------------------------------------------------===//
// Type catalog
//===----------------------------------------------------------------------===//

struct FieldDescriptor {
    std::string name;
    std::string type_name;
    bool key = false;  // part of the table key
};

struct IndexDescriptor {
    std::string name;
    bool unique = false;
    std::vector<std::string> fields;
    std::vector<bool> ascending;

    bool operator==(const IndexDescriptor& other) const {
        return name == other.name && unique == other.unique &&
               fields == other.fields && ascending == other.ascending;
    }
};

struct TableDescriptor {
    std::string schema_name;
    std::string table_name;
    std::vector<FieldDescriptor> fields;
    std::vector<IndexDescriptor> indexes;

    // Name of an explicitly declared composite key, if any
    std::optional<std::string> key_field_name;
};

//===----------------------------------------------------------------------===//
// RowCursor - result of one submitted statement
//===----------------------------------------------------------------------===//

class RowCursor {
public:
    virtual ~RowCursor() = default;

    // true for row-returning statements, false for update-count results
    virtual bool IsQuery() const = 0;

    // May pull the next chunk from the engine; throws EngineException
    virtual bool HasNext() = 0;

    // Returns at most max_rows rows, fewer only when the result is exhausted
    virtual std::vector<Row> FetchPage(size_t max_rows) = 0;

    virtual std::vector<ResultColumnMeta> GetColumns() const = 0;

    // Releases engine resources; safe to call more than once
    virtual void Close() = 0;
};

//===----------------------------------------------------------------------===//
// QueryEngine
//===----------------------------------------------------------------------===//

class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    // Blocks until the statement has produced its first result
    virtual std::unique_ptr<RowCursor> Submit(const Statement& statement) = 0;

    // Prepares sql without executing it
    virtual std::vector<ParameterMeta> PrepareParams(const std::string& schema,
                                                     const std::string& sql) = 0;

    virtual std::vector<std::string> ListPublicCaches() = 0;

    virtual std::vector<TableDescriptor> TypesFor(const std::string& cache_name) = 0;
};

} // namespace sqlbridge
