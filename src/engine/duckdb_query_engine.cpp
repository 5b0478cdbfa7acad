//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// engine/duckdb_query_engine.cpp
//
// DuckDB implementation of the query engine interface
//===----------------------------------------------------------------------===//

#include "engine/duckdb_query_engine.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <map>

namespace sqlbridge {

namespace {

std::string EscapeLiteral(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    for (char c : text) {
        if (c == '\'') {
            escaped += '\'';
        }
        escaped += c;
    }
    return escaped;
}

std::string QuoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void RunSetting(duckdb::Connection& conn, const std::string& sql) {
    auto result = conn.Query(sql);
    if (result->HasError()) {
        throw EngineException(result->GetError());
    }
}

std::string CellString(const duckdb::Value& value) {
    return value.IsNull() ? std::string() : value.ToString();
}

// duckdb_indexes().expressions is a list in recent releases and a
// "[a, b]" string in older ones
std::vector<std::string> ExpressionList(const duckdb::Value& value) {
    std::vector<std::string> items;
    if (value.IsNull()) {
        return items;
    }
    if (value.type().id() == duckdb::LogicalTypeId::LIST) {
        for (auto& child : duckdb::ListValue::GetChildren(value)) {
            items.push_back(CellString(child));
        }
        return items;
    }

    std::string text = value.ToString();
    if (!text.empty() && text.front() == '[') text.erase(0, 1);
    if (!text.empty() && text.back() == ']') text.pop_back();

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        auto first = item.find_first_not_of(" \t'\"");
        auto last = item.find_last_not_of(" \t'\"");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

//===----------------------------------------------------------------------===//
// DuckDBRowCursor - pages over a (streaming or materialized) query result
//===----------------------------------------------------------------------===//

class DuckDBRowCursor : public RowCursor {
public:
    DuckDBRowCursor(std::unique_ptr<duckdb::Connection> connection,
                    duckdb::unique_ptr<duckdb::PreparedStatement> prepared,
                    duckdb::unique_ptr<duckdb::QueryResult> result,
                    std::string schema)
        : connection_(std::move(connection))
        , prepared_(std::move(prepared))
        , result_(std::move(result)) {
        for (duckdb::idx_t i = 0; i < result_->ColumnCount(); i++) {
            ResultColumnMeta column;
            column.schema_name = schema;
            column.column_name = result_->names[i];
            column.type = result_->types[i];
            columns_.push_back(std::move(column));
        }
    }

    ~DuckDBRowCursor() override { Close(); }

    bool IsQuery() const override { return true; }

    bool HasNext() override { return Prefetch(); }

    std::vector<Row> FetchPage(size_t max_rows) override {
        std::vector<Row> rows;
        while (rows.size() < max_rows && Prefetch()) {
            duckdb::idx_t col_count = chunk_->ColumnCount();
            Row row;
            row.reserve(col_count);
            for (duckdb::idx_t col = 0; col < col_count; col++) {
                row.push_back(chunk_->GetValue(col, chunk_offset_));
            }
            rows.push_back(std::move(row));
            chunk_offset_++;
        }
        return rows;
    }

    std::vector<ResultColumnMeta> GetColumns() const override { return columns_; }

    void Close() override {
        chunk_.reset();
        result_.reset();
        prepared_.reset();
        connection_.reset();
    }

private:
    // Makes sure chunk_ has an unread row; false once the result is drained
    bool Prefetch() {
        if (chunk_ && chunk_offset_ < chunk_->size()) {
            return true;
        }
        if (!result_ || exhausted_) {
            return false;
        }

        try {
            chunk_ = result_->Fetch();
        } catch (const std::exception& e) {
            throw EngineException(e.what());
        }
        if (result_->HasError()) {
            throw EngineException(result_->GetError());
        }

        chunk_offset_ = 0;
        if (!chunk_ || chunk_->size() == 0) {
            chunk_.reset();
            exhausted_ = true;
            return false;
        }
        return true;
    }

private:
    // Declaration order matters: the result must be released before the
    // statement, and both before the connection that owns the context
    std::unique_ptr<duckdb::Connection> connection_;
    duckdb::unique_ptr<duckdb::PreparedStatement> prepared_;
    duckdb::unique_ptr<duckdb::QueryResult> result_;
    duckdb::unique_ptr<duckdb::DataChunk> chunk_;
    duckdb::idx_t chunk_offset_ = 0;
    bool exhausted_ = false;
    std::vector<ResultColumnMeta> columns_;
};

//===----------------------------------------------------------------------===//
// DuckDBUpdateCursor - materialized rows of a DML/DDL statement
//===----------------------------------------------------------------------===//

class DuckDBUpdateCursor : public RowCursor {
public:
    DuckDBUpdateCursor(std::vector<Row> rows, std::vector<ResultColumnMeta> columns)
        : rows_(std::move(rows)), columns_(std::move(columns)) {}

    bool IsQuery() const override { return false; }

    bool HasNext() override { return position_ < rows_.size(); }

    std::vector<Row> FetchPage(size_t max_rows) override {
        std::vector<Row> page;
        while (page.size() < max_rows && position_ < rows_.size()) {
            page.push_back(std::move(rows_[position_++]));
        }
        return page;
    }

    std::vector<ResultColumnMeta> GetColumns() const override { return columns_; }

    void Close() override {
        rows_.clear();
        position_ = 0;
    }

private:
    std::vector<Row> rows_;
    size_t position_ = 0;
    std::vector<ResultColumnMeta> columns_;
};

std::vector<Row> DrainResult(duckdb::QueryResult& result) {
    std::vector<Row> rows;
    while (true) {
        auto chunk = result.Fetch();
        if (result.HasError()) {
            throw EngineException(result.GetError());
        }
        if (!chunk || chunk->size() == 0) break;

        for (duckdb::idx_t r = 0; r < chunk->size(); r++) {
            Row row;
            row.reserve(chunk->ColumnCount());
            for (duckdb::idx_t col = 0; col < chunk->ColumnCount(); col++) {
                row.push_back(chunk->GetValue(col, r));
            }
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// DuckDBQueryEngine
//===----------------------------------------------------------------------===//

DuckDBQueryEngine::DuckDBQueryEngine(std::shared_ptr<duckdb::DuckDB> db_p)
    : db_(std::move(db_p)) {
    if (!db_) {
        throw std::invalid_argument("DuckDBQueryEngine requires a database instance");
    }
}

std::unique_ptr<duckdb::Connection> DuckDBQueryEngine::OpenConnection(const std::string& schema,
                                                                      const StatementFlags& flags) {
    auto conn = std::make_unique<duckdb::Connection>(*db_);

    if (!schema.empty()) {
        RunSetting(*conn, "SET search_path = '" + EscapeLiteral(QuoteIdentifier(schema)) + "'");
    }
    if (flags.enforce_join_order) {
        RunSetting(*conn, "SET disabled_optimizers = 'join_order'");
    }
    // distributed_joins, collocated and replicated_only have no meaning on a
    // single embedded instance
    return conn;
}

std::unique_ptr<RowCursor> DuckDBQueryEngine::Submit(const Statement& statement) {
    auto conn = OpenConnection(statement.schema, statement.flags);

    auto prepared = conn->Prepare(statement.sql);
    if (prepared->HasError()) {
        throw EngineException(prepared->GetError());
    }

    auto return_type = prepared->GetStatementProperties().return_type;
    bool is_query = return_type == duckdb::StatementReturnType::QUERY_RESULT;

    if ((statement.shape == StatementShape::SELECT_ONLY && !is_query) ||
        (statement.shape == StatementShape::UPDATE_ONLY && is_query)) {
        throw EngineException(std::string("Given statement type does not match that declared by the client [expected=") +
                              StatementShapeToString(statement.shape) + "]");
    }

    duckdb::vector<duckdb::Value> params(statement.args.begin(), statement.args.end());
    auto pending = prepared->PendingQuery(params, is_query && statement.flags.lazy);
    if (pending->HasError()) {
        throw EngineException(pending->GetError());
    }
    auto result = pending->Execute();
    if (result->HasError()) {
        throw EngineException(result->GetError());
    }

    if (is_query) {
        return std::make_unique<DuckDBRowCursor>(std::move(conn), std::move(prepared),
                                                 std::move(result), statement.schema);
    }

    std::vector<ResultColumnMeta> columns;
    std::vector<Row> rows;
    if (return_type == duckdb::StatementReturnType::NOTHING) {
        // DDL and settings report no count of their own
        rows.push_back(Row{duckdb::Value::BIGINT(0)});
        ResultColumnMeta count;
        count.column_name = "Count";
        count.type = duckdb::LogicalType::BIGINT;
        columns.push_back(std::move(count));
    } else {
        for (duckdb::idx_t i = 0; i < result->ColumnCount(); i++) {
            ResultColumnMeta column;
            column.column_name = result->names[i];
            column.type = result->types[i];
            columns.push_back(std::move(column));
        }
        rows = DrainResult(*result);
    }

    DLOG_DEBUG("engine", "Statement produced {} update rows: {}", rows.size(), statement.sql);
    return std::make_unique<DuckDBUpdateCursor>(std::move(rows), std::move(columns));
}

std::vector<ParameterMeta> DuckDBQueryEngine::PrepareParams(const std::string& schema,
                                                            const std::string& sql) {
    auto conn = OpenConnection(schema, StatementFlags());

    auto prepared = conn->Prepare(sql);
    if (prepared->HasError()) {
        throw EngineException(prepared->GetError());
    }

    // Positional parameters are keyed "1", "2", ...
    auto expected = prepared->GetExpectedParameterTypes();
    std::vector<ParameterMeta> params;
    params.reserve(expected.size());
    for (size_t i = 1; i <= expected.size(); i++) {
        ParameterMeta meta;
        meta.position = static_cast<int32_t>(i);

        auto it = expected.find(std::to_string(i));
        if (it == expected.end()) {
            meta.type_name = "UNKNOWN";
        } else {
            const auto& type = it->second;
            meta.type_name = type.ToString();
            if (type.id() == duckdb::LogicalTypeId::DECIMAL) {
                meta.precision = duckdb::DecimalType::GetWidth(type);
                meta.scale = duckdb::DecimalType::GetScale(type);
            }
        }
        params.push_back(std::move(meta));
    }
    return params;
}

std::vector<Row> DuckDBQueryEngine::CatalogQuery(duckdb::Connection& conn,
                                                 const std::string& sql,
                                                 duckdb::vector<duckdb::Value> params) {
    auto prepared = conn.Prepare(sql);
    if (prepared->HasError()) {
        throw EngineException(prepared->GetError());
    }
    auto result = prepared->Execute(params, false);
    if (result->HasError()) {
        throw EngineException(result->GetError());
    }
    return DrainResult(*result);
}

std::vector<std::string> DuckDBQueryEngine::ListPublicCaches() {
    duckdb::Connection conn(*db_);
    auto rows = CatalogQuery(conn,
        "SELECT database_name FROM duckdb_databases() WHERE NOT internal ORDER BY database_name",
        {});

    std::vector<std::string> names;
    names.reserve(rows.size());
    for (auto& row : rows) {
        names.push_back(CellString(row[0]));
    }
    return names;
}

std::vector<TableDescriptor> DuckDBQueryEngine::TypesFor(const std::string& cache_name) {
    duckdb::Connection conn(*db_);
    duckdb::vector<duckdb::Value> params {duckdb::Value(cache_name)};

    std::vector<TableDescriptor> tables;
    std::map<std::pair<std::string, std::string>, size_t> by_name;

    auto table_rows = CatalogQuery(conn,
        "SELECT schema_name, table_name FROM duckdb_tables() "
        "WHERE database_name = $1 ORDER BY schema_name, table_name",
        params);
    for (auto& row : table_rows) {
        TableDescriptor table;
        table.schema_name = CellString(row[0]);
        table.table_name = CellString(row[1]);
        by_name[{table.schema_name, table.table_name}] = tables.size();
        tables.push_back(std::move(table));
    }

    auto column_rows = CatalogQuery(conn,
        "SELECT schema_name, table_name, column_name, data_type FROM duckdb_columns() "
        "WHERE database_name = $1 ORDER BY schema_name, table_name, column_index",
        params);
    for (auto& row : column_rows) {
        auto it = by_name.find({CellString(row[0]), CellString(row[1])});
        if (it == by_name.end()) continue;  // view column

        FieldDescriptor field;
        field.name = CellString(row[2]);
        field.type_name = CellString(row[3]);
        tables[it->second].fields.push_back(std::move(field));
    }

    auto key_rows = CatalogQuery(conn,
        "SELECT schema_name, table_name, constraint_column_names FROM duckdb_constraints() "
        "WHERE database_name = $1 AND constraint_type = 'PRIMARY KEY'",
        params);
    for (auto& row : key_rows) {
        auto it = by_name.find({CellString(row[0]), CellString(row[1])});
        if (it == by_name.end()) continue;

        auto& table = tables[it->second];
        auto key_columns = ExpressionList(row[2]);
        for (auto& field : table.fields) {
            if (std::find(key_columns.begin(), key_columns.end(), field.name) != key_columns.end()) {
                field.key = true;
            }
        }
    }

    auto index_rows = CatalogQuery(conn,
        "SELECT schema_name, table_name, index_name, is_unique, expressions FROM duckdb_indexes() "
        "WHERE database_name = $1 ORDER BY schema_name, table_name, index_name",
        params);
    for (auto& row : index_rows) {
        auto it = by_name.find({CellString(row[0]), CellString(row[1])});
        if (it == by_name.end()) continue;

        IndexDescriptor index;
        index.name = CellString(row[2]);
        index.unique = !row[3].IsNull() && row[3].GetValue<bool>();
        index.fields = ExpressionList(row[4]);
        // DuckDB ART indexes have no sort direction
        index.ascending.assign(index.fields.size(), true);
        tables[it->second].indexes.push_back(std::move(index));
    }

    DLOG_DEBUG("engine", "Loaded {} tables from database {}", tables.size(), cache_name);
    return tables;
}

} // namespace sqlbridge
