//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/metadata_resolver.cpp
//===----------------------------------------------------------------------===//

#include "handler/metadata_resolver.hpp"
#include "handler/query_executor.hpp"
#include "logging/logger.hpp"
#include <parallel_hashmap/phmap.h>

namespace sqlbridge {

namespace {

// Unit separator, never part of a catalog name
constexpr char KEY_SEPARATOR = '\x1f';

void AddKeyPart(std::string& key, const std::string& part) {
    key += part;
    key += KEY_SEPARATOR;
}

std::string DedupKey(const std::string& schema_name) {
    return schema_name;
}

std::string DedupKey(const TableMeta& table) {
    std::string key;
    AddKeyPart(key, table.schema_name);
    AddKeyPart(key, table.table_name);
    AddKeyPart(key, table.table_type);
    return key;
}

std::string DedupKey(const ColumnMeta& column) {
    std::string key;
    AddKeyPart(key, column.schema_name);
    AddKeyPart(key, column.table_name);
    AddKeyPart(key, column.column_name);
    AddKeyPart(key, column.type_name);
    return key;
}

std::string DedupKey(const IndexMeta& index) {
    std::string key;
    AddKeyPart(key, index.schema_name);
    AddKeyPart(key, index.table_name);
    AddKeyPart(key, index.index.name);
    AddKeyPart(key, index.index.unique ? "U" : "N");
    AddKeyPart(key, std::to_string(index.index.fields.size()));
    for (const auto& field : index.index.fields) {
        AddKeyPart(key, field);
    }
    for (bool asc : index.index.ascending) {
        key += asc ? 'A' : 'D';
    }
    return key;
}

std::string DedupKey(const PrimaryKeyMeta& primary_key) {
    std::string key;
    AddKeyPart(key, primary_key.schema_name);
    AddKeyPart(key, primary_key.table_name);
    AddKeyPart(key, primary_key.key_name);
    for (const auto& field : primary_key.fields) {
        AddKeyPart(key, field);
    }
    return key;
}

// Appends items not seen before, keeping first-seen order
template <typename T>
class UniqueAppender {
public:
    explicit UniqueAppender(std::vector<T>& items) : items_(items) {}

    void Append(T item) {
        if (seen_.insert(DedupKey(item)).second) {
            items_.push_back(std::move(item));
        }
    }

private:
    std::vector<T>& items_;
    phmap::flat_hash_set<std::string> seen_;
};

} // anonymous namespace

MetadataResolver::MetadataResolver(QueryEngine& engine) : engine_(engine) {
}

template <typename F>
void MetadataResolver::ForEachTable(const SqlPattern& schema_pattern, const SqlPattern& table_pattern, F&& fn) {
    for (const auto& cache_name : engine_.ListPublicCaches()) {
        for (const auto& table : engine_.TypesFor(cache_name)) {
            if (!schema_pattern.Matches(table.schema_name)) continue;
            if (!table_pattern.Matches(table.table_name)) continue;
            fn(table);
        }
    }
}

Response MetadataResolver::Failure(const Request& request, const char* what, const std::exception& e) {
    LOG_ERROR("metadata", std::string("Failed to get ") + what + " metadata [reqId=" +
              std::to_string(request.request_id) + ", req=" + RequestToString(request) + "]: " + e.what());
    return Response::Failed(e.what());
}

Response MetadataResolver::GetTables(const Request& request, const MetaTablesRequest& meta) {
    try {
        MetaTablesResult result;
        UniqueAppender<TableMeta> tables(result.tables);
        ForEachTable(SqlPattern(meta.schema_pattern), SqlPattern(meta.table_pattern),
                     [&tables](const TableDescriptor& table) {
            tables.Append(TableMeta{table.schema_name, table.table_name, TABLE_TYPE});
        });
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "tables", e);
    }
}

Response MetadataResolver::GetColumns(const Request& request, const MetaColumnsRequest& meta) {
    try {
        SqlPattern column_pattern(meta.column_pattern);

        MetaColumnsResult result;
        UniqueAppender<ColumnMeta> columns(result.columns);
        ForEachTable(SqlPattern(meta.schema_pattern), SqlPattern(meta.table_pattern),
                     [&](const TableDescriptor& table) {
            for (const auto& field : table.fields) {
                if (!column_pattern.Matches(field.name)) continue;
                columns.Append(ColumnMeta{table.schema_name, table.table_name, field.name, field.type_name});
            }
        });
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "columns", e);
    }
}

Response MetadataResolver::GetIndexes(const Request& request, const MetaIndexesRequest& meta) {
    try {
        MetaIndexesResult result;
        UniqueAppender<IndexMeta> indexes(result.indexes);
        ForEachTable(SqlPattern(meta.schema_pattern), SqlPattern(meta.table_pattern),
                     [&indexes](const TableDescriptor& table) {
            for (const auto& index : table.indexes) {
                indexes.Append(IndexMeta{table.schema_name, table.table_name, index});
            }
        });
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "indexes", e);
    }
}

Response MetadataResolver::GetParams(const Request& request, const MetaParamsRequest& meta) {
    try {
        MetaParamsResult result;
        result.params = engine_.PrepareParams(ResolveSchema(meta.schema), meta.sql);
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "parameters", e);
    }
}

Response MetadataResolver::GetPrimaryKeys(const Request& request, const MetaPrimaryKeysRequest& meta) {
    try {
        MetaPrimaryKeysResult result;
        UniqueAppender<PrimaryKeyMeta> primary_keys(result.primary_keys);
        ForEachTable(SqlPattern(meta.schema_pattern), SqlPattern(meta.table_pattern),
                     [&primary_keys](const TableDescriptor& table) {
            PrimaryKeyMeta key;
            key.schema_name = table.schema_name;
            key.table_name = table.table_name;
            key.key_name = table.key_field_name ? *table.key_field_name
                                                : "PK_" + table.schema_name + "_" + table.table_name;

            for (const auto& field : table.fields) {
                if (field.key) {
                    key.fields.push_back(field.name);
                }
            }
            if (key.fields.empty()) {
                key.fields.push_back(IMPLICIT_KEY_FIELD);
            }

            primary_keys.Append(std::move(key));
        });
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "primary keys", e);
    }
}

Response MetadataResolver::GetSchemas(const Request& request, const MetaSchemasRequest& meta) {
    try {
        MetaSchemasResult result;
        UniqueAppender<std::string> schemas(result.schemas);
        ForEachTable(SqlPattern(meta.schema_pattern), SqlPattern(std::string()),
                     [&schemas](const TableDescriptor& table) {
            schemas.Append(table.schema_name);
        });
        return Response::Success(std::move(result));
    } catch (const std::exception& e) {
        return Failure(request, "schemas", e);
    }
}

} // namespace sqlbridge
