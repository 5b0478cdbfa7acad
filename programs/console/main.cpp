//===----------------------------------------------------------------------===//
//                         SqlBridge Console
//
// programs/console/main.cpp
//
// Interactive driver for one request handler session on an embedded DuckDB
// database. SQL text goes through Execute/Fetch/Close, backslash commands
// map to the metadata and batch requests.
//
// Usage:
//   sqlbridge_console -d data.duckdb
//   sqlbridge_console -c sqlbridge.yaml --lazy
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "engine/duckdb_query_engine.hpp"
#include "handler/request_handler.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <readline/readline.h>
#include <readline/history.h>

using namespace sqlbridge;

static std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> SplitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

static std::string Arg(const std::vector<std::string>& words, size_t i) {
    return i < words.size() ? words[i] : std::string();
}

static void PrintVersion() {
    std::cout << "SqlBridge Console " << SQLBRIDGE_VERSION << "\n"
              << "Git commit: " << SQLBRIDGE_GIT_COMMIT << "\n"
              << "Build type: " << SQLBRIDGE_BUILD_TYPE << "\n"
              << "Build time: " << SQLBRIDGE_BUILD_TIME << "\n";
}

static void PrintHelp() {
    std::cout <<
        "\nSqlBridge console\n"
        "\nCommands:\n"
        "  SQL ending with ';'                 Execute and page through the result\n"
        "  \\tables [schema] [table]           List tables (SQL wildcards % and _)\n"
        "  \\columns [schema] [table] [column] List columns\n"
        "  \\indexes [schema] [table]          List indexes\n"
        "  \\pk [schema] [table]               List primary keys\n"
        "  \\schemas [schema]                  List schemas\n"
        "  \\params SQL                        Show parameter types of SQL\n"
        "  \\batch SQL [| args]; [| args]...   Run a batch, entries without SQL reuse the previous SQL\n"
        "  \\cursors                           Number of open cursors\n"
        "  \\version                           Server version\n"
        "  \\q                                 Quit\n\n";
}

static bool PrintFailure(const Response& response) {
    if (response.IsSuccess()) {
        return false;
    }
    std::cerr << "Error: " << response.error << "\n";
    return true;
}

static void PrintRows(const std::vector<Row>& rows) {
    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size(); c++) {
            if (c) std::cout << "\t";
            std::cout << (row[c].IsNull() ? std::string("NULL") : row[c].ToString());
        }
        std::cout << "\n";
    }
}

//===----------------------------------------------------------------------===//
// Console session
//===----------------------------------------------------------------------===//

class ConsoleSession {
public:
    ConsoleSession(RequestHandler& handler, int32_t page_size)
        : handler_(handler), page_size_(page_size) {}

    void ExecuteSql(const std::string& sql) {
        ExecuteRequest execute;
        execute.sql = sql;
        execute.page_size = page_size_;

        auto response = Send(execute);
        if (PrintFailure(response)) return;

        const auto* result = response.As<QueryExecuteResult>();
        if (!result->is_query) {
            std::cout << "(" << result->update_count << " rows affected)\n\n";
            return;
        }

        PrintHeader(result->columns);

        size_t total = result->items.size();
        PrintRows(result->items);

        bool last = result->last;
        while (!last) {
            FetchRequest fetch;
            fetch.query_id = result->query_id;
            fetch.page_size = page_size_;

            auto page = Send(fetch);
            if (PrintFailure(page)) {
                // A failed fetch leaves the cursor registered
                PrintFailure(Send(CloseRequest{result->query_id}));
                return;
            }

            const auto* rows = page.As<QueryFetchResult>();
            PrintRows(rows->items);
            total += rows->items.size();
            last = rows->last;
        }

        if (!handler_.GetConfig().auto_close_cursors) {
            PrintFailure(Send(CloseRequest{result->query_id}));
        }
        std::cout << "(" << total << " row" << (total != 1 ? "s" : "") << ")\n\n";
    }

    void Tables(const std::vector<std::string>& words) {
        auto response = Send(MetaTablesRequest{Arg(words, 1), Arg(words, 2)});
        if (PrintFailure(response)) return;
        for (const auto& t : response.As<MetaTablesResult>()->tables) {
            std::cout << t.schema_name << "\t" << t.table_name << "\t" << t.table_type << "\n";
        }
        std::cout << "\n";
    }

    void Columns(const std::vector<std::string>& words) {
        auto response = Send(MetaColumnsRequest{Arg(words, 1), Arg(words, 2), Arg(words, 3)});
        if (PrintFailure(response)) return;
        for (const auto& c : response.As<MetaColumnsResult>()->columns) {
            std::cout << c.schema_name << "\t" << c.table_name << "\t" << c.column_name << "\t"
                      << c.type_name << "\n";
        }
        std::cout << "\n";
    }

    void Indexes(const std::vector<std::string>& words) {
        auto response = Send(MetaIndexesRequest{Arg(words, 1), Arg(words, 2)});
        if (PrintFailure(response)) return;
        for (const auto& i : response.As<MetaIndexesResult>()->indexes) {
            std::cout << i.schema_name << "\t" << i.table_name << "\t" << i.index.name
                      << (i.index.unique ? "\tUNIQUE\t" : "\t\t");
            for (size_t f = 0; f < i.index.fields.size(); f++) {
                if (f) std::cout << ", ";
                std::cout << i.index.fields[f];
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    void PrimaryKeys(const std::vector<std::string>& words) {
        auto response = Send(MetaPrimaryKeysRequest{Arg(words, 1), Arg(words, 2)});
        if (PrintFailure(response)) return;
        for (const auto& k : response.As<MetaPrimaryKeysResult>()->primary_keys) {
            std::cout << k.schema_name << "\t" << k.table_name << "\t" << k.key_name << "\t";
            for (size_t f = 0; f < k.fields.size(); f++) {
                if (f) std::cout << ", ";
                std::cout << k.fields[f];
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    void Schemas(const std::vector<std::string>& words) {
        auto response = Send(MetaSchemasRequest{Arg(words, 1)});
        if (PrintFailure(response)) return;
        for (const auto& schema : response.As<MetaSchemasResult>()->schemas) {
            std::cout << schema << "\n";
        }
        std::cout << "\n";
    }

    void Params(const std::string& sql) {
        auto response = Send(MetaParamsRequest{std::string(), sql});
        if (PrintFailure(response)) return;
        for (const auto& p : response.As<MetaParamsResult>()->params) {
            std::cout << "$" << p.position << "\t" << p.type_name;
            if (p.precision > 0) {
                std::cout << "(" << p.precision << "," << p.scale << ")";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    // "INSERT INTO t VALUES (?, ?) | 1, a; | 2, b"
    void Batch(const std::string& text) {
        BatchExecuteRequest batch;

        std::istringstream entries(text);
        std::string entry;
        while (std::getline(entries, entry, ';')) {
            if (Trim(entry).empty()) continue;

            BatchQuery query;
            auto bar = entry.find('|');
            std::string sql = Trim(entry.substr(0, bar));
            if (!sql.empty()) {
                query.sql = sql;
            }
            if (bar != std::string::npos) {
                std::istringstream args(entry.substr(bar + 1));
                std::string arg;
                while (std::getline(args, arg, ',')) {
                    query.args.push_back(duckdb::Value(Trim(arg)));
                }
            }
            batch.queries.push_back(std::move(query));
        }

        auto response = Send(std::move(batch));
        const auto* result = response.As<BatchExecuteResult>();
        if (result) {
            std::cout << "Update counts:";
            for (auto count : result->update_counts) {
                std::cout << " " << count;
            }
            std::cout << "\n";
        }
        PrintFailure(response);
        std::cout << "\n";
    }

private:
    Response Send(RequestBody body) {
        return handler_.Handle(Request(++request_id_, std::move(body)));
    }

    void PrintHeader(const std::vector<ResultColumnMeta>& columns) {
        for (size_t c = 0; c < columns.size(); c++) {
            if (c) std::cout << "\t";
            std::cout << columns[c].column_name;
        }
        std::cout << "\n";
        for (size_t c = 0; c < columns.size(); c++) {
            if (c) std::cout << "\t";
            std::cout << std::string(columns[c].column_name.size(), '-');
        }
        std::cout << "\n";
    }

private:
    RequestHandler& handler_;
    int32_t page_size_;
    uint64_t request_id_ = 0;
};

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version;
        ServerConfig config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        Logger::Initialize(config.ToLogOptions());

        LOG_INFO("console", "Opening database: " + config.database_path);
        auto db = std::make_shared<duckdb::DuckDB>(config.database_path);
        auto engine = std::make_shared<DuckDBQueryEngine>(db);
        auto gate = std::make_shared<ShutdownGate>();

        RequestHandler handler(engine, gate, config.ToHandlerConfig());
        ConsoleSession session(handler, config.page_size);

        auto handshake = handler.WriteHandshake();
        std::cout << "SqlBridge " << handshake.version.ToString() << " on " << config.database_path << "\n"
                  << "Enter SQL followed by ';'  |  \\help for commands  |  \\q to exit\n\n";

        using_history();

        std::string buf;
        bool multiline = false;

        while (true) {
            const char* prompt = multiline ? "   ...> " : "sqlbridge> ";
            char* raw = readline(prompt);
            if (!raw) { std::cout << "\n"; break; }

            std::string line(raw);
            free(raw);

            if (Trim(line).empty()) continue;
            add_history(line.c_str());

            // Commands only at the start of a fresh statement
            std::string command = Trim(line);
            if (!multiline && command[0] == '\\') {
                auto words = SplitWords(command);
                const auto& name = words[0];
                std::string rest = Trim(command.substr(name.size()));

                if (name == "\\q" || name == "\\quit") break;
                else if (name == "\\help" || name == "\\h") PrintHelp();
                else if (name == "\\tables") session.Tables(words);
                else if (name == "\\columns") session.Columns(words);
                else if (name == "\\indexes") session.Indexes(words);
                else if (name == "\\pk") session.PrimaryKeys(words);
                else if (name == "\\schemas") session.Schemas(words);
                else if (name == "\\params") session.Params(rest);
                else if (name == "\\batch") session.Batch(rest);
                else if (name == "\\cursors") std::cout << handler.GetOpenCursorCount() << " open cursors\n\n";
                else if (name == "\\version") std::cout << handshake.version.ToString() << "\n\n";
                else std::cerr << "Unknown command: " << name << "\n";
                continue;
            }

            buf += (multiline ? "\n" : "") + line;

            if (Trim(buf).back() != ';') { multiline = true; continue; }
            multiline = false;

            session.ExecuteSql(buf);
            buf.clear();
        }

        handler.OnDisconnect();
        gate->Block();
        Logger::Shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
