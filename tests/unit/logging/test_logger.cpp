//===----------------------------------------------------------------------===//
//                         SqlBridge Server - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger: level names, line layout, file rotation, concurrent
// initialization and the levels the request handler logs at
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include "handler/request_handler.hpp"
#include "handler/fake_query_engine.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <regex>
#include <set>
#include <thread>
#include <vector>

using namespace sqlbridge;
using namespace sqlbridge::test;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static void StartFileLog(const std::string& path, const std::string& level) {
    std::filesystem::remove(path);
    Logger::Shutdown();

    LogOptions options;
    options.file = path;
    options.level = level;
    Logger::Initialize(options);
}

// Shuts the logger down so the file is complete, then returns its lines
static std::vector<std::string> StopAndReadLog(const std::string& path) {
    Logger::Flush();
    Logger::Shutdown();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    std::filesystem::remove(path);
    return lines;
}

static bool HasLine(const std::vector<std::string>& lines, const std::string& level, const std::string& text) {
    for (const auto& line : lines) {
        if (line.find("[" + level + "]") != std::string::npos && line.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static bool Mentions(const std::vector<std::string>& lines, const std::string& text) {
    for (const auto& line : lines) {
        if (line.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Level Tests
//===----------------------------------------------------------------------===//

void TestParseLevel() {
    std::cout << "  Testing level names..." << std::endl;

    auto level = spdlog::level::info;
    assert(Logger::ParseLevel("trace", level) && level == spdlog::level::trace);
    assert(Logger::ParseLevel("Warning", level) && level == spdlog::level::warn);
    assert(Logger::ParseLevel("ERR", level) && level == spdlog::level::err);
    assert(Logger::ParseLevel("fatal", level) && level == spdlog::level::critical);
    assert(Logger::ParseLevel("OFF", level) && level == spdlog::level::off);

    level = spdlog::level::debug;
    assert(!Logger::ParseLevel("verbose", level));
    assert(!Logger::ParseLevel("", level));
    assert(level == spdlog::level::debug);

    std::cout << "    PASSED" << std::endl;
}

void TestUnknownLevelFallsBackToInfo() {
    std::cout << "  Testing unknown level falls back to info..." << std::endl;

    std::string path = "/tmp/sqlbridge_test_unknown_level.log";
    StartFileLog(path, "verbose");
    assert(Logger::Get()->level() == spdlog::level::info);
    LOG_DEBUG("test", "hidden debug line");

    auto lines = StopAndReadLog(path);
    assert(Mentions(lines, "[logger] Unknown log level 'verbose', using info"));
    assert(!Mentions(lines, "hidden debug line"));

    std::cout << "    PASSED" << std::endl;
}

void TestOffLevelSilencesEverything() {
    std::cout << "  Testing off level..." << std::endl;

    std::string path = "/tmp/sqlbridge_test_off_level.log";
    StartFileLog(path, "off");
    assert(!Logger::Get()->should_log(spdlog::level::critical));

    LOG_ERROR("test", "error line");
    LOG_FATAL("test", "fatal line");
    DLOG_FATAL("test", "fatal line {}", 2);

    auto lines = StopAndReadLog(path);
    assert(lines.empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Output Tests
//===----------------------------------------------------------------------===//

void TestLineLayout() {
    std::cout << "  Testing line layout with thread id and component..." << std::endl;

    std::string path = "/tmp/sqlbridge_test_layout.log";
    StartFileLog(path, "info");

    LOG_INFO("handler", "Layout line");
    std::thread worker([]() { DLOG_INFO("cursor", "Layout line from {}", "worker"); });
    worker.join();

    auto lines = StopAndReadLog(path);
    assert(lines.size() == 2);

    std::regex layout(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[info\] \[t(\d+)\] \[(\w+)\] Layout line.*)");
    std::smatch main_match;
    std::smatch worker_match;
    assert(std::regex_match(lines[0], main_match, layout));
    assert(std::regex_match(lines[1], worker_match, layout));
    assert(main_match[2] == "handler");
    assert(worker_match[2] == "cursor");
    assert(main_match[1] != worker_match[1]);
    assert(lines[1].find("Layout line from worker") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

void TestFileRotation() {
    std::cout << "  Testing file rotation options..." << std::endl;

    std::string path = "/tmp/sqlbridge_test_rotation.log";
    std::string rotated = "/tmp/sqlbridge_test_rotation.1.log";
    std::string beyond_limit = "/tmp/sqlbridge_test_rotation.2.log";
    std::filesystem::remove(path);
    std::filesystem::remove(rotated);
    std::filesystem::remove(beyond_limit);

    Logger::Shutdown();
    LogOptions options;
    options.file = path;
    options.max_file_size = 4 * 1024;
    options.max_files = 1;
    Logger::Initialize(options);

    std::string padding(200, 'x');
    for (int i = 0; i < 100; i++) {
        LOG_INFO("test", padding);
    }
    Logger::Flush();
    Logger::Shutdown();

    assert(std::filesystem::exists(path));
    assert(std::filesystem::exists(rotated));
    assert(!std::filesystem::exists(beyond_limit));
    assert(std::filesystem::file_size(path) <= options.max_file_size);

    std::filesystem::remove(path);
    std::filesystem::remove(rotated);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Initialization Tests
//===----------------------------------------------------------------------===//

void TestConcurrentInitialize() {
    std::cout << "  Testing concurrent initialization..." << std::endl;

    Logger::Shutdown();

    const std::vector<std::string> levels = {"trace", "debug", "warn", "error"};
    std::mutex mutex;
    std::set<spdlog::logger*> seen;
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&, i]() {
            LogOptions options;
            options.level = levels[i % levels.size()];
            Logger::Initialize(options);
            DLOG_DEBUG("test", "thread {} initialized", i);

            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(Logger::Get().get());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // One logger, configured by whichever call won
    assert(seen.size() == 1);
    auto level = Logger::Get()->level();
    assert(level == spdlog::level::trace || level == spdlog::level::debug ||
           level == spdlog::level::warn || level == spdlog::level::err);

    // Ignored until Shutdown
    LogOptions options;
    options.level = "off";
    Logger::Initialize(options);
    assert(Logger::Get()->level() == level);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Handler Logging Tests
//===----------------------------------------------------------------------===//

void TestHandlerLogLevels() {
    std::cout << "  Testing handler failures are logged at their level..." << std::endl;

    std::string path = "/tmp/sqlbridge_test_handler_levels.log";
    StartFileLog(path, "info");

    auto engine = std::make_shared<FakeQueryEngine>();
    engine->AddFailure("SELECT broken", "Binder Error: column not found");
    engine->AddRawUpdate("UPDATE two_rows", {Row{duckdb::Value::BIGINT(1)}, Row{duckdb::Value::BIGINT(2)}});
    engine->AddUnknownFailure("SELECT crash");
    {
        RequestHandler handler(engine, std::make_shared<ShutdownGate>(), HandlerConfig());

        ExecuteRequest broken;
        broken.sql = "SELECT broken";
        assert(!handler.Handle(Request(5, broken)).IsSuccess());

        ExecuteRequest malformed;
        malformed.sql = "UPDATE two_rows";
        assert(!handler.Handle(Request(6, malformed)).IsSuccess());

        ExecuteRequest crash;
        crash.sql = "SELECT crash";
        assert(!handler.Handle(Request(7, crash)).IsSuccess());

        BatchExecuteRequest batch;
        batch.queries.push_back(BatchQuery{std::string("SELECT broken"), {}});
        assert(!handler.Handle(Request(8, batch)).IsSuccess());

        // Client mistakes are answered, not logged as failures
        assert(!handler.Handle(Request(9, FetchRequest{424242, 10})).IsSuccess());
    }

    auto lines = StopAndReadLog(path);
    assert(HasLine(lines, "error", "[handler] Failed to execute SQL query [reqId=5"));
    assert(HasLine(lines, "error", "Binder Error: column not found"));
    assert(HasLine(lines, "critical", "[handler] Internal error executing query [reqId=6"));
    assert(HasLine(lines, "error", "[handler] Unknown failure handling request [reqId=7"));
    assert(HasLine(lines, "error", "[batch] Failed to execute batch query [reqId=8"));
    assert(!Mentions(lines, "reqId=9"));
    assert(!Mentions(lines, "424242"));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Levels:" << std::endl;
    TestParseLevel();
    TestUnknownLevelFallsBackToInfo();
    TestOffLevelSilencesEverything();

    std::cout << "\n2. Output:" << std::endl;
    TestLineLayout();
    TestFileRotation();

    std::cout << "\n3. Initialization:" << std::endl;
    TestConcurrentInitialize();

    std::cout << "\n4. Handler Logging:" << std::endl;
    TestHandlerLogLevels();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
