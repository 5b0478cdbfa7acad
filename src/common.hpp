//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// common.hpp
//
// Common definitions and includes for SqlBridge
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <stdexcept>

// DuckDB includes
#include "duckdb.hpp"

namespace sqlbridge {

// One result row, one cell per column
using Row = std::vector<duckdb::Value>;

// Forward declarations
class QueryEngine;
class RowCursor;
class QueryCursor;
class CursorRegistry;
class ShutdownGate;
class RequestHandler;
struct HandlerConfig;

// Shared pointer types
using QueryCursorPtr = std::shared_ptr<QueryCursor>;

// Visitor built from lambdas, one per variant alternative
template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Constants
constexpr const char* DEFAULT_SCHEMA = "main";
constexpr uint32_t DEFAULT_MAX_OPEN_CURSORS = 128;
constexpr int32_t DEFAULT_PAGE_SIZE = 1024;

//===----------------------------------------------------------------------===//
// Exceptions
//===----------------------------------------------------------------------===//

// Failure reported by the query engine (parse, plan, execution)
class EngineException : public std::runtime_error {
public:
    explicit EngineException(const std::string& message)
        : std::runtime_error(message) {}
};

// Broken internal invariant; never an expected client-facing error
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace sqlbridge
