//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/query_cursor.hpp
//
// Server-side handle over the paginated result of one executed statement
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/query_engine.hpp"

namespace sqlbridge {

class QueryCursor {
public:
    // max_rows caps the rows ever returned, 0 = unbounded
    QueryCursor(uint64_t id, int32_t page_size, int32_t max_rows,
                std::unique_ptr<RowCursor> rows);

    // Releases the engine cursor if Close() was never called
    ~QueryCursor();

    // Non-copyable
    QueryCursor(const QueryCursor&) = delete;
    QueryCursor& operator=(const QueryCursor&) = delete;

    uint64_t GetId() const { return id_; }
    bool IsQuery() const { return is_query_; }

    void SetPageSize(int32_t page_size);
    int32_t GetPageSize() const;
    int32_t GetMaxRows() const { return max_rows_; }

    // Next page of at most page size rows, never past max rows.
    // Throws EngineException, also when the cursor was closed.
    std::vector<Row> FetchPage();

    // true while rows remain and the max rows cap has not been reached
    bool HasNext();

    std::vector<ResultColumnMeta> GetColumns() const;

    // Idempotent
    void Close();
    bool IsClosed() const { return closed_.load(); }

private:
    const uint64_t id_;
    const int32_t max_rows_;
    const bool is_query_;

    mutable std::mutex mutex_;
    int32_t page_size_;
    int64_t fetched_ = 0;
    std::unique_ptr<RowCursor> rows_;
    std::atomic<bool> closed_{false};
};

} // namespace sqlbridge
