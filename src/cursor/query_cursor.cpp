//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/query_cursor.cpp
//===----------------------------------------------------------------------===//

#include "cursor/query_cursor.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace sqlbridge {

QueryCursor::QueryCursor(uint64_t id, int32_t page_size, int32_t max_rows,
                         std::unique_ptr<RowCursor> rows)
    : id_(id)
    , max_rows_(max_rows)
    , is_query_(rows->IsQuery())
    , page_size_(page_size)
    , rows_(std::move(rows)) {
}

QueryCursor::~QueryCursor() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_WARN("cursor", "Failed to release query cursor " + std::to_string(id_) + ": " + e.what());
    }
}

void QueryCursor::SetPageSize(int32_t page_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    page_size_ = page_size;
}

int32_t QueryCursor::GetPageSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page_size_;
}

std::vector<Row> QueryCursor::FetchPage() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw EngineException("Query cursor is closed [queryId=" + std::to_string(id_) + "]");
    }

    size_t limit = static_cast<size_t>(page_size_);
    if (max_rows_ > 0) {
        int64_t remaining = static_cast<int64_t>(max_rows_) - fetched_;
        if (remaining <= 0) {
            return {};
        }
        limit = std::min(limit, static_cast<size_t>(remaining));
    }

    auto page = rows_->FetchPage(limit);
    fetched_ += static_cast<int64_t>(page.size());
    return page;
}

bool QueryCursor::HasNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    if (max_rows_ > 0 && fetched_ >= max_rows_) {
        return false;
    }
    return rows_->HasNext();
}

std::vector<ResultColumnMeta> QueryCursor::GetColumns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_->GetColumns();
}

void QueryCursor::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.exchange(true)) {
        return;
    }
    rows_->Close();
    DLOG_TRACE("cursor", "Closed query cursor {} after {} rows", id_, fetched_);
}

} // namespace sqlbridge
