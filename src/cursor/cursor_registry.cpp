//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/cursor_registry.cpp
//===----------------------------------------------------------------------===//

#include "cursor/cursor_registry.hpp"
#include "logging/logger.hpp"

namespace sqlbridge {

bool CursorRegistry::Insert(uint64_t id, QueryCursorPtr cursor) {
    return cursors_.insert({id, std::move(cursor)}).second;
}

QueryCursorPtr CursorRegistry::Get(uint64_t id) const {
    QueryCursorPtr result;
    cursors_.if_contains(id, [&result](const auto& item) {
        result = item.second;
    });
    return result;
}

QueryCursorPtr CursorRegistry::Remove(uint64_t id) {
    QueryCursorPtr result;
    cursors_.erase_if(id, [&result](auto& item) {
        result = std::move(item.second);
        return true;
    });
    return result;
}

std::vector<QueryCursorPtr> CursorRegistry::RemoveAll() {
    std::vector<uint64_t> ids;
    cursors_.for_each([&ids](const auto& item) {
        ids.push_back(item.first);
    });

    // A concurrent Remove may win for some ids
    std::vector<QueryCursorPtr> removed;
    removed.reserve(ids.size());
    for (uint64_t id : ids) {
        auto cursor = Remove(id);
        if (cursor) {
            removed.push_back(std::move(cursor));
        }
    }
    return removed;
}

size_t CursorRegistry::CloseAll() {
    auto removed = RemoveAll();
    for (auto& cursor : removed) {
        try {
            cursor->Close();
        } catch (const std::exception& e) {
            LOG_WARN("cursor", "Failed to close query cursor " + std::to_string(cursor->GetId()) +
                     ": " + e.what());
        }
    }

    if (!removed.empty()) {
        LOG_DEBUG("cursor", "Closed " + std::to_string(removed.size()) + " query cursors");
    }
    return removed.size();
}

size_t CursorRegistry::Size() const {
    return cursors_.size();
}

} // namespace sqlbridge
