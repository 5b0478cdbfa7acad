//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/cursor_registry.hpp
//
// Open query cursors of one handler, keyed by query id
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "cursor/query_cursor.hpp"
#include <parallel_hashmap/phmap.h>

namespace sqlbridge {

class CursorRegistry {
public:
    CursorRegistry() = default;

    // Non-copyable
    CursorRegistry(const CursorRegistry&) = delete;
    CursorRegistry& operator=(const CursorRegistry&) = delete;

    // false if the id is already registered
    bool Insert(uint64_t id, QueryCursorPtr cursor);

    // nullptr if not registered
    QueryCursorPtr Get(uint64_t id) const;

    // Atomically unregisters and returns the cursor, nullptr if not registered
    QueryCursorPtr Remove(uint64_t id);

    // Unregisters every cursor; the caller closes them
    std::vector<QueryCursorPtr> RemoveAll();

    // Unregisters and closes every cursor. A failing close is logged and
    // does not stop the sweep. Returns the number of cursors removed.
    size_t CloseAll();

    size_t Size() const;

private:
    // Sharded map with per-submap locks, atomic per key
    phmap::parallel_flat_hash_map<
        uint64_t,
        QueryCursorPtr,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, QueryCursorPtr>>,
        4,
        std::mutex
    > cursors_;
};

} // namespace sqlbridge
