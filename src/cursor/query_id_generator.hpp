//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/query_id_generator.hpp
//
// Process-wide source of query cursor ids
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace sqlbridge {

class QueryIdGenerator {
public:
    // Unique across every handler in the process; ids are never reused
    static uint64_t Next();

private:
    static std::atomic<uint64_t> next_id_;
};

} // namespace sqlbridge
