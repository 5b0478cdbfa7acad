//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// cursor/query_id_generator.cpp
//===----------------------------------------------------------------------===//

#include "cursor/query_id_generator.hpp"

namespace sqlbridge {

std::atomic<uint64_t> QueryIdGenerator::next_id_{1};

uint64_t QueryIdGenerator::Next() {
    return next_id_.fetch_add(1);
}

} // namespace sqlbridge
