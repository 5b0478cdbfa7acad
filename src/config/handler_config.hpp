//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// config/handler_config.hpp
//
// Per-session execution settings, fixed when a RequestHandler is created
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace sqlbridge {

struct HandlerConfig {
    bool distributed_joins = false;
    bool enforce_join_order = false;
    bool collocated = false;
    bool replicated_only = false;
    bool lazy = false;

    // Close a query cursor as soon as its last page has been returned
    bool auto_close_cursors = false;

    // 0 = unlimited
    uint32_t max_open_cursors = DEFAULT_MAX_OPEN_CURSORS;
};

} // namespace sqlbridge
