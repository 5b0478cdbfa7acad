//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/request_handler.hpp
//
// Entry point for one client session: admits each request through the
// shutdown gate, routes it by kind and always answers with a Response
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/handler_config.hpp"
#include "cursor/cursor_registry.hpp"
#include "handler/batch_executor.hpp"
#include "handler/metadata_resolver.hpp"
#include "handler/query_executor.hpp"
#include "handler/shutdown_gate.hpp"
#include "protocol/handshake.hpp"
#include "protocol/request.hpp"
#include "protocol/response.hpp"

namespace sqlbridge {

class RequestHandler {
public:
    RequestHandler(std::shared_ptr<QueryEngine> engine,
                   std::shared_ptr<ShutdownGate> gate,
                   const HandlerConfig& config);

    ~RequestHandler();

    // Non-copyable
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    Response Handle(const Request& request);

    // Response for a failure that happened outside Handle(), e.g. while
    // decoding the request
    Response HandleException(const std::exception& e) const;

    HandshakeResult WriteHandshake() const;

    // Closes every open cursor of this session. Skipped when the node is
    // stopping; the cursors are then released with the handler.
    void OnDisconnect() noexcept;

    size_t GetOpenCursorCount() const { return registry_.Size(); }
    const HandlerConfig& GetConfig() const { return config_; }

private:
    Response Dispatch(const Request& request);

private:
    std::shared_ptr<QueryEngine> engine_;
    std::shared_ptr<ShutdownGate> gate_;
    const HandlerConfig config_;

    CursorRegistry registry_;
    QueryExecutor query_executor_;
    BatchExecutor batch_executor_;
    MetadataResolver metadata_resolver_;
};

} // namespace sqlbridge
