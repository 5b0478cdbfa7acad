//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/request_handler.cpp
//===----------------------------------------------------------------------===//

#include "handler/request_handler.hpp"
#include "logging/logger.hpp"

namespace sqlbridge {

namespace {

constexpr const char* NODE_STOPPING_ERROR = "Failed to handle request because node is stopping.";
constexpr const char* UNKNOWN_ERROR = "Unknown error while handling request.";

QueryEngine& RequireEngine(const std::shared_ptr<QueryEngine>& engine) {
    if (!engine) {
        throw std::invalid_argument("RequestHandler requires a query engine");
    }
    return *engine;
}

} // anonymous namespace

RequestHandler::RequestHandler(std::shared_ptr<QueryEngine> engine,
                               std::shared_ptr<ShutdownGate> gate,
                               const HandlerConfig& config)
    : engine_(std::move(engine))
    , gate_(std::move(gate))
    , config_(config)
    , query_executor_(RequireEngine(engine_), registry_, config_)
    , batch_executor_(*engine_, config_)
    , metadata_resolver_(*engine_) {
    if (!gate_) {
        throw std::invalid_argument("RequestHandler requires a shutdown gate");
    }

    LOG_DEBUG("handler", "Request handler created (max_open_cursors=" +
              std::to_string(config_.max_open_cursors) + ", auto_close_cursors=" +
              (config_.auto_close_cursors ? "true" : "false") + ", lazy=" +
              (config_.lazy ? "true" : "false") + ")");
}

RequestHandler::~RequestHandler() {
    size_t open = registry_.Size();
    if (open > 0) {
        DLOG_DEBUG("handler", "Releasing {} open cursors with the handler", open);
    }
}

Response RequestHandler::Handle(const Request& request) {
    ShutdownGate::Lease lease(*gate_);
    if (!lease) {
        return Response::Failed(NODE_STOPPING_ERROR);
    }

    try {
        return Dispatch(request);
    } catch (const std::exception& e) {
        LOG_ERROR("handler", "Unexpected failure handling request [reqId=" +
                  std::to_string(request.request_id) + ", req=" + RequestToString(request) + "]: " + e.what());
        return HandleException(e);
    } catch (...) {
        LOG_ERROR("handler", "Unknown failure handling request [reqId=" +
                  std::to_string(request.request_id) + ", req=" + RequestToString(request) + "]");
        return Response::Failed(UNKNOWN_ERROR);
    }
}

Response RequestHandler::Dispatch(const Request& request) {
    DLOG_TRACE("handler", "Handling {}", RequestToString(request));

    return std::visit(Overloaded{
        [&](const ExecuteRequest& r) { return query_executor_.Execute(request, r); },
        [&](const FetchRequest& r) { return query_executor_.Fetch(request, r); },
        [&](const CloseRequest& r) { return query_executor_.Close(request, r); },
        [&](const QueryMetaRequest& r) { return query_executor_.QueryMeta(request, r); },
        [&](const BatchExecuteRequest& r) { return batch_executor_.ExecuteBatch(request, r); },
        [&](const MetaTablesRequest& r) { return metadata_resolver_.GetTables(request, r); },
        [&](const MetaColumnsRequest& r) { return metadata_resolver_.GetColumns(request, r); },
        [&](const MetaIndexesRequest& r) { return metadata_resolver_.GetIndexes(request, r); },
        [&](const MetaParamsRequest& r) { return metadata_resolver_.GetParams(request, r); },
        [&](const MetaPrimaryKeysRequest& r) { return metadata_resolver_.GetPrimaryKeys(request, r); },
        [&](const MetaSchemasRequest& r) { return metadata_resolver_.GetSchemas(request, r); },
    }, request.body);
}

Response RequestHandler::HandleException(const std::exception& e) const {
    return Response::Failed(e.what());
}

HandshakeResult RequestHandler::WriteHandshake() const {
    return MakeHandshake();
}

void RequestHandler::OnDisconnect() noexcept {
    try {
        ShutdownGate::Lease lease(*gate_);
        if (!lease) {
            LOG_DEBUG("handler", "Node is stopping, skipping cursor sweep on disconnect");
            return;
        }

        size_t closed = registry_.CloseAll();
        DLOG_DEBUG("handler", "Client disconnected, closed {} cursors", closed);
    } catch (const std::exception& e) {
        LOG_ERROR("handler", std::string("Failed to close cursors on disconnect: ") + e.what());
    } catch (...) {
        LOG_ERROR("handler", "Unknown failure closing cursors on disconnect");
    }
}

} // namespace sqlbridge
