//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/shutdown_gate.cpp
//===----------------------------------------------------------------------===//

#include "handler/shutdown_gate.hpp"
#include "logging/logger.hpp"

namespace sqlbridge {

bool ShutdownGate::Enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_) {
        return false;
    }
    active_++;
    return true;
}

void ShutdownGate::Leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ == 0) {
        LOG_ERROR("gate", "Leave() called without a matching Enter()");
        return;
    }
    if (--active_ == 0 && blocked_) {
        drained_cv_.notify_all();
    }
}

void ShutdownGate::Block() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!blocked_) {
        blocked_ = true;
        DLOG_INFO("gate", "Blocking new requests, waiting for {} in flight", active_);
    }
    drained_cv_.wait(lock, [this] { return active_ == 0; });
}

bool ShutdownGate::IsBlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_;
}

size_t ShutdownGate::GetActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace sqlbridge
