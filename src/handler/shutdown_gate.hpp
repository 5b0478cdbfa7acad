//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/shutdown_gate.hpp
//
// Admission gate for request processing. Requests hold a lease while they
// run; Block() refuses new leases and waits for the active ones to drain.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace sqlbridge {

class ShutdownGate {
public:
    ShutdownGate() = default;

    // Non-copyable
    ShutdownGate(const ShutdownGate&) = delete;
    ShutdownGate& operator=(const ShutdownGate&) = delete;

    // false once Block() has been called
    bool Enter();

    // Exactly once per successful Enter()
    void Leave();

    // Refuse new entries, then wait until every active lease is returned.
    // Safe to call more than once.
    void Block();

    bool IsBlocked() const;
    size_t GetActiveCount() const;

    // Scoped lease: enters on construction, leaves on destruction if entered
    class Lease {
    public:
        explicit Lease(ShutdownGate& gate) : gate_(gate), entered_(gate.Enter()) {}
        ~Lease() {
            if (entered_) {
                gate_.Leave();
            }
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return entered_; }

    private:
        ShutdownGate& gate_;
        bool entered_;
    };

private:
    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;
    size_t active_ = 0;
    bool blocked_ = false;
};

} // namespace sqlbridge
