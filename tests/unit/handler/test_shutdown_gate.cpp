//===----------------------------------------------------------------------===//
//                         SqlBridge Server - Unit Tests
//
// tests/unit/handler/test_shutdown_gate.cpp
//
// Unit tests for ShutdownGate
//===----------------------------------------------------------------------===//

#include "handler/shutdown_gate.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>

using namespace sqlbridge;

void TestEnterLeave() {
    std::cout << "  Testing enter/leave..." << std::endl;

    ShutdownGate gate;
    assert(!gate.IsBlocked());
    assert(gate.Enter());
    assert(gate.Enter());
    assert(gate.GetActiveCount() == 2);
    gate.Leave();
    gate.Leave();
    assert(gate.GetActiveCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestBlockRefusesNewEntries() {
    std::cout << "  Testing block refuses new entries..." << std::endl;

    ShutdownGate gate;
    gate.Block();
    assert(gate.IsBlocked());
    assert(!gate.Enter());
    assert(gate.GetActiveCount() == 0);

    // Second block returns immediately
    gate.Block();

    std::cout << "    PASSED" << std::endl;
}

void TestLease() {
    std::cout << "  Testing scoped lease..." << std::endl;

    ShutdownGate gate;
    {
        ShutdownGate::Lease lease(gate);
        assert(lease);
        assert(gate.GetActiveCount() == 1);
    }
    assert(gate.GetActiveCount() == 0);

    gate.Block();
    {
        ShutdownGate::Lease lease(gate);
        assert(!lease);
        assert(gate.GetActiveCount() == 0);
    }
    assert(gate.GetActiveCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestBlockWaitsForInFlight() {
    std::cout << "  Testing block waits for in-flight requests..." << std::endl;

    ShutdownGate gate;
    std::atomic<bool> released{false};
    std::atomic<bool> block_returned{false};

    assert(gate.Enter());

    std::thread blocker([&]() {
        gate.Block();
        // Must not return before the lease is given back
        assert(released.load());
        block_returned = true;
    });

    // Wait until the blocker has closed the gate
    while (!gate.IsBlocked()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(!gate.Enter());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!block_returned.load());

    released = true;
    gate.Leave();
    blocker.join();
    assert(block_returned.load());

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentLeases() {
    std::cout << "  Testing concurrent leases then shutdown..." << std::endl;

    ShutdownGate gate;
    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};
    std::atomic<int> inside{0};
    std::atomic<bool> violated{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 500; i++) {
                ShutdownGate::Lease lease(gate);
                if (!lease) {
                    refused++;
                    continue;
                }
                admitted++;
                inside++;
                if (gate.IsBlocked() && gate.GetActiveCount() == 0) {
                    violated = true;
                }
                inside--;
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    gate.Block();
    assert(gate.GetActiveCount() == 0);
    assert(inside.load() == 0);

    for (auto& th : threads) th.join();

    assert(!violated.load());
    assert(admitted.load() + refused.load() == 8 * 500);

    std::cout << "    PASSED (admitted=" << admitted.load() << ", refused=" << refused.load() << ")" << std::endl;
}

int main() {
    std::cout << "=== ShutdownGate Unit Tests ===" << std::endl;

    std::cout << "\n1. Basic:" << std::endl;
    TestEnterLeave();
    TestBlockRefusesNewEntries();
    TestLease();

    std::cout << "\n2. Shutdown:" << std::endl;
    TestBlockWaitsForInFlight();
    TestConcurrentLeases();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
