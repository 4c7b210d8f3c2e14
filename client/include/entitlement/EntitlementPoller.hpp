#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "entitlement/EntitlementGate.hpp"
#include "net/CancellationToken.hpp"

// Background task that refreshes an EntitlementGate every `interval`, right
// away on start, on identity change and on demand. stop() (or destruction)
// cancels a fetch in flight and joins the thread.
class EntitlementPoller {
public:
    EntitlementPoller(EntitlementGate& gate, std::chrono::milliseconds interval);
    ~EntitlementPoller();

    EntitlementPoller(const EntitlementPoller&) = delete;
    EntitlementPoller& operator=(const EntitlementPoller&) = delete;

    void start(const Identity& identity);
    void stop();

    // Drops the cached set immediately, then refreshes for the new identity.
    void setIdentity(const Identity& identity);

    // Refresh now instead of at the next tick.
    void triggerRefresh();

    std::uint64_t completedRefreshes() const;

    // Blocks until at least `count` refreshes have completed or `timeout` passes.
    bool waitForRefreshes(std::uint64_t count, std::chrono::milliseconds timeout) const;

    bool isRunning() const;

private:
    void run();

    EntitlementGate& gate_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mtx_;
    std::condition_variable wakeCv_;
    mutable std::condition_variable doneCv_;
    bool running_ = false;
    bool stopping_ = false;
    bool triggered_ = false;
    std::uint64_t completed_ = 0;

    std::unique_ptr<CancellationToken> cancel_;
    std::thread worker_;
};
