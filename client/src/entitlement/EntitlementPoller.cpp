#include "entitlement/EntitlementPoller.hpp"

#include "utils/Log.hpp"

EntitlementPoller::EntitlementPoller(EntitlementGate& gate, std::chrono::milliseconds interval)
    : gate_(gate), interval_(interval) {}

EntitlementPoller::~EntitlementPoller() {
    stop();
}

void EntitlementPoller::start(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) return;

    gate_.changeIdentity(identity);

    cancel_ = std::make_unique<CancellationToken>();
    stopping_ = false;
    triggered_ = false;
    running_ = true;
    worker_ = std::thread([this]() { run(); });

    LOGX("POLLER", "Started, interval=" << interval_.count() << "ms");
}

void EntitlementPoller::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        stopping_ = true;
        if (cancel_) cancel_->cancel();
        worker = std::move(worker_);
    }
    wakeCv_.notify_all();

    if (worker.joinable()) worker.join();

    std::lock_guard<std::mutex> lock(mtx_);
    running_ = false;
    doneCv_.notify_all();
    LOGX("POLLER", "Stopped after " << completed_ << " refresh(es)");
}

void EntitlementPoller::setIdentity(const Identity& identity) {
    gate_.changeIdentity(identity);
    triggerRefresh();
}

void EntitlementPoller::triggerRefresh() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        triggered_ = true;
    }
    wakeCv_.notify_all();
}

std::uint64_t EntitlementPoller::completedRefreshes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return completed_;
}

bool EntitlementPoller::waitForRefreshes(std::uint64_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return doneCv_.wait_for(lock, timeout, [this, count]() {
        return completed_ >= count || !running_;
    }) && completed_ >= count;
}

bool EntitlementPoller::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
}

void EntitlementPoller::run() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        triggered_ = false;
        const CancellationToken* cancel = cancel_.get();

        lock.unlock();
        gate_.refreshCurrent(cancel);
        lock.lock();

        ++completed_;
        doneCv_.notify_all();

        wakeCv_.wait_for(lock, interval_, [this]() { return stopping_ || triggered_; });
    }
}
