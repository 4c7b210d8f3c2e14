#include "threadpool/ThreadPool.hpp"
#include "utils/Log.hpp"

ThreadPool::ThreadPool(int threads)
    : stop(false)
{
    if (threads <= 0) {
        throw std::runtime_error("ThreadPool requires at least one worker");
    }

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

// Drains the queue before joining: every submitted future gets a value.
ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stop.store(true, std::memory_order_relaxed);
    }
    cv.notify_all();

    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> fn;

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            cv.wait(lock, [this]() {
                return stop.load(std::memory_order_relaxed) || !tasks.empty();
            });
            if (tasks.empty()) {
                return;
            }
            fn = std::move(tasks.front());
            tasks.pop();
        }

        if (fn) {
            fn();
        } else {
            LOGW("POOL", "Got empty task (fn=null)");
        }
    }
}
