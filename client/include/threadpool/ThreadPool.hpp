// ThreadPool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>

// Fixed-size worker pool with a FIFO task queue.
class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t getWorkerCount() const { return workers.size(); }

    // Queues `fn`; exceptions it throws are delivered through the future.
    template <typename F>
    auto submit(F fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (stop.load(std::memory_order_relaxed)) {
                throw std::runtime_error("ThreadPool is stopping, task rejected");
            }
            tasks.push([task]() { (*task)(); });
        }
        cv.notify_one();
        return fut;
    }

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::atomic<bool> stop{false};

    std::condition_variable cv;
    std::mutex queueMutex;
};
