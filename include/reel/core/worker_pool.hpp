// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace reel::core {

// Fixed-size pool of worker threads fed from one FIFO queue.
// Each worker runs a task to completion before taking the next one.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t size);
    ~WorkerPool();

    // Non-copyable, non-movable (workers capture this)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task; false once the pool is shutting down
    [[nodiscard]] bool submit(Task task);

    // Drop queued tasks that no worker has started; returns how many
    std::size_t discard_pending();

    // Block until the queue is empty and no task is running
    void wait();

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    void worker_loop(std::stop_token stoken);

    std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable idle_cv_;
    std::queue<Task> tasks_;
    std::size_t running_{0};
    bool closed_{false};
    std::vector<std::jthread> threads_;
};

} // namespace reel::core
