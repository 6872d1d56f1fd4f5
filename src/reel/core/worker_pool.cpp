// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/worker_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace reel::core {

WorkerPool::WorkerPool(std::size_t size) {
    size = std::max<std::size_t>(size, 1);
    threads_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        threads_.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
    }
}

WorkerPool::~WorkerPool() {
    wait();
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    for (auto& t : threads_) {
        t.request_stop();
    }
    work_cv_.notify_all();
    // jthread joins on destruction
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

std::size_t WorkerPool::discard_pending() {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        dropped = tasks_.size();
        std::queue<Task> empty;
        tasks_.swap(empty);
    }
    idle_cv_.notify_all();
    return dropped;
}

void WorkerPool::wait() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

void WorkerPool::worker_loop(std::stop_token stoken) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            // Wakes on new work or on the destructor's stop request
            if (!work_cv_.wait(lock, stoken, [this] { return !tasks_.empty(); })) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("worker task failed: {}", e.what());
        }

        {
            std::lock_guard lock(mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace reel::core
