#include "thread_pool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ThreadPool::ThreadPool(size_t threads, std::string name)
    : name_(std::move(name)) {
    if (threads == 0) {
        throw std::invalid_argument("thread pool " + name_ + " needs at least one thread");
    }
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("thread pool " + name_ + " is shutting down");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error in {} task: {}", name_, e.what());
        }
    }
}
