#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO of fire-and-forget tasks.
// Destruction finishes every queued task before joining.
class ThreadPool {
public:
    ThreadPool(size_t threads, std::string name);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void enqueue(std::function<void()> task);
    size_t pending() const;

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};
