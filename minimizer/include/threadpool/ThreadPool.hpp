// ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "threadpool/Task.hpp"

// Fixed-size FIFO worker pool. Tasks must not throw; the pool logs and drops
// an exception that escapes one so the remaining tasks still run.
class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t getWorkerCount() const { return workers.size(); }

    void enqueue(Task task);

    // Blocks until every enqueued task has finished.
    void waitIdle();

    std::size_t getPendingTaskCount() const {
        return pendingTasks.load(std::memory_order_relaxed);
    }

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::deque<Task> queue;
    std::atomic<bool> stop{false};

    // waiting + running
    std::atomic<std::size_t> pendingTasks{0};

    std::condition_variable cv;
    std::condition_variable idleCv;
    std::mutex queueMutex;
};
