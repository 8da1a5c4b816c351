#include "threadpool/ThreadPool.hpp"

#include <exception>
#include <stdexcept>

#include "monitor/Log.hpp"

ThreadPool::ThreadPool(int threads) {
    if (threads < 1) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

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

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.push_back(std::move(task));
        pendingTasks.fetch_add(1, std::memory_order_relaxed);
    }
    cv.notify_one();
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex);
    idleCv.wait(lock, [this]() {
        return pendingTasks.load(std::memory_order_relaxed) == 0;
    });
}

void ThreadPool::workerLoop() {
    while (true) {
        Task t;

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            cv.wait(lock, [this]() {
                return stop.load(std::memory_order_relaxed) || !queue.empty();
            });
            // drain what is queued before leaving
            if (queue.empty()) {
                return;
            }
            t = std::move(queue.front());
            queue.pop_front();
        }

        if (t.fn) {
            try {
                t.fn();
            } catch (const std::exception& e) {
                LOGX(LogLevel::Error, "ThreadPool", "Task " << t.id << " (" << t.label << ") threw: " << e.what());
            }
        } else {
            LOGX(LogLevel::Warn, "ThreadPool", "Got empty task (fn=null)");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            pendingTasks.fetch_sub(1, std::memory_order_relaxed);
        }
        idleCv.notify_all();
    }
}
