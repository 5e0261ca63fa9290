#include "thread_pool.hpp"
#include <stdexcept>

ThreadPool::ThreadPool(size_t numThreads) {
    if (numThreads == 0)
        numThreads = 1;
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i)
        workers.emplace_back([this]() { workerLoop(); });
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (stopping && workers.empty())
            return;
        stopping = true;
    }
    queueCv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable())
            worker.join();
    }
    workers.clear();
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCv.wait(lock, [this]() { return stopping || !tasks.empty(); });
            if (tasks.empty())
                return;  // stopping and drained
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}
