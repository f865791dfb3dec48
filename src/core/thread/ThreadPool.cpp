#include "core/thread/ThreadPool.hpp"
#include <deque>
#include <spdlog/spdlog.h>

namespace hostguard {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::deque<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskCv;
    std::condition_variable doneCv;
    size_t activeThreads = 0;
    size_t completedTasks = 0;
    size_t rejectedTasks = 0;
    bool stopping = false;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    void spawnWorker() {
        workers.emplace_back([this]() { workerLoop(); });
    }

    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                taskCv.wait(lock, [this]() { return stopping || !tasks.empty(); });
                if (tasks.empty()) {
                    return; // stopping и очередь пуста
                }
                task = std::move(tasks.front());
                tasks.pop_front();
                ++activeThreads;
            }
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("ThreadPool: task threw: {}", e.what());
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                --activeThreads;
                ++completedTasks;
                if (tasks.empty() && activeThreads == 0) {
                    doneCv.notify_all();
                }
            }
        }
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = false;
        for (size_t i = 0; i < config.minThreads; ++i) {
            spawnWorker();
        }
    }

    void join() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        taskCv.notify_all();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: invalid configuration");
    }
    pImpl->start();
    spdlog::debug("ThreadPool: started with {} threads (max {})", config.minThreads, config.maxThreads);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping) {
            throw std::runtime_error("ThreadPool: enqueue on stopped pool");
        }
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            ++pImpl->rejectedTasks;
            throw QueueFullError();
        }
        pImpl->tasks.push_back(std::move(task));
        // Все потоки заняты, расширяемся до maxThreads
        const size_t busy = pImpl->activeThreads + pImpl->tasks.size();
        if (busy > pImpl->workers.size() && pImpl->workers.size() < pImpl->config.maxThreads) {
            pImpl->spawnWorker();
        }
    }
    pImpl->taskCv.notify_one();
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->activeThreads;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->doneCv.wait(lock, [this]() {
        return pImpl->tasks.empty() && pImpl->activeThreads == 0;
    });
}

void ThreadPool::stop() {
    if (!pImpl) {
        return;
    }
    pImpl->join();
}

void ThreadPool::restart() {
    stop();
    pImpl->start();
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks;
    metrics.rejectedTasks = pImpl->rejectedTasks;
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace hostguard
