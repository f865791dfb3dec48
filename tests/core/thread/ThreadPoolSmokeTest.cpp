#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/thread/ThreadPool.hpp"

using namespace hostguard::core::thread;

void smokeTestThreadPool() {
    std::cout << "Testing ThreadPool basic operations...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 8;
    config.queueSize = 100;

    ThreadPool pool(config);

    // Проверяем начальное состояние
    assert(pool.getActiveThreadCount() == 0);
    assert(pool.getQueueSize() == 0);
    assert(pool.isQueueEmpty());
    assert(pool.getMetrics().totalThreads == 2);

    std::cout << "[OK] ThreadPool smoke test\n";
}

void testThreadPoolTaskExecution() {
    std::cout << "Testing ThreadPool task execution...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 50;

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    for (int i = 0; i < 5; ++i) {
        pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        });
    }
    pool.waitForCompletion();
    assert(taskCounter == 5);

    // Результат и исключение через future
    auto value = pool.submit([]() { return 6 * 7; });
    assert(value.get() == 42);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    bool thrown = false;
    try {
        failing.get();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] ThreadPool task execution test\n";
}

void testThreadPoolQueueFull() {
    std::cout << "Testing ThreadPool bounded queue...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 1;
    config.queueSize = 2;

    ThreadPool pool(config);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    pool.enqueue([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    pool.enqueue([]() {});
    pool.enqueue([]() {});
    bool rejected = false;
    try {
        pool.enqueue([]() {});
    } catch (const QueueFullError&) {
        rejected = true;
    }
    assert(rejected);
    assert(pool.getMetrics().rejectedTasks == 1);
    assert(pool.getQueueSize() == 2);

    release.set_value();
    pool.waitForCompletion();
    assert(pool.isQueueEmpty());
    assert(pool.getMetrics().completedTasks == 3);

    std::cout << "[OK] ThreadPool bounded queue test\n";
}

void testThreadPoolGrowth() {
    std::cout << "Testing ThreadPool growth...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 3;
    config.queueSize = 20;

    ThreadPool pool(config);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    for (int i = 0; i < 6; ++i) {
        pool.enqueue([gate]() { gate.wait(); });
    }
    const auto metrics = pool.getMetrics();
    assert(metrics.totalThreads > config.minThreads);
    assert(metrics.totalThreads <= config.maxThreads);

    release.set_value();
    pool.waitForCompletion();
    assert(pool.getMetrics().completedTasks == 6);

    std::cout << "[OK] ThreadPool growth test\n";
}

void testThreadPoolConfiguration() {
    std::cout << "Testing ThreadPool configuration...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 50;

    ThreadPool pool(config);
    auto currentConfig = pool.getConfiguration();
    assert(currentConfig.minThreads == 2);
    assert(currentConfig.maxThreads == 4);
    assert(currentConfig.queueSize == 50);

    ThreadPoolConfig invalid;
    invalid.minThreads = 5;
    invalid.maxThreads = 2;
    bool thrown = false;
    try {
        ThreadPool broken(invalid);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] ThreadPool configuration test\n";
}

void testThreadPoolStopRestart() {
    std::cout << "Testing ThreadPool stop/restart operations...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 20;

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    for (int i = 0; i < 3; ++i) {
        pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        });
    }

    // stop() дорабатывает очередь
    pool.stop();
    assert(taskCounter == 3);

    bool thrown = false;
    try {
        pool.enqueue([]() {});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    pool.restart();
    for (int i = 0; i < 2; ++i) {
        pool.enqueue([&taskCounter]() { taskCounter++; });
    }
    pool.waitForCompletion();
    assert(taskCounter == 5);

    std::cout << "[OK] ThreadPool stop/restart test\n";
}

void testThreadPoolConcurrentAccess() {
    std::cout << "Testing ThreadPool concurrent access...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 200;

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    const int numThreads = 4;
    const int tasksPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&pool, &taskCounter, tasksPerThread]() {
            for (int i = 0; i < tasksPerThread; ++i) {
                pool.enqueue([&taskCounter]() {
                    taskCounter++;
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    pool.waitForCompletion();
    assert(taskCounter == numThreads * tasksPerThread);

    std::cout << "[OK] ThreadPool concurrent access test\n";
}

int main() {
    try {
        smokeTestThreadPool();
        testThreadPoolTaskExecution();
        testThreadPoolQueueFull();
        testThreadPoolGrowth();
        testThreadPoolConfiguration();
        testThreadPoolStopRestart();
        testThreadPoolConcurrentAccess();
        std::cout << "All ThreadPool tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ThreadPool test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
