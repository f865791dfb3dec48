#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <future>
#include <stdexcept>
#include <type_traits>

namespace hostguard {
namespace core {
namespace thread {

// Метрики пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;    // Потоки, выполняющие задачу
    size_t queueSize = 0;        // Размер очереди
    size_t totalThreads = 0;     // Всего потоков
    size_t completedTasks = 0;   // Выполнено задач
    size_t rejectedTasks = 0;    // Отклонено (очередь полна)
};

// Конфигурация пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 2;       // Мин. потоки
    size_t maxThreads = 8;       // Макс. потоки
    size_t queueSize = 1024;     // Макс. очередь

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Очередь пула переполнена
class QueueFullError : public std::runtime_error {
public:
    QueueFullError() : std::runtime_error("thread pool queue is full") {}
};

// Пул потоков. Растёт от minThreads до maxThreads, когда все потоки заняты.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    void enqueue(std::function<void()> task); // Добавить задачу (QueueFullError)

    // Добавить задачу с результатом
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул
    void restart(); // Перезапустить пул
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace hostguard
