#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace hostguard {
namespace core {
namespace operations {

enum class ErrorKind {
    None,
    ValidationRejected,
    CapabilityDenied,
    RateLimited,
    SecretNotFound,
    SecretAccessDenied,
    UpstreamFailure,
    Timeout,
    InternalLockRecovered,
};

std::string errorKindToString(ErrorKind kind); // Стабильное значение поля "error" для гостя

// Результат вызова, который видит гость
struct OperationResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string reason;               // Код причины (для ValidationRejected)
    nlohmann::json data;              // Полезная нагрузка при успехе

    static OperationResult ok(nlohmann::json data = nullptr);
    static OperationResult failure(ErrorKind error, const std::string& reason = "");

    // {"success":true,"data":...} или {"success":false,"error":"...",["reason":"..."]}
    nlohmann::json toJson() const;
    std::string toJsonString() const;
};

// Вызывается ровно один раз победителем гонки за исход (пишет событие аудита)
using SettleCallback = std::function<void(const OperationResult&)>;

// OperationHandle — исход асинхронной операции, фиксируется ровно один раз.
// Рабочий поток (settle) и ожидающий по таймауту соревнуются за атомарный флаг;
// победитель вызывает SettleCallback и публикует результат.
class OperationHandle {
public:
    OperationHandle() = default;

    static OperationHandle pending(SettleCallback onSettle, std::chrono::milliseconds timeout);
    static OperationHandle completed(OperationResult result); // Уже зафиксирован, callback не вызывается

    bool valid() const { return static_cast<bool>(state_); }
    bool isSettled() const;
    std::chrono::milliseconds timeout() const;

    // false, если исход уже зафиксирован (результат отброшен)
    bool settle(OperationResult result);

    OperationResult wait(); // Ждать не дольше собственного таймаута
    OperationResult wait(std::chrono::milliseconds timeout); // min(timeout, собственный таймаут)

private:
    struct State;
    std::shared_ptr<State> state_;
};

// KeyedMutex — мьютекс на ключ (ресурс). Записи удаляются, когда ключ свободен.
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(KeyedMutex* owner, std::string key);
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        KeyedMutex* owner_;
        std::string key_;
    };

    Guard lock(const std::string& key);
    size_t activeKeys() const;

private:
    struct Entry {
        std::mutex mutex;
        size_t refs = 0;
    };
    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace operations
} // namespace core
} // namespace hostguard
