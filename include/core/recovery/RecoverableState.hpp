#pragma once

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace hostguard {
namespace core {
namespace recovery {

// Callback о восстановлении состояния (имя состояния, причина)
using RecoveryCallback = std::function<void(const std::string&, const std::string&)>;

// Мутация под замком завершилась исключением; состояние будет сброшено при следующем захвате
class PoisonedStateError : public std::runtime_error {
public:
    PoisonedStateError(const std::string& name, const std::string& reason)
        : std::runtime_error("state '" + name + "' poisoned: " + reason), name_(name) {}
    const std::string& stateName() const { return name_; }

private:
    std::string name_;
};

// RecoverableState — разделяемое состояние под мьютексом с восстановлением после сбоя.
// Если мутация выбросила исключение под замком, состояние помечается "отравленным";
// следующий захват сбрасывает его в T{} и сообщает через RecoveryCallback
// вместо того чтобы распространять ошибку дальше.
template<typename T>
class RecoverableState {
public:
    explicit RecoverableState(std::string name) : name_(std::move(name)) {}
    RecoverableState(const RecoverableState&) = delete;
    RecoverableState& operator=(const RecoverableState&) = delete;

    void setRecoveryCallback(RecoveryCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        onRecovered_ = std::move(callback);
    }

    // Выполнить fn(T&) под замком. Исключение из fn отравляет состояние
    // и пробрасывается как PoisonedStateError.
    template<typename F>
    auto with(F&& fn) -> decltype(fn(std::declval<T&>())) {
        RecoveryCallback notify;
        std::string reason;
        std::unique_lock<std::mutex> lock(mutex_);
        if (poisoned_) {
            reason = poisonReason_;
            recoverLocked();
            notify = onRecovered_;
        }
        if (notify) {
            // Уведомление без удержания замка
            lock.unlock();
            notify(name_, reason);
            lock.lock();
        }
        try {
            return fn(value_);
        } catch (const std::exception& e) {
            poisoned_ = true;
            poisonReason_ = e.what();
            throw PoisonedStateError(name_, poisonReason_);
        }
    }

    bool isPoisoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return poisoned_;
    }

    size_t recoveryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return recoveries_;
    }

    const std::string& name() const { return name_; }

private:
    void recoverLocked() {
        value_ = T{};
        poisoned_ = false;
        ++recoveries_;
        spdlog::warn("RecoverableState[{}]: recovered to empty state after failure: {}", name_, poisonReason_);
        poisonReason_.clear();
    }

    std::string name_;
    mutable std::mutex mutex_;
    T value_{};
    bool poisoned_ = false;
    std::string poisonReason_;
    size_t recoveries_ = 0;
    RecoveryCallback onRecovered_;
};

} // namespace recovery
} // namespace core
} // namespace hostguard
