#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/identity/UserContext.hpp"

namespace hostguard {
namespace core {
namespace operations {
class SecureOperations;
}
namespace bridge {

// Функция, видимая гостевому скрипту: аргументы-строки -> JSON-текст результата
using GuestFunction = std::function<std::string(const std::vector<std::string>&)>;

// Интерпретатор гостевых скриптов (внешний коллаборатор)
class GuestEnvironment {
public:
    virtual ~GuestEnvironment() = default;
    virtual void bindFunction(const std::string& name, GuestFunction function) = 0;
};

struct BridgeConfig {
    std::chrono::milliseconds callTimeout{30000};      // Сколько гость ждёт исход операции
    std::chrono::milliseconds maxFetchTimeout{300000}; // Верхняя граница timeoutMs в опциях fetch

    bool validate() const { return callTimeout.count() > 0 && maxFetchTimeout.count() > 0; }
};

// GuestBridge — блокирующий адаптер: связывает гостевые функции с SecureOperations.
// Структурные аргументы (опции fetch) передаются JSON-текстом.
class GuestBridge {
public:
    GuestBridge(std::shared_ptr<operations::SecureOperations> operations, const BridgeConfig& config = BridgeConfig{});

    // Привязать все функции к окружению от имени ctx
    void install(GuestEnvironment& env, const identity::UserContextPtr& ctx) const;

    // Вызов без окружения; неизвестное имя -> MalformedArguments
    std::string call(const std::string& name, const identity::UserContextPtr& ctx,
                     const std::vector<std::string>& args) const;

    static const std::vector<std::string>& functionNames();

    BridgeConfig getConfiguration() const { return config_; }

private:
    std::shared_ptr<operations::SecureOperations> operations_;
    BridgeConfig config_;
};

} // namespace bridge
} // namespace core
} // namespace hostguard
