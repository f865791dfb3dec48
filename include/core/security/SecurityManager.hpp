#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/audit/AuditSinks.hpp"
#include "core/config/CoreConfig.hpp"
#include "core/identity/UserContext.hpp"
#include "core/operations/SecureOperations.hpp"

namespace hostguard {
namespace core {
namespace threat {
class ThreatDetector;
}
namespace security {

// SecurityManager — сборка ядра: создаёт сервисы безопасности, связывает аудит,
// детектор угроз и восстановление состояний, отдаёт SecureOperations и GuestBridge.
// Коллабораторы, не переданные явно, заменяются реализациями в памяти;
// transport оборачивается SecretInjectingTransport.
class SecurityManager {
public:
    explicit SecurityManager(const config::CoreConfig& config = config::CoreConfig{},
                             operations::OperationCollaborators collaborators = {});
    ~SecurityManager();
    SecurityManager(const SecurityManager&) = delete;
    SecurityManager& operator=(const SecurityManager&) = delete;

    void setAlertCallback(audit::AlertCallback callback); // До initialize()

    bool initialize(); // Инициализация
    void shutdown();   // Завершение работы
    bool isInitialized() const;

    // Контекст исполнения: роли из UserRepository, владелец скрипта из хранилища скриптов
    identity::UserContextPtr createContext(const std::optional<std::string>& principalId,
                                           const std::string& scriptUri = "",
                                           const std::string& clientIp = "") const;

    // Попытка входа: rate limit класса "auth" и событие аудита. false, если попытка отклонена лимитом
    bool recordAuthentication(const std::optional<std::string>& principalId, const std::string& clientIp,
                              bool success, const std::string& detail);

    void runMaintenance(); // Очистка простаивающих корзин и устаревших данных детектора

    std::shared_ptr<validation::InputValidator> getValidator() const;
    std::shared_ptr<ratelimit::RateLimiter> getRateLimiter() const;
    std::shared_ptr<secrets::SecretsManager> getSecrets() const;
    std::shared_ptr<audit::SecurityAuditor> getAuditor() const;
    std::shared_ptr<threat::ThreatDetector> getThreatDetector() const;
    std::shared_ptr<operations::SecureOperations> getOperations() const;
    std::shared_ptr<bridge::GuestBridge> getBridge() const;
    operations::OperationCollaborators getCollaborators() const; // Transport без обёртки

    nlohmann::json getMetrics() const;
    config::CoreConfig getConfiguration() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace security
} // namespace core
} // namespace hostguard
