#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/collab/Collaborators.hpp"
#include "core/identity/UserContext.hpp"
#include "core/operations/OperationResult.hpp"
#include "core/thread/ThreadPool.hpp"

namespace hostguard {
namespace core {
namespace validation {
class InputValidator;
}
namespace ratelimit {
class RateLimiter;
}
namespace secrets {
class SecretsManager;
}
namespace audit {
class SecurityAuditor;
}
namespace operations {

struct OperationsConfig {
    std::chrono::milliseconds delegateTimeout{30000};  // Таймаут делегата по умолчанию
    std::chrono::milliseconds fetchTimeout{30000};     // Таймаут исходящего запроса
    thread::ThreadPoolConfig threads;

    bool validate() const {
        return delegateTimeout.count() > 0 && fetchTimeout.count() > 0 && threads.validate();
    }
};

// Сервисы безопасности, общие для всех вызовов
struct SecurityServices {
    std::shared_ptr<validation::InputValidator> validator;
    std::shared_ptr<ratelimit::RateLimiter> rateLimiter;
    std::shared_ptr<secrets::SecretsManager> secrets;
    std::shared_ptr<audit::SecurityAuditor> auditor;
};

// Внешние коллабораторы, к которым делегируются операции
struct OperationCollaborators {
    std::shared_ptr<collab::ResourceRepository> scripts;
    std::shared_ptr<collab::ResourceRepository> assets;
    std::shared_ptr<collab::ResourceRepository> tables;
    std::shared_ptr<collab::HttpTransport> transport;  // Уже обёрнут SecretInjectingTransport
    std::shared_ptr<collab::Registry> registry;
    std::shared_ptr<collab::StreamBroadcaster> streams;
    std::shared_ptr<collab::UserRepository> users;
};

struct FetchRequest {
    std::string url;
    std::string method = "GET";
    collab::HeaderList headers;
    std::string body;
    std::optional<std::chrono::milliseconds> timeout; // Переопределение fetchTimeout
};

enum class GraphQLKind { Query, Mutation, Subscription };

struct OperationsMetrics {
    uint64_t totalCalls = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    std::map<std::string, uint64_t> failuresByError;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"totalCalls", totalCalls},
            {"succeeded", succeeded},
            {"failed", failed},
            {"failuresByError", failuresByError}
        };
    }
};

// SecureOperations — единственная точка исполнения чувствительных действий.
// Конвейер каждого вызова: валидация -> capability -> rate limit (однократно) ->
// делегат в пуле потоков под замком ресурса -> ровно одно итоговое событие аудита.
// Timeout фиксируется ожидающим, пока делегат ещё может выполнить мутацию: для таких
// вызовов итоговое событие предшествует мутации. Фактический исход делегат пишет
// позже информационным событием (outcome None, detail lateCompletion).
class SecureOperations {
public:
    using Context = identity::UserContextPtr;

    SecureOperations(const OperationsConfig& config, SecurityServices services, OperationCollaborators collaborators);
    ~SecureOperations();
    SecureOperations(const SecureOperations&) = delete;
    SecureOperations& operator=(const SecureOperations&) = delete;

    // Скрипты
    OperationHandle upsertScript(const Context& ctx, const std::string& uri, const std::string& content);
    OperationHandle getScript(const Context& ctx, const std::string& uri);
    OperationHandle deleteScript(const Context& ctx, const std::string& uri);
    OperationHandle listScripts(const Context& ctx);
    // Владельцы скрипта; менять их может владелец или Administrator
    OperationHandle getScriptOwners(const Context& ctx, const std::string& uri);
    OperationHandle addScriptOwner(const Context& ctx, const std::string& uri, const std::string& principal);
    OperationHandle removeScriptOwner(const Context& ctx, const std::string& uri, const std::string& principal);

    // Ассеты (содержимое в base64)
    OperationHandle upsertAsset(const Context& ctx, const std::string& uri, const std::string& mimeType,
                                const std::string& base64Content);
    OperationHandle fetchAsset(const Context& ctx, const std::string& uri);
    OperationHandle deleteAsset(const Context& ctx, const std::string& uri);
    OperationHandle listAssets(const Context& ctx);

    // Таблицы (схема: JSON-объект)
    OperationHandle upsertTable(const Context& ctx, const std::string& name, const std::string& schemaJson);
    OperationHandle getTable(const Context& ctx, const std::string& name);
    OperationHandle deleteTable(const Context& ctx, const std::string& name);
    OperationHandle listTables(const Context& ctx);

    OperationHandle fetch(const Context& ctx, const FetchRequest& request);

    // Регистрации
    OperationHandle registerRoute(const Context& ctx, const std::string& path, const std::string& handler,
                                  const std::string& method);
    OperationHandle registerGraphQL(const Context& ctx, GraphQLKind kind, const std::string& name,
                                    const std::string& sdl, const std::string& handler);
    OperationHandle registerTool(const Context& ctx, const std::string& name, const std::string& description,
                                 const std::string& schemaJson, const std::string& handler);
    OperationHandle registerStream(const Context& ctx, const std::string& path);
    OperationHandle broadcast(const Context& ctx, const std::string& path, const std::string& message);

    // Администрирование
    OperationHandle readAuditLog(const Context& ctx, size_t limit); // Свои записи, кроме Administrator
    OperationHandle pruneAuditLog(const Context& ctx, size_t keepLast);
    OperationHandle listRoles(const Context& ctx, const std::string& principal);
    OperationHandle addRole(const Context& ctx, const std::string& principal, const std::string& role);
    OperationHandle removeRole(const Context& ctx, const std::string& principal, const std::string& role);

    // Секреты: только идентификаторы
    OperationHandle listSecretIdentifiers(const Context& ctx);         // ManageSecrets, все
    OperationHandle listScriptSecretIdentifiers(const Context& ctx);   // Гостю: те же, что видит exists()
    OperationHandle secretExists(const Context& ctx, const std::string& identifier);

    // Отказ по неразбираемым аргументам (ValidationRejected / MalformedArguments)
    OperationHandle rejectMalformed(const Context& ctx, const std::string& operation, const std::string& detail);

    OperationsMetrics getMetrics() const;
    OperationsConfig getConfiguration() const;
    void shutdown(); // Дождаться делегатов и остановить пул

    static bool isAllowedMethod(const std::string& method);

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
    std::unique_ptr<thread::ThreadPool> pool_; // Объявлен последним: разрушается первым
};

} // namespace operations
} // namespace core
} // namespace hostguard
