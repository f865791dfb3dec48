#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/audit/AuditSinks.hpp"
#include "core/audit/SecurityEvent.hpp"

namespace hostguard {
namespace core {
namespace audit {

// Конфигурация аудитора
struct AuditorConfig {
    size_t bufferCapacity = 10000;              // Кольцевой буфер записей
    size_t queueCapacity = 4096;                // Очередь пересылки в sink'и
    bool enableFileSink = false;                // NDJSON-файл
    std::string logPath = "logs/audit.log";
    size_t maxLogSize = 10 * 1024 * 1024;       // Байт на файл
    size_t maxLogFiles = 5;

    bool validate() const {
        if (bufferCapacity == 0 || queueCapacity == 0) return false;
        if (enableFileSink && (logPath.empty() || maxLogSize == 0 || maxLogFiles == 0)) return false;
        return true;
    }
};

// Фильтр выборки; пустые поля не фильтруют
struct AuditQuery {
    std::optional<std::string> principal;
    std::optional<std::string> resource;
    std::optional<EventKind> kind;
    uint64_t sinceSequence = 0;  // Только записи с sequence > sinceSequence
    size_t limit = 100;
};

struct AuditMetrics {
    uint64_t totalEvents = 0;
    size_t bufferedEvents = 0;
    uint64_t forwardedEvents = 0;
    uint64_t droppedForwarding = 0;  // Очередь была полна
    uint64_t evictedEvents = 0;      // Вытеснены из кольцевого буфера
    uint64_t prunedEvents = 0;
    uint64_t lockRecoveries = 0;
    size_t sinkCount = 0;
    size_t subscriberCount = 0;
    std::map<std::string, uint64_t> eventsByKind;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"totalEvents", totalEvents},
            {"bufferedEvents", bufferedEvents},
            {"forwardedEvents", forwardedEvents},
            {"droppedForwarding", droppedForwarding},
            {"evictedEvents", evictedEvents},
            {"prunedEvents", prunedEvents},
            {"lockRecoveries", lockRecoveries},
            {"sinkCount", sinkCount},
            {"subscriberCount", subscriberCount},
            {"eventsByKind", eventsByKind}
        };
    }
};

using EventSubscriber = std::function<void(const AuditRecord&)>;
using Redactor = std::function<std::string(const std::string&)>;

// SecurityAuditor — журнал событий безопасности только на добавление.
// log() не блокируется на I/O: запись попадает в кольцевой буфер и в ограниченную
// очередь, которую разбирает один поток-диспетчер (sink'и и подписчики).
class SecurityAuditor {
public:
    explicit SecurityAuditor(const AuditorConfig& config = AuditorConfig{});
    ~SecurityAuditor();
    SecurityAuditor(const SecurityAuditor&) = delete;
    SecurityAuditor& operator=(const SecurityAuditor&) = delete;

    bool initialize(); // Запуск диспетчера (и файлового sink'а, если включён)
    void shutdown();   // Дослать очередь и остановить диспетчер

    void addSink(std::shared_ptr<AuditSink> sink);
    void subscribe(EventSubscriber subscriber);
    void setRedactor(Redactor redactor); // Применяется к message и details

    uint64_t log(SecurityEvent event); // Возвращает sequence записи

    // Информационные события (outcome = None)
    uint64_t logAuthAttempt(const std::optional<std::string>& principal, const std::string& clientIp, const std::string& method);
    uint64_t logAuthSuccess(const std::string& principal, const std::string& clientIp, const std::string& method);
    uint64_t logAuthFailure(const std::optional<std::string>& principal, const std::string& clientIp, const std::string& reason);
    uint64_t logCapabilityDenied(const std::optional<std::string>& principal, const std::string& resource, const std::string& capability);
    uint64_t logValidationFailure(const std::optional<std::string>& principal, const std::string& target, const std::string& reason);
    uint64_t logSuspiciousActivity(const std::optional<std::string>& principal, const std::string& clientIp, const std::string& description);
    uint64_t logLockRecovered(const std::string& component, const std::string& reason);

    // Дождаться пересылки всех поставленных в очередь записей.
    // Нельзя вызывать из sink'а или подписчика.
    void flush();

    std::vector<AuditRecord> records(size_t limit) const; // Последние limit записей по возрастанию sequence
    std::vector<AuditRecord> query(const AuditQuery& query) const;
    size_t pruneOlderThan(std::chrono::seconds age);
    size_t pruneKeepLast(size_t keep);
    bool verifyChain() const; // Проверка хеш-цепочки сохранённых записей
    size_t size() const;

    AuditMetrics getMetrics() const;
    AuditorConfig getConfiguration() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace audit
} // namespace core
} // namespace hostguard
