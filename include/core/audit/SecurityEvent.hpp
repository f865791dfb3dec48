#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hostguard {
namespace core {
namespace audit {

enum class EventKind {
    AuthAttempt,
    AuthSuccess,
    AuthFailure,
    CapabilityDenied,
    ValidationRejected,
    DangerousPatternDetected,
    RateLimitExceeded,
    SecretAccessed,
    SecretNotFound,
    OperationSucceeded,
    UpstreamFailure,
    Timeout,
    InternalLockRecovered,
    SuspiciousActivity,
    ThreatDetected,
    AdministrativeAction,
};

enum class Severity { Low, Medium, High, Critical };

// Исход операции; None: информационное событие, не результат вызова
enum class Outcome { None, Success, Failure };

std::string eventKindToString(EventKind kind);
std::optional<EventKind> eventKindFromString(const std::string& name);
std::string severityToString(Severity severity);
std::string outcomeToString(Outcome outcome);
Severity defaultSeverity(EventKind kind);

// SecurityEvent — неизменяемая запись о событии безопасности.
// После передачи в аудитор живёт как shared_ptr<const SecurityEvent>.
struct SecurityEvent {
    std::string id;                                   // UUIDv4
    std::chrono::system_clock::time_point timestamp;
    EventKind kind = EventKind::SuspiciousActivity;
    Severity severity = Severity::Low;
    Outcome outcome = Outcome::None;
    std::optional<std::string> principalId;
    std::string clientIp;
    std::string resource;
    std::string action;
    std::map<std::string, std::string> details;
    std::string message;

    nlohmann::json toJson() const;
    std::string detail(const std::string& key, const std::string& fallback = "") const;
};

// Запись журнала: порядковый номер, звено хеш-цепочки и само событие
struct AuditRecord {
    uint64_t sequence = 0;
    std::string chainDigest; // sha256(предыдущий digest || canonical JSON события), hex
    std::shared_ptr<const SecurityEvent> event;

    nlohmann::json toJson() const;
};

// UUIDv4 из криптографического ГСЧ (OpenSSL RAND_bytes)
std::string generateEventId();

// Построитель события; build() назначает id и время
class EventBuilder {
public:
    explicit EventBuilder(EventKind kind);
    EventBuilder& severity(Severity value);
    EventBuilder& outcome(Outcome value);
    EventBuilder& principal(const std::optional<std::string>& value);
    EventBuilder& clientIp(const std::string& value);
    EventBuilder& resource(const std::string& value);
    EventBuilder& action(const std::string& value);
    EventBuilder& detail(const std::string& key, const std::string& value);
    EventBuilder& message(const std::string& value);
    SecurityEvent build() const;

private:
    SecurityEvent event_;
};

} // namespace audit
} // namespace core
} // namespace hostguard
