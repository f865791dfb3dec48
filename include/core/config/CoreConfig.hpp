#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/audit/SecurityAuditor.hpp"
#include "core/bridge/GuestBridge.hpp"
#include "core/operations/SecureOperations.hpp"
#include "core/ratelimit/RateLimiter.hpp"
#include "core/secrets/SecretsManager.hpp"
#include "core/threat/ThreatDetector.hpp"
#include "core/validation/InputValidator.hpp"

namespace hostguard {
namespace core {
namespace config {

// CoreConfig — конфигурация ядра. Отсутствующие ключи оставляют значения по умолчанию.
//
// {
//   "logLevel": "info",
//   "validator":  { "maxUriLength": 200, "allowPrivateNetworks": false, ... },
//   "rateLimits": { "default": {"capacity":100,"refillPerSecond":10}, "fetch": {...} },
//   "auditor":    { "bufferCapacity", "queueCapacity", "enableFileSink", "logPath", "maxLogSize", "maxLogFiles" },
//   "threat":     { "maxAuthFailures", "authFailureWindowMinutes", ... },
//   "operations": { "delegateTimeoutMs", "fetchTimeoutMs", "threads": {"min","max","queue"} },
//   "bridge":     { "callTimeoutMs", "maxFetchTimeoutMs" },
//   "secrets":    { "file", "loadEnvironment" }
// }
struct CoreConfig {
    std::string logLevel = "info";
    validation::ValidatorLimits validator;
    ratelimit::RateLimitConfig rateLimits = ratelimit::RateLimitConfig::defaults();
    audit::AuditorConfig auditor;
    threat::ThreatConfig threat;
    operations::OperationsConfig operations;
    bridge::BridgeConfig bridge;
    secrets::SecretsConfig secrets;

    bool validate() const;

    static CoreConfig fromJson(const nlohmann::json& j);     // std::runtime_error при неверных типах
    static CoreConfig loadFromFile(const std::string& path); // std::runtime_error, если файл не читается
};

} // namespace config
} // namespace core
} // namespace hostguard
