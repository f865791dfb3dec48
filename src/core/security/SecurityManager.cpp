#include "core/security/SecurityManager.hpp"
#include "core/audit/SecurityAuditor.hpp"
#include "core/bridge/GuestBridge.hpp"
#include "core/collab/InMemoryCollaborators.hpp"
#include "core/logging/Logger.hpp"
#include "core/ratelimit/RateLimiter.hpp"
#include "core/secrets/SecretInjector.hpp"
#include "core/secrets/SecretsManager.hpp"
#include "core/threat/ThreatDetector.hpp"
#include "core/validation/InputValidator.hpp"
#include <mutex>
#include <stdexcept>

namespace hostguard {
namespace core {
namespace security {

namespace {
constexpr std::chrono::seconds kBucketIdleAge{600};
}

struct SecurityManager::Impl {
    config::CoreConfig config;
    operations::OperationCollaborators collaborators;
    audit::AlertCallback alertCallback;
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("hostguard");

    mutable std::mutex mutex;
    bool initialized = false;

    std::shared_ptr<validation::InputValidator> validator;
    std::shared_ptr<ratelimit::RateLimiter> rateLimiter;
    std::shared_ptr<secrets::SecretsManager> secretsManager;
    std::shared_ptr<audit::SecurityAuditor> auditor;
    std::shared_ptr<audit::AlertSink> alertSink;
    std::shared_ptr<threat::ThreatDetector> threatDetector;
    std::shared_ptr<operations::SecureOperations> secureOperations;
    std::shared_ptr<bridge::GuestBridge> guestBridge;

    void fillDefaultCollaborators() {
        if (!collaborators.scripts) collaborators.scripts = std::make_shared<collab::InMemoryRepository>();
        if (!collaborators.assets) collaborators.assets = std::make_shared<collab::InMemoryRepository>();
        if (!collaborators.tables) collaborators.tables = std::make_shared<collab::InMemoryRepository>();
        if (!collaborators.transport) collaborators.transport = std::make_shared<collab::UnconfiguredTransport>();
        if (!collaborators.registry) collaborators.registry = std::make_shared<collab::InMemoryRegistry>();
        if (!collaborators.streams) collaborators.streams = std::make_shared<collab::InMemoryStreamBroadcaster>();
        if (!collaborators.users) collaborators.users = std::make_shared<collab::InMemoryUserRepository>();
    }

    void build() {
        if (!config.validate()) {
            throw std::invalid_argument("SecurityManager: invalid configuration");
        }
        validator = std::make_shared<validation::InputValidator>(config.validator);

        auditor = std::make_shared<audit::SecurityAuditor>(config.auditor);
        alertSink = std::make_shared<audit::AlertSink>(audit::Severity::Critical, alertCallback);
        auditor->addSink(alertSink);

        secretsManager = std::make_shared<secrets::SecretsManager>();
        std::weak_ptr<secrets::SecretsManager> weakSecrets = secretsManager;
        auditor->setRedactor([weakSecrets](const std::string& text) {
            auto owner = weakSecrets.lock();
            return owner ? owner->redact(text) : text;
        });

        std::weak_ptr<audit::SecurityAuditor> weakAuditor = auditor;
        const recovery::RecoveryCallback onRecovered = [weakAuditor](const std::string& name, const std::string& reason) {
            if (auto owner = weakAuditor.lock()) {
                owner->logLockRecovered(name, reason);
            }
        };
        secretsManager->setRecoveryCallback(onRecovered);
        size_t loaded = 0;
        if (config.secrets.loadEnvironment) {
            loaded += secretsManager->loadFromEnvironment();
        }
        if (!config.secrets.file.empty()) {
            loaded += secretsManager->loadFromFile(config.secrets.file);
        }
        logger->info("SecurityManager: {} secrets loaded", loaded);

        rateLimiter = std::make_shared<ratelimit::RateLimiter>(config.rateLimits);
        rateLimiter->attachAuditor(auditor);
        rateLimiter->setRecoveryCallback(onRecovered);

        threatDetector = std::make_shared<threat::ThreatDetector>(config.threat);
        threatDetector->attach(auditor);

        if (!auditor->initialize()) {
            throw std::runtime_error("SecurityManager: auditor failed to start");
        }

        fillDefaultCollaborators();
        operations::OperationCollaborators wired = collaborators;
        wired.transport = std::make_shared<secrets::SecretInjectingTransport>(collaborators.transport, secretsManager, auditor);

        operations::SecurityServices services;
        services.validator = validator;
        services.rateLimiter = rateLimiter;
        services.secrets = secretsManager;
        services.auditor = auditor;
        secureOperations = std::make_shared<operations::SecureOperations>(config.operations, services, wired);
        guestBridge = std::make_shared<bridge::GuestBridge>(secureOperations, config.bridge);
    }

    void release() {
        guestBridge.reset();
        if (secureOperations) {
            secureOperations->shutdown();
            secureOperations.reset();
        }
        threatDetector.reset();
        rateLimiter.reset();
        if (auditor) {
            auditor->shutdown();
            auditor.reset();
        }
        alertSink.reset();
        secretsManager.reset();
        validator.reset();
    }
};

SecurityManager::SecurityManager(const config::CoreConfig& config, operations::OperationCollaborators collaborators)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->config = config;
    pImpl->collaborators = std::move(collaborators);
}

SecurityManager::~SecurityManager() {
    shutdown();
}

void SecurityManager::setAlertCallback(audit::AlertCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->alertCallback = std::move(callback);
}

bool SecurityManager::initialize() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized) {
        return true;
    }
    try {
        pImpl->build();
        pImpl->initialized = true;
        pImpl->logger->info("SecurityManager: initialized ({} guest functions)",
                            bridge::GuestBridge::functionNames().size());
        return true;
    } catch (const std::exception& e) {
        pImpl->logger->error("SecurityManager: initialization failed: {}", e.what());
        pImpl->release();
        return false;
    }
}

void SecurityManager::shutdown() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized) {
        return;
    }
    // Сначала дождаться делегатов: их итоговые события должны попасть в аудит
    pImpl->secureOperations->shutdown();
    pImpl->auditor->flush();
    pImpl->auditor->shutdown();
    pImpl->initialized = false;
    pImpl->logger->info("SecurityManager: shut down");
}

bool SecurityManager::isInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->initialized;
}

identity::UserContextPtr SecurityManager::createContext(const std::optional<std::string>& principalId,
                                                        const std::string& scriptUri,
                                                        const std::string& clientIp) const {
    std::shared_ptr<validation::InputValidator> validator;
    operations::OperationCollaborators collaborators;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->initialized) {
            throw std::runtime_error("SecurityManager: not initialized");
        }
        validator = pImpl->validator;
        collaborators = pImpl->collaborators;
    }

    identity::RoleSet roles;
    if (principalId) {
        roles = collaborators.users->rolesOf(*principalId);
        roles.insert(identity::Role::Authenticated);
    }
    std::vector<std::string> owners;
    std::string normalized;
    if (!scriptUri.empty() && validator->validateUri(scriptUri, normalized)) {
        collab::Resource script;
        if (collaborators.scripts->get(normalized, script)) {
            owners = script.owners;
        }
    }
    return identity::UserContext::fromRoles(principalId, roles, scriptUri, owners, clientIp);
}

bool SecurityManager::recordAuthentication(const std::optional<std::string>& principalId, const std::string& clientIp,
                                           bool success, const std::string& detail) {
    std::shared_ptr<ratelimit::RateLimiter> rateLimiter = getRateLimiter();
    std::shared_ptr<audit::SecurityAuditor> auditor = getAuditor();
    if (!rateLimiter || !auditor) {
        throw std::runtime_error("SecurityManager: not initialized");
    }
    const std::string subject = principalId ? "user:" + *principalId
                                            : "ip:" + (clientIp.empty() ? std::string("unknown") : clientIp);
    if (!rateLimiter->admit({subject, "auth"})) {
        return false;
    }
    if (success && principalId) {
        auditor->logAuthSuccess(*principalId, clientIp, detail);
    } else {
        auditor->logAuthFailure(principalId, clientIp, detail);
    }
    return true;
}

void SecurityManager::runMaintenance() {
    std::shared_ptr<ratelimit::RateLimiter> rateLimiter = getRateLimiter();
    std::shared_ptr<threat::ThreatDetector> threatDetector = getThreatDetector();
    if (!rateLimiter || !threatDetector) {
        return;
    }
    const size_t buckets = rateLimiter->evictIdle(kBucketIdleAge);
    const size_t subjects = threatDetector->cleanup(std::chrono::system_clock::now());
    if (buckets > 0 || subjects > 0) {
        pImpl->logger->debug("SecurityManager: maintenance evicted {} buckets, {} threat subjects", buckets, subjects);
    }
}

std::shared_ptr<validation::InputValidator> SecurityManager::getValidator() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->validator;
}

std::shared_ptr<ratelimit::RateLimiter> SecurityManager::getRateLimiter() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->rateLimiter;
}

std::shared_ptr<secrets::SecretsManager> SecurityManager::getSecrets() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->secretsManager;
}

std::shared_ptr<audit::SecurityAuditor> SecurityManager::getAuditor() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->auditor;
}

std::shared_ptr<threat::ThreatDetector> SecurityManager::getThreatDetector() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->threatDetector;
}

std::shared_ptr<operations::SecureOperations> SecurityManager::getOperations() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->secureOperations;
}

std::shared_ptr<bridge::GuestBridge> SecurityManager::getBridge() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->guestBridge;
}

operations::OperationCollaborators SecurityManager::getCollaborators() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->collaborators;
}

nlohmann::json SecurityManager::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    nlohmann::json metrics{{"initialized", pImpl->initialized}};
    if (pImpl->auditor) {
        metrics["audit"] = pImpl->auditor->getMetrics().toJson();
        metrics["alerts"] = pImpl->alertSink->alertCount();
    }
    if (pImpl->secureOperations) {
        metrics["operations"] = pImpl->secureOperations->getMetrics().toJson();
    }
    if (pImpl->threatDetector) {
        metrics["threat"] = pImpl->threatDetector->statistics().toJson();
    }
    if (pImpl->rateLimiter) {
        metrics["rateLimiter"] = nlohmann::json{{"buckets", pImpl->rateLimiter->bucketCount()}};
    }
    if (pImpl->secretsManager) {
        metrics["secrets"] = pImpl->secretsManager->count();
    }
    return metrics;
}

config::CoreConfig SecurityManager::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace security
} // namespace core
} // namespace hostguard
