#include "core/operations/SecureOperations.hpp"
#include "core/audit/SecurityAuditor.hpp"
#include "core/logging/Logger.hpp"
#include "core/ratelimit/RateLimiter.hpp"
#include "core/recovery/RecoverableState.hpp"
#include "core/secrets/SecretInjector.hpp"
#include "core/secrets/SecretsManager.hpp"
#include "core/validation/InputValidator.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <utility>
#include <vector>
#include <openssl/evp.h>

namespace hostguard {
namespace core {
namespace operations {

using identity::Capability;
using validation::ValidationReason;
using validation::ValidationTarget;

namespace {

const std::set<std::string> kAllowedMethods = {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD"};

constexpr size_t kDefaultAuditPage = 100;
constexpr size_t kMaxAuditPage = 1000;

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool decodeBase64(const std::string& in, std::string& out) {
    if (in.empty()) {
        out.clear();
        return true;
    }
    if (in.size() % 4 != 0) {
        return false;
    }
    std::string buffer(in.size() / 4 * 3, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buffer[0]),
                                        reinterpret_cast<const unsigned char*>(in.data()),
                                        static_cast<int>(in.size()));
    if (written < 0) {
        return false;
    }
    // EVP_DecodeBlock не учитывает '=' в длине результата
    size_t padding = 0;
    if (in[in.size() - 1] == '=') ++padding;
    if (in[in.size() - 2] == '=') ++padding;
    buffer.resize(static_cast<size_t>(written) - padding);
    out.swap(buffer);
    return true;
}

std::string encodeBase64(const std::string& in) {
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        reinterpret_cast<const unsigned char*>(in.data()),
                                        static_cast<int>(in.size()));
    out.resize(static_cast<size_t>(std::max(written, 0)));
    return out;
}

audit::EventKind eventKindFor(ErrorKind error) {
    switch (error) {
        case ErrorKind::None: return audit::EventKind::OperationSucceeded;
        case ErrorKind::ValidationRejected: return audit::EventKind::ValidationRejected;
        case ErrorKind::CapabilityDenied: return audit::EventKind::CapabilityDenied;
        case ErrorKind::RateLimited: return audit::EventKind::RateLimitExceeded;
        case ErrorKind::SecretNotFound: return audit::EventKind::SecretNotFound;
        case ErrorKind::SecretAccessDenied: return audit::EventKind::CapabilityDenied;
        case ErrorKind::UpstreamFailure: return audit::EventKind::UpstreamFailure;
        case ErrorKind::Timeout: return audit::EventKind::Timeout;
        case ErrorKind::InternalLockRecovered: return audit::EventKind::InternalLockRecovered;
    }
    return audit::EventKind::UpstreamFailure;
}

nlohmann::json toJsonArray(const std::vector<std::string>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array;
}

constexpr size_t kMaxOperationName = 64;

// Имя операции от моста: буквы, цифры, '.', '_' и не длиннее kMaxOperationName
bool isOperationName(const std::string& name) {
    if (name.empty() || name.size() > kMaxOperationName) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.' || c == '_';
    });
}

constexpr size_t kMaxDetailLength = 256;

// Управляющие символы заменяются на '?', длина ограничена
std::string boundedDetail(const std::string& detail) {
    std::string out = detail.substr(0, kMaxDetailLength);
    for (char& c : out) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            c = '?';
        }
    }
    return out;
}

std::string joinOwners(const std::vector<std::string>& owners) {
    std::string joined;
    for (const auto& owner : owners) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += owner;
    }
    return joined;
}

// Существующий скрипт меняет только администратор или один из владельцев
bool mayManageScript(const identity::UserContext& ctx, const collab::Resource& script) {
    return ctx.isAdministrator() || ctx.isOwner(script.owners);
}

OperationResult notOwner() {
    return OperationResult::failure(ErrorKind::CapabilityDenied, "NotOwner");
}

// Описание вызова для конвейера
struct Call {
    std::string operation;
    std::string actionClass;
    std::optional<Capability> capability;
    std::string resource;
    bool ordered = false;                 // Мутация: сериализуется по resource
    std::chrono::milliseconds timeout{0};
};

using Input = std::pair<const std::string*, ValidationTarget>;
using Delegate = std::function<OperationResult()>;
using Details = std::map<std::string, std::string>;

} // namespace

struct SecureOperations::Impl : public std::enable_shared_from_this<SecureOperations::Impl> {
    OperationsConfig config;
    SecurityServices services;
    OperationCollaborators collaborators;
    KeyedMutex resourceLocks;
    thread::ThreadPool* pool = nullptr;
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("secureops");
    mutable std::mutex metricsMutex;
    OperationsMetrics metrics;

    Impl(const OperationsConfig& cfg, SecurityServices svc, OperationCollaborators collab)
        : config(cfg), services(std::move(svc)), collaborators(std::move(collab)) {}

    Call makeCall(const std::string& operation, const std::string& actionClass,
                  std::optional<Capability> capability, const std::string& resource, bool ordered) const {
        Call call;
        call.operation = operation;
        call.actionClass = actionClass;
        call.capability = capability;
        call.resource = resource;
        call.ordered = ordered;
        call.timeout = config.delegateTimeout;
        return call;
    }

    void emitOutcome(const Context& ctx, const Call& call, const OperationResult& result, const Details& extra = {}) {
        audit::EventBuilder builder(result.success ? audit::EventKind::OperationSucceeded : eventKindFor(result.error));
        builder.outcome(result.success ? audit::Outcome::Success : audit::Outcome::Failure)
            .principal(ctx->principalId())
            .clientIp(ctx->clientIp())
            .resource(call.resource)
            .action(call.operation)
            .detail("actionClass", call.actionClass);
        if (result.success) {
            builder.severity(audit::Severity::Low);
        }
        if (!ctx->scriptUri().empty()) {
            builder.detail("scriptUri", ctx->scriptUri());
        }
        if (!ctx->scriptOwners().empty()) {
            builder.detail("scriptOwners", joinOwners(ctx->scriptOwners()));
        }
        if (!result.success) {
            builder.detail("error", errorKindToString(result.error));
            if (!result.reason.empty()) {
                builder.detail("reason", result.reason);
            }
        }
        for (const auto& entry : extra) {
            builder.detail(entry.first, entry.second);
        }
        builder.message(result.success ? call.operation + " succeeded"
                                       : call.operation + " failed: " + errorKindToString(result.error));
        try {
            services.auditor->log(builder.build());
        } catch (const std::exception& e) {
            logger->error("SecureOperations: audit of {} failed: {}", call.operation, e.what());
        }

        std::lock_guard<std::mutex> lock(metricsMutex);
        ++metrics.totalCalls;
        if (result.success) {
            ++metrics.succeeded;
        } else {
            ++metrics.failed;
            ++metrics.failuresByError[errorKindToString(result.error)];
        }
    }

    OperationHandle reject(const Context& ctx, const Call& call, const OperationResult& result, const Details& extra = {}) {
        emitOutcome(ctx, call, result, extra);
        return OperationHandle::completed(result);
    }

    OperationHandle rejectInput(const Context& ctx, const Call& call, const std::string& target, ValidationReason reason) {
        const std::string code = validation::validationReasonToString(reason);
        logger->debug("{} rejected: {} ({})", call.operation, code, target);
        return reject(ctx, call, OperationResult::failure(ErrorKind::ValidationRejected, code), {{"target", target}});
    }

    OperationHandle run(const Context& ctx, Call call, const std::vector<Input>& inputs, Delegate delegate) {
        for (const auto& input : inputs) {
            const validation::ValidationResult verdict = services.validator->validate(*input.first, input.second);
            if (!verdict) {
                return rejectInput(ctx, call, validation::validationTargetToString(input.second), verdict.reason);
            }
        }

        if (call.capability && !ctx->hasCapability(*call.capability)) {
            return reject(ctx, call, OperationResult::failure(ErrorKind::CapabilityDenied),
                          {{"capability", identity::capabilityToString(*call.capability)}});
        }

        ratelimit::RateLimitDecision decision;
        try {
            decision = services.rateLimiter->check({ctx->rateLimitSubject(), call.actionClass});
        } catch (const recovery::PoisonedStateError& e) {
            logger->error("SecureOperations: rate limiter state failed during {}: {}", call.operation, e.what());
            return reject(ctx, call, OperationResult::failure(ErrorKind::InternalLockRecovered));
        }
        if (!decision.allowed) {
            return reject(ctx, call, OperationResult::failure(ErrorKind::RateLimited),
                          {{"retryAfterMs", std::to_string(decision.retryAfter.count())}});
        }

        auto self = shared_from_this();
        auto shared = std::make_shared<const Call>(std::move(call));
        Context context = ctx;
        OperationHandle handle = OperationHandle::pending(
            [self, context, shared](const OperationResult& result) { self->emitOutcome(context, *shared, result); },
            shared->timeout);

        try {
            pool->enqueue([self, context, handle, shared, delegate]() mutable {
                self->execute(context, *shared, handle, delegate);
            });
        } catch (const std::exception& e) {
            logger->error("SecureOperations: cannot schedule {}: {}", shared->operation, e.what());
            handle.settle(OperationResult::failure(ErrorKind::UpstreamFailure));
        }
        return handle;
    }

    // Делегат завершился после Timeout: информационная запись (outcome None) о фактическом исходе
    void emitLateCompletion(const Context& ctx, const Call& call, const OperationResult& result) {
        audit::EventBuilder builder(result.success ? audit::EventKind::OperationSucceeded : eventKindFor(result.error));
        builder.severity(audit::Severity::Medium)
            .principal(ctx->principalId())
            .clientIp(ctx->clientIp())
            .resource(call.resource)
            .action(call.operation)
            .detail("actionClass", call.actionClass)
            .detail("lateCompletion", "true")
            .detail("result", result.success ? std::string("success") : errorKindToString(result.error))
            .message(call.operation + " completed after its deadline");
        try {
            services.auditor->log(builder.build());
        } catch (const std::exception& e) {
            logger->error("SecureOperations: audit of late {} failed: {}", call.operation, e.what());
        }
    }

    void execute(const Context& ctx, const Call& call, OperationHandle& handle, const Delegate& delegate) {
        if (handle.isSettled()) {
            logger->warn("SecureOperations: {} timed out before it started, delegate skipped", call.operation);
            return;
        }
        std::optional<KeyedMutex::Guard> guard;
        if (call.ordered) {
            guard.emplace(resourceLocks.lock(call.resource));
        }
        OperationResult result;
        try {
            result = delegate();
        } catch (const secrets::SecretNotFoundError& e) {
            result = OperationResult::failure(ErrorKind::SecretNotFound);
        } catch (const secrets::SecretAccessDeniedError& e) {
            result = OperationResult::failure(ErrorKind::SecretAccessDenied);
        } catch (const recovery::PoisonedStateError& e) {
            logger->error("SecureOperations: {} hit a failed shared state: {}", call.operation, e.what());
            result = OperationResult::failure(ErrorKind::InternalLockRecovered);
        } catch (const std::exception& e) {
            logger->error("SecureOperations: {} failed: {}", call.operation, e.what());
            result = OperationResult::failure(ErrorKind::UpstreamFailure);
        }
        // Событие пишется под замком ресурса: порядок аудита совпадает с порядком мутаций
        if (!handle.settle(result)) {
            logger->warn("SecureOperations: {} finished after its deadline, result discarded", call.operation);
            emitLateCompletion(ctx, call, result);
        }
    }
};

SecureOperations::SecureOperations(const OperationsConfig& config, SecurityServices services,
                                   OperationCollaborators collaborators) {
    if (!config.validate()) {
        throw std::invalid_argument("SecureOperations: invalid configuration");
    }
    if (!services.validator || !services.rateLimiter || !services.secrets || !services.auditor) {
        throw std::invalid_argument("SecureOperations: security services are incomplete");
    }
    if (!collaborators.scripts || !collaborators.assets || !collaborators.tables || !collaborators.transport ||
        !collaborators.registry || !collaborators.streams || !collaborators.users) {
        throw std::invalid_argument("SecureOperations: collaborators are incomplete");
    }
    pImpl = std::make_shared<Impl>(config, std::move(services), std::move(collaborators));
    pool_ = std::make_unique<thread::ThreadPool>(config.threads);
    pImpl->pool = pool_.get();
    pImpl->logger->info("SecureOperations ready ({}..{} workers)", config.threads.minThreads, config.threads.maxThreads);
}

SecureOperations::~SecureOperations() {
    shutdown();
}

void SecureOperations::shutdown() {
    if (pool_) {
        pool_->stop();
    }
}

bool SecureOperations::isAllowedMethod(const std::string& method) {
    return kAllowedMethods.count(method) > 0;
}

OperationsMetrics SecureOperations::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->metricsMutex);
    return pImpl->metrics;
}

OperationsConfig SecureOperations::getConfiguration() const {
    return pImpl->config;
}

// ---- Скрипты ----

OperationHandle SecureOperations::upsertScript(const Context& ctx, const std::string& uri, const std::string& content) {
    Call call = pImpl->makeCall("upsertScript", "script.write", Capability::WriteScripts, "script:" + uri, true);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {{&content, ValidationTarget::ScriptContent}},
        [scripts, normalized, content, ctx]() {
            collab::Resource resource;
            if (scripts->get(normalized, resource)) {
                if (!mayManageScript(*ctx, resource)) {
                    return notOwner();
                }
            } else {
                resource.key = normalized;
                if (ctx->principalId()) {
                    resource.owners.push_back(*ctx->principalId());
                }
            }
            resource.content = content;
            resource.contentType = "application/javascript";
            if (!scripts->upsert(resource)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"uri", normalized}});
        });
}

OperationHandle SecureOperations::getScript(const Context& ctx, const std::string& uri) {
    Call call = pImpl->makeCall("getScript", "script.read", Capability::ReadScripts, "script:" + uri, false);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {}, [scripts, normalized]() {
        collab::Resource resource;
        if (!scripts->get(normalized, resource)) {
            return OperationResult::ok(nullptr);
        }
        return OperationResult::ok(nlohmann::json{
            {"uri", resource.key}, {"content", resource.content}, {"owners", resource.owners}});
    });
}

OperationHandle SecureOperations::deleteScript(const Context& ctx, const std::string& uri) {
    Call call = pImpl->makeCall("deleteScript", "script.write", Capability::DeleteScripts, "script:" + uri, true);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {}, [scripts, normalized, ctx]() {
        collab::Resource existing;
        if (!scripts->get(normalized, existing)) {
            return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"deleted", false}});
        }
        if (!mayManageScript(*ctx, existing)) {
            return notOwner();
        }
        const bool deleted = scripts->remove(normalized);
        return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"deleted", deleted}});
    });
}

OperationHandle SecureOperations::getScriptOwners(const Context& ctx, const std::string& uri) {
    Call call = pImpl->makeCall("getScriptOwners", "script.read", Capability::ReadScripts, "script:" + uri, false);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {}, [scripts, normalized]() {
        collab::Resource resource;
        if (!scripts->get(normalized, resource)) {
            return OperationResult::ok(nullptr);
        }
        return OperationResult::ok(toJsonArray(resource.owners));
    });
}

OperationHandle SecureOperations::addScriptOwner(const Context& ctx, const std::string& uri, const std::string& principal) {
    Call call = pImpl->makeCall("addScriptOwner", "script.write", Capability::WriteScripts, "script:" + uri, true);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    if (principal.empty()) {
        return pImpl->rejectInput(ctx, call, "Principal", ValidationReason::Empty);
    }
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {{&principal, ValidationTarget::FormField}},
        [scripts, normalized, principal, ctx]() {
            collab::Resource resource;
            if (!scripts->get(normalized, resource)) {
                return OperationResult::ok(nullptr);
            }
            if (!mayManageScript(*ctx, resource)) {
                return notOwner();
            }
            const bool added = std::find(resource.owners.begin(), resource.owners.end(), principal) == resource.owners.end();
            if (added) {
                resource.owners.push_back(principal);
                if (!scripts->upsert(resource)) {
                    return OperationResult::failure(ErrorKind::UpstreamFailure);
                }
            }
            return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"owner", principal}, {"added", added}});
        });
}

OperationHandle SecureOperations::removeScriptOwner(const Context& ctx, const std::string& uri,
                                                    const std::string& principal) {
    Call call = pImpl->makeCall("removeScriptOwner", "script.write", Capability::WriteScripts, "script:" + uri, true);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "script:" + normalized;
    if (principal.empty()) {
        return pImpl->rejectInput(ctx, call, "Principal", ValidationReason::Empty);
    }
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {{&principal, ValidationTarget::FormField}},
        [scripts, normalized, principal, ctx]() {
            collab::Resource resource;
            if (!scripts->get(normalized, resource)) {
                return OperationResult::ok(nullptr);
            }
            if (!mayManageScript(*ctx, resource)) {
                return notOwner();
            }
            auto it = std::find(resource.owners.begin(), resource.owners.end(), principal);
            if (it == resource.owners.end()) {
                return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"owner", principal}, {"removed", false}});
            }
            // Последнего владельца снимает только администратор
            if (resource.owners.size() == 1 && !ctx->isAdministrator()) {
                return OperationResult::failure(ErrorKind::CapabilityDenied, "LastOwner");
            }
            resource.owners.erase(it);
            if (!scripts->upsert(resource)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"owner", principal}, {"removed", true}});
        });
}

OperationHandle SecureOperations::listScripts(const Context& ctx) {
    Call call = pImpl->makeCall("listScripts", "script.read", Capability::ReadScripts, "script:*", false);
    auto scripts = pImpl->collaborators.scripts;
    return pImpl->run(ctx, std::move(call), {}, [scripts]() {
        return OperationResult::ok(toJsonArray(scripts->list("")));
    });
}

// ---- Ассеты ----

OperationHandle SecureOperations::upsertAsset(const Context& ctx, const std::string& uri, const std::string& mimeType,
                                              const std::string& base64Content) {
    Call call = pImpl->makeCall("upsertAsset", "asset.write", Capability::WriteAssets, "asset:" + uri, true);
    const validation::InputValidator& validator = *pImpl->services.validator;
    std::string normalized;
    auto verdict = validator.validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "asset:" + normalized;
    verdict = validator.validateMimeType(mimeType);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "MimeType", verdict.reason);
    }
    if (base64Content.size() / 4 * 3 > validator.limits().maxAssetSize + 3) {
        return pImpl->rejectInput(ctx, call, "AssetContent", ValidationReason::Oversized);
    }
    std::string content;
    if (!decodeBase64(base64Content, content)) {
        return pImpl->rejectInput(ctx, call, "AssetContent", ValidationReason::InvalidCharacters);
    }
    auto assets = pImpl->collaborators.assets;
    const std::string owner = ctx->principalLabel();
    auto decoded = std::make_shared<const std::string>(std::move(content));
    return pImpl->run(ctx, std::move(call), {{decoded.get(), ValidationTarget::AssetContent}},
        [assets, normalized, mimeType, decoded, owner]() {
            collab::Resource resource;
            resource.key = normalized;
            resource.content = *decoded;
            resource.contentType = mimeType;
            resource.owners.push_back(owner);
            if (!assets->upsert(resource)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"size", decoded->size()}});
        });
}

OperationHandle SecureOperations::fetchAsset(const Context& ctx, const std::string& uri) {
    Call call = pImpl->makeCall("fetchAsset", "asset.read", Capability::ReadAssets, "asset:" + uri, false);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "asset:" + normalized;
    auto assets = pImpl->collaborators.assets;
    return pImpl->run(ctx, std::move(call), {}, [assets, normalized]() {
        collab::Resource resource;
        if (!assets->get(normalized, resource)) {
            return OperationResult::ok(nullptr);
        }
        return OperationResult::ok(nlohmann::json{
            {"uri", resource.key}, {"mimetype", resource.contentType}, {"content", encodeBase64(resource.content)}});
    });
}

OperationHandle SecureOperations::deleteAsset(const Context& ctx, const std::string& uri) {
    Call call = pImpl->makeCall("deleteAsset", "asset.write", Capability::DeleteAssets, "asset:" + uri, true);
    std::string normalized;
    const auto verdict = pImpl->services.validator->validateUri(uri, normalized);
    if (!verdict) {
        return pImpl->rejectInput(ctx, call, "Uri", verdict.reason);
    }
    call.resource = "asset:" + normalized;
    auto assets = pImpl->collaborators.assets;
    return pImpl->run(ctx, std::move(call), {}, [assets, normalized]() {
        const bool deleted = assets->remove(normalized);
        return OperationResult::ok(nlohmann::json{{"uri", normalized}, {"deleted", deleted}});
    });
}

OperationHandle SecureOperations::listAssets(const Context& ctx) {
    Call call = pImpl->makeCall("listAssets", "asset.read", Capability::ReadAssets, "asset:*", false);
    auto assets = pImpl->collaborators.assets;
    return pImpl->run(ctx, std::move(call), {}, [assets]() {
        return OperationResult::ok(toJsonArray(assets->list("")));
    });
}

// ---- Таблицы ----

OperationHandle SecureOperations::upsertTable(const Context& ctx, const std::string& name, const std::string& schemaJson) {
    Call call = pImpl->makeCall("upsertTable", "table.write", Capability::WriteTables, "table:" + name, true);
    auto tables = pImpl->collaborators.tables;
    const std::string owner = ctx->principalLabel();
    return pImpl->run(ctx, std::move(call),
        {{&name, ValidationTarget::TableName}, {&schemaJson, ValidationTarget::TableSchema}},
        [tables, name, schemaJson, owner]() {
            collab::Resource resource;
            resource.key = name;
            resource.content = schemaJson;
            resource.contentType = "application/json";
            resource.owners.push_back(owner);
            if (!tables->upsert(resource)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"name", name}});
        });
}

OperationHandle SecureOperations::getTable(const Context& ctx, const std::string& name) {
    Call call = pImpl->makeCall("getTable", "table.read", Capability::ReadTables, "table:" + name, false);
    auto tables = pImpl->collaborators.tables;
    return pImpl->run(ctx, std::move(call), {{&name, ValidationTarget::TableName}}, [tables, name]() {
        collab::Resource resource;
        if (!tables->get(name, resource)) {
            return OperationResult::ok(nullptr);
        }
        return OperationResult::ok(nlohmann::json{
            {"name", resource.key}, {"schema", nlohmann::json::parse(resource.content)}});
    });
}

OperationHandle SecureOperations::deleteTable(const Context& ctx, const std::string& name) {
    Call call = pImpl->makeCall("deleteTable", "table.write", Capability::WriteTables, "table:" + name, true);
    auto tables = pImpl->collaborators.tables;
    return pImpl->run(ctx, std::move(call), {{&name, ValidationTarget::TableName}}, [tables, name]() {
        const bool deleted = tables->remove(name);
        return OperationResult::ok(nlohmann::json{{"name", name}, {"deleted", deleted}});
    });
}

OperationHandle SecureOperations::listTables(const Context& ctx) {
    Call call = pImpl->makeCall("listTables", "table.read", Capability::ReadTables, "table:*", false);
    auto tables = pImpl->collaborators.tables;
    return pImpl->run(ctx, std::move(call), {}, [tables]() {
        return OperationResult::ok(toJsonArray(tables->list("")));
    });
}

// ---- Исходящие запросы ----

OperationHandle SecureOperations::fetch(const Context& ctx, const FetchRequest& request) {
    std::string host;
    if (!validation::InputValidator::extractHost(request.url, host)) {
        host = "invalid";
    }
    Call call = pImpl->makeCall("fetch", "fetch", Capability::OutboundFetch, "fetch:" + host, false);
    const std::chrono::milliseconds timeout =
        request.timeout && request.timeout->count() > 0 ? *request.timeout : pImpl->config.fetchTimeout;
    call.timeout = timeout;

    const std::string method = toUpper(request.method.empty() ? std::string("GET") : request.method);
    if (!isAllowedMethod(method)) {
        return pImpl->rejectInput(ctx, call, "Method", ValidationReason::InvalidCharacters);
    }
    std::vector<Input> inputs;
    inputs.emplace_back(&request.url, ValidationTarget::Url);
    for (const auto& header : request.headers) {
        inputs.emplace_back(&header.first, ValidationTarget::HeaderName);
        inputs.emplace_back(&header.second, ValidationTarget::HeaderValue);
    }
    inputs.emplace_back(&request.body, ValidationTarget::FormField);

    collab::HttpRequest outbound;
    outbound.method = method;
    outbound.url = request.url;
    outbound.headers = request.headers;
    outbound.body = request.body;
    outbound.originScript = ctx->scriptUri();
    outbound.callSite = "fetch";

    auto transport = pImpl->collaborators.transport;
    auto secrets = pImpl->services.secrets;
    return pImpl->run(ctx, std::move(call), inputs, [transport, secrets, outbound, timeout]() {
        const collab::HttpResponse response = transport->send(outbound, timeout);
        // Секрет, отражённый сервером, не должен вернуться гостю
        nlohmann::json headers = nlohmann::json::object();
        for (const auto& header : response.headers) {
            headers[header.first] = secrets->redact(header.second);
        }
        return OperationResult::ok(nlohmann::json{
            {"status", response.status},
            {"ok", response.ok()},
            {"headers", headers},
            {"body", secrets->redact(response.body)}});
    });
}

// ---- Регистрации ----

OperationHandle SecureOperations::registerRoute(const Context& ctx, const std::string& path, const std::string& handler,
                                                const std::string& method) {
    const std::string verb = toUpper(method.empty() ? std::string("GET") : method);
    Call call = pImpl->makeCall("registerRoute", "register", Capability::ManageRoutes, "route:" + verb + " " + path, true);
    if (!isAllowedMethod(verb)) {
        return pImpl->rejectInput(ctx, call, "Method", ValidationReason::InvalidCharacters);
    }
    collab::RegistrationRequest entry;
    entry.kind = collab::RegistrationKind::Route;
    entry.name = path;
    entry.handler = handler;
    entry.method = verb;
    entry.scriptUri = ctx->scriptUri();
    entry.owner = ctx->principalLabel();
    auto registry = pImpl->collaborators.registry;
    return pImpl->run(ctx, std::move(call),
        {{&path, ValidationTarget::RouteName}, {&handler, ValidationTarget::ScriptName}},
        [registry, entry]() {
            if (!registry->registerEntry(entry)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"path", entry.name}, {"method", entry.method}});
        });
}

OperationHandle SecureOperations::registerGraphQL(const Context& ctx, GraphQLKind kind, const std::string& name,
                                                  const std::string& sdl, const std::string& handler) {
    collab::RegistrationRequest entry;
    switch (kind) {
        case GraphQLKind::Query: entry.kind = collab::RegistrationKind::GraphQLQuery; break;
        case GraphQLKind::Mutation: entry.kind = collab::RegistrationKind::GraphQLMutation; break;
        case GraphQLKind::Subscription: entry.kind = collab::RegistrationKind::GraphQLSubscription; break;
    }
    const std::string kindName = collab::registrationKindToString(entry.kind);
    Call call = pImpl->makeCall("registerGraphQL", "register", Capability::ManageGraphQL, kindName + ":" + name, true);
    entry.name = name;
    entry.schema = sdl;
    entry.handler = handler;
    entry.scriptUri = ctx->scriptUri();
    entry.owner = ctx->principalLabel();
    auto registry = pImpl->collaborators.registry;
    return pImpl->run(ctx, std::move(call),
        {{&name, ValidationTarget::ScriptName}, {&sdl, ValidationTarget::GraphQLSchema},
         {&handler, ValidationTarget::ScriptName}},
        [registry, entry, kindName]() {
            if (!registry->registerEntry(entry)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"name", entry.name}, {"kind", kindName}});
        });
}

OperationHandle SecureOperations::registerTool(const Context& ctx, const std::string& name, const std::string& description,
                                               const std::string& schemaJson, const std::string& handler) {
    Call call = pImpl->makeCall("registerTool", "register", Capability::ManageTools, "tool:" + name, true);
    collab::RegistrationRequest entry;
    entry.kind = collab::RegistrationKind::Tool;
    entry.name = name;
    entry.description = description;
    entry.schema = schemaJson;
    entry.handler = handler;
    entry.scriptUri = ctx->scriptUri();
    entry.owner = ctx->principalLabel();
    auto registry = pImpl->collaborators.registry;
    return pImpl->run(ctx, std::move(call),
        {{&name, ValidationTarget::ScriptName}, {&description, ValidationTarget::FormField},
         {&schemaJson, ValidationTarget::TableSchema}, {&handler, ValidationTarget::ScriptName}},
        [registry, entry]() {
            if (!registry->registerEntry(entry)) {
                return OperationResult::failure(ErrorKind::UpstreamFailure);
            }
            return OperationResult::ok(nlohmann::json{{"name", entry.name}});
        });
}

OperationHandle SecureOperations::registerStream(const Context& ctx, const std::string& path) {
    Call call = pImpl->makeCall("registerStream", "register", Capability::ManageStreams, "stream:" + path, true);
    collab::RegistrationRequest entry;
    entry.kind = collab::RegistrationKind::StreamRoute;
    entry.name = path;
    entry.scriptUri = ctx->scriptUri();
    entry.owner = ctx->principalLabel();
    auto registry = pImpl->collaborators.registry;
    return pImpl->run(ctx, std::move(call), {{&path, ValidationTarget::StreamName}}, [registry, entry]() {
        if (!registry->registerEntry(entry)) {
            return OperationResult::failure(ErrorKind::UpstreamFailure);
        }
        return OperationResult::ok(nlohmann::json{{"path", entry.name}});
    });
}

OperationHandle SecureOperations::broadcast(const Context& ctx, const std::string& path, const std::string& message) {
    Call call = pImpl->makeCall("broadcast", "stream.send", Capability::ManageStreams, "stream:" + path, true);
    auto streams = pImpl->collaborators.streams;
    return pImpl->run(ctx, std::move(call),
        {{&path, ValidationTarget::StreamName}, {&message, ValidationTarget::FormField}},
        [streams, path, message]() {
            const size_t delivered = streams->broadcast(path, message);
            return OperationResult::ok(nlohmann::json{{"path", path}, {"delivered", delivered}});
        });
}

// ---- Администрирование ----

OperationHandle SecureOperations::readAuditLog(const Context& ctx, size_t limit) {
    Call call = pImpl->makeCall("readAuditLog", "audit.read", Capability::ViewLogs, "audit", false);
    const size_t page = limit == 0 ? kDefaultAuditPage : std::min(limit, kMaxAuditPage);
    auto auditor = pImpl->services.auditor;
    Context context = ctx;
    return pImpl->run(ctx, std::move(call), {}, [auditor, context, page]() {
        std::vector<audit::AuditRecord> records;
        if (context->isAdministrator()) {
            records = auditor->records(page);
        } else if (context->principalId()) {
            audit::AuditQuery query;
            query.principal = context->principalId();
            query.limit = page;
            records = auditor->query(query);
        } else if (!context->clientIp().empty()) {
            // Анонимный субъект видит только анонимные записи со своего адреса
            for (const auto& record : auditor->records(auditor->getConfiguration().bufferCapacity)) {
                if (!record.event->principalId && record.event->clientIp == context->clientIp()) {
                    records.push_back(record);
                }
            }
            if (records.size() > page) {
                records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(page));
            }
        }
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& record : records) {
            entries.push_back(record.toJson());
        }
        return OperationResult::ok(entries);
    });
}

OperationHandle SecureOperations::pruneAuditLog(const Context& ctx, size_t keepLast) {
    Call call = pImpl->makeCall("pruneAuditLog", "admin", Capability::Administrator, "audit", true);
    auto auditor = pImpl->services.auditor;
    return pImpl->run(ctx, std::move(call), {}, [auditor, keepLast]() {
        const size_t pruned = auditor->pruneKeepLast(keepLast);
        return OperationResult::ok(nlohmann::json{{"pruned", pruned}, {"kept", auditor->size()}});
    });
}

OperationHandle SecureOperations::listRoles(const Context& ctx, const std::string& principal) {
    Call call = pImpl->makeCall("listRoles", "admin", Capability::ManageRoles, "user:" + principal, false);
    if (principal.empty()) {
        return pImpl->rejectInput(ctx, call, "Principal", ValidationReason::Empty);
    }
    auto users = pImpl->collaborators.users;
    return pImpl->run(ctx, std::move(call), {{&principal, ValidationTarget::FormField}}, [users, principal]() {
        nlohmann::json roles = nlohmann::json::array();
        for (identity::Role role : users->rolesOf(principal)) {
            roles.push_back(identity::roleToString(role));
        }
        return OperationResult::ok(nlohmann::json{{"principal", principal}, {"roles", roles}});
    });
}

OperationHandle SecureOperations::addRole(const Context& ctx, const std::string& principal, const std::string& role) {
    Call call = pImpl->makeCall("addRole", "admin", Capability::ManageRoles, "user:" + principal, true);
    if (principal.empty()) {
        return pImpl->rejectInput(ctx, call, "Principal", ValidationReason::Empty);
    }
    const auto parsed = identity::roleFromString(role);
    if (!parsed) {
        return pImpl->rejectInput(ctx, call, "Role", ValidationReason::InvalidCharacters);
    }
    auto users = pImpl->collaborators.users;
    const identity::Role value = *parsed;
    return pImpl->run(ctx, std::move(call), {{&principal, ValidationTarget::FormField}}, [users, principal, value]() {
        if (!users->addRole(principal, value)) {
            return OperationResult::failure(ErrorKind::UpstreamFailure);
        }
        return OperationResult::ok(nlohmann::json{{"principal", principal}, {"role", identity::roleToString(value)}});
    });
}

OperationHandle SecureOperations::removeRole(const Context& ctx, const std::string& principal, const std::string& role) {
    Call call = pImpl->makeCall("removeRole", "admin", Capability::ManageRoles, "user:" + principal, true);
    if (principal.empty()) {
        return pImpl->rejectInput(ctx, call, "Principal", ValidationReason::Empty);
    }
    const auto parsed = identity::roleFromString(role);
    if (!parsed) {
        return pImpl->rejectInput(ctx, call, "Role", ValidationReason::InvalidCharacters);
    }
    auto users = pImpl->collaborators.users;
    const identity::Role value = *parsed;
    return pImpl->run(ctx, std::move(call), {{&principal, ValidationTarget::FormField}}, [users, principal, value]() {
        const bool removed = users->removeRole(principal, value);
        return OperationResult::ok(nlohmann::json{{"principal", principal}, {"removed", removed}});
    });
}

// ---- Секреты ----

OperationHandle SecureOperations::listSecretIdentifiers(const Context& ctx) {
    Call call = pImpl->makeCall("listSecretIdentifiers", "admin", Capability::ManageSecrets, "secrets", false);
    auto secrets = pImpl->services.secrets;
    return pImpl->run(ctx, std::move(call), {}, [secrets]() {
        return OperationResult::ok(toJsonArray(secrets->listIdentifiers()));
    });
}

OperationHandle SecureOperations::listScriptSecretIdentifiers(const Context& ctx) {
    Call call = pImpl->makeCall("listScriptSecretIdentifiers", "secrets", std::nullopt, "secrets", false);
    auto secrets = pImpl->services.secrets;
    return pImpl->run(ctx, std::move(call), {}, [secrets]() {
        return OperationResult::ok(toJsonArray(secrets->listIdentifiers()));
    });
}

OperationHandle SecureOperations::secretExists(const Context& ctx, const std::string& identifier) {
    const std::string id = secrets::SecretsManager::normalizeIdentifier(identifier);
    Call call = pImpl->makeCall("secretExists", "secrets", std::nullopt, "secret:" + id, false);
    if (identifier.empty()) {
        return pImpl->rejectInput(ctx, call, "SecretIdentifier", ValidationReason::Empty);
    }
    auto secrets = pImpl->services.secrets;
    return pImpl->run(ctx, std::move(call), {{&identifier, ValidationTarget::FormField}}, [secrets, id]() {
        return OperationResult::ok(secrets->exists(id));
    });
}

OperationHandle SecureOperations::rejectMalformed(const Context& ctx, const std::string& operation, const std::string& detail) {
    const std::string name = isOperationName(operation) ? operation : std::string("unknown");
    Call call = pImpl->makeCall(name, "bridge", std::nullopt, name, false);
    return pImpl->reject(ctx, call,
                         OperationResult::failure(ErrorKind::ValidationRejected,
                                                  validation::validationReasonToString(ValidationReason::MalformedArguments)),
                         {{"detail", boundedDetail(detail)}});
}

} // namespace operations
} // namespace core
} // namespace hostguard
