#pragma once
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/collab/Collaborators.hpp"
#include "core/secrets/SecretsManager.hpp"

namespace hostguard {
namespace core {
namespace audit {
class SecurityAuditor;
}
namespace secrets {

enum class InjectionStatus {
    Ok,
    NotFound,
    AccessDenied, // Нарушено ограничение URL или скрипта
};

struct InjectionResult {
    InjectionStatus status = InjectionStatus::Ok;
    std::string identifier;             // Первый неразрешённый идентификатор
    std::vector<std::string> resolved;  // Подставленные идентификаторы (без повторов)

    bool ok() const { return status == InjectionStatus::Ok; }
};

// SecretInjector — подстановка маркеров {{secret:<id>}} в заголовки и тело запроса.
// Всё или ничего: при неразрешённом маркере запрос не изменяется.
// Подстановка однопроходная, значения повторно не разворачиваются.
class SecretInjector {
public:
    explicit SecretInjector(std::shared_ptr<SecretsManager> secrets);

    InjectionResult inject(collab::HttpRequest& request) const;

    // Идентификаторы маркеров в порядке появления, без повторов, в нижнем регистре
    static std::vector<std::string> findMarkers(const std::string& text);
    static bool containsMarker(const std::string& text);

private:
    std::shared_ptr<SecretsManager> secrets_;
};

class SecretNotFoundError : public std::runtime_error {
public:
    explicit SecretNotFoundError(const std::string& identifier)
        : std::runtime_error("secret not found: " + identifier), identifier_(identifier) {}
    const std::string& identifier() const { return identifier_; }

private:
    std::string identifier_;
};

class SecretAccessDeniedError : public std::runtime_error {
public:
    explicit SecretAccessDeniedError(const std::string& identifier)
        : std::runtime_error("secret access denied: " + identifier), identifier_(identifier) {}
    const std::string& identifier() const { return identifier_; }

private:
    std::string identifier_;
};

// Транспорт-обёртка: подставляет секреты до любого сетевого I/O и пишет
// SecretAccessed на каждый подставленный идентификатор.
// Бросает SecretNotFoundError / SecretAccessDeniedError, не вызывая inner.
class SecretInjectingTransport : public collab::HttpTransport {
public:
    SecretInjectingTransport(std::shared_ptr<collab::HttpTransport> inner,
                             std::shared_ptr<SecretsManager> secrets,
                             std::shared_ptr<audit::SecurityAuditor> auditor);

    collab::HttpResponse send(const collab::HttpRequest& request, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<collab::HttpTransport> inner_;
    SecretInjector injector_;
    std::shared_ptr<audit::SecurityAuditor> auditor_;
};

} // namespace secrets
} // namespace core
} // namespace hostguard
