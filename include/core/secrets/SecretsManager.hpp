#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/recovery/RecoverableState.hpp"

namespace hostguard {
namespace core {
namespace secrets {

enum class SecretLookupStatus {
    Found,
    NotFound,
    UrlNotAllowed,
    ScriptNotAllowed,
};

std::string secretLookupStatusToString(SecretLookupStatus status);

// Результат поиска с проверкой ограничений. value заполнен только при Found.
struct SecretLookup {
    SecretLookupStatus status = SecretLookupStatus::NotFound;
    std::string value;

    bool found() const { return status == SecretLookupStatus::Found; }
};

struct SecretsConfig {
    std::string file;             // JSON-файл секретов (пусто: не читать)
    bool loadEnvironment = true;  // Переменные SECRET_*

    bool validate() const { return true; }
};

// SecretsManager — хранилище секретов. Значения доступны только нативному коду;
// гостю отдаются лишь exists() и список идентификаторов.
// Идентификаторы нечувствительны к регистру (приводятся к нижнему).
class SecretsManager {
public:
    SecretsManager();
    ~SecretsManager();
    SecretsManager(const SecretsManager&) = delete;
    SecretsManager& operator=(const SecretsManager&) = delete;

    void setRecoveryCallback(recovery::RecoveryCallback callback);

    // Видимо гостю
    bool exists(const std::string& identifier) const;
    std::vector<std::string> listIdentifiers() const;

    // Только нативный код
    std::optional<std::string> get(const std::string& identifier) const;
    SecretLookup getWithConstraints(const std::string& identifier, const std::string& url,
                                    const std::string& scriptUri) const;
    void set(const std::string& identifier, const std::string& value);
    void setConstrained(const std::string& identifier, const std::string& value,
                        const std::string& allowedUrlPattern, const std::string& allowedScriptPattern);
    bool remove(const std::string& identifier);
    void clear();
    size_t count() const;

    // Замена известных значений (длиной >= 8) на "[REDACTED]"
    std::string redact(const std::string& text) const;
    static bool looksLikeSecret(const std::string& value);

    size_t loadFromEnvironment(); // Из environ
    size_t loadFromVariables(const std::map<std::string, std::string>& variables); // Формат SECRET_*
    size_t loadFromMap(const std::map<std::string, std::string>& secrets); // id -> значение, без ограничений
    size_t loadFromFile(const std::string& path); // JSON-массив; std::runtime_error при ошибке

    static std::string normalizeIdentifier(const std::string& identifier);
    static std::string normalizeUrl(const std::string& url); // Схема и хост в нижнем регистре
    static bool globMatch(const std::string& pattern, const std::string& text); // fnmatch, '*' проходит через '/'

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace secrets
} // namespace core
} // namespace hostguard
