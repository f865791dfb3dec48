#pragma once
#include <memory>
#include <string>

namespace hostguard {
namespace core {
namespace validation {

// Что именно проверяется: набор правил зависит от назначения строки
enum class ValidationTarget {
    ScriptContent,
    ScriptName,
    Uri,
    AssetName,
    AssetContent,
    Url,
    HeaderName,
    HeaderValue,
    TableName,
    TableSchema,
    GraphQLSchema,
    StreamName,
    ConfigValue,
    FormField,
    RouteName,
};

// Стабильные коды причин отказа (возвращаются гостю как "reason")
enum class ValidationReason {
    None,
    Empty,
    Oversized,
    InvalidCharacters,
    PathTraversal,
    CodeExecutionPrimitive,
    CrossSiteScripting,
    HeaderInjection,
    NullByte,
    InvalidScheme,
    BlockedHost,
    MalformedUrl,
    InvalidMimeType,
    MalformedArguments,
};

std::string validationTargetToString(ValidationTarget target);
std::string validationReasonToString(ValidationReason reason);

struct ValidationResult {
    bool ok = true;
    ValidationReason reason = ValidationReason::None;

    static ValidationResult accept() { return {}; }
    static ValidationResult reject(ValidationReason why) { return {false, why}; }
    explicit operator bool() const { return ok; }
};

// Лимиты размеров (байты/символы) и сетевые ограничения
struct ValidatorLimits {
    size_t maxUriLength = 200;
    size_t maxScriptSize = 100000;
    size_t maxAssetSize = 10000000;
    size_t maxHeaderNameLength = 256;
    size_t maxHeaderValueLength = 8192;
    size_t maxUrlLength = 2048;
    size_t maxGraphQLSchemaSize = 1000000;
    size_t maxStreamNameLength = 64;
    size_t maxConfigValueLength = 4096;
    size_t maxTableNameLength = 64;
    size_t maxTableSchemaSize = 65536;
    size_t maxFormFieldLength = 65536;
    bool allowPrivateNetworks = false; // Разрешить localhost/частные адреса в fetch

    bool validate() const;
};

// InputValidator — проверка всех строк, пришедших от гостевого скрипта.
// Возвращает первое найденное нарушение; совпавшая подстрока наружу не отдаётся.
class InputValidator {
public:
    explicit InputValidator(const ValidatorLimits& limits = ValidatorLimits{});
    ~InputValidator();
    InputValidator(const InputValidator&) = delete;
    InputValidator& operator=(const InputValidator&) = delete;

    ValidationResult validate(const std::string& payload, ValidationTarget target) const;

    // Проверка URI с нормализацией (повторные '/' схлопываются)
    ValidationResult validateUri(const std::string& uri, std::string& normalized) const;
    ValidationResult validateMimeType(const std::string& mimeType) const;

    // Хост из http(s) URL в нижнем регистре; false, если URL не разбирается
    static bool extractHost(const std::string& url, std::string& host);
    static bool isBlockedHost(const std::string& host);

    const ValidatorLimits& limits() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace validation
} // namespace core
} // namespace hostguard
