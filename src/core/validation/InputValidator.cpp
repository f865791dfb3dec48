#include "core/validation/InputValidator.hpp"
#include "core/logging/Logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <regex>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace hostguard {
namespace core {
namespace validation {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsNul(const std::string& value) {
    return value.find('\0') != std::string::npos;
}

bool containsCrLf(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

bool isPrivateIpv4(const unsigned char* b) {
    if (b[0] == 0 || b[0] == 10 || b[0] == 127) return true;
    if (b[0] == 169 && b[1] == 254) return true;
    if (b[0] == 172 && b[1] >= 16 && b[1] <= 31) return true;
    if (b[0] == 192 && b[1] == 168) return true;
    if (b[0] == 100 && b[1] >= 64 && b[1] <= 127) return true; // CGNAT
    return false;
}

const char* kCodePrimitivePatterns[] = {
    R"(eval\s*\()",
    R"(Function\s*\()",
    R"(setTimeout\s*\()",
    R"(setInterval\s*\()",
    R"(import\s*\()",
    R"(require\s*\()",
    R"(process\.)",
    R"(__proto__)",
    R"(constructor\.constructor)",
    R"(globalThis)",
    R"(window)",
    R"(document)",
};

const char* kConfigPrimitives[] = {"eval(", "function(", "require(", "import("};

} // namespace

std::string validationTargetToString(ValidationTarget target) {
    switch (target) {
        case ValidationTarget::ScriptContent: return "ScriptContent";
        case ValidationTarget::ScriptName: return "ScriptName";
        case ValidationTarget::Uri: return "Uri";
        case ValidationTarget::AssetName: return "AssetName";
        case ValidationTarget::AssetContent: return "AssetContent";
        case ValidationTarget::Url: return "Url";
        case ValidationTarget::HeaderName: return "HeaderName";
        case ValidationTarget::HeaderValue: return "HeaderValue";
        case ValidationTarget::TableName: return "TableName";
        case ValidationTarget::TableSchema: return "TableSchema";
        case ValidationTarget::GraphQLSchema: return "GraphQLSchema";
        case ValidationTarget::StreamName: return "StreamName";
        case ValidationTarget::ConfigValue: return "ConfigValue";
        case ValidationTarget::FormField: return "FormField";
        case ValidationTarget::RouteName: return "RouteName";
    }
    return "Unknown";
}

std::string validationReasonToString(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::None: return "None";
        case ValidationReason::Empty: return "Empty";
        case ValidationReason::Oversized: return "Oversized";
        case ValidationReason::InvalidCharacters: return "InvalidCharacters";
        case ValidationReason::PathTraversal: return "PathTraversal";
        case ValidationReason::CodeExecutionPrimitive: return "CodeExecutionPrimitive";
        case ValidationReason::CrossSiteScripting: return "CrossSiteScripting";
        case ValidationReason::HeaderInjection: return "HeaderInjection";
        case ValidationReason::NullByte: return "NullByte";
        case ValidationReason::InvalidScheme: return "InvalidScheme";
        case ValidationReason::BlockedHost: return "BlockedHost";
        case ValidationReason::MalformedUrl: return "MalformedUrl";
        case ValidationReason::InvalidMimeType: return "InvalidMimeType";
        case ValidationReason::MalformedArguments: return "MalformedArguments";
    }
    return "Unknown";
}

bool ValidatorLimits::validate() const {
    return maxUriLength > 0 && maxScriptSize > 0 && maxAssetSize > 0 &&
           maxHeaderNameLength > 0 && maxHeaderValueLength > 0 && maxUrlLength > 0 &&
           maxGraphQLSchemaSize > 0 && maxStreamNameLength > 0 && maxConfigValueLength > 0 &&
           maxTableNameLength > 0 && maxTableSchemaSize > 0 && maxFormFieldLength > 0;
}

struct InputValidator::Impl {
    ValidatorLimits limits;
    std::vector<std::regex> codePrimitives;
    std::regex xss;
    std::regex uriChars;
    std::regex fileName;
    std::regex streamName;
    std::regex routeChars;
    std::regex headerNameChars;
    std::regex tableName;
    std::regex mimeType;
    std::regex infiniteLoop;

    explicit Impl(const ValidatorLimits& cfg)
        : limits(cfg)
        , xss(R"(<\s*script|javascript\s*:|on(error|load)\s*=|<\s*iframe)",
              std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
        , uriChars(R"(^[A-Za-z0-9\-_/.]+$)", std::regex::optimize)
        , fileName(R"(^[A-Za-z0-9_\-.]+$)", std::regex::optimize)
        , streamName(R"(^/?[A-Za-z0-9_\-]+(/[A-Za-z0-9_\-]+)*$)", std::regex::optimize)
        , routeChars(R"(^/[A-Za-z0-9\-_/.:*{}]*$)", std::regex::optimize)
        , headerNameChars(R"(^[!#$%&'*+.^_`|~0-9A-Za-z-]+$)", std::regex::optimize)
        , tableName(R"(^[A-Za-z_][A-Za-z0-9_]*$)", std::regex::optimize)
        , mimeType(R"(^[A-Za-z0-9][A-Za-z0-9!#$&^_.+-]*/[A-Za-z0-9][A-Za-z0-9!#$&^_.+-]*(\s*;\s*[A-Za-z0-9_.+-]+=("[^"]*"|[A-Za-z0-9_.+-]+))*$)",
                   std::regex::optimize)
        , infiniteLoop(R"(while\s*\(\s*true\s*\)|for\s*\(\s*;\s*;\s*\))", std::regex::optimize) {
        for (const char* pattern : kCodePrimitivePatterns) {
            codePrimitives.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
        }
    }

    bool hasTraversal(const std::string& value) const {
        if (value.find("..") != std::string::npos || value.find('\\') != std::string::npos) {
            return true;
        }
        return toLower(value).find("%2e%2e") != std::string::npos;
    }

    bool hasXss(const std::string& value) const {
        return std::regex_search(value, xss);
    }

    ValidationResult scriptContent(const std::string& content) const {
        if (content.size() > limits.maxScriptSize) return ValidationResult::reject(ValidationReason::Oversized);
        if (containsNul(content)) return ValidationResult::reject(ValidationReason::NullByte);
        for (const auto& pattern : codePrimitives) {
            if (std::regex_search(content, pattern)) {
                return ValidationResult::reject(ValidationReason::CodeExecutionPrimitive);
            }
        }
        if (std::regex_search(content, infiniteLoop)) {
            // Только предупреждение: такой цикл бывает легитимным
            logging::getLogger("validation")->warn("Script content contains a potentially infinite loop");
        }
        return ValidationResult::accept();
    }

    ValidationResult uri(const std::string& value) const {
        if (value.empty()) return ValidationResult::reject(ValidationReason::Empty);
        if (value.size() > limits.maxUriLength) return ValidationResult::reject(ValidationReason::Oversized);
        if (containsNul(value)) return ValidationResult::reject(ValidationReason::NullByte);
        if (value.front() != '/') return ValidationResult::reject(ValidationReason::InvalidCharacters);
        if (hasTraversal(value)) return ValidationResult::reject(ValidationReason::PathTraversal);
        if (!std::regex_match(value, uriChars)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
        return ValidationResult::accept();
    }

    ValidationResult fileNameLike(const std::string& value) const {
        if (value.empty()) return ValidationResult::reject(ValidationReason::Empty);
        if (value.size() > limits.maxUriLength) return ValidationResult::reject(ValidationReason::Oversized);
        if (containsNul(value)) return ValidationResult::reject(ValidationReason::NullByte);
        if (hasTraversal(value)) return ValidationResult::reject(ValidationReason::PathTraversal);
        if (!std::regex_match(value, fileName)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
        return ValidationResult::accept();
    }

    ValidationResult url(const std::string& value) const {
        if (value.empty()) return ValidationResult::reject(ValidationReason::Empty);
        if (value.size() > limits.maxUrlLength) return ValidationResult::reject(ValidationReason::Oversized);
        if (containsNul(value)) return ValidationResult::reject(ValidationReason::NullByte);
        if (containsCrLf(value)) return ValidationResult::reject(ValidationReason::HeaderInjection);
        const std::string lowered = toLower(value);
        if (lowered.rfind("http://", 0) != 0 && lowered.rfind("https://", 0) != 0) {
            return ValidationResult::reject(ValidationReason::InvalidScheme);
        }
        if (value.find_first_of(" \t") != std::string::npos) {
            return ValidationResult::reject(ValidationReason::MalformedUrl);
        }
        std::string host;
        if (!InputValidator::extractHost(value, host)) {
            return ValidationResult::reject(ValidationReason::MalformedUrl);
        }
        if (!limits.allowPrivateNetworks && InputValidator::isBlockedHost(host)) {
            return ValidationResult::reject(ValidationReason::BlockedHost);
        }
        return ValidationResult::accept();
    }

    ValidationResult headerName(const std::string& value) const {
        if (value.empty()) return ValidationResult::reject(ValidationReason::Empty);
        if (value.size() > limits.maxHeaderNameLength) return ValidationResult::reject(ValidationReason::Oversized);
        if (containsNul(value)) return ValidationResult::reject(ValidationReason::NullByte);
        if (containsCrLf(value)) return ValidationResult::reject(ValidationReason::HeaderInjection);
        if (!std::regex_match(value, headerNameChars)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
        return ValidationResult::accept();
    }
};

InputValidator::InputValidator(const ValidatorLimits& limits)
    : pImpl(std::make_unique<Impl>(limits)) {
    if (!limits.validate()) {
        throw std::invalid_argument("InputValidator: invalid limits");
    }
}

InputValidator::~InputValidator() = default;

const ValidatorLimits& InputValidator::limits() const {
    return pImpl->limits;
}

ValidationResult InputValidator::validate(const std::string& payload, ValidationTarget target) const {
    const ValidatorLimits& limits = pImpl->limits;
    switch (target) {
        case ValidationTarget::ScriptContent:
            return pImpl->scriptContent(payload);

        case ValidationTarget::Uri:
            return pImpl->uri(payload);

        case ValidationTarget::ScriptName:
        case ValidationTarget::AssetName:
            return pImpl->fileNameLike(payload);

        case ValidationTarget::AssetContent:
            if (payload.size() > limits.maxAssetSize) return ValidationResult::reject(ValidationReason::Oversized);
            return ValidationResult::accept();

        case ValidationTarget::Url:
            return pImpl->url(payload);

        case ValidationTarget::HeaderName:
            return pImpl->headerName(payload);

        case ValidationTarget::HeaderValue:
            if (payload.size() > limits.maxHeaderValueLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsCrLf(payload)) return ValidationResult::reject(ValidationReason::HeaderInjection);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (pImpl->hasXss(payload)) return ValidationResult::reject(ValidationReason::CrossSiteScripting);
            return ValidationResult::accept();

        case ValidationTarget::TableName:
            if (payload.empty()) return ValidationResult::reject(ValidationReason::Empty);
            if (payload.size() > limits.maxTableNameLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (!std::regex_match(payload, pImpl->tableName)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
            return ValidationResult::accept();

        case ValidationTarget::TableSchema: {
            if (payload.empty()) return ValidationResult::reject(ValidationReason::Empty);
            if (payload.size() > limits.maxTableSchemaSize) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            const auto schema = nlohmann::json::parse(payload, nullptr, false);
            if (schema.is_discarded() || !schema.is_object()) {
                return ValidationResult::reject(ValidationReason::InvalidCharacters);
            }
            return ValidationResult::accept();
        }

        case ValidationTarget::GraphQLSchema:
            if (payload.empty()) return ValidationResult::reject(ValidationReason::Empty);
            if (payload.size() > limits.maxGraphQLSchemaSize) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (toLower(payload).find("__schema") != std::string::npos) {
                logging::getLogger("validation")->warn("GraphQL schema references introspection fields");
            }
            return ValidationResult::accept();

        case ValidationTarget::StreamName:
            if (payload.empty()) return ValidationResult::reject(ValidationReason::Empty);
            if (payload.size() > limits.maxStreamNameLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (pImpl->hasTraversal(payload)) return ValidationResult::reject(ValidationReason::PathTraversal);
            if (!std::regex_match(payload, pImpl->streamName)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
            return ValidationResult::accept();

        case ValidationTarget::ConfigValue: {
            if (payload.size() > limits.maxConfigValueLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            const std::string lowered = toLower(payload);
            for (const char* primitive : kConfigPrimitives) {
                if (lowered.find(primitive) != std::string::npos) {
                    return ValidationResult::reject(ValidationReason::CodeExecutionPrimitive);
                }
            }
            if (payload.find("../") != std::string::npos || payload.find("..\\") != std::string::npos) {
                return ValidationResult::reject(ValidationReason::PathTraversal);
            }
            if (pImpl->hasXss(payload)) return ValidationResult::reject(ValidationReason::CrossSiteScripting);
            return ValidationResult::accept();
        }

        case ValidationTarget::FormField:
            if (payload.size() > limits.maxFormFieldLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (pImpl->hasXss(payload)) return ValidationResult::reject(ValidationReason::CrossSiteScripting);
            return ValidationResult::accept();

        case ValidationTarget::RouteName:
            if (payload.empty()) return ValidationResult::reject(ValidationReason::Empty);
            if (payload.size() > limits.maxUriLength) return ValidationResult::reject(ValidationReason::Oversized);
            if (containsNul(payload)) return ValidationResult::reject(ValidationReason::NullByte);
            if (pImpl->hasTraversal(payload)) return ValidationResult::reject(ValidationReason::PathTraversal);
            if (pImpl->hasXss(payload)) return ValidationResult::reject(ValidationReason::CrossSiteScripting);
            if (!std::regex_match(payload, pImpl->routeChars)) return ValidationResult::reject(ValidationReason::InvalidCharacters);
            return ValidationResult::accept();
    }
    return ValidationResult::reject(ValidationReason::InvalidCharacters);
}

ValidationResult InputValidator::validateUri(const std::string& uri, std::string& normalized) const {
    ValidationResult result = pImpl->uri(uri);
    if (!result) {
        return result;
    }
    normalized.clear();
    normalized.reserve(uri.size());
    for (char c : uri) {
        if (c == '/' && !normalized.empty() && normalized.back() == '/') {
            continue;
        }
        normalized.push_back(c);
    }
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return result;
}

ValidationResult InputValidator::validateMimeType(const std::string& mimeType) const {
    if (mimeType.empty() || mimeType.size() > 255) {
        return ValidationResult::reject(ValidationReason::InvalidMimeType);
    }
    if (!std::regex_match(mimeType, pImpl->mimeType)) {
        return ValidationResult::reject(ValidationReason::InvalidMimeType);
    }
    return ValidationResult::accept();
}

bool InputValidator::extractHost(const std::string& url, std::string& host) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return false;
    }
    const size_t start = schemeEnd + 3;
    const size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return false;
    }

    std::string candidate;
    std::string port;
    if (authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            return false;
        }
        candidate = authority.substr(1, close - 1);
        const std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return false;
            port = rest.substr(1);
            if (port.empty()) return false;
        }
        in6_addr addr6{};
        if (inet_pton(AF_INET6, candidate.c_str(), &addr6) != 1) {
            return false;
        }
    } else {
        const size_t colon = authority.find(':');
        candidate = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port = authority.substr(colon + 1);
            if (port.empty()) return false;
        }
        for (unsigned char c : candidate) {
            if (!std::isalnum(c) && c != '-' && c != '.' && c != '_') {
                return false;
            }
        }
    }
    for (unsigned char c : port) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    if (candidate.empty()) {
        return false;
    }
    host = toLower(candidate);
    return true;
}

bool InputValidator::isBlockedHost(const std::string& rawHost) {
    std::string host = toLower(rawHost);
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty() || host == "localhost") {
        return true;
    }
    const std::string localSuffix = ".localhost";
    if (host.size() > localSuffix.size() &&
        host.compare(host.size() - localSuffix.size(), localSuffix.size(), localSuffix) == 0) {
        return true;
    }

    in_addr addr4{};
    if (inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
        return isPrivateIpv4(reinterpret_cast<const unsigned char*>(&addr4.s_addr));
    }

    in6_addr addr6{};
    if (inet_pton(AF_INET6, host.c_str(), &addr6) == 1) {
        const unsigned char* b = addr6.s6_addr;
        if (IN6_IS_ADDR_LOOPBACK(&addr6) || IN6_IS_ADDR_UNSPECIFIED(&addr6) || IN6_IS_ADDR_LINKLOCAL(&addr6)) {
            return true;
        }
        if ((b[0] & 0xfe) == 0xfc) {
            return true; // unique local fc00::/7
        }
        if (IN6_IS_ADDR_V4MAPPED(&addr6)) {
            return isPrivateIpv4(b + 12);
        }
        return false;
    }

    // Числовые формы, которые не разбирает inet_pton ("2130706433", "0x7f.1"), считаем опасными
    const bool numericLike = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == 'x';
    }) && std::isdigit(static_cast<unsigned char>(host.front()));
    return numericLike;
}

} // namespace validation
} // namespace core
} // namespace hostguard
