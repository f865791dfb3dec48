#include "core/secrets/SecretsManager.hpp"
#include "core/logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

extern char** environ;

namespace hostguard {
namespace core {
namespace secrets {

namespace {

// Пустой шаблон: без ограничения
struct SecretRecord {
    std::string value;
    std::string allowedUrlPattern;
    std::string allowedScriptPattern;
};

using SecretTable = std::map<std::string, SecretRecord>;

const std::string kEnvPrefix = "SECRET_";
const std::string kAllowMarker = "__ALLOW_";
const std::string kScriptMarker = "__SCRIPT_";

} // namespace

std::string secretLookupStatusToString(SecretLookupStatus status) {
    switch (status) {
        case SecretLookupStatus::Found: return "Found";
        case SecretLookupStatus::NotFound: return "NotFound";
        case SecretLookupStatus::UrlNotAllowed: return "UrlNotAllowed";
        case SecretLookupStatus::ScriptNotAllowed: return "ScriptNotAllowed";
    }
    return "NotFound";
}

struct SecretsManager::Impl {
    recovery::RecoverableState<SecretTable> table{"secrets.table"};
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("secrets");

    void store(const std::string& identifier, SecretRecord record) {
        const std::string id = SecretsManager::normalizeIdentifier(identifier);
        if (id.empty()) {
            throw std::invalid_argument("SecretsManager: empty secret identifier");
        }
        table.with([&](SecretTable& t) { t[id] = std::move(record); });
    }
};

SecretsManager::SecretsManager() : pImpl(std::make_unique<Impl>()) {}

SecretsManager::~SecretsManager() = default;

void SecretsManager::setRecoveryCallback(recovery::RecoveryCallback callback) {
    pImpl->table.setRecoveryCallback(std::move(callback));
}

std::string SecretsManager::normalizeIdentifier(const std::string& identifier) {
    std::string id = identifier;
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return id;
}

std::string SecretsManager::normalizeUrl(const std::string& url) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return normalizeIdentifier(url);
    }
    const size_t authorityEnd = url.find_first_of("/?#", schemeEnd + 3);
    const std::string head = url.substr(0, authorityEnd);
    std::string normalized = normalizeIdentifier(head);
    if (authorityEnd != std::string::npos) {
        normalized += url.substr(authorityEnd);
    }
    return normalized;
}

bool SecretsManager::globMatch(const std::string& pattern, const std::string& text) {
    if (pattern.empty()) {
        return true;
    }
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

bool SecretsManager::exists(const std::string& identifier) const {
    const std::string id = normalizeIdentifier(identifier);
    return pImpl->table.with([&id](SecretTable& t) { return t.count(id) > 0; });
}

std::vector<std::string> SecretsManager::listIdentifiers() const {
    return pImpl->table.with([](SecretTable& t) {
        std::vector<std::string> ids;
        ids.reserve(t.size());
        for (const auto& entry : t) {
            ids.push_back(entry.first);
        }
        return ids;
    });
}

std::optional<std::string> SecretsManager::get(const std::string& identifier) const {
    const std::string id = normalizeIdentifier(identifier);
    return pImpl->table.with([&id](SecretTable& t) -> std::optional<std::string> {
        auto it = t.find(id);
        if (it == t.end()) {
            return std::nullopt;
        }
        return it->second.value;
    });
}

SecretLookup SecretsManager::getWithConstraints(const std::string& identifier, const std::string& url,
                                                const std::string& scriptUri) const {
    const std::string id = normalizeIdentifier(identifier);
    const std::string normalizedUrl = normalizeUrl(url);
    SecretLookup lookup = pImpl->table.with([&](SecretTable& t) {
        SecretLookup result;
        auto it = t.find(id);
        if (it == t.end()) {
            result.status = SecretLookupStatus::NotFound;
            return result;
        }
        const SecretRecord& record = it->second;
        if (!record.allowedUrlPattern.empty() && !globMatch(record.allowedUrlPattern, normalizedUrl)) {
            result.status = SecretLookupStatus::UrlNotAllowed;
            return result;
        }
        // Скрипт сравнивается с учётом регистра; неизвестный скрипт не проходит ограничение
        if (!record.allowedScriptPattern.empty() &&
            (scriptUri.empty() || !globMatch(record.allowedScriptPattern, scriptUri))) {
            result.status = SecretLookupStatus::ScriptNotAllowed;
            return result;
        }
        result.status = SecretLookupStatus::Found;
        result.value = record.value;
        return result;
    });
    if (!lookup.found()) {
        pImpl->logger->debug("Secret '{}' lookup: {}", id, secretLookupStatusToString(lookup.status));
    }
    return lookup;
}

void SecretsManager::set(const std::string& identifier, const std::string& value) {
    pImpl->store(identifier, SecretRecord{value, "", ""});
}

void SecretsManager::setConstrained(const std::string& identifier, const std::string& value,
                                    const std::string& allowedUrlPattern, const std::string& allowedScriptPattern) {
    pImpl->store(identifier, SecretRecord{value, allowedUrlPattern, allowedScriptPattern});
}

bool SecretsManager::remove(const std::string& identifier) {
    const std::string id = normalizeIdentifier(identifier);
    return pImpl->table.with([&id](SecretTable& t) { return t.erase(id) > 0; });
}

void SecretsManager::clear() {
    pImpl->table.with([](SecretTable& t) { t.clear(); });
}

size_t SecretsManager::count() const {
    return pImpl->table.with([](SecretTable& t) { return t.size(); });
}

std::string SecretsManager::redact(const std::string& text) const {
    if (text.empty()) {
        return text;
    }
    return pImpl->table.with([&text](SecretTable& t) {
        std::string result = text;
        for (const auto& entry : t) {
            const std::string& value = entry.second.value;
            if (value.size() < 8) {
                continue;
            }
            size_t pos = 0;
            while ((pos = result.find(value, pos)) != std::string::npos) {
                result.replace(pos, value.size(), "[REDACTED]");
                pos += 10;
            }
        }
        return result;
    });
}

bool SecretsManager::looksLikeSecret(const std::string& value) {
    static const char* kMarkers[] = {
        "sk-", "sg.", "key_", "api_key", "apikey", "secret", "token", "password", "bearer ",
    };
    const std::string lowered = normalizeIdentifier(value);
    if (value.size() >= 20) {
        for (const char* marker : kMarkers) {
            if (lowered.find(marker) != std::string::npos) {
                return true;
            }
        }
    }
    if (value.size() >= 32) {
        const auto alnum = std::count_if(value.begin(), value.end(),
                                         [](unsigned char c) { return std::isalnum(c) != 0; });
        if (static_cast<double>(alnum) / static_cast<double>(value.size()) > 0.8) {
            return true;
        }
    }
    return false;
}

size_t SecretsManager::loadFromEnvironment() {
    std::map<std::string, std::string> variables;
    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        if (entry.compare(0, kEnvPrefix.size(), kEnvPrefix) != 0) {
            continue;
        }
        // Имя переменной не содержит '=', значение может
        const size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        variables[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    const size_t loaded = loadFromVariables(variables);
    if (loaded == 0) {
        pImpl->logger->debug("No secrets found in environment (looking for SECRET_* prefix)");
    }
    return loaded;
}

size_t SecretsManager::loadFromVariables(const std::map<std::string, std::string>& variables) {
    size_t loaded = 0;
    for (const auto& entry : variables) {
        const std::string& name = entry.first;
        if (name.compare(0, kEnvPrefix.size(), kEnvPrefix) != 0 || entry.second.empty()) {
            continue;
        }
        const std::string rest = name.substr(kEnvPrefix.size());
        const size_t allowPos = rest.find(kAllowMarker);
        if (allowPos == std::string::npos) {
            if (rest.empty()) {
                continue;
            }
            set(rest, entry.second);
            pImpl->logger->info("Loaded secret '{}' from environment", normalizeIdentifier(rest));
            ++loaded;
            continue;
        }
        const std::string id = rest.substr(0, allowPos);
        const std::string afterAllow = rest.substr(allowPos + kAllowMarker.size());
        const size_t scriptPos = afterAllow.find(kScriptMarker);
        if (id.empty() || scriptPos == std::string::npos) {
            pImpl->logger->warn("Skipping malformed secret variable '{}': expected SECRET_<ID>__ALLOW_<url>__SCRIPT_<script>",
                                normalizeIdentifier(id.empty() ? rest : id));
            continue;
        }
        const std::string urlPattern = afterAllow.substr(0, scriptPos);
        const std::string scriptPattern = afterAllow.substr(scriptPos + kScriptMarker.size());
        setConstrained(id, entry.second, urlPattern, scriptPattern);
        pImpl->logger->info("Loaded constrained secret '{}' (url '{}', script '{}')",
                            normalizeIdentifier(id), urlPattern, scriptPattern);
        ++loaded;
    }
    return loaded;
}

size_t SecretsManager::loadFromMap(const std::map<std::string, std::string>& secrets) {
    size_t loaded = 0;
    for (const auto& entry : secrets) {
        if (entry.first.empty() || entry.second.empty()) {
            continue;
        }
        set(entry.first, entry.second);
        ++loaded;
    }
    if (loaded > 0) {
        pImpl->logger->info("Loaded {} secrets from configuration", loaded);
    }
    return loaded;
}

size_t SecretsManager::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("SecretsManager: cannot open secrets file: " + path);
    }
    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("SecretsManager: invalid secrets file " + path + ": " + e.what());
    }
    if (!document.is_array()) {
        throw std::runtime_error("SecretsManager: secrets file must contain a JSON array: " + path);
    }
    size_t loaded = 0;
    size_t index = 0;
    for (const auto& item : document) {
        ++index;
        if (!item.is_object() || !item.contains("identifier") || !item.contains("value") ||
            !item["identifier"].is_string() || !item["value"].is_string()) {
            pImpl->logger->warn("Skipping malformed entry in secrets file {}", path);
            continue;
        }
        const std::string id = item["identifier"].get<std::string>();
        const std::string value = item["value"].get<std::string>();
        if (id.empty() || value.empty()) {
            pImpl->logger->warn("Skipping secret with empty identifier or value in {}", path);
            continue;
        }
        // Неверный шаблон не превращается в секрет без ограничений
        std::string urlPattern;
        std::string scriptPattern;
        try {
            urlPattern = item.value("allowedUrlPattern", std::string());
            scriptPattern = item.value("allowedScriptPattern", std::string());
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("SecretsManager: entry " + std::to_string(index) + " ('" + id + "') in " + path +
                                     " has a non-string constraint: " + e.what());
        }
        setConstrained(id, value, urlPattern, scriptPattern);
        ++loaded;
    }
    pImpl->logger->info("Loaded {} secrets from {}", loaded, path);
    return loaded;
}

} // namespace secrets
} // namespace core
} // namespace hostguard
