#include "core/secrets/SecretInjector.hpp"
#include "core/audit/SecurityAuditor.hpp"
#include "core/logging/Logger.hpp"
#include "core/validation/InputValidator.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace hostguard {
namespace core {
namespace secrets {

namespace {

const std::string kMarkerOpen = "{{secret:";
const std::string kMarkerClose = "}}";

bool isIdentifierChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
}

// Разбор маркера, начинающегося в pos. false, если это не маркер.
bool parseMarker(const std::string& text, size_t pos, std::string& identifier, size_t& end) {
    const size_t idStart = pos + kMarkerOpen.size();
    const size_t close = text.find(kMarkerClose, idStart);
    if (close == std::string::npos || close == idStart) {
        return false;
    }
    for (size_t i = idStart; i < close; ++i) {
        if (!isIdentifierChar(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    identifier = SecretsManager::normalizeIdentifier(text.substr(idStart, close - idStart));
    end = close + kMarkerClose.size();
    return true;
}

template<typename F>
void forEachMarker(const std::string& text, F&& fn) {
    size_t pos = text.find(kMarkerOpen);
    while (pos != std::string::npos) {
        std::string identifier;
        size_t end = 0;
        if (parseMarker(text, pos, identifier, end)) {
            fn(pos, end, identifier);
            pos = text.find(kMarkerOpen, end);
        } else {
            pos = text.find(kMarkerOpen, pos + 1);
        }
    }
}

std::string substitute(const std::string& text, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(text.size());
    size_t copied = 0;
    forEachMarker(text, [&](size_t begin, size_t end, const std::string& identifier) {
        out.append(text, copied, begin - copied);
        out += values.at(identifier);
        copied = end;
    });
    out.append(text, copied, std::string::npos);
    return out;
}

} // namespace

SecretInjector::SecretInjector(std::shared_ptr<SecretsManager> secrets)
    : secrets_(std::move(secrets)) {
    if (!secrets_) {
        throw std::invalid_argument("SecretInjector: secrets manager is required");
    }
}

std::vector<std::string> SecretInjector::findMarkers(const std::string& text) {
    std::vector<std::string> identifiers;
    forEachMarker(text, [&identifiers](size_t, size_t, const std::string& identifier) {
        if (std::find(identifiers.begin(), identifiers.end(), identifier) == identifiers.end()) {
            identifiers.push_back(identifier);
        }
    });
    return identifiers;
}

bool SecretInjector::containsMarker(const std::string& text) {
    return !findMarkers(text).empty();
}

InjectionResult SecretInjector::inject(collab::HttpRequest& request) const {
    InjectionResult result;
    std::vector<std::string> identifiers;
    auto collect = [&identifiers](const std::string& text) {
        for (const auto& id : findMarkers(text)) {
            if (std::find(identifiers.begin(), identifiers.end(), id) == identifiers.end()) {
                identifiers.push_back(id);
            }
        }
    };
    for (const auto& header : request.headers) {
        collect(header.second);
    }
    collect(request.body);
    if (identifiers.empty()) {
        return result;
    }

    // Сначала разрешаем всё, потом меняем запрос
    std::map<std::string, std::string> values;
    for (const auto& id : identifiers) {
        SecretLookup lookup = secrets_->getWithConstraints(id, request.url, request.originScript);
        if (!lookup.found()) {
            result.status = lookup.status == SecretLookupStatus::NotFound
                ? InjectionStatus::NotFound : InjectionStatus::AccessDenied;
            result.identifier = id;
            return result;
        }
        values.emplace(id, std::move(lookup.value));
    }
    for (auto& header : request.headers) {
        header.second = substitute(header.second, values);
    }
    request.body = substitute(request.body, values);
    result.resolved = identifiers;
    return result;
}

SecretInjectingTransport::SecretInjectingTransport(std::shared_ptr<collab::HttpTransport> inner,
                                                   std::shared_ptr<SecretsManager> secrets,
                                                   std::shared_ptr<audit::SecurityAuditor> auditor)
    : inner_(std::move(inner)), injector_(std::move(secrets)), auditor_(std::move(auditor)) {
    if (!inner_) {
        throw std::invalid_argument("SecretInjectingTransport: inner transport is required");
    }
}

collab::HttpResponse SecretInjectingTransport::send(const collab::HttpRequest& request,
                                                    std::chrono::milliseconds timeout) {
    collab::HttpRequest prepared = request;
    const InjectionResult result = injector_.inject(prepared);
    if (result.status == InjectionStatus::NotFound) {
        logging::getLogger("secrets")->warn("Outbound request aborted: secret '{}' not found (script {})",
                                            result.identifier, request.originScript);
        throw SecretNotFoundError(result.identifier);
    }
    if (result.status == InjectionStatus::AccessDenied) {
        logging::getLogger("secrets")->warn("Outbound request aborted: secret '{}' not allowed for this URL or script (script {})",
                                            result.identifier, request.originScript);
        throw SecretAccessDeniedError(result.identifier);
    }
    if (auditor_) {
        std::string host;
        if (!validation::InputValidator::extractHost(request.url, host)) {
            host = "unknown";
        }
        for (const auto& id : result.resolved) {
            auditor_->log(audit::EventBuilder(audit::EventKind::SecretAccessed)
                              .resource("secret:" + id)
                              .action("fetch")
                              .detail("identifier", id)
                              .detail("scriptUri", request.originScript)
                              .detail("callSite", request.callSite)
                              .detail("host", host)
                              .message("Secret injected into outbound request")
                              .build());
        }
    }
    return inner_->send(prepared, timeout);
}

} // namespace secrets
} // namespace core
} // namespace hostguard
