#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include "core/audit/SecurityAuditor.hpp"
#include "core/collab/Collaborators.hpp"
#include "core/secrets/SecretInjector.hpp"
#include "core/secrets/SecretsManager.hpp"

using namespace hostguard::core;
using namespace hostguard::core::secrets;

// Транспорт, запоминающий отправленные запросы
class RecordingTransport : public collab::HttpTransport {
public:
    collab::HttpResponse send(const collab::HttpRequest& request, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last = request;
        collab::HttpResponse response;
        response.status = 200;
        response.body = "{\"ok\":true}";
        return response;
    }

    size_t calls = 0;
    collab::HttpRequest last;

private:
    std::mutex mutex_;
};

collab::HttpRequest makeRequest(const std::string& url) {
    collab::HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.originScript = "/billing/charge.js";
    request.callSite = "fetch";
    return request;
}

void testMarkerParsing() {
    std::cout << "Testing marker parsing...\n";
    const auto ids = SecretInjector::findMarkers("a {{secret:API_KEY}} b {{secret:api_key}} {{secret:other.v2}}");
    assert(ids.size() == 2);
    assert(ids[0] == "api_key");
    assert(ids[1] == "other.v2");

    // Другие формы маркеров не распознаются
    assert(!SecretInjector::containsMarker("{{API_KEY}}"));
    assert(!SecretInjector::containsMarker("{{secret:}}"));
    assert(!SecretInjector::containsMarker("{{secret:bad id}}"));
    assert(SecretInjector::containsMarker("x{{secret:{{secret:ok}}"));
    std::cout << "[OK] Marker parsing test\n";
}

void testInjection() {
    std::cout << "Testing injection into headers and body...\n";
    auto secrets = std::make_shared<SecretsManager>();
    secrets->set("api_key", "sk-live-0123456789");
    SecretInjector injector(secrets);

    collab::HttpRequest request = makeRequest("https://api.example.com/v1");
    request.headers.emplace_back("Authorization", "Bearer {{secret:API_KEY}}");
    request.headers.emplace_back("X-Plain", "{{SECRET_NAME}}");
    request.body = "{\"key\":\"{{secret:api_key}}\"}";

    const InjectionResult result = injector.inject(request);
    assert(result.ok());
    assert(result.resolved.size() == 1);
    assert(request.headers[0].second == "Bearer sk-live-0123456789");
    assert(request.headers[1].second == "{{SECRET_NAME}}");
    assert(request.body == "{\"key\":\"sk-live-0123456789\"}");

    // Повторная подстановка ничего не меняет
    const collab::HttpRequest once = request;
    assert(injector.inject(request).ok());
    assert(request.headers == once.headers);
    assert(request.body == once.body);

    std::cout << "[OK] Injection test\n";
}

void testValueIsNotReexpanded() {
    std::cout << "Testing single-pass substitution...\n";
    auto secrets = std::make_shared<SecretsManager>();
    secrets->set("outer", "{{secret:inner}}");
    secrets->set("inner", "must-not-appear");
    SecretInjector injector(secrets);

    collab::HttpRequest request = makeRequest("https://api.example.com/");
    request.body = "{{secret:outer}}";
    assert(injector.inject(request).ok());
    assert(request.body == "{{secret:inner}}");
    std::cout << "[OK] Single-pass test\n";
}

void testAllOrNothing() {
    std::cout << "Testing all-or-nothing injection...\n";
    auto secrets = std::make_shared<SecretsManager>();
    secrets->set("present", "present-value-123");
    secrets->setConstrained("bound", "bound-value-123", "https://api.partner.com/*", "");
    SecretInjector injector(secrets);

    collab::HttpRequest request = makeRequest("https://api.example.com/");
    request.headers.emplace_back("A", "{{secret:present}}");
    request.body = "{{secret:missing}}";
    const InjectionResult missing = injector.inject(request);
    assert(missing.status == InjectionStatus::NotFound);
    assert(missing.identifier == "missing");
    assert(request.headers[0].second == "{{secret:present}}");

    collab::HttpRequest wrongHost = makeRequest("https://api.example.com/");
    wrongHost.body = "{{secret:bound}}";
    assert(injector.inject(wrongHost).status == InjectionStatus::AccessDenied);
    assert(wrongHost.body == "{{secret:bound}}");

    std::cout << "[OK] All-or-nothing test\n";
}

void testInjectingTransport() {
    std::cout << "Testing SecretInjectingTransport...\n";
    auto secrets = std::make_shared<SecretsManager>();
    secrets->set("token", "tok-0123456789abcdef");
    auto auditor = std::make_shared<audit::SecurityAuditor>();
    auto inner = std::make_shared<RecordingTransport>();
    SecretInjectingTransport transport(inner, secrets, auditor);

    // Нет API_KEY: запрос прерывается до обращения к сети
    collab::HttpRequest missing = makeRequest("https://api.example.com/");
    missing.headers.emplace_back("Authorization", "Bearer {{secret:API_KEY}}");
    bool notFound = false;
    try {
        transport.send(missing, std::chrono::milliseconds(1000));
    } catch (const SecretNotFoundError& e) {
        notFound = true;
        assert(e.identifier() == "api_key");
        // Значение секрета в сообщение не попадает
        assert(std::string(e.what()).find("tok-") == std::string::npos);
    }
    assert(notFound);
    assert(inner->calls == 0);
    assert(auditor->size() == 0);

    collab::HttpRequest good = makeRequest("https://api.example.com/v1/items");
    good.headers.emplace_back("Authorization", "Bearer {{secret:token}}");
    const collab::HttpResponse response = transport.send(good, std::chrono::milliseconds(1000));
    assert(response.ok());
    assert(inner->calls == 1);
    assert(inner->last.headers[0].second == "Bearer tok-0123456789abcdef");

    const auto records = auditor->records(10);
    assert(records.size() == 1);
    const audit::SecurityEvent& event = *records[0].event;
    assert(event.kind == audit::EventKind::SecretAccessed);
    assert(event.resource == "secret:token");
    assert(event.detail("host") == "api.example.com");
    assert(event.detail("scriptUri") == "/billing/charge.js");
    assert(event.toJson().dump().find("tok-0123456789abcdef") == std::string::npos);

    std::cout << "[OK] Injecting transport test\n";
}

int main() {
    try {
        testMarkerParsing();
        testInjection();
        testValueIsNotReexpanded();
        testAllOrNothing();
        testInjectingTransport();
        std::cout << "All SecretInjector tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "SecretInjector test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
