#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/audit/SecurityAuditor.hpp"
#include "core/collab/InMemoryCollaborators.hpp"
#include "core/operations/SecureOperations.hpp"
#include "core/ratelimit/RateLimiter.hpp"
#include "core/secrets/SecretInjector.hpp"
#include "core/secrets/SecretsManager.hpp"
#include "core/validation/InputValidator.hpp"

using namespace hostguard::core;
using identity::UserContext;
using operations::ErrorKind;
using operations::OperationResult;

// Транспорт с настраиваемой задержкой; отвечает эхом заголовка Authorization
class EchoTransport : public collab::HttpTransport {
public:
    collab::HttpResponse send(const collab::HttpRequest& request, std::chrono::milliseconds) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_ = request;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        collab::HttpResponse response;
        response.status = 200;
        for (const auto& header : request.headers) {
            if (header.first == "Authorization") {
                response.headers.emplace_back("X-Echo", header.second);
                response.body = "you sent " + header.second;
            }
        }
        return response;
    }

    collab::HttpRequest last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    std::atomic<size_t> calls{0};
    std::chrono::milliseconds delay{0};

private:
    mutable std::mutex mutex_;
    collab::HttpRequest last_;
};

struct Harness {
    std::shared_ptr<validation::InputValidator> validator = std::make_shared<validation::InputValidator>();
    std::shared_ptr<ratelimit::RateLimiter> rateLimiter;
    std::shared_ptr<secrets::SecretsManager> secrets = std::make_shared<secrets::SecretsManager>();
    std::shared_ptr<audit::SecurityAuditor> auditor = std::make_shared<audit::SecurityAuditor>();
    std::shared_ptr<collab::InMemoryRepository> scripts = std::make_shared<collab::InMemoryRepository>();
    std::shared_ptr<collab::InMemoryRepository> assets = std::make_shared<collab::InMemoryRepository>();
    std::shared_ptr<collab::InMemoryRepository> tables = std::make_shared<collab::InMemoryRepository>();
    std::shared_ptr<EchoTransport> transport = std::make_shared<EchoTransport>();
    std::shared_ptr<collab::InMemoryRegistry> registry = std::make_shared<collab::InMemoryRegistry>();
    std::shared_ptr<collab::InMemoryStreamBroadcaster> streams = std::make_shared<collab::InMemoryStreamBroadcaster>();
    std::shared_ptr<collab::InMemoryUserRepository> users = std::make_shared<collab::InMemoryUserRepository>();
    std::unique_ptr<operations::SecureOperations> ops;

    explicit Harness(const ratelimit::RateLimitConfig& limits = ratelimit::RateLimitConfig::defaults())
        : rateLimiter(std::make_shared<ratelimit::RateLimiter>(limits)) {
        operations::SecurityServices services{validator, rateLimiter, secrets, auditor};
        operations::OperationCollaborators collaborators;
        collaborators.scripts = scripts;
        collaborators.assets = assets;
        collaborators.tables = tables;
        collaborators.transport = std::make_shared<secrets::SecretInjectingTransport>(transport, secrets, auditor);
        collaborators.registry = registry;
        collaborators.streams = streams;
        collaborators.users = users;
        ops = std::make_unique<operations::SecureOperations>(operations::OperationsConfig{}, services, collaborators);
    }

    // Итоговые события вызовов (без информационных)
    std::vector<audit::AuditRecord> outcomes(const std::string& action = "") const {
        std::vector<audit::AuditRecord> result;
        for (const auto& record : auditor->records(10000)) {
            if (record.event->outcome == audit::Outcome::None) continue;
            if (!action.empty() && record.event->action != action) continue;
            result.push_back(record);
        }
        return result;
    }
};

void testCapabilityDenied() {
    std::cout << "Testing capability denial...\n";
    Harness h;
    auto anonymous = UserContext::anonymous("198.51.100.7");
    auto handle = h.ops->upsertScript(anonymous, "/app/main.js", "let x = 1;");
    assert(handle.isSettled());
    const OperationResult result = handle.wait();
    assert(result.toJsonString() == R"({"error":"CapabilityDenied","success":false})");
    assert(h.scripts->size() == 0);

    const auto events = h.outcomes();
    assert(events.size() == 1);
    assert(events[0].event->kind == audit::EventKind::CapabilityDenied);
    assert(events[0].event->outcome == audit::Outcome::Failure);
    assert(events[0].event->detail("capability") == "WriteScripts");
    assert(events[0].event->resource == "script:/app/main.js");
    assert(h.ops->getMetrics().failuresByError.at("CapabilityDenied") == 1);
    std::cout << "[OK] Capability denial test\n";
}

void testScriptLifecycle() {
    std::cout << "Testing script lifecycle...\n";
    Harness h;
    auto editor = UserContext::editor("alice");

    OperationResult result = h.ops->upsertScript(editor, "/app//main.js/", "export const answer = 42;").wait();
    assert(result.success);
    assert(result.data["uri"] == "/app/main.js");

    result = h.ops->getScript(editor, "/app/main.js").wait();
    assert(result.success);
    assert(result.data["content"] == "export const answer = 42;");
    assert(result.data["owners"].size() == 1 && result.data["owners"][0] == "alice");

    result = h.ops->listScripts(editor).wait();
    assert(result.success && result.data.size() == 1);

    result = h.ops->deleteScript(editor, "/app/main.js").wait();
    assert(result.success && result.data["deleted"] == true);

    result = h.ops->getScript(editor, "/app/main.js").wait();
    assert(result.success && result.data.is_null());

    const auto events = h.outcomes();
    assert(events.size() == 5);
    for (const auto& record : events) {
        assert(record.event->kind == audit::EventKind::OperationSucceeded);
        assert(record.event->principalId == std::string("alice"));
    }
    std::cout << "[OK] Script lifecycle test\n";
}

void testValidationRejected() {
    std::cout << "Testing input rejection...\n";
    Harness h;
    auto editor = UserContext::editor("alice");

    OperationResult result = h.ops->upsertScript(editor, "/app/../secret.js", "let x = 1;").wait();
    assert(!result.success && result.error == ErrorKind::ValidationRejected);
    assert(result.reason == "PathTraversal");

    result = h.ops->upsertScript(editor, "/app/run.js", "eval(payload)").wait();
    assert(result.reason == "CodeExecutionPrimitive");
    assert(h.scripts->size() == 0);

    result = h.ops->upsertAsset(editor, "/img/logo.png", "image/png", "abc").wait();
    assert(result.error == ErrorKind::ValidationRejected && result.reason == "InvalidCharacters");

    result = h.ops->upsertTable(editor, "users", "[1, 2]").wait();
    assert(result.error == ErrorKind::ValidationRejected);

    const auto events = h.outcomes();
    assert(events.size() == 4);
    assert(events[1].event->detail("target") == "ScriptContent");
    assert(events[1].event->detail("reason") == "CodeExecutionPrimitive");
    std::cout << "[OK] Input rejection test\n";
}

void testAssetsAndTables() {
    std::cout << "Testing assets and tables...\n";
    Harness h;
    auto editor = UserContext::editor("alice");

    OperationResult result = h.ops->upsertAsset(editor, "/img/logo.png", "image/png", "aGVsbG8=").wait();
    assert(result.success && result.data["size"] == 5);
    result = h.ops->fetchAsset(editor, "/img/logo.png").wait();
    assert(result.data["content"] == "aGVsbG8=");
    assert(result.data["mimetype"] == "image/png");
    result = h.ops->listAssets(editor).wait();
    assert(result.data.size() == 1);

    result = h.ops->upsertTable(editor, "orders", R"({"id": "integer", "total": "decimal"})").wait();
    assert(result.success);
    result = h.ops->getTable(editor, "orders").wait();
    assert(result.data["schema"]["total"] == "decimal");
    result = h.ops->deleteTable(editor, "orders").wait();
    assert(result.data["deleted"] == true);

    // Authenticated может читать таблицы, но не менять их
    result = h.ops->upsertTable(UserContext::authenticated("bob"), "orders", R"({"id": "integer"})").wait();
    assert(result.error == ErrorKind::CapabilityDenied);
    std::cout << "[OK] Assets and tables test\n";
}

void testRateLimited() {
    std::cout << "Testing rate limiting...\n";
    ratelimit::RateLimitConfig limits = ratelimit::RateLimitConfig::defaults();
    limits.classes["script.read"] = {2.0, 0.5, true};
    Harness h(limits);
    auto user = UserContext::authenticated("carol");

    assert(h.ops->listScripts(user).wait().success);
    assert(h.ops->listScripts(user).wait().success);
    const OperationResult third = h.ops->listScripts(user).wait();
    assert(third.error == ErrorKind::RateLimited);

    // Другой класс действий не затронут
    assert(h.ops->listAssets(user).wait().success);

    const auto events = h.outcomes("listScripts");
    assert(events.size() == 3);
    assert(events[2].event->kind == audit::EventKind::RateLimitExceeded);
    assert(std::stoll(events[2].event->detail("retryAfterMs")) > 0);
    std::cout << "[OK] Rate limiting test\n";
}

void testTimeoutSettlesOnce() {
    std::cout << "Testing timeout settles exactly once...\n";
    Harness h;
    h.transport->delay = std::chrono::milliseconds(300);
    auto user = UserContext::authenticated("dave");

    operations::FetchRequest request;
    request.url = "https://api.example.com/slow";
    request.timeout = std::chrono::milliseconds(50);
    const OperationResult result = h.ops->fetch(user, request).wait();
    assert(result.error == ErrorKind::Timeout);

    // Дождаться делегата: его поздний результат отбрасывается, но фиксируется в аудите
    h.ops->shutdown();
    assert(h.transport->calls <= 1);
    const auto events = h.outcomes("fetch");
    assert(events.size() == 1);
    assert(events[0].event->kind == audit::EventKind::Timeout);

    size_t late = 0;
    for (const auto& record : h.auditor->records(10000)) {
        if (record.event->action == "fetch" && record.event->detail("lateCompletion") == "true") {
            assert(record.event->outcome == audit::Outcome::None);
            assert(record.event->detail("result") == "success");
            ++late;
        }
    }
    assert(late == h.transport->calls);
    std::cout << "[OK] Timeout test\n";
}

void testFetchSecrets() {
    std::cout << "Testing fetch with secret markers...\n";
    Harness h;
    auto user = UserContext::authenticated("erin");

    operations::FetchRequest request;
    request.url = "https://api.example.com/v1/charge";
    request.method = "post";
    request.headers = {{"Authorization", "Bearer {{secret:API_KEY}}"}};
    request.body = "amount=10";

    OperationResult result = h.ops->fetch(user, request).wait();
    assert(result.toJsonString() == R"({"error":"SecretNotFound","success":false})");
    assert(h.transport->calls == 0);

    h.secrets->set("api_key", "sk_live_0123456789abcdef");
    result = h.ops->fetch(user, request).wait();
    assert(result.success);
    assert(h.transport->calls == 1);
    assert(h.transport->last().method == "POST");
    assert(h.transport->last().headers[0].second == "Bearer sk_live_0123456789abcdef");
    // Отражённое значение не возвращается гостю
    assert(result.data["status"] == 200);
    assert(result.data["body"] == "you sent Bearer [REDACTED]");
    assert(result.data["headers"]["X-Echo"] == "Bearer [REDACTED]");
    assert(result.toJsonString().find("sk_live") == std::string::npos);

    for (const auto& record : h.auditor->records(10000)) {
        assert(record.toJson().dump().find("sk_live") == std::string::npos);
    }
    audit::AuditQuery accessed;
    accessed.kind = audit::EventKind::SecretAccessed;
    assert(h.auditor->query(accessed).size() == 1);
    std::cout << "[OK] Fetch secrets test\n";
}

void testFetchRejected() {
    std::cout << "Testing rejected fetch requests...\n";
    Harness h;
    auto user = UserContext::authenticated("erin");

    operations::FetchRequest request;
    request.url = "http://127.0.0.1:8080/admin";
    OperationResult result = h.ops->fetch(user, request).wait();
    assert(result.reason == "BlockedHost");

    request.url = "https://api.example.com/";
    request.method = "TRACE";
    result = h.ops->fetch(user, request).wait();
    assert(result.error == ErrorKind::ValidationRejected);

    request.method = "GET";
    request.headers = {{"X-Test", "a\r\nInjected: yes"}};
    result = h.ops->fetch(user, request).wait();
    assert(result.reason == "HeaderInjection");

    result = h.ops->fetch(UserContext::anonymous("192.0.2.1"), operations::FetchRequest{}).wait();
    assert(result.error == ErrorKind::ValidationRejected);
    assert(h.transport->calls == 0);
    std::cout << "[OK] Rejected fetch test\n";
}

void testConcurrentMutationsAuditedOnce() {
    std::cout << "Testing concurrent mutations...\n";
    Harness h;
    auto editor = UserContext::editor("frank");
    const int numThreads = 20;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&h, &editor, &succeeded, i]() {
            if (h.ops->upsertScript(editor, "/shared.js", "let version = " + std::to_string(i) + ";").wait().success) {
                ++succeeded;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(succeeded == numThreads);
    assert(h.scripts->size() == 1);
    assert(h.outcomes("upsertScript").size() == static_cast<size_t>(numThreads));
    assert(h.auditor->verifyChain());
    std::cout << "[OK] Concurrent mutations test\n";
}

void testRegistrations() {
    std::cout << "Testing registrations...\n";
    Harness h;
    auto editor = UserContext::editor("grace");

    OperationResult result = h.ops->registerRoute(editor, "/api/items/{id}", "handleItem", "post").wait();
    assert(result.success && result.data["method"] == "POST");
    assert(h.registry->contains(collab::RegistrationKind::Route, "/api/items/{id}"));

    result = h.ops->registerGraphQL(editor, operations::GraphQLKind::Query, "items",
                                    "type Query { items: [String] }", "resolveItems").wait();
    assert(result.success && result.data["kind"] == "graphql.query");

    result = h.ops->registerTool(editor, "lookup", "Finds an item", R"({"type": "object"})", "lookupTool").wait();
    assert(result.success);
    assert(h.registry->contains(collab::RegistrationKind::Tool, "lookup"));

    result = h.ops->registerRoute(editor, "/api/x", "handle<script>", "GET").wait();
    assert(result.error == ErrorKind::ValidationRejected);

    // Authenticated управляет потоками, но не маршрутами
    auto user = UserContext::authenticated("heidi");
    assert(h.ops->registerRoute(user, "/api/y", "handleY", "GET").wait().error == ErrorKind::CapabilityDenied);
    assert(h.ops->registerStream(user, "/events/orders").wait().success);

    std::vector<std::string> received;
    std::mutex receivedMutex;
    h.streams->subscribe("/events/orders", [&received, &receivedMutex](const std::string& message) {
        std::lock_guard<std::mutex> lock(receivedMutex);
        received.push_back(message);
    });
    result = h.ops->broadcast(user, "/events/orders", "order 17 shipped").wait();
    assert(result.success && result.data["delivered"] == 1);
    assert(received.size() == 1 && received[0] == "order 17 shipped");
    std::cout << "[OK] Registrations test\n";
}

void testAuditLogAccess() {
    std::cout << "Testing audit log access...\n";
    Harness h;
    h.ops->upsertScript(UserContext::anonymous("198.51.100.7"), "/a.js", "let a = 1;").wait();
    h.ops->upsertScript(UserContext::anonymous("198.51.100.8"), "/b.js", "let b = 1;").wait();
    h.ops->listScripts(UserContext::editor("ivan")).wait();

    OperationResult result = h.ops->readAuditLog(UserContext::anonymous("198.51.100.7"), 0).wait();
    assert(result.success && result.data.size() == 1);
    assert(result.data[0]["clientIp"] == "198.51.100.7");

    result = h.ops->readAuditLog(UserContext::editor("ivan"), 10).wait();
    assert(result.data.size() == 1 && result.data[0]["principal"] == "ivan");

    auto admin = UserContext::admin("root");
    result = h.ops->readAuditLog(admin, 1000000).wait();
    assert(result.data.size() >= 5);
    assert(result.data[0].contains("chainDigest"));

    assert(h.ops->pruneAuditLog(UserContext::editor("ivan"), 1).wait().error == ErrorKind::CapabilityDenied);
    result = h.ops->pruneAuditLog(admin, 2).wait();
    assert(result.success && result.data["kept"] == 2);
    assert(h.auditor->verifyChain());
    std::cout << "[OK] Audit log access test\n";
}

void testRolesAndSecrets() {
    std::cout << "Testing roles and secret listing...\n";
    Harness h;
    auto admin = UserContext::admin("root");

    OperationResult result = h.ops->addRole(admin, "judy", "editor").wait();
    assert(result.success);
    result = h.ops->listRoles(admin, "judy").wait();
    assert(result.data["roles"].size() == 1 && result.data["roles"][0] == "editor");
    assert(h.ops->addRole(admin, "judy", "superuser").wait().reason == "InvalidCharacters");
    assert(h.ops->addRole(admin, "", "editor").wait().reason == "Empty");
    assert(h.ops->addRole(UserContext::editor("judy"), "judy", "administrator").wait().error == ErrorKind::CapabilityDenied);
    result = h.ops->removeRole(admin, "judy", "editor").wait();
    assert(result.data["removed"] == true);

    h.secrets->set("shared_token", "shared-token-value-1");
    h.secrets->setConstrained("billing_key", "billing-key-value-2", "https://pay.example.com/*", "/billing/*");

    auto billing = UserContext::fromRoles(std::string("kim"), {identity::Role::Authenticated}, "/billing/charge.js");
    auto other = UserContext::fromRoles(std::string("kim"), {identity::Role::Authenticated}, "/blog/post.js");
    assert(h.ops->listScriptSecretIdentifiers(billing).wait().data.size() == 2);
    assert(h.ops->listScriptSecretIdentifiers(other).wait().data.size() == 2);
    assert(h.ops->listScriptSecretIdentifiers(admin).wait().data.size() == 2);

    // Список и exists() раскрывают одно и то же множество
    for (const auto& id : h.ops->listScriptSecretIdentifiers(other).wait().data) {
        assert(h.ops->secretExists(other, id.get<std::string>()).wait().data == true);
    }
    assert(h.ops->listSecretIdentifiers(other).wait().error == ErrorKind::CapabilityDenied);
    assert(h.ops->listSecretIdentifiers(admin).wait().data.size() == 2);

    assert(h.ops->secretExists(other, "SHARED_TOKEN").wait().data == true);
    assert(h.ops->secretExists(other, "missing").wait().data == false);
    assert(h.ops->secretExists(other, "").wait().reason == "Empty");

    // Значения секретов не попадают в ответы
    for (const auto& record : h.auditor->records(10000)) {
        assert(record.toJson().dump().find("value-") == std::string::npos);
    }
    std::cout << "[OK] Roles and secrets test\n";
}

void testMalformedAndConstruction() {
    std::cout << "Testing malformed calls and construction...\n";
    Harness h;
    const OperationResult result = h.ops->rejectMalformed(UserContext::authenticated("leo"), "fetch", "arity").wait();
    assert(result.toJsonString() == R"({"error":"ValidationRejected","reason":"MalformedArguments","success":false})");
    assert(h.outcomes("fetch").size() == 1);

    bool thrown = false;
    try {
        operations::SecurityServices services{h.validator, h.rateLimiter, h.secrets, nullptr};
        operations::SecureOperations broken(operations::OperationsConfig{}, services, {});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Malformed and construction test\n";
}

void testScriptOwnership() {
    std::cout << "Testing script ownership...\n";
    Harness h;
    auto bob = UserContext::editor("bob");
    auto mallory = UserContext::authenticated("mallory");
    auto admin = UserContext::admin("root");

    assert(h.ops->upsertScript(bob, "/a.js", "let owner = 'bob';").wait().success);
    OperationResult result = h.ops->upsertScript(mallory, "/a.js", "let owner = 'mallory';").wait();
    assert(result.toJsonString() == R"({"error":"CapabilityDenied","reason":"NotOwner","success":false})");
    assert(h.ops->getScript(bob, "/a.js").wait().data["content"] == "let owner = 'bob';");

    size_t denied = 0;
    for (const auto& record : h.outcomes("upsertScript")) {
        if (record.event->principalId == std::string("mallory")) {
            assert(record.event->kind == audit::EventKind::CapabilityDenied);
            assert(record.event->detail("reason") == "NotOwner");
            ++denied;
        }
    }
    assert(denied == 1);

    assert(h.ops->upsertScript(bob, "/a.js", "let version = 2;").wait().success);
    assert(h.ops->upsertScript(admin, "/a.js", "let version = 3;").wait().success);
    result = h.ops->getScriptOwners(mallory, "/a.js").wait();
    assert(result.success && result.data.size() == 1 && result.data[0] == "bob");
    assert(h.ops->getScriptOwners(mallory, "/missing.js").wait().data.is_null());

    // Добавлять владельцев может только владелец
    assert(h.ops->addScriptOwner(mallory, "/a.js", "mallory").wait().reason == "NotOwner");
    result = h.ops->addScriptOwner(bob, "/a.js", "mallory").wait();
    assert(result.success && result.data["added"] == true);
    assert(h.ops->addScriptOwner(bob, "/a.js", "mallory").wait().data["added"] == false);
    assert(h.ops->addScriptOwner(bob, "/a.js", "").wait().reason == "Empty");
    assert(h.ops->upsertScript(mallory, "/a.js", "let version = 4;").wait().success);

    result = h.ops->removeScriptOwner(mallory, "/a.js", "bob").wait();
    assert(result.success && result.data["removed"] == true);
    assert(h.ops->removeScriptOwner(mallory, "/a.js", "bob").wait().data["removed"] == false);
    result = h.ops->removeScriptOwner(mallory, "/a.js", "mallory").wait();
    assert(result.toJsonString() == R"({"error":"CapabilityDenied","reason":"LastOwner","success":false})");
    assert(h.ops->removeScriptOwner(admin, "/a.js", "mallory").wait().data["removed"] == true);
    assert(h.ops->getScriptOwners(admin, "/a.js").wait().data.empty());

    // Удаление: не владелец получает отказ, владелец удаляет
    assert(h.ops->upsertScript(bob, "/b.js", "let b = 1;").wait().success);
    assert(h.ops->deleteScript(UserContext::editor("carol"), "/b.js").wait().reason == "NotOwner");
    assert(h.scripts->size() == 2);
    assert(h.ops->deleteScript(bob, "/b.js").wait().data["deleted"] == true);
    assert(h.ops->deleteScript(bob, "/b.js").wait().data["deleted"] == false);
    std::cout << "[OK] Script ownership test\n";
}

void testMalformedOperationName() {
    std::cout << "Testing malformed operation names...\n";
    Harness h;
    const std::string name = std::string(200000, 'x') + "\r\nFAKE";
    const OperationResult result = h.ops->rejectMalformed(UserContext::authenticated("leo"), name, "arity\r\n").wait();
    assert(result.reason == "MalformedArguments");

    const auto events = h.outcomes();
    assert(events.size() == 1);
    assert(events[0].event->action == "unknown");
    assert(events[0].event->resource == "unknown");
    assert(events[0].event->detail("detail").find('\r') == std::string::npos);
    const std::string dumped = events[0].toJson().dump();
    assert(dumped.find("FAKE") == std::string::npos);
    assert(dumped.size() < 4096);
    std::cout << "[OK] Malformed operation name test\n";
}

int main() {
    try {
        testCapabilityDenied();
        testScriptLifecycle();
        testValidationRejected();
        testAssetsAndTables();
        testRateLimited();
        testTimeoutSettlesOnce();
        testFetchSecrets();
        testFetchRejected();
        testConcurrentMutationsAuditedOnce();
        testRegistrations();
        testAuditLogAccess();
        testRolesAndSecrets();
        testMalformedAndConstruction();
        testScriptOwnership();
        testMalformedOperationName();
        std::cout << "All SecureOperations tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "SecureOperations test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
