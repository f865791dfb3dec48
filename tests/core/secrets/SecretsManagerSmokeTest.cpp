#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "core/secrets/SecretsManager.hpp"

using namespace hostguard::core::secrets;

void testBasicStorage() {
    std::cout << "Testing SecretsManager basic storage...\n";
    SecretsManager manager;

    manager.set("API_KEY", "sk-test-1234567890");
    assert(manager.exists("api_key"));
    assert(manager.exists("Api_Key"));
    assert(manager.get("API_KEY").value() == "sk-test-1234567890");
    assert(manager.count() == 1);

    const auto ids = manager.listIdentifiers();
    assert(ids.size() == 1 && ids[0] == "api_key");

    assert(manager.remove("API_KEY"));
    assert(!manager.remove("API_KEY"));
    assert(!manager.get("api_key"));

    bool thrown = false;
    try {
        manager.set("", "value");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] Basic storage test\n";
}

void testConstraints() {
    std::cout << "Testing URL and script constraints...\n";
    SecretsManager manager;
    manager.setConstrained("stripe", "sk_live_abcdefgh", "https://api.stripe.com/*", "/billing/*");

    SecretLookup ok = manager.getWithConstraints("STRIPE", "HTTPS://API.Stripe.com/v1/charges", "/billing/charge.js");
    assert(ok.found() && ok.value == "sk_live_abcdefgh");

    SecretLookup wrongUrl = manager.getWithConstraints("stripe", "https://evil.example.com/v1", "/billing/charge.js");
    assert(wrongUrl.status == SecretLookupStatus::UrlNotAllowed);
    assert(wrongUrl.value.empty());

    SecretLookup wrongScript = manager.getWithConstraints("stripe", "https://api.stripe.com/v1", "/other/app.js");
    assert(wrongScript.status == SecretLookupStatus::ScriptNotAllowed);

    // Шаблон скрипта чувствителен к регистру, пустой скрипт не проходит
    assert(manager.getWithConstraints("stripe", "https://api.stripe.com/v1", "/Billing/charge.js").status ==
           SecretLookupStatus::ScriptNotAllowed);
    assert(manager.getWithConstraints("stripe", "https://api.stripe.com/v1", "").status ==
           SecretLookupStatus::ScriptNotAllowed);

    assert(manager.getWithConstraints("missing", "https://api.stripe.com/v1", "/billing/x.js").status ==
           SecretLookupStatus::NotFound);

    manager.set("open", "open-secret-value");
    // Ограничения действуют на значение, а не на видимость идентификатора
    const auto ids = manager.listIdentifiers();
    assert(ids.size() == 2 && ids[0] == "open" && ids[1] == "stripe");

    assert(SecretsManager::globMatch("", "anything"));
    assert(SecretsManager::globMatch("https://*.example.com/*", "https://a.example.com/x/y"));
    assert(!SecretsManager::globMatch("/billing/*", "/reports/x.js"));
    assert(SecretsManager::normalizeUrl("HTTPS://Api.Example.COM/Path?Q=1") == "https://api.example.com/Path?Q=1");

    std::cout << "[OK] Constraint test\n";
}

void testEnvironmentFormat() {
    std::cout << "Testing SECRET_* variable format...\n";
    SecretsManager manager;
    const size_t loaded = manager.loadFromVariables({
        {"SECRET_GITHUB_TOKEN", "ghp_abcdefghijklmnop"},
        {"SECRET_MAIL__ALLOW_https://api.mail.com/*__SCRIPT_/mail/*", "mail-secret-123"},
        {"SECRET_BROKEN__ALLOW_https://x.com", "ignored-value"},
        {"SECRET_EMPTY", ""},
        {"PATH", "/usr/bin"},
    });
    assert(loaded == 2);
    assert(manager.exists("github_token"));
    assert(manager.getWithConstraints("mail", "https://api.mail.com/send", "/mail/send.js").found());
    assert(manager.getWithConstraints("mail", "https://other.com/send", "/mail/send.js").status ==
           SecretLookupStatus::UrlNotAllowed);
    assert(!manager.exists("broken"));
    assert(!manager.exists("empty"));

    assert(manager.loadFromMap({{"DB_PASSWORD", "hunter2hunter2"}, {"", "x"}}) == 1);
    assert(manager.exists("db_password"));

    std::cout << "[OK] Environment format test\n";
}

void testFileLoading() {
    std::cout << "Testing secrets file loading...\n";
    const std::string path = "hostguard_secrets_smoke.json";
    {
        std::ofstream out(path);
        out << R"([
            {"identifier": "WEBHOOK", "value": "whsec_0123456789", "allowedUrlPattern": "https://hooks.example.com/*"},
            {"identifier": "plain", "value": "plain-secret-value"},
            {"identifier": 42, "value": "bad"}
        ])";
    }
    SecretsManager manager;
    assert(manager.loadFromFile(path) == 2);
    assert(manager.getWithConstraints("webhook", "https://hooks.example.com/in", "").found());
    assert(manager.exists("plain"));
    std::remove(path.c_str());

    bool thrown = false;
    try {
        manager.loadFromFile("does-not-exist.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    // Нестроковый шаблон: runtime_error с номером записи, секрет не загружен
    {
        std::ofstream out(path);
        out << R"([{"identifier": "hook", "value": "hook-secret-value", "allowedUrlPattern": ["https://*"]}])";
    }
    SecretsManager strict;
    std::string message;
    try {
        strict.loadFromFile(path);
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    assert(message.find("entry 1 ('hook')") != std::string::npos);
    assert(!strict.exists("hook"));
    std::remove(path.c_str());

    std::cout << "[OK] File loading test\n";
}

void testRedaction() {
    std::cout << "Testing redaction...\n";
    SecretsManager manager;
    manager.set("long", "supersecretvalue");
    manager.set("short", "abc");

    const std::string text = "token=supersecretvalue; again supersecretvalue; abc stays";
    const std::string redacted = manager.redact(text);
    assert(redacted == "token=[REDACTED]; again [REDACTED]; abc stays");
    assert(manager.redact("") == "");

    assert(SecretsManager::looksLikeSecret("sk-abcdefghijklmnopqrstuvwxyz"));
    assert(!SecretsManager::looksLikeSecret("hello"));

    std::cout << "[OK] Redaction test\n";
}

int main() {
    try {
        testBasicStorage();
        testConstraints();
        testEnvironmentFormat();
        testFileLoading();
        testRedaction();
        std::cout << "All SecretsManager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "SecretsManager test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
