#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "core/validation/InputValidator.hpp"

using namespace hostguard::core::validation;

namespace {
ValidationReason reasonOf(const InputValidator& validator, const std::string& payload, ValidationTarget target) {
    return validator.validate(payload, target).reason;
}
}

void testScriptContent() {
    std::cout << "Testing script content validation...\n";
    InputValidator validator;

    assert(validator.validate("export default function handler(req) { return 'ok'; }",
                              ValidationTarget::ScriptContent));
    assert(validator.validate("", ValidationTarget::ScriptContent));
    assert(reasonOf(validator, "const x = eval ('1+1');", ValidationTarget::ScriptContent) ==
           ValidationReason::CodeExecutionPrimitive);
    assert(reasonOf(validator, "process.exit(1)", ValidationTarget::ScriptContent) ==
           ValidationReason::CodeExecutionPrimitive);
    assert(reasonOf(validator, "obj.__proto__.x = 1", ValidationTarget::ScriptContent) ==
           ValidationReason::CodeExecutionPrimitive);
    // Бесконечный цикл только логируется
    assert(validator.validate("while (true) { break; }", ValidationTarget::ScriptContent));
    assert(reasonOf(validator, std::string("a\0b", 3), ValidationTarget::ScriptContent) == ValidationReason::NullByte);
    assert(reasonOf(validator, std::string(100001, 'a'), ValidationTarget::ScriptContent) == ValidationReason::Oversized);

    std::cout << "[OK] Script content test\n";
}

void testUris() {
    std::cout << "Testing URI validation and normalization...\n";
    InputValidator validator;

    std::string normalized;
    assert(validator.validateUri("/app//handlers/main.js/", normalized));
    assert(normalized == "/app/handlers/main.js");
    assert(validator.validateUri("/", normalized) && normalized == "/");

    assert(validator.validateUri("", normalized).reason == ValidationReason::Empty);
    assert(validator.validateUri("/app/../etc/passwd", normalized).reason == ValidationReason::PathTraversal);
    assert(validator.validateUri("/app/%2E%2E/x", normalized).reason == ValidationReason::PathTraversal);
    assert(validator.validateUri("app/main.js", normalized).reason == ValidationReason::InvalidCharacters);
    assert(validator.validateUri("/app/main js", normalized).reason == ValidationReason::InvalidCharacters);
    assert(validator.validateUri("/" + std::string(200, 'a'), normalized).reason == ValidationReason::Oversized);

    assert(validator.validate("logo.png", ValidationTarget::AssetName));
    assert(reasonOf(validator, "../logo.png", ValidationTarget::AssetName) == ValidationReason::PathTraversal);

    std::cout << "[OK] URI test\n";
}

void testUrlsAndHosts() {
    std::cout << "Testing outbound URL validation...\n";
    InputValidator validator;

    assert(validator.validate("https://api.example.com/v1/items?x=1", ValidationTarget::Url));
    assert(reasonOf(validator, "ftp://example.com/file", ValidationTarget::Url) == ValidationReason::InvalidScheme);
    assert(reasonOf(validator, "http://localhost:8080/", ValidationTarget::Url) == ValidationReason::BlockedHost);
    assert(reasonOf(validator, "http://10.1.2.3/", ValidationTarget::Url) == ValidationReason::BlockedHost);
    assert(reasonOf(validator, "http://169.254.169.254/latest", ValidationTarget::Url) == ValidationReason::BlockedHost);
    assert(reasonOf(validator, "http://[::1]/", ValidationTarget::Url) == ValidationReason::BlockedHost);
    assert(reasonOf(validator, "http://2130706433/", ValidationTarget::Url) == ValidationReason::BlockedHost);
    assert(reasonOf(validator, "https://example.com/\r\nX: y", ValidationTarget::Url) == ValidationReason::HeaderInjection);
    assert(reasonOf(validator, "https:///nohost", ValidationTarget::Url) == ValidationReason::MalformedUrl);

    std::string host;
    assert(InputValidator::extractHost("https://user:pw@API.Example.com:443/x", host));
    assert(host == "api.example.com");
    assert(!InputValidator::isBlockedHost("8.8.8.8"));
    assert(InputValidator::isBlockedHost("app.localhost"));
    assert(InputValidator::isBlockedHost("::ffff:192.168.1.1"));

    ValidatorLimits open;
    open.allowPrivateNetworks = true;
    InputValidator permissive(open);
    assert(permissive.validate("http://localhost:8080/", ValidationTarget::Url));

    std::cout << "[OK] URL test\n";
}

void testHeadersAndFields() {
    std::cout << "Testing headers, tables, streams and form fields...\n";
    InputValidator validator;

    assert(validator.validate("X-Api-Key", ValidationTarget::HeaderName));
    assert(reasonOf(validator, "X Api", ValidationTarget::HeaderName) == ValidationReason::InvalidCharacters);
    assert(reasonOf(validator, "value\r\nSet-Cookie: a", ValidationTarget::HeaderValue) == ValidationReason::HeaderInjection);
    assert(reasonOf(validator, "<script>alert(1)</script>", ValidationTarget::HeaderValue) ==
           ValidationReason::CrossSiteScripting);

    assert(validator.validate("users_v2", ValidationTarget::TableName));
    assert(reasonOf(validator, "2users", ValidationTarget::TableName) == ValidationReason::InvalidCharacters);
    assert(validator.validate(R"({"id":"string"})", ValidationTarget::TableSchema));
    assert(reasonOf(validator, "[1,2]", ValidationTarget::TableSchema) == ValidationReason::InvalidCharacters);

    assert(validator.validate("/chat/room-1", ValidationTarget::StreamName));
    assert(reasonOf(validator, "/chat/../admin", ValidationTarget::StreamName) == ValidationReason::PathTraversal);

    assert(validator.validate("/api/items/:id", ValidationTarget::RouteName));
    assert(reasonOf(validator, "api/items", ValidationTarget::RouteName) == ValidationReason::InvalidCharacters);

    assert(reasonOf(validator, "<img src=x onerror=alert(1)>", ValidationTarget::FormField) ==
           ValidationReason::CrossSiteScripting);
    assert(reasonOf(validator, "require('fs')", ValidationTarget::ConfigValue) == ValidationReason::CodeExecutionPrimitive);

    assert(validator.validateMimeType("image/png"));
    assert(validator.validateMimeType("text/html; charset=utf-8"));
    assert(validator.validateMimeType("png").reason == ValidationReason::InvalidMimeType);

    std::cout << "[OK] Headers and fields test\n";
}

void testInvalidLimits() {
    std::cout << "Testing invalid validator limits...\n";
    ValidatorLimits limits;
    limits.maxScriptSize = 0;
    bool thrown = false;
    try {
        InputValidator validator(limits);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Invalid limits test\n";
}

int main() {
    try {
        testScriptContent();
        testUris();
        testUrlsAndHosts();
        testHeadersAndFields();
        testInvalidLimits();
        std::cout << "All InputValidator tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "InputValidator test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
