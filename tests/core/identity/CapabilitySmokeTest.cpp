#include <cassert>
#include <iostream>
#include "core/identity/Capability.hpp"
#include "core/identity/UserContext.hpp"

using namespace hostguard::core::identity;

void testCapabilityNames() {
    std::cout << "Testing capability names...\n";

    for (Capability capability : allCapabilities()) {
        const auto parsed = capabilityFromString(capabilityToString(capability));
        assert(parsed && *parsed == capability);
    }
    assert(capabilityToString(Capability::WriteScripts) == "WriteScripts");
    // Разбор точный: регистр имеет значение
    assert(!capabilityFromString("writescripts"));
    assert(!capabilityFromString(""));
    assert(allCapabilities().size() == 17);

    assert(roleFromString("editor") == Role::Editor);
    assert(!roleFromString("root"));

    std::cout << "[OK] Capability names test\n";
}

void testRoleImplication() {
    std::cout << "Testing role implication table...\n";

    const CapabilitySet anonymous = roleCapabilities(Role::Anonymous);
    const CapabilitySet authenticated = roleCapabilities(Role::Authenticated);
    const CapabilitySet editor = roleCapabilities(Role::Editor);
    const CapabilitySet admin = roleCapabilities(Role::Administrator);

    assert(anonymous == CapabilitySet{Capability::ViewLogs});
    for (Capability c : anonymous) assert(authenticated.count(c));
    for (Capability c : authenticated) assert(editor.count(c));
    for (Capability c : editor) assert(admin.count(c));
    assert(admin.size() == allCapabilities().size());

    assert(authenticated.count(Capability::WriteScripts));
    assert(!authenticated.count(Capability::DeleteScripts));
    assert(editor.count(Capability::ManageRoutes));
    assert(!editor.count(Capability::ManageSecrets));

    assert(hasPrivilege(Role::Administrator, Role::Editor));
    assert(!hasPrivilege(Role::Authenticated, Role::Editor));

    std::cout << "[OK] Role implication test\n";
}

void testUserContext() {
    std::cout << "Testing UserContext...\n";

    auto anonymous = UserContext::anonymous("203.0.113.7");
    assert(!anonymous->isAuthenticated());
    assert(!anonymous->principalId());
    assert(anonymous->hasCapability(Capability::ViewLogs));
    assert(!anonymous->hasCapability(Capability::WriteScripts));
    assert(anonymous->rateLimitSubject() == "ip:203.0.113.7");
    assert(anonymous->principalLabel() == "anonymous");
    assert(UserContext::anonymous()->rateLimitSubject() == "ip:unknown");

    auto editor = UserContext::editor("alice");
    assert(editor->isAuthenticated());
    assert(editor->hasRole(Role::Authenticated));
    assert(!editor->hasRole(Role::Administrator));
    assert(editor->hasCapability(Capability::DeleteAssets));
    assert(!editor->isAdministrator());
    assert(editor->rateLimitSubject() == "user:alice");

    assert(UserContext::admin("root")->isAdministrator());

    // Роли без principal не дают аутентификации
    auto forged = UserContext::fromRoles(std::nullopt, {Role::Administrator});
    assert(!forged->isAuthenticated());
    assert(!forged->isAdministrator());

    auto owned = UserContext::fromRoles(std::string("bob"), {Role::Authenticated}, "/app/main.js", {"bob"});
    assert(owned->isOwner(owned->scriptOwners()));
    assert(owned->isOwner({"carol", "bob"}));
    assert(!owned->isOwner({"alice"}));
    auto visitor = UserContext::fromRoles(std::string("alice"), {Role::Authenticated}, "/app/main.js", {"bob"});
    assert(!visitor->isOwner(visitor->scriptOwners()));
    // Анонимный контекст ничем не владеет
    assert(!UserContext::anonymous("192.0.2.1")->isOwner({"anonymous"}));
    assert(owned->scriptUri() == "/app/main.js");

    auto explicitCaps = UserContext::withCapabilities(std::string("svc"), {Capability::OutboundFetch});
    assert(explicitCaps->hasCapability(Capability::OutboundFetch));
    assert(!explicitCaps->hasCapability(Capability::ReadScripts));
    assert(hasCapability(*explicitCaps, Capability::OutboundFetch));

    std::cout << "[OK] UserContext test\n";
}

int main() {
    try {
        testCapabilityNames();
        testRoleImplication();
        testUserContext();
        std::cout << "All Capability tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Capability test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
