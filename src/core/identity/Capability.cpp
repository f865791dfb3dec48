#include "core/identity/Capability.hpp"
#include <utility>

namespace hostguard {
namespace core {
namespace identity {

namespace {

const std::pair<Capability, const char*> kCapabilityNames[] = {
    {Capability::ReadScripts, "ReadScripts"},
    {Capability::WriteScripts, "WriteScripts"},
    {Capability::DeleteScripts, "DeleteScripts"},
    {Capability::ReadAssets, "ReadAssets"},
    {Capability::WriteAssets, "WriteAssets"},
    {Capability::DeleteAssets, "DeleteAssets"},
    {Capability::ReadTables, "ReadTables"},
    {Capability::WriteTables, "WriteTables"},
    {Capability::ViewLogs, "ViewLogs"},
    {Capability::ManageStreams, "ManageStreams"},
    {Capability::ManageGraphQL, "ManageGraphQL"},
    {Capability::ManageRoutes, "ManageRoutes"},
    {Capability::ManageTools, "ManageTools"},
    {Capability::OutboundFetch, "OutboundFetch"},
    {Capability::ManageRoles, "ManageRoles"},
    {Capability::ManageSecrets, "ManageSecrets"},
    {Capability::Administrator, "Administrator"},
};

// Capability, которые добавляет каждая роль к роли ниже
CapabilitySet ownCapabilities(Role role) {
    switch (role) {
        case Role::Anonymous:
            return {Capability::ViewLogs};
        case Role::Authenticated:
            return {Capability::ReadScripts, Capability::WriteScripts,
                    Capability::ReadAssets, Capability::WriteAssets,
                    Capability::ReadTables, Capability::ManageStreams,
                    Capability::OutboundFetch};
        case Role::Editor:
            return {Capability::DeleteScripts, Capability::DeleteAssets,
                    Capability::WriteTables, Capability::ManageGraphQL,
                    Capability::ManageRoutes, Capability::ManageTools};
        case Role::Administrator:
            return {Capability::ManageRoles, Capability::ManageSecrets,
                    Capability::Administrator};
    }
    return {};
}

} // namespace

std::string capabilityToString(Capability capability) {
    for (const auto& entry : kCapabilityNames) {
        if (entry.first == capability) {
            return entry.second;
        }
    }
    return "Unknown";
}

std::optional<Capability> capabilityFromString(const std::string& name) {
    for (const auto& entry : kCapabilityNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const std::vector<Capability>& allCapabilities() {
    static const std::vector<Capability> all = [] {
        std::vector<Capability> v;
        for (const auto& entry : kCapabilityNames) {
            v.push_back(entry.first);
        }
        return v;
    }();
    return all;
}

std::string roleToString(Role role) {
    switch (role) {
        case Role::Anonymous:     return "anonymous";
        case Role::Authenticated: return "authenticated";
        case Role::Editor:        return "editor";
        case Role::Administrator: return "administrator";
    }
    return "unknown";
}

std::optional<Role> roleFromString(const std::string& name) {
    if (name == "anonymous")     return Role::Anonymous;
    if (name == "authenticated") return Role::Authenticated;
    if (name == "editor")        return Role::Editor;
    if (name == "administrator") return Role::Administrator;
    return std::nullopt;
}

CapabilitySet roleCapabilities(Role role) {
    CapabilitySet result;
    for (uint8_t level = 0; level <= static_cast<uint8_t>(role); ++level) {
        const CapabilitySet own = ownCapabilities(static_cast<Role>(level));
        result.insert(own.begin(), own.end());
    }
    return result;
}

bool hasPrivilege(Role a, Role b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

CapabilitySet capabilitiesForRoles(const RoleSet& roles) {
    CapabilitySet result;
    for (Role role : roles) {
        const CapabilitySet caps = roleCapabilities(role);
        result.insert(caps.begin(), caps.end());
    }
    return result;
}

} // namespace identity
} // namespace core
} // namespace hostguard
