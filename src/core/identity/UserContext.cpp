#include "core/identity/UserContext.hpp"
#include <algorithm>

namespace hostguard {
namespace core {
namespace identity {

UserContext::UserContext(std::optional<std::string> principalId,
                         bool authenticated,
                         RoleSet roles,
                         CapabilitySet capabilities,
                         std::string scriptUri,
                         std::vector<std::string> scriptOwners,
                         std::string clientIp)
    : principalId_(std::move(principalId))
    , authenticated_(authenticated)
    , roles_(std::move(roles))
    , capabilities_(std::move(capabilities))
    , scriptUri_(std::move(scriptUri))
    , scriptOwners_(std::move(scriptOwners))
    , clientIp_(std::move(clientIp)) {}

std::shared_ptr<const UserContext> UserContext::anonymous(const std::string& clientIp) {
    return fromRoles(std::nullopt, {Role::Anonymous}, "", {}, clientIp);
}

std::shared_ptr<const UserContext> UserContext::authenticated(const std::string& principalId) {
    return fromRoles(principalId, {Role::Authenticated});
}

std::shared_ptr<const UserContext> UserContext::editor(const std::string& principalId) {
    return fromRoles(principalId, {Role::Editor});
}

std::shared_ptr<const UserContext> UserContext::admin(const std::string& principalId) {
    return fromRoles(principalId, {Role::Administrator});
}

std::shared_ptr<const UserContext> UserContext::fromRoles(const std::optional<std::string>& principalId,
                                                          const RoleSet& roles,
                                                          const std::string& scriptUri,
                                                          const std::vector<std::string>& scriptOwners,
                                                          const std::string& clientIp) {
    // Без principal аутентификация невозможна, какие бы роли ни пришли
    RoleSet effective = principalId ? roles : RoleSet{Role::Anonymous};
    if (effective.empty()) {
        effective.insert(Role::Anonymous);
    }
    const bool authenticated = principalId.has_value();
    return std::make_shared<const UserContext>(principalId, authenticated, effective,
                                               capabilitiesForRoles(effective),
                                               scriptUri, scriptOwners, clientIp);
}

std::shared_ptr<const UserContext> UserContext::withCapabilities(const std::optional<std::string>& principalId,
                                                                 const CapabilitySet& capabilities,
                                                                 const std::string& scriptUri) {
    return std::make_shared<const UserContext>(principalId, principalId.has_value(), RoleSet{},
                                               capabilities, scriptUri);
}

bool UserContext::hasCapability(Capability capability) const {
    return capabilities_.count(capability) > 0;
}

bool UserContext::hasRole(Role role) const {
    return std::any_of(roles_.begin(), roles_.end(),
                       [role](Role held) { return hasPrivilege(held, role); });
}

bool UserContext::isAdministrator() const {
    return hasCapability(Capability::Administrator);
}

bool UserContext::isOwner(const std::vector<std::string>& owners) const {
    return principalId_ && std::find(owners.begin(), owners.end(), *principalId_) != owners.end();
}

std::string UserContext::principalLabel() const {
    return principalId_ ? *principalId_ : std::string("anonymous");
}

std::string UserContext::rateLimitSubject() const {
    if (principalId_) {
        return "user:" + *principalId_;
    }
    return "ip:" + (clientIp_.empty() ? std::string("unknown") : clientIp_);
}

bool hasCapability(const UserContext& ctx, Capability capability) {
    return ctx.hasCapability(capability);
}

} // namespace identity
} // namespace core
} // namespace hostguard
