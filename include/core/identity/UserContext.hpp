#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/identity/Capability.hpp"

namespace hostguard {
namespace core {
namespace identity {

// UserContext — кто выполняет скрипт и что ему разрешено.
// Создаётся диспетчером запросов один раз на запрос и не меняется до его конца.
class UserContext {
public:
    UserContext(std::optional<std::string> principalId,
                bool authenticated,
                RoleSet roles,
                CapabilitySet capabilities,
                std::string scriptUri = "",
                std::vector<std::string> scriptOwners = {},
                std::string clientIp = "");

    static std::shared_ptr<const UserContext> anonymous(const std::string& clientIp = "");
    static std::shared_ptr<const UserContext> authenticated(const std::string& principalId);
    static std::shared_ptr<const UserContext> editor(const std::string& principalId);
    static std::shared_ptr<const UserContext> admin(const std::string& principalId);
    static std::shared_ptr<const UserContext> fromRoles(const std::optional<std::string>& principalId,
                                                        const RoleSet& roles,
                                                        const std::string& scriptUri = "",
                                                        const std::vector<std::string>& scriptOwners = {},
                                                        const std::string& clientIp = "");
    // Явный набор capability без ролей
    static std::shared_ptr<const UserContext> withCapabilities(const std::optional<std::string>& principalId,
                                                               const CapabilitySet& capabilities,
                                                               const std::string& scriptUri = "");

    bool hasCapability(Capability capability) const; // Проверка capability
    bool hasRole(Role role) const; // Роль включена (с учётом иерархии)
    bool isAdministrator() const;
    bool isOwner(const std::vector<std::string>& owners) const; // principal входит в owners

    const std::optional<std::string>& principalId() const { return principalId_; }
    bool isAuthenticated() const { return authenticated_; }
    const RoleSet& roles() const { return roles_; }
    const CapabilitySet& capabilities() const { return capabilities_; }
    const std::string& scriptUri() const { return scriptUri_; }
    const std::vector<std::string>& scriptOwners() const { return scriptOwners_; }
    const std::string& clientIp() const { return clientIp_; }

    // Идентификатор для аудита: principal, либо "anonymous"
    std::string principalLabel() const;
    // Ключ rate limit: principal для аутентифицированных, IP для анонимных
    std::string rateLimitSubject() const;

private:
    const std::optional<std::string> principalId_;
    const bool authenticated_;
    const RoleSet roles_;
    const CapabilitySet capabilities_;
    const std::string scriptUri_;
    const std::vector<std::string> scriptOwners_;
    const std::string clientIp_;
};

using UserContextPtr = std::shared_ptr<const UserContext>;

// Чистая проверка без побочных эффектов
bool hasCapability(const UserContext& ctx, Capability capability);

} // namespace identity
} // namespace core
} // namespace hostguard
