#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hostguard {
namespace core {
namespace identity {

// Capability — атомарное разрешение. Роль = набор capability.
enum class Capability : uint8_t {
    ReadScripts,
    WriteScripts,
    DeleteScripts,
    ReadAssets,
    WriteAssets,
    DeleteAssets,
    ReadTables,
    WriteTables,
    ViewLogs,
    ManageStreams,
    ManageGraphQL,
    ManageRoutes,
    ManageTools,
    OutboundFetch,
    ManageRoles,
    ManageSecrets,
    Administrator,
};

using CapabilitySet = std::set<Capability>;

// Роли по возрастанию привилегий: каждая следующая включает предыдущую
enum class Role : uint8_t {
    Anonymous = 0,
    Authenticated = 1,
    Editor = 2,
    Administrator = 3,
};

using RoleSet = std::set<Role>;

std::string capabilityToString(Capability capability);
std::optional<Capability> capabilityFromString(const std::string& name);
const std::vector<Capability>& allCapabilities();

std::string roleToString(Role role);
std::optional<Role> roleFromString(const std::string& name);

// Таблица импликаций:
//   Anonymous     — ViewLogs
//   Authenticated — + ReadScripts, WriteScripts, ReadAssets, WriteAssets,
//                     ReadTables, ManageStreams, OutboundFetch
//   Editor        — + DeleteScripts, DeleteAssets, WriteTables,
//                     ManageGraphQL, ManageRoutes, ManageTools
//   Administrator — + ManageRoles, ManageSecrets, Administrator
CapabilitySet roleCapabilities(Role role);

// true, если роль a включает роль b (Administrator ⊇ Editor ⊇ Authenticated ⊇ Anonymous)
bool hasPrivilege(Role a, Role b);

// Объединение capability всех ролей
CapabilitySet capabilitiesForRoles(const RoleSet& roles);

} // namespace identity
} // namespace core
} // namespace hostguard
