#include "core/bridge/GuestBridge.hpp"
#include "core/logging/Logger.hpp"
#include "core/operations/SecureOperations.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace hostguard {
namespace core {
namespace bridge {

using operations::OperationHandle;
using operations::SecureOperations;

namespace {

class MalformedArguments : public std::runtime_error {
public:
    explicit MalformedArguments(const std::string& what) : std::runtime_error(what) {}
};

const std::string kUnknownFunction = "unknown";

using Context = identity::UserContextPtr;
using Args = std::vector<std::string>;
using Invoker = std::function<OperationHandle(SecureOperations&, const Context&, const Args&, const BridgeConfig&)>;

struct Binding {
    std::string name;
    size_t minArgs;
    size_t maxArgs;
    Invoker invoke;
};

size_t parseCount(const std::string& text, const std::string& what) {
    const bool digits = !text.empty() && text.size() <= 9 &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        throw MalformedArguments(what + " must be a non-negative integer");
    }
    return static_cast<size_t>(std::stoul(text));
}

// Опции fetch: {"method","headers":{...},"body","timeoutMs"}; timeoutMs не больше maxTimeout
operations::FetchRequest parseFetch(const Args& args, std::chrono::milliseconds maxTimeout) {
    operations::FetchRequest request;
    request.url = args[0];
    if (args.size() < 2 || args[1].empty()) {
        return request;
    }
    const nlohmann::json options = nlohmann::json::parse(args[1]);
    if (!options.is_object()) {
        throw MalformedArguments("fetch options must be an object");
    }
    if (options.contains("method")) {
        if (!options["method"].is_string()) {
            throw MalformedArguments("method must be a string");
        }
        request.method = options["method"].get<std::string>();
    }
    if (options.contains("headers")) {
        const nlohmann::json& headers = options["headers"];
        if (!headers.is_object()) {
            throw MalformedArguments("headers must be an object");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (!it.value().is_string()) {
                throw MalformedArguments("header values must be strings");
            }
            request.headers.emplace_back(it.key(), it.value().get<std::string>());
        }
    }
    if (options.contains("body")) {
        const nlohmann::json& body = options["body"];
        request.body = body.is_string() ? body.get<std::string>() : body.dump();
    }
    if (options.contains("timeoutMs")) {
        const nlohmann::json& timeout = options["timeoutMs"];
        if (!timeout.is_number_unsigned() || timeout.get<uint64_t>() == 0) {
            throw MalformedArguments("timeoutMs must be a positive integer");
        }
        const uint64_t value = timeout.get<uint64_t>();
        if (value > static_cast<uint64_t>(maxTimeout.count())) {
            throw MalformedArguments("timeoutMs exceeds " + std::to_string(maxTimeout.count()));
        }
        request.timeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
    }
    return request;
}

const std::vector<Binding>& bindings() {
    static const std::vector<Binding> table = {
        {"scriptStorage.upsertScript", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.upsertScript(ctx, a[0], a[1]); }},
        {"scriptStorage.getScript", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.getScript(ctx, a[0]); }},
        {"scriptStorage.deleteScript", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.deleteScript(ctx, a[0]); }},
        {"scriptStorage.listScripts", 0, 0,
         [](SecureOperations& ops, const Context& ctx, const Args&, const BridgeConfig&) { return ops.listScripts(ctx); }},
        {"scriptStorage.getScriptOwners", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.getScriptOwners(ctx, a[0]); }},
        {"scriptStorage.addScriptOwner", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.addScriptOwner(ctx, a[0], a[1]); }},
        {"scriptStorage.removeScriptOwner", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.removeScriptOwner(ctx, a[0], a[1]); }},

        {"assetStorage.upsertAsset", 3, 3,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.upsertAsset(ctx, a[0], a[1], a[2]); }},
        {"assetStorage.fetchAsset", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.fetchAsset(ctx, a[0]); }},
        {"assetStorage.deleteAsset", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.deleteAsset(ctx, a[0]); }},
        {"assetStorage.listAssets", 0, 0,
         [](SecureOperations& ops, const Context& ctx, const Args&, const BridgeConfig&) { return ops.listAssets(ctx); }},

        {"database.upsertTable", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.upsertTable(ctx, a[0], a[1]); }},
        {"database.getTable", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.getTable(ctx, a[0]); }},
        {"database.deleteTable", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.deleteTable(ctx, a[0]); }},
        {"database.listTables", 0, 0,
         [](SecureOperations& ops, const Context& ctx, const Args&, const BridgeConfig&) { return ops.listTables(ctx); }},

        {"fetch", 1, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig& cfg) {
             return ops.fetch(ctx, parseFetch(a, cfg.maxFetchTimeout));
         }},

        {"secretStorage.exists", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.secretExists(ctx, a[0]); }},
        {"secretStorage.list", 0, 0,
         [](SecureOperations& ops, const Context& ctx, const Args&, const BridgeConfig&) { return ops.listScriptSecretIdentifiers(ctx); }},

        {"routeRegistry.registerRoute", 2, 3,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.registerRoute(ctx, a[0], a[1], a.size() > 2 ? a[2] : std::string("GET"));
         }},
        {"routeRegistry.registerStreamRoute", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.registerStream(ctx, a[0]); }},
        {"routeRegistry.sendStreamMessage", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.broadcast(ctx, a[0], a[1]); }},

        {"graphQLRegistry.registerQuery", 3, 3,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.registerGraphQL(ctx, operations::GraphQLKind::Query, a[0], a[1], a[2]);
         }},
        {"graphQLRegistry.registerMutation", 3, 3,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.registerGraphQL(ctx, operations::GraphQLKind::Mutation, a[0], a[1], a[2]);
         }},
        {"graphQLRegistry.registerSubscription", 3, 3,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.registerGraphQL(ctx, operations::GraphQLKind::Subscription, a[0], a[1], a[2]);
         }},

        {"mcpRegistry.registerTool", 4, 4,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.registerTool(ctx, a[0], a[1], a[2], a[3]);
         }},

        {"console.listLogs", 0, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.readAuditLog(ctx, a.empty() ? 0 : parseCount(a[0], "limit"));
         }},

        {"admin.pruneLogs", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) {
             return ops.pruneAuditLog(ctx, parseCount(a[0], "keepLast"));
         }},
        {"admin.listRoles", 1, 1,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.listRoles(ctx, a[0]); }},
        {"admin.addRole", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.addRole(ctx, a[0], a[1]); }},
        {"admin.removeRole", 2, 2,
         [](SecureOperations& ops, const Context& ctx, const Args& a, const BridgeConfig&) { return ops.removeRole(ctx, a[0], a[1]); }},
    };
    return table;
}

const Binding* findBinding(const std::string& name) {
    for (const auto& binding : bindings()) {
        if (binding.name == name) {
            return &binding;
        }
    }
    return nullptr;
}

} // namespace

GuestBridge::GuestBridge(std::shared_ptr<SecureOperations> operations, const BridgeConfig& config)
    : operations_(std::move(operations)), config_(config) {
    if (!operations_) {
        throw std::invalid_argument("GuestBridge: operations are required");
    }
    if (!config_.validate()) {
        throw std::invalid_argument("GuestBridge: invalid configuration");
    }
}

const std::vector<std::string>& GuestBridge::functionNames() {
    static const std::vector<std::string> names = []() {
        std::vector<std::string> result;
        for (const auto& binding : bindings()) {
            result.push_back(binding.name);
        }
        return result;
    }();
    return names;
}

void GuestBridge::install(GuestEnvironment& env, const identity::UserContextPtr& ctx) const {
    if (!ctx) {
        throw std::invalid_argument("GuestBridge: user context is required");
    }
    const GuestBridge self = *this;
    for (const auto& name : functionNames()) {
        env.bindFunction(name, [self, ctx, name](const std::vector<std::string>& args) {
            return self.call(name, ctx, args);
        });
    }
    logging::getLogger("bridge")->debug("GuestBridge: installed {} functions for {}",
                                        functionNames().size(), ctx->principalLabel());
}

std::string GuestBridge::call(const std::string& name, const identity::UserContextPtr& ctx,
                              const std::vector<std::string>& args) const {
    if (!ctx) {
        throw std::invalid_argument("GuestBridge: user context is required");
    }
    OperationHandle handle;
    const Binding* binding = findBinding(name);
    if (!binding) {
        // Имя от гостя в аудит не попадает
        handle = operations_->rejectMalformed(ctx, kUnknownFunction,
                                              "unknown function, name length " + std::to_string(name.size()));
    } else if (args.size() < binding->minArgs || args.size() > binding->maxArgs) {
        handle = operations_->rejectMalformed(
            ctx, name, "expected " + std::to_string(binding->minArgs) + ".." + std::to_string(binding->maxArgs) +
                           " arguments, got " + std::to_string(args.size()));
    } else {
        try {
            handle = binding->invoke(*operations_, ctx, args, config_);
        } catch (const MalformedArguments& e) {
            handle = operations_->rejectMalformed(ctx, name, e.what());
        } catch (const nlohmann::json::exception& e) {
            logging::getLogger("bridge")->debug("GuestBridge: {} JSON argument rejected: {}", name, e.what());
            handle = operations_->rejectMalformed(ctx, name, "invalid JSON argument");
        }
    }
    return handle.wait(config_.callTimeout).toJsonString();
}

} // namespace bridge
} // namespace core
} // namespace hostguard
