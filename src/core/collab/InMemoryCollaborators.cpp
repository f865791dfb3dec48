#include "core/collab/InMemoryCollaborators.hpp"
#include <mutex>
#include <vector>

namespace hostguard {
namespace core {
namespace collab {

std::string registrationKindToString(RegistrationKind kind) {
    switch (kind) {
        case RegistrationKind::Route: return "route";
        case RegistrationKind::StreamRoute: return "stream";
        case RegistrationKind::GraphQLQuery: return "graphql.query";
        case RegistrationKind::GraphQLMutation: return "graphql.mutation";
        case RegistrationKind::GraphQLSubscription: return "graphql.subscription";
        case RegistrationKind::Tool: return "tool";
    }
    return "unknown";
}

bool InMemoryRepository::upsert(const Resource& resource) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Resource stored = resource;
    stored.updatedAt = std::chrono::system_clock::now();
    resources_[resource.key] = std::move(stored);
    return true;
}

bool InMemoryRepository::get(const std::string& key, Resource& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = resources_.find(key);
    if (it == resources_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool InMemoryRepository::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return resources_.erase(key) > 0;
}

std::vector<std::string> InMemoryRepository::list(const std::string& prefix) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = resources_.lower_bound(prefix); it != resources_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

size_t InMemoryRepository::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return resources_.size();
}

bool InMemoryRegistry::registerEntry(const RegistrationRequest& request) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[{request.kind, request.name}] = request;
    return true;
}

std::vector<RegistrationRequest> InMemoryRegistry::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<RegistrationRequest> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.second);
    }
    return result;
}

bool InMemoryRegistry::contains(RegistrationKind kind, const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count({kind, name}) > 0;
}

size_t InMemoryStreamBroadcaster::subscribe(const std::string& path, StreamSubscriber subscriber) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const size_t id = nextId_++;
    subscribers_[id] = Subscription{path, std::move(subscriber)};
    return id;
}

bool InMemoryStreamBroadcaster::unsubscribe(size_t id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

size_t InMemoryStreamBroadcaster::broadcast(const std::string& path, const std::string& message) {
    std::vector<StreamSubscriber> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : subscribers_) {
            if (entry.second.path == path) {
                targets.push_back(entry.second.callback);
            }
        }
    }
    for (const auto& target : targets) {
        target(message);
    }
    return targets.size();
}

identity::RoleSet InMemoryUserRepository::rolesOf(const std::string& principal) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = roles_.find(principal);
    return it != roles_.end() ? it->second : identity::RoleSet{};
}

bool InMemoryUserRepository::addRole(const std::string& principal, identity::Role role) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    roles_[principal].insert(role);
    return true;
}

bool InMemoryUserRepository::removeRole(const std::string& principal, identity::Role role) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = roles_.find(principal);
    if (it == roles_.end()) {
        return false;
    }
    return it->second.erase(role) > 0;
}

HttpResponse UnconfiguredTransport::send(const HttpRequest& request, std::chrono::milliseconds) {
    throw TransportError("no outbound transport configured for " + request.method + " request");
}

} // namespace collab
} // namespace core
} // namespace hostguard
