#pragma once
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include "core/collab/Collaborators.hpp"

namespace hostguard {
namespace core {
namespace collab {

// Реализации коллабораторов в памяти: для хост-процесса без БД и для тестов

class InMemoryRepository : public ResourceRepository {
public:
    bool upsert(const Resource& resource) override;
    bool get(const std::string& key, Resource& out) const override;
    bool remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix) const override;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Resource> resources_;
};

class InMemoryRegistry : public Registry {
public:
    bool registerEntry(const RegistrationRequest& request) override; // Повторная регистрация заменяет запись
    std::vector<RegistrationRequest> entries() const;
    bool contains(RegistrationKind kind, const std::string& name) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<RegistrationKind, std::string>, RegistrationRequest> entries_;
};

using StreamSubscriber = std::function<void(const std::string& message)>;

class InMemoryStreamBroadcaster : public StreamBroadcaster {
public:
    size_t subscribe(const std::string& path, StreamSubscriber subscriber); // id подписки
    bool unsubscribe(size_t id);
    size_t broadcast(const std::string& path, const std::string& message) override;

private:
    struct Subscription {
        std::string path;
        StreamSubscriber callback;
    };
    mutable std::shared_mutex mutex_;
    std::map<size_t, Subscription> subscribers_;
    size_t nextId_ = 1;
};

class InMemoryUserRepository : public UserRepository {
public:
    identity::RoleSet rolesOf(const std::string& principal) const override;
    bool addRole(const std::string& principal, identity::Role role) override;
    bool removeRole(const std::string& principal, identity::Role role) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, identity::RoleSet> roles_;
};

// Транспорт по умолчанию: исходящие запросы не настроены
class UnconfiguredTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) override;
};

} // namespace collab
} // namespace core
} // namespace hostguard
