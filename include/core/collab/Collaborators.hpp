#pragma once
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "core/identity/Capability.hpp"

namespace hostguard {
namespace core {
namespace collab {

// Хранимый объект: скрипт, ассет или таблица
struct Resource {
    std::string key;
    std::string content;
    std::string contentType;
    std::vector<std::string> owners; // Первый записавший и добавленные им владельцы
    std::chrono::system_clock::time_point updatedAt;
    std::map<std::string, std::string> metadata;
};

// Хранилище ресурсов (скрипты, ассеты, таблицы; по экземпляру на вид)
class ResourceRepository {
public:
    virtual ~ResourceRepository() = default;
    virtual bool upsert(const Resource& resource) = 0;
    virtual bool get(const std::string& key, Resource& out) const = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual std::vector<std::string> list(const std::string& prefix) const = 0;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::string body;
    std::string originScript; // URI скрипта-инициатора (для ограничений секретов)
    std::string callSite;     // Точка вызова для аудита
};

struct HttpResponse {
    int status = 0;
    HeaderList headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Сбой транспорта: сеть, таймаут соединения, неверный ответ
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
};

enum class RegistrationKind {
    Route,
    StreamRoute,
    GraphQLQuery,
    GraphQLMutation,
    GraphQLSubscription,
    Tool,
};

std::string registrationKindToString(RegistrationKind kind);

struct RegistrationRequest {
    RegistrationKind kind = RegistrationKind::Route;
    std::string name;        // Путь маршрута / имя операции / имя инструмента
    std::string handler;     // Имя функции-обработчика в скрипте
    std::string method;      // HTTP-метод для маршрутов
    std::string description;
    std::string schema;      // SDL или JSON-схема
    std::string scriptUri;
    std::string owner;
};

// Реестр маршрутов, GraphQL-операций, инструментов и потоков
class Registry {
public:
    virtual ~Registry() = default;
    virtual bool registerEntry(const RegistrationRequest& request) = 0;
};

class StreamBroadcaster {
public:
    virtual ~StreamBroadcaster() = default;
    virtual size_t broadcast(const std::string& path, const std::string& message) = 0; // Число получателей
};

class UserRepository {
public:
    virtual ~UserRepository() = default;
    virtual identity::RoleSet rolesOf(const std::string& principal) const = 0;
    virtual bool addRole(const std::string& principal, identity::Role role) = 0;
    virtual bool removeRole(const std::string& principal, identity::Role role) = 0;
};

} // namespace collab
} // namespace core
} // namespace hostguard
