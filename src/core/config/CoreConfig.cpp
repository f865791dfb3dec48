#include "core/config/CoreConfig.hpp"
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hostguard {
namespace core {
namespace config {

namespace {

const std::set<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

template<typename T>
void read(const nlohmann::json& section, const std::string& path, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("CoreConfig: invalid value for " + path + "." + key + ": " + e.what());
    }
}

template<typename Duration>
void readDuration(const nlohmann::json& section, const std::string& path, const char* key, Duration& target) {
    if (!section.contains(key)) {
        return;
    }
    uint64_t count = 0;
    read(section, path, key, count);
    if (count > static_cast<uint64_t>(std::numeric_limits<typename Duration::rep>::max())) {
        throw std::runtime_error("CoreConfig: " + path + "." + key + " is out of range");
    }
    target = Duration(static_cast<typename Duration::rep>(count));
}

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name)) {
        return empty;
    }
    const nlohmann::json& value = j.at(name);
    if (!value.is_object()) {
        throw std::runtime_error(std::string("CoreConfig: section '") + name + "' must be an object");
    }
    return value;
}

ratelimit::BucketConfig readBucket(const nlohmann::json& j, const std::string& path,
                                   const ratelimit::BucketConfig& base) {
    if (!j.is_object()) {
        throw std::runtime_error("CoreConfig: " + path + " must be an object");
    }
    ratelimit::BucketConfig bucket = base;
    read(j, path, "capacity", bucket.capacity);
    read(j, path, "refillPerSecond", bucket.refillPerSecond);
    read(j, path, "enabled", bucket.enabled);
    return bucket;
}

} // namespace

bool CoreConfig::validate() const {
    return kLogLevels.count(logLevel) > 0 && validator.validate() && rateLimits.validate() &&
           auditor.validate() && threat.validate() && operations.validate() && bridge.validate() &&
           secrets.validate();
}

CoreConfig CoreConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("CoreConfig: root must be an object");
    }
    CoreConfig config;
    read(j, "", "logLevel", config.logLevel);

    const nlohmann::json& v = section(j, "validator");
    read(v, "validator", "maxUriLength", config.validator.maxUriLength);
    read(v, "validator", "maxScriptSize", config.validator.maxScriptSize);
    read(v, "validator", "maxAssetSize", config.validator.maxAssetSize);
    read(v, "validator", "maxHeaderNameLength", config.validator.maxHeaderNameLength);
    read(v, "validator", "maxHeaderValueLength", config.validator.maxHeaderValueLength);
    read(v, "validator", "maxUrlLength", config.validator.maxUrlLength);
    read(v, "validator", "maxGraphQLSchemaSize", config.validator.maxGraphQLSchemaSize);
    read(v, "validator", "maxStreamNameLength", config.validator.maxStreamNameLength);
    read(v, "validator", "maxConfigValueLength", config.validator.maxConfigValueLength);
    read(v, "validator", "maxTableNameLength", config.validator.maxTableNameLength);
    read(v, "validator", "maxTableSchemaSize", config.validator.maxTableSchemaSize);
    read(v, "validator", "maxFormFieldLength", config.validator.maxFormFieldLength);
    read(v, "validator", "allowPrivateNetworks", config.validator.allowPrivateNetworks);

    // Классы, не указанные в файле, сохраняют значения по умолчанию
    const nlohmann::json& limits = section(j, "rateLimits");
    for (auto it = limits.begin(); it != limits.end(); ++it) {
        const std::string path = "rateLimits." + it.key();
        if (it.key() == "default") {
            config.rateLimits.defaultBucket = readBucket(it.value(), path, config.rateLimits.defaultBucket);
        } else {
            config.rateLimits.classes[it.key()] =
                readBucket(it.value(), path, config.rateLimits.forClass(it.key()));
        }
    }

    const nlohmann::json& a = section(j, "auditor");
    read(a, "auditor", "bufferCapacity", config.auditor.bufferCapacity);
    read(a, "auditor", "queueCapacity", config.auditor.queueCapacity);
    read(a, "auditor", "enableFileSink", config.auditor.enableFileSink);
    read(a, "auditor", "logPath", config.auditor.logPath);
    read(a, "auditor", "maxLogSize", config.auditor.maxLogSize);
    read(a, "auditor", "maxLogFiles", config.auditor.maxLogFiles);

    const nlohmann::json& t = section(j, "threat");
    read(t, "threat", "maxAuthFailures", config.threat.maxAuthFailures);
    readDuration(t, "threat", "authFailureWindowMinutes", config.threat.authFailureWindow);
    read(t, "threat", "maxCapabilityDenials", config.threat.maxCapabilityDenials);
    readDuration(t, "threat", "capabilityDenialWindowMinutes", config.threat.capabilityDenialWindow);
    read(t, "threat", "maxRateLimitViolations", config.threat.maxRateLimitViolations);
    readDuration(t, "threat", "rateLimitWindowMinutes", config.threat.rateLimitWindow);
    read(t, "threat", "maxValidationRejections", config.threat.maxValidationRejections);
    readDuration(t, "threat", "validationWindowMinutes", config.threat.validationWindow);
    read(t, "threat", "maxGeoDistanceKm", config.threat.maxGeoDistanceKm);
    readDuration(t, "threat", "geoWindowHours", config.threat.geoWindow);

    const nlohmann::json& o = section(j, "operations");
    readDuration(o, "operations", "delegateTimeoutMs", config.operations.delegateTimeout);
    readDuration(o, "operations", "fetchTimeoutMs", config.operations.fetchTimeout);
    const nlohmann::json& threads = section(o, "threads");
    read(threads, "operations.threads", "min", config.operations.threads.minThreads);
    read(threads, "operations.threads", "max", config.operations.threads.maxThreads);
    read(threads, "operations.threads", "queue", config.operations.threads.queueSize);

    readDuration(section(j, "bridge"), "bridge", "callTimeoutMs", config.bridge.callTimeout);
    readDuration(section(j, "bridge"), "bridge", "maxFetchTimeoutMs", config.bridge.maxFetchTimeout);

    const nlohmann::json& s = section(j, "secrets");
    read(s, "secrets", "file", config.secrets.file);
    read(s, "secrets", "loadEnvironment", config.secrets.loadEnvironment);

    return config;
}

CoreConfig CoreConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("CoreConfig: cannot open " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("CoreConfig: " + path + " is not valid JSON: " + e.what());
    }
    CoreConfig config = fromJson(j);
    if (!config.validate()) {
        throw std::runtime_error("CoreConfig: " + path + " failed validation");
    }
    spdlog::info("CoreConfig: loaded {}", path);
    return config;
}

} // namespace config
} // namespace core
} // namespace hostguard
