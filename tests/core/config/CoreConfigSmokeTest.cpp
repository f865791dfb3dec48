#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/CoreConfig.hpp"

using hostguard::core::config::CoreConfig;

void testDefaults() {
    std::cout << "Testing default configuration...\n";
    const CoreConfig config;
    assert(config.validate());
    assert(config.logLevel == "info");
    assert(config.rateLimits.forClass("fetch").capacity == 60.0);
    assert(config.rateLimits.forClass("unknown.class").capacity == 100.0);
    assert(config.operations.delegateTimeout == std::chrono::milliseconds(30000));
    assert(config.bridge.callTimeout == std::chrono::milliseconds(30000));
    assert(config.bridge.maxFetchTimeout == std::chrono::milliseconds(300000));
    assert(!config.auditor.enableFileSink);
    std::cout << "[OK] Defaults test\n";
}

void testFromJson() {
    std::cout << "Testing configuration from JSON...\n";
    const nlohmann::json j = {
        {"logLevel", "debug"},
        {"validator", {{"maxUriLength", 120}, {"allowPrivateNetworks", true}}},
        {"rateLimits", {
            {"default", {{"capacity", 10}, {"refillPerSecond", 2}}},
            {"fetch", {{"refillPerSecond", 0.5}}},
            {"stream.send", {{"enabled", false}}}
        }},
        {"auditor", {{"bufferCapacity", 500}}},
        {"threat", {{"maxAuthFailures", 3}, {"authFailureWindowMinutes", 5}, {"geoWindowHours", 2}}},
        {"operations", {{"delegateTimeoutMs", 1500}, {"threads", {{"min", 1}, {"max", 2}, {"queue", 16}}}}},
        {"bridge", {{"callTimeoutMs", 2500}, {"maxFetchTimeoutMs", 60000}}},
        {"secrets", {{"loadEnvironment", false}}}
    };
    const CoreConfig config = CoreConfig::fromJson(j);
    assert(config.validate());
    assert(config.logLevel == "debug");
    assert(config.validator.maxUriLength == 120);
    assert(config.validator.allowPrivateNetworks);
    assert(config.rateLimits.defaultBucket.capacity == 10.0);
    // Частичный класс начинается с собственных значений по умолчанию
    assert(config.rateLimits.forClass("fetch").capacity == 60.0);
    assert(config.rateLimits.forClass("fetch").refillPerSecond == 0.5);
    assert(!config.rateLimits.forClass("stream.send").enabled);
    assert(config.rateLimits.forClass("script.read").capacity == 200.0);
    assert(config.auditor.bufferCapacity == 500);
    assert(config.auditor.queueCapacity == 4096);
    assert(config.threat.maxAuthFailures == 3);
    assert(config.threat.authFailureWindow == std::chrono::minutes(5));
    assert(config.threat.geoWindow == std::chrono::hours(2));
    assert(config.operations.delegateTimeout == std::chrono::milliseconds(1500));
    assert(config.operations.fetchTimeout == std::chrono::milliseconds(30000));
    assert(config.operations.threads.maxThreads == 2);
    assert(config.bridge.callTimeout == std::chrono::milliseconds(2500));
    assert(config.bridge.maxFetchTimeout == std::chrono::milliseconds(60000));
    assert(!config.secrets.loadEnvironment);
    std::cout << "[OK] JSON configuration test\n";
}

void testInvalidJson() {
    std::cout << "Testing invalid configuration values...\n";
    auto rejects = [](const nlohmann::json& j) {
        try {
            CoreConfig::fromJson(j);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    assert(rejects(nlohmann::json::array()));
    assert(rejects({{"validator", "strict"}}));
    assert(rejects({{"auditor", {{"bufferCapacity", "many"}}}}));
    assert(rejects({{"rateLimits", {{"fetch", 5}}}}));
    // Значение за пределами представления длительности
    assert(rejects({{"operations", {{"delegateTimeoutMs", 18446744073709551615ULL}}}}));

    CoreConfig config = CoreConfig::fromJson({{"logLevel", "verbose"}});
    assert(!config.validate());
    config = CoreConfig::fromJson({{"operations", {{"threads", {{"min", 4}, {"max", 2}}}}}});
    assert(!config.validate());
    config = CoreConfig::fromJson({{"bridge", {{"maxFetchTimeoutMs", 0}}}});
    assert(!config.validate());
    std::cout << "[OK] Invalid configuration test\n";
}

void testLoadFromFile() {
    std::cout << "Testing configuration file loading...\n";
    const auto path = std::filesystem::temp_directory_path() / "hostguard_config_smoke.json";
    {
        std::ofstream out(path);
        out << R"({"logLevel": "warn", "bridge": {"callTimeoutMs": 1000}})";
    }
    const CoreConfig config = CoreConfig::loadFromFile(path.string());
    assert(config.logLevel == "warn");
    assert(config.bridge.callTimeout == std::chrono::milliseconds(1000));

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool thrown = false;
    try {
        CoreConfig::loadFromFile(path.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    {
        std::ofstream out(path);
        out << R"({"auditor": {"bufferCapacity": 0}})";
    }
    thrown = false;
    try {
        CoreConfig::loadFromFile(path.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::filesystem::remove(path);

    thrown = false;
    try {
        CoreConfig::loadFromFile(path.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] File loading test\n";
}

int main() {
    try {
        testDefaults();
        testFromJson();
        testInvalidJson();
        testLoadFromFile();
        std::cout << "All CoreConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CoreConfig test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
