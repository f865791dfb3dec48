#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/audit/SecurityAuditor.hpp"
#include "core/config/CoreConfig.hpp"
#include "core/logging/Logger.hpp"
#include "core/security/SecurityManager.hpp"

using namespace hostguard::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::shared_ptr<security::SecurityManager> g_securityManager;

// Signal handler for graceful shutdown
void signalHandler(int) {
    g_running = false;
}

// Initialize logging system
void initializeLogging(const std::string& level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("hostguard_service", console_sink);
        spdlog::set_default_logger(logger);
        logging::setLevel(spdlog::level::from_str(level));

        spdlog::info("=== HostGuard Security Core Starting ===");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

config::CoreConfig loadConfiguration(int argc, char* argv[]) {
    if (argc < 2) {
        return config::CoreConfig{};
    }
    return config::CoreConfig::loadFromFile(argv[1]);
}

// Initialize core components
void initializeComponents(const config::CoreConfig& config) {
    spdlog::info("[init] SecurityManager");
    g_securityManager = std::make_shared<security::SecurityManager>(config);
    g_securityManager->setAlertCallback([](const audit::AuditRecord& record) {
        spdlog::critical("[alert] {} #{}: {}", audit::eventKindToString(record.event->kind), record.sequence,
                         record.event->message);
    });
    if (!g_securityManager->initialize()) {
        throw std::runtime_error("Failed to initialize security manager");
    }
    spdlog::info("[init] SecurityManager initialized");
}

// Main service loop
void runServiceLoop() {
    spdlog::info("Starting service loop...");
    auto lastMaintenance = std::chrono::steady_clock::now();
    auto lastMetrics = lastMaintenance;
    while (g_running) {
        try {
            const auto now = std::chrono::steady_clock::now();
            if (now - lastMaintenance > std::chrono::seconds(30)) {
                g_securityManager->runMaintenance();
                lastMaintenance = now;
            }
            if (now - lastMetrics > std::chrono::seconds(60)) {
                spdlog::info("[loop] metrics: {}", g_securityManager->getMetrics().dump());
                lastMetrics = now;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    spdlog::info("Service loop stopped");
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");
    try {
        if (g_securityManager) {
            auto auditor = g_securityManager->getAuditor();
            g_securityManager->shutdown();
            if (auditor && !auditor->verifyChain()) {
                spdlog::error("Audit chain verification failed at shutdown");
            }
        }
        spdlog::info("All components shut down successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const config::CoreConfig config = loadConfiguration(argc, argv);
        initializeLogging(config.logLevel);
        initializeComponents(config);
        runServiceLoop();
        shutdown();

        spdlog::info("=== HostGuard Security Core Shutdown Complete ===");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get("hostguard_service")) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
