#include "core/logging/Logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hostguard {
namespace core {
namespace logging {

namespace {
std::mutex g_loggerMutex;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    // Повторная проверка: другой поток мог зарегистрировать логгер
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern(kLogPattern);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(level);
    });
}

} // namespace logging
} // namespace core
} // namespace hostguard
