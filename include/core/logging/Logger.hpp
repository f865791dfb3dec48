#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace hostguard {
namespace core {
namespace logging {

// Именованный логгер компонента; создаётся при первом обращении (stdout, цвет)
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Уровень для всех логгеров компонентов
void setLevel(spdlog::level::level_enum level);

// Общий формат строк лога
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v";

} // namespace logging
} // namespace core
} // namespace hostguard
