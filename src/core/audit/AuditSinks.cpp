#include "core/audit/AuditSinks.hpp"
#include "core/logging/Logger.hpp"
#include <atomic>
#include <filesystem>
#include <spdlog/sinks/rotating_file_sink.h>

namespace hostguard {
namespace core {
namespace audit {

namespace {
std::atomic<unsigned> g_sinkCounter{0};
}

LogAuditSink::LogAuditSink(const std::string& logPath, size_t maxSize, size_t maxFiles) {
    const std::filesystem::path path(logPath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, maxSize, maxFiles);
    fileSink->set_pattern("%v");
    // Уникальное имя, глобально не регистрируем
    logger_ = std::make_shared<spdlog::logger>("audit_file_" + std::to_string(g_sinkCounter++), fileSink);
    logger_->set_level(spdlog::level::info);
}

void LogAuditSink::write(const AuditRecord& record) {
    logger_->info(record.toJson().dump());
}

void LogAuditSink::flush() {
    logger_->flush();
}

AlertSink::AlertSink(Severity threshold, AlertCallback callback)
    : threshold_(threshold), callback_(std::move(callback)) {}

void AlertSink::write(const AuditRecord& record) {
    if (!record.event || record.event->severity < threshold_) {
        return;
    }
    ++alerts_;
    logging::getLogger("audit")->critical("ALERT [{}] {}: {} (principal={}, resource={})",
        severityToString(record.event->severity),
        eventKindToString(record.event->kind),
        record.event->message,
        record.event->principalId.value_or("anonymous"),
        record.event->resource);
    if (callback_) {
        callback_(record);
    }
}

} // namespace audit
} // namespace core
} // namespace hostguard
