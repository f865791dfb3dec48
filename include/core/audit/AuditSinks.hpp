#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/audit/SecurityEvent.hpp"

namespace hostguard {
namespace core {
namespace audit {

// Получатель записей журнала. Вызывается только из потока-диспетчера аудитора.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void write(const AuditRecord& record) = 0;
    virtual void flush() {}
    virtual std::string name() const = 0;
};

// NDJSON в ротируемый файл (spdlog rotating_file_sink_mt, шаблон "%v")
class LogAuditSink : public AuditSink {
public:
    LogAuditSink(const std::string& logPath, size_t maxSize, size_t maxFiles);
    void write(const AuditRecord& record) override;
    void flush() override;
    std::string name() const override { return "log"; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

using AlertCallback = std::function<void(const AuditRecord&)>;

// Оповещение о событиях не ниже заданной важности (по умолчанию Critical)
class AlertSink : public AuditSink {
public:
    explicit AlertSink(Severity threshold = Severity::Critical, AlertCallback callback = nullptr);
    void write(const AuditRecord& record) override;
    std::string name() const override { return "alert"; }
    size_t alertCount() const { return alerts_.load(); }

private:
    Severity threshold_;
    AlertCallback callback_;
    std::atomic<size_t> alerts_{0};
};

} // namespace audit
} // namespace core
} // namespace hostguard
