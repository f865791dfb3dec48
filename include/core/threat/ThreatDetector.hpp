#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/audit/SecurityEvent.hpp"

namespace hostguard {
namespace core {
namespace audit {
class SecurityAuditor;
}
namespace threat {

// Пороги и окна обнаружения
struct ThreatConfig {
    size_t maxAuthFailures = 5;
    std::chrono::minutes authFailureWindow{15};
    size_t maxCapabilityDenials = 10;
    std::chrono::minutes capabilityDenialWindow{30};
    size_t maxRateLimitViolations = 20;
    std::chrono::minutes rateLimitWindow{5};
    size_t maxValidationRejections = 5;
    std::chrono::minutes validationWindow{10};
    double maxGeoDistanceKm = 1000.0;
    std::chrono::hours geoWindow{24};

    bool validate() const {
        return maxAuthFailures > 0 && maxCapabilityDenials > 0 && maxRateLimitViolations > 0 &&
               maxValidationRejections > 0 && maxGeoDistanceKm > 0.0 &&
               authFailureWindow.count() > 0 && capabilityDenialWindow.count() > 0 &&
               rateLimitWindow.count() > 0 && validationWindow.count() > 0 && geoWindow.count() > 0;
    }
};

enum class ThreatLevel { Low, Medium, High, Critical };

std::string threatLevelToString(ThreatLevel level);
ThreatLevel threatLevelForScore(double confidence); // >=90 Critical, >=70 High, >=40 Medium

struct ThreatIndicator {
    std::string type;
    double severity = 0.0;
    std::string description;
    std::vector<std::string> evidence;
};

struct ThreatAssessment {
    ThreatLevel level = ThreatLevel::Low;
    double confidence = 0.0;
    std::vector<ThreatIndicator> indicators;
    std::vector<std::string> recommendedActions;

    nlohmann::json toJson() const;
};

struct ThreatStatistics {
    size_t monitoredSubjects = 0;
    size_t authFailures = 0;       // В текущих окнах
    size_t capabilityDenials = 0;
    size_t rateLimitViolations = 0;
    size_t validationRejections = 0;
    size_t threatsDetected = 0;    // За всё время

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"monitoredSubjects", monitoredSubjects},
            {"authFailures", authFailures},
            {"capabilityDenials", capabilityDenials},
            {"rateLimitViolations", rateLimitViolations},
            {"validationRejections", validationRejections},
            {"threatsDetected", threatsDetected}
        };
    }
};

// ThreatDetector — подписчик потока событий аудита. Ведёт скользящие окна по
// субъекту (principal или IP) и при превышении порога пишет ThreatDetected обратно
// в аудитор, после чего окно очищается. Свои ThreatDetected игнорирует.
class ThreatDetector : public std::enable_shared_from_this<ThreatDetector> {
public:
    explicit ThreatDetector(const ThreatConfig& config = ThreatConfig{});
    ~ThreatDetector();
    ThreatDetector(const ThreatDetector&) = delete;
    ThreatDetector& operator=(const ThreatDetector&) = delete;

    // Подписка на аудитор; ссылки слабые с обеих сторон
    void attach(const std::shared_ptr<audit::SecurityAuditor>& auditor);

    // Учесть событие; возвращает сформированные ThreatDetected (уже отправленные в аудитор, если он есть)
    std::vector<audit::SecurityEvent> onEvent(const audit::SecurityEvent& event);

    ThreatAssessment assess(const audit::SecurityEvent& event) const;
    ThreatStatistics statistics() const;
    size_t cleanup(std::chrono::system_clock::time_point now); // Удаляет устаревшие записи, возвращает число субъектов удалённых
    ThreatConfig getConfiguration() const;

    static std::string subjectOf(const audit::SecurityEvent& event);
    static double distanceKm(double lat1, double lon1, double lat2, double lon2);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace threat
} // namespace core
} // namespace hostguard
