#include "core/threat/ThreatDetector.hpp"
#include "core/audit/SecurityAuditor.hpp"
#include "core/logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace hostguard {
namespace core {
namespace threat {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

struct GeoFix {
    TimePoint at;
    double lat = 0.0;
    double lon = 0.0;
};

struct SubjectState {
    std::deque<TimePoint> authFailures;
    std::deque<TimePoint> capabilityDenials;
    std::deque<TimePoint> rateLimitViolations;
    std::deque<TimePoint> validationRejections;
    std::optional<GeoFix> lastGeo;

    bool empty() const {
        return authFailures.empty() && capabilityDenials.empty() && rateLimitViolations.empty() &&
               validationRejections.empty() && !lastGeo;
    }
};

template<typename Duration>
void expire(std::deque<TimePoint>& window, TimePoint now, Duration length) {
    while (!window.empty() && window.front() + length < now) {
        window.pop_front();
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

bool readGeo(const audit::SecurityEvent& event, double& lat, double& lon) {
    return parseDouble(event.detail("geo.lat"), lat) && parseDouble(event.detail("geo.lon"), lon) &&
           lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

std::vector<std::string> recommendedActionsFor(ThreatLevel level, const std::vector<ThreatIndicator>& indicators) {
    std::vector<std::string> actions;
    switch (level) {
        case ThreatLevel::Critical:
            actions = {"IMMEDIATE ACTION: Block IP address", "Alert security team immediately",
                       "Review all recent activity from this source", "Consider temporary account lockdown"};
            break;
        case ThreatLevel::High:
            actions = {"Increase monitoring for this IP/user", "Apply additional authentication requirements",
                       "Review recent activity patterns"};
            break;
        case ThreatLevel::Medium:
            actions = {"Continue monitoring", "Log detailed activity for analysis"};
            break;
        case ThreatLevel::Low:
            actions = {"Standard monitoring sufficient"};
            break;
    }
    for (const auto& indicator : indicators) {
        std::string extra;
        if (indicator.type == "brute_force_authentication") {
            extra = "Implement progressive delays for authentication";
        } else if (indicator.type == "sql_injection_attempt") {
            extra = "Review and validate all database queries";
        } else if (indicator.type == "xss_attempt") {
            extra = "Verify input sanitization and output encoding";
        } else if (indicator.type == "geographic_anomaly") {
            extra = "Verify the session with the account owner";
        }
        if (!extra.empty() && std::find(actions.begin(), actions.end(), extra) == actions.end()) {
            actions.push_back(extra);
        }
    }
    return actions;
}

} // namespace

std::string threatLevelToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::Low: return "Low";
        case ThreatLevel::Medium: return "Medium";
        case ThreatLevel::High: return "High";
        case ThreatLevel::Critical: return "Critical";
    }
    return "Low";
}

ThreatLevel threatLevelForScore(double confidence) {
    if (confidence >= 90.0) return ThreatLevel::Critical;
    if (confidence >= 70.0) return ThreatLevel::High;
    if (confidence >= 40.0) return ThreatLevel::Medium;
    return ThreatLevel::Low;
}

nlohmann::json ThreatAssessment::toJson() const {
    nlohmann::json j;
    j["level"] = threatLevelToString(level);
    j["confidence"] = confidence;
    j["recommendedActions"] = recommendedActions;
    j["indicators"] = nlohmann::json::array();
    for (const auto& indicator : indicators) {
        j["indicators"].push_back({
            {"type", indicator.type},
            {"severity", indicator.severity},
            {"description", indicator.description},
            {"evidence", indicator.evidence}
        });
    }
    return j;
}

struct ThreatDetector::Impl {
    ThreatConfig config;
    mutable std::mutex mutex;
    std::map<std::string, SubjectState> subjects;
    size_t threatsDetected = 0;
    std::weak_ptr<audit::SecurityAuditor> auditor;
    std::shared_ptr<spdlog::logger> logger = logging::getLogger("threat");

    explicit Impl(const ThreatConfig& cfg) : config(cfg) {}

    audit::SecurityEvent threatEvent(const audit::SecurityEvent& source, const std::string& subject,
                                     const std::string& indicator, size_t count, const std::string& window,
                                     audit::Severity severity, const std::string& message) const {
        return audit::EventBuilder(audit::EventKind::ThreatDetected)
            .severity(severity)
            .principal(source.principalId)
            .clientIp(source.clientIp)
            .resource(source.resource)
            .action("threat")
            .detail("indicator", indicator)
            .detail("subject", subject)
            .detail("count", std::to_string(count))
            .detail("window", window)
            .detail("trigger", source.id)
            .message(message)
            .build();
    }

    // Добавить отметку в окно; true при достижении порога (окно очищается)
    template<typename Duration>
    static bool record(std::deque<TimePoint>& window, TimePoint at, Duration length, size_t threshold, size_t& count) {
        expire(window, at, length);
        window.push_back(at);
        count = window.size();
        if (count >= threshold) {
            window.clear();
            return true;
        }
        return false;
    }
};

ThreatDetector::ThreatDetector(const ThreatConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreatDetector: invalid configuration");
    }
}

ThreatDetector::~ThreatDetector() = default;

void ThreatDetector::attach(const std::shared_ptr<audit::SecurityAuditor>& auditor) {
    if (!auditor) {
        throw std::invalid_argument("ThreatDetector::attach: null auditor");
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->auditor = auditor;
    }
    std::weak_ptr<ThreatDetector> weakSelf = shared_from_this();
    auditor->subscribe([weakSelf](const audit::AuditRecord& record) {
        if (auto self = weakSelf.lock()) {
            if (record.event) {
                self->onEvent(*record.event);
            }
        }
    });
}

std::string ThreatDetector::subjectOf(const audit::SecurityEvent& event) {
    if (event.principalId) {
        return "user:" + *event.principalId;
    }
    const std::string subject = event.detail("subject");
    if (!subject.empty()) {
        return subject;
    }
    return "ip:" + (event.clientIp.empty() ? std::string("unknown") : event.clientIp);
}

double ThreatDetector::distanceKm(double lat1, double lon1, double lat2, double lon2) {
    constexpr double kEarthRadiusKm = 6371.0;
    constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
    const double dLat = (lat2 - lat1) * kDegToRad;
    const double dLon = (lon2 - lon1) * kDegToRad;
    const double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
                     std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) *
                     std::sin(dLon / 2) * std::sin(dLon / 2);
    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

std::vector<audit::SecurityEvent> ThreatDetector::onEvent(const audit::SecurityEvent& event) {
    std::vector<audit::SecurityEvent> emitted;
    if (event.kind == audit::EventKind::ThreatDetected) {
        return emitted;
    }
    double lat = 0.0;
    double lon = 0.0;
    const bool hasGeo = readGeo(event, lat, lon);
    const bool counted = event.kind == audit::EventKind::AuthFailure ||
                         event.kind == audit::EventKind::CapabilityDenied ||
                         event.kind == audit::EventKind::RateLimitExceeded ||
                         event.kind == audit::EventKind::ValidationRejected ||
                         event.kind == audit::EventKind::DangerousPatternDetected;
    if (!counted && !hasGeo) {
        return emitted;
    }
    const std::string subject = subjectOf(event);
    const TimePoint at = event.timestamp;
    std::shared_ptr<audit::SecurityAuditor> auditor;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const ThreatConfig& cfg = pImpl->config;
        SubjectState& state = pImpl->subjects[subject];
        size_t count = 0;

        switch (event.kind) {
            case audit::EventKind::AuthFailure:
                if (Impl::record(state.authFailures, at, cfg.authFailureWindow, cfg.maxAuthFailures, count)) {
                    emitted.push_back(pImpl->threatEvent(event, subject, "brute_force_authentication", count,
                        std::to_string(cfg.authFailureWindow.count()) + "m", audit::Severity::High,
                        "Potential brute force attack: " + std::to_string(count) + " failed authentication attempts"));
                }
                break;
            case audit::EventKind::CapabilityDenied:
                if (Impl::record(state.capabilityDenials, at, cfg.capabilityDenialWindow, cfg.maxCapabilityDenials, count)) {
                    emitted.push_back(pImpl->threatEvent(event, subject, "privilege_escalation_attempt", count,
                        std::to_string(cfg.capabilityDenialWindow.count()) + "m", audit::Severity::High,
                        "Potential privilege escalation: " + std::to_string(count) + " capability denials"));
                }
                break;
            case audit::EventKind::RateLimitExceeded:
                if (Impl::record(state.rateLimitViolations, at, cfg.rateLimitWindow, cfg.maxRateLimitViolations, count)) {
                    emitted.push_back(pImpl->threatEvent(event, subject, "rapid_request_pattern", count,
                        std::to_string(cfg.rateLimitWindow.count()) + "m", audit::Severity::High,
                        "Sustained rate limit violations: " + std::to_string(count)));
                }
                break;
            case audit::EventKind::ValidationRejected:
            case audit::EventKind::DangerousPatternDetected:
                if (Impl::record(state.validationRejections, at, cfg.validationWindow, cfg.maxValidationRejections, count)) {
                    emitted.push_back(pImpl->threatEvent(event, subject, "injection_attempt", count,
                        std::to_string(cfg.validationWindow.count()) + "m", audit::Severity::High,
                        "Repeated rejected input: " + std::to_string(count) + " validation failures"));
                }
                break;
            default:
                break;
        }

        if (hasGeo) {
            if (state.lastGeo && at - state.lastGeo->at <= cfg.geoWindow) {
                const double km = distanceKm(state.lastGeo->lat, state.lastGeo->lon, lat, lon);
                if (km > cfg.maxGeoDistanceKm) {
                    expire(state.authFailures, at, cfg.authFailureWindow);
                    const bool withAuthFailures = !state.authFailures.empty() ||
                                                  event.kind == audit::EventKind::AuthFailure;
                    audit::SecurityEvent geo = pImpl->threatEvent(event, subject, "geographic_anomaly", 1,
                        std::to_string(cfg.geoWindow.count()) + "h",
                        withAuthFailures ? audit::Severity::Critical : audit::Severity::High,
                        "Access from a location " + std::to_string(static_cast<long>(km)) +
                        " km away from the previous one");
                    geo.details["distanceKm"] = std::to_string(static_cast<long>(km));
                    emitted.push_back(std::move(geo));
                }
            }
            state.lastGeo = GeoFix{at, lat, lon};
        }

        pImpl->threatsDetected += emitted.size();
        auditor = pImpl->auditor.lock();
    }

    for (const auto& threat : emitted) {
        pImpl->logger->warn("Threat detected for {}: {} ({})", subject, threat.detail("indicator"), threat.message);
        if (auditor) {
            auditor->log(threat);
        }
    }
    return emitted;
}

ThreatAssessment ThreatDetector::assess(const audit::SecurityEvent& event) const {
    std::vector<ThreatIndicator> indicators;
    const std::string subject = subjectOf(event);
    const ThreatConfig& cfg = pImpl->config;

    size_t authFailures = 0;
    size_t denials = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->subjects.find(subject);
        if (it != pImpl->subjects.end()) {
            authFailures = it->second.authFailures.size();
            denials = it->second.capabilityDenials.size();
        }
    }

    switch (event.kind) {
        case audit::EventKind::AuthFailure:
            if (authFailures + 1 >= cfg.maxAuthFailures) {
                indicators.push_back({"brute_force_authentication", 80.0,
                    "Potential brute force attack: " + std::to_string(authFailures + 1) + " failed authentication attempts",
                    {"Subject: " + subject, "Failed attempts: " + std::to_string(authFailures + 1)}});
            }
            break;
        case audit::EventKind::CapabilityDenied:
            if (denials + 1 >= cfg.maxCapabilityDenials) {
                indicators.push_back({"privilege_escalation_attempt", 70.0,
                    "Potential privilege escalation: " + std::to_string(denials + 1) + " capability denials",
                    {"Subject: " + subject, "Denials: " + std::to_string(denials + 1)}});
            }
            break;
        case audit::EventKind::ValidationRejected:
        case audit::EventKind::DangerousPatternDetected: {
            std::string text = event.message;
            for (const auto& entry : event.details) {
                text += " " + entry.second;
            }
            const std::string lowered = toLower(text);
            auto has = [&lowered](const char* needle) { return lowered.find(needle) != std::string::npos; };
            if (has("sql") || has("union") || has("select") || has("drop")) {
                indicators.push_back({"sql_injection_attempt", 85.0, "Potential SQL injection attempt detected",
                                      {"Subject: " + subject}});
            }
            if (has("script") || has("xss") || has("javascript") || has("onerror")) {
                indicators.push_back({"xss_attempt", 75.0, "Potential XSS attempt detected",
                                      {"Subject: " + subject}});
            }
            if (has("..") || has("traversal") || has("directory")) {
                indicators.push_back({"path_traversal_attempt", 70.0, "Potential path traversal attempt detected",
                                      {"Resource: " + event.resource}});
            }
            break;
        }
        case audit::EventKind::SuspiciousActivity: {
            const std::time_t seconds = std::chrono::system_clock::to_time_t(event.timestamp);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            if (utc.tm_hour < 6 || utc.tm_hour > 22) {
                indicators.push_back({"unusual_time_access", 30.0,
                    "Access at unusual time: " + std::to_string(utc.tm_hour) + ":00", {"Subject: " + subject}});
            }
            const std::string userAgent = event.detail("userAgent");
            if (!userAgent.empty()) {
                const std::string lowered = toLower(userAgent);
                if (lowered.find("bot") != std::string::npos || lowered.find("crawler") != std::string::npos ||
                    lowered.find("scanner") != std::string::npos || userAgent.size() < 20) {
                    indicators.push_back({"suspicious_user_agent", 40.0, "Suspicious user agent detected",
                                          {"User agent: " + userAgent}});
                }
            }
            break;
        }
        default: {
            double requests = 0.0;
            if (parseDouble(event.detail("requestCount"), requests) && requests > 100.0) {
                indicators.push_back({"rapid_request_pattern", 60.0,
                    "High request volume detected: " + event.detail("requestCount") + " requests",
                    {"Subject: " + subject}});
            }
            break;
        }
    }

    ThreatAssessment assessment;
    double total = 0.0;
    for (const auto& indicator : indicators) {
        total += indicator.severity;
    }
    assessment.confidence = indicators.empty() ? 0.0 : total / static_cast<double>(indicators.size());
    assessment.level = threatLevelForScore(assessment.confidence);
    assessment.indicators = std::move(indicators);
    assessment.recommendedActions = recommendedActionsFor(assessment.level, assessment.indicators);
    return assessment;
}

ThreatStatistics ThreatDetector::statistics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreatStatistics stats;
    stats.monitoredSubjects = pImpl->subjects.size();
    for (const auto& entry : pImpl->subjects) {
        stats.authFailures += entry.second.authFailures.size();
        stats.capabilityDenials += entry.second.capabilityDenials.size();
        stats.rateLimitViolations += entry.second.rateLimitViolations.size();
        stats.validationRejections += entry.second.validationRejections.size();
    }
    stats.threatsDetected = pImpl->threatsDetected;
    return stats;
}

size_t ThreatDetector::cleanup(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const ThreatConfig& cfg = pImpl->config;
    size_t removed = 0;
    for (auto it = pImpl->subjects.begin(); it != pImpl->subjects.end();) {
        SubjectState& state = it->second;
        expire(state.authFailures, now, cfg.authFailureWindow);
        expire(state.capabilityDenials, now, cfg.capabilityDenialWindow);
        expire(state.rateLimitViolations, now, cfg.rateLimitWindow);
        expire(state.validationRejections, now, cfg.validationWindow);
        if (state.lastGeo && state.lastGeo->at + cfg.geoWindow < now) {
            state.lastGeo.reset();
        }
        if (state.empty()) {
            it = pImpl->subjects.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

ThreatConfig ThreatDetector::getConfiguration() const {
    return pImpl->config;
}

} // namespace threat
} // namespace core
} // namespace hostguard
