#include "core/audit/SecurityEvent.hpp"
#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/rand.h>

namespace hostguard {
namespace core {
namespace audit {

namespace {

const std::array<std::pair<EventKind, const char*>, 16> kKindNames = {{
    {EventKind::AuthAttempt, "AuthAttempt"},
    {EventKind::AuthSuccess, "AuthSuccess"},
    {EventKind::AuthFailure, "AuthFailure"},
    {EventKind::CapabilityDenied, "CapabilityDenied"},
    {EventKind::ValidationRejected, "ValidationRejected"},
    {EventKind::DangerousPatternDetected, "DangerousPatternDetected"},
    {EventKind::RateLimitExceeded, "RateLimitExceeded"},
    {EventKind::SecretAccessed, "SecretAccessed"},
    {EventKind::SecretNotFound, "SecretNotFound"},
    {EventKind::OperationSucceeded, "OperationSucceeded"},
    {EventKind::UpstreamFailure, "UpstreamFailure"},
    {EventKind::Timeout, "Timeout"},
    {EventKind::InternalLockRecovered, "InternalLockRecovered"},
    {EventKind::SuspiciousActivity, "SuspiciousActivity"},
    {EventKind::ThreatDetected, "ThreatDetected"},
    {EventKind::AdministrativeAction, "AdministrativeAction"},
}};

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

} // namespace

std::string eventKindToString(EventKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.first == kind) {
            return entry.second;
        }
    }
    return "Unknown";
}

std::optional<EventKind> eventKindFromString(const std::string& name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "Low";
        case Severity::Medium: return "Medium";
        case Severity::High: return "High";
        case Severity::Critical: return "Critical";
    }
    return "Low";
}

std::string outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::None: return "None";
        case Outcome::Success: return "Success";
        case Outcome::Failure: return "Failure";
    }
    return "None";
}

Severity defaultSeverity(EventKind kind) {
    switch (kind) {
        case EventKind::AuthAttempt:
        case EventKind::AuthSuccess:
        case EventKind::SecretAccessed:
        case EventKind::OperationSucceeded:
            return Severity::Low;
        case EventKind::AuthFailure:
        case EventKind::ValidationRejected:
        case EventKind::RateLimitExceeded:
        case EventKind::SecretNotFound:
        case EventKind::UpstreamFailure:
        case EventKind::Timeout:
        case EventKind::AdministrativeAction:
            return Severity::Medium;
        case EventKind::CapabilityDenied:
        case EventKind::DangerousPatternDetected:
        case EventKind::InternalLockRecovered:
        case EventKind::SuspiciousActivity:
        case EventKind::ThreatDetected:
            return Severity::High;
    }
    return Severity::Low;
}

nlohmann::json SecurityEvent::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["timestamp"] = formatTimestamp(timestamp);
    j["kind"] = eventKindToString(kind);
    j["severity"] = severityToString(severity);
    j["outcome"] = outcomeToString(outcome);
    j["principal"] = principalId ? nlohmann::json(*principalId) : nlohmann::json(nullptr);
    j["clientIp"] = clientIp;
    j["resource"] = resource;
    j["action"] = action;
    j["details"] = details;
    j["message"] = message;
    return j;
}

std::string SecurityEvent::detail(const std::string& key, const std::string& fallback) const {
    auto it = details.find(key);
    return it != details.end() ? it->second : fallback;
}

nlohmann::json AuditRecord::toJson() const {
    nlohmann::json j = event ? event->toJson() : nlohmann::json::object();
    j["sequence"] = sequence;
    j["chainDigest"] = chainDigest;
    return j;
}

std::string generateEventId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("generateEventId: RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40); // версия 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80); // вариант RFC 4122
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

EventBuilder::EventBuilder(EventKind kind) {
    event_.kind = kind;
    event_.severity = defaultSeverity(kind);
}

EventBuilder& EventBuilder::severity(Severity value) { event_.severity = value; return *this; }
EventBuilder& EventBuilder::outcome(Outcome value) { event_.outcome = value; return *this; }
EventBuilder& EventBuilder::principal(const std::optional<std::string>& value) { event_.principalId = value; return *this; }
EventBuilder& EventBuilder::clientIp(const std::string& value) { event_.clientIp = value; return *this; }
EventBuilder& EventBuilder::resource(const std::string& value) { event_.resource = value; return *this; }
EventBuilder& EventBuilder::action(const std::string& value) { event_.action = value; return *this; }
EventBuilder& EventBuilder::message(const std::string& value) { event_.message = value; return *this; }

EventBuilder& EventBuilder::detail(const std::string& key, const std::string& value) {
    event_.details[key] = value;
    return *this;
}

SecurityEvent EventBuilder::build() const {
    SecurityEvent event = event_;
    event.id = generateEventId();
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

} // namespace audit
} // namespace core
} // namespace hostguard
