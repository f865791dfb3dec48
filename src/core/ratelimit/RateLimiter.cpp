#include "core/ratelimit/RateLimiter.hpp"
#include "core/audit/SecurityAuditor.hpp"
#include "core/logging/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace hostguard {
namespace core {
namespace ratelimit {

const BucketConfig& RateLimitConfig::forClass(const std::string& actionClass) const {
    auto it = classes.find(actionClass);
    return it != classes.end() ? it->second : defaultBucket;
}

bool RateLimitConfig::validate() const {
    if (!defaultBucket.validate()) return false;
    for (const auto& entry : classes) {
        if (entry.first.empty() || !entry.second.validate()) return false;
    }
    return true;
}

RateLimitConfig RateLimitConfig::defaults() {
    RateLimitConfig config;
    config.defaultBucket = {100.0, 10.0, true};
    // Запись и внешние запросы: как лимит по IP, чтение: как лимит пользователя
    config.classes["script.write"] = {60.0, 1.0, true};
    config.classes["asset.write"] = {60.0, 1.0, true};
    config.classes["table.write"] = {60.0, 1.0, true};
    config.classes["fetch"] = {60.0, 1.0, true};
    config.classes["admin"] = {60.0, 1.0, true};
    config.classes["script.read"] = {200.0, 5.0, true};
    config.classes["asset.read"] = {200.0, 5.0, true};
    config.classes["table.read"] = {200.0, 5.0, true};
    config.classes["audit.read"] = {200.0, 5.0, true};
    config.classes["stream.send"] = {1000.0, 20.0, true};
    return config;
}

TokenBucket::TokenBucket(const BucketConfig& config, TimePoint now)
    : capacity_(config.capacity)
    , refillPerSecond_(config.refillPerSecond)
    , tokens_(config.capacity)
    , lastRefill_(now) {}

void TokenBucket::refill(TimePoint now) {
    if (now <= lastRefill_) {
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refillPerSecond_);
    lastRefill_ = now;
}

bool TokenBucket::consume(double cost, TimePoint now) {
    refill(now);
    ++total_;
    if (tokens_ >= cost) {
        tokens_ -= cost;
        return true;
    }
    ++rejected_;
    return false;
}

double TokenBucket::available(TimePoint now) {
    refill(now);
    return tokens_;
}

void TokenBucket::reconfigure(const BucketConfig& config) {
    capacity_ = config.capacity;
    refillPerSecond_ = config.refillPerSecond;
    tokens_ = std::min(tokens_, capacity_);
}

std::chrono::milliseconds TokenBucket::timeUntil(double cost) const {
    if (tokens_ >= cost) {
        return std::chrono::milliseconds(0);
    }
    if (refillPerSecond_ <= 0.0 || cost > capacity_) {
        return std::chrono::milliseconds::max();
    }
    const double seconds = (cost - tokens_) / refillPerSecond_;
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
}

struct RateLimiter::Impl {
    mutable std::mutex configMutex;
    RateLimitConfig config;
    Clock clock;
    recovery::RecoverableState<std::map<RateLimitKey, TokenBucket>> buckets{"ratelimit.buckets"};
    std::shared_ptr<audit::SecurityAuditor> auditor;
    std::shared_ptr<spdlog::logger> logger;

    Impl(const RateLimitConfig& cfg, Clock c)
        : config(cfg), clock(std::move(c)), logger(logging::getLogger("ratelimit")) {
        if (!clock) {
            clock = []() { return std::chrono::steady_clock::now(); };
        }
    }

    BucketConfig configFor(const std::string& actionClass) const {
        std::lock_guard<std::mutex> lock(configMutex);
        return config.forClass(actionClass);
    }
};

RateLimiter::RateLimiter(const RateLimitConfig& config, Clock clock)
    : pImpl(std::make_unique<Impl>(config, std::move(clock))) {
    if (!config.validate()) {
        throw std::invalid_argument("RateLimiter: invalid configuration");
    }
}

RateLimiter::~RateLimiter() = default;

void RateLimiter::attachAuditor(std::shared_ptr<audit::SecurityAuditor> auditor) {
    std::lock_guard<std::mutex> lock(pImpl->configMutex);
    pImpl->auditor = std::move(auditor);
}

void RateLimiter::setRecoveryCallback(recovery::RecoveryCallback callback) {
    pImpl->buckets.setRecoveryCallback(std::move(callback));
}

RateLimitDecision RateLimiter::check(const RateLimitKey& key, double cost) {
    const BucketConfig bucketConfig = pImpl->configFor(key.actionClass);
    if (!bucketConfig.enabled) {
        return {true, bucketConfig.capacity, std::chrono::milliseconds(0)};
    }
    const TimePoint now = pImpl->clock();
    return pImpl->buckets.with([&](std::map<RateLimitKey, TokenBucket>& buckets) {
        auto it = buckets.find(key);
        if (it == buckets.end()) {
            it = buckets.emplace(key, TokenBucket(bucketConfig, now)).first;
        } else if (it->second.capacity() != bucketConfig.capacity ||
                   it->second.refillPerSecond() != bucketConfig.refillPerSecond) {
            it->second.reconfigure(bucketConfig);
        }
        RateLimitDecision decision;
        decision.allowed = it->second.consume(cost, now);
        decision.remaining = it->second.available(now);
        decision.retryAfter = decision.allowed ? std::chrono::milliseconds(0) : it->second.timeUntil(cost);
        return decision;
    });
}

bool RateLimiter::admit(const RateLimitKey& key, double cost) {
    const RateLimitDecision decision = check(key, cost);
    if (decision.allowed) {
        return true;
    }
    pImpl->logger->debug("Rate limit exceeded for {}", key.toString());
    std::shared_ptr<audit::SecurityAuditor> auditor;
    {
        std::lock_guard<std::mutex> lock(pImpl->configMutex);
        auditor = pImpl->auditor;
    }
    if (auditor) {
        auditor->log(audit::EventBuilder(audit::EventKind::RateLimitExceeded)
                         .resource(key.actionClass)
                         .action(key.actionClass)
                         .detail("subject", key.subject)
                         .detail("retryAfterMs", std::to_string(decision.retryAfter.count()))
                         .message("Rate limit exceeded")
                         .build());
    }
    return false;
}

std::map<std::string, BucketStatistics> RateLimiter::statistics() const {
    return pImpl->buckets.with([](std::map<RateLimitKey, TokenBucket>& buckets) {
        std::map<std::string, BucketStatistics> stats;
        for (const auto& entry : buckets) {
            stats[entry.first.toString()] = entry.second.statistics();
        }
        return stats;
    });
}

size_t RateLimiter::bucketCount() const {
    return pImpl->buckets.with([](std::map<RateLimitKey, TokenBucket>& buckets) { return buckets.size(); });
}

size_t RateLimiter::evictIdle(std::chrono::seconds age) {
    const TimePoint now = pImpl->clock();
    const size_t evicted = pImpl->buckets.with([&](std::map<RateLimitKey, TokenBucket>& buckets) {
        size_t count = 0;
        for (auto it = buckets.begin(); it != buckets.end();) {
            const bool idle = now - it->second.lastRefill() >= age;
            it->second.available(now);
            if (idle && it->second.isFull()) {
                it = buckets.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        return count;
    });
    if (evicted > 0) {
        pImpl->logger->debug("Evicted {} idle rate-limit buckets", evicted);
    }
    return evicted;
}

void RateLimiter::updateConfig(const std::string& actionClass, const BucketConfig& config) {
    if (actionClass.empty() || !config.validate()) {
        throw std::invalid_argument("RateLimiter::updateConfig: invalid bucket configuration");
    }
    std::lock_guard<std::mutex> lock(pImpl->configMutex);
    pImpl->config.classes[actionClass] = config;
}

RateLimitConfig RateLimiter::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->configMutex);
    return pImpl->config;
}

} // namespace ratelimit
} // namespace core
} // namespace hostguard
