#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include "core/recovery/RecoverableState.hpp"

namespace hostguard {
namespace core {
namespace audit {
class SecurityAuditor;
}
namespace ratelimit {

using TimePoint = std::chrono::steady_clock::time_point;
using Clock = std::function<TimePoint()>;

// Параметры корзины для класса действий
struct BucketConfig {
    double capacity = 100.0;        // Макс. токенов
    double refillPerSecond = 10.0;  // Скорость пополнения
    bool enabled = true;            // false: всегда пропускать

    bool validate() const { return capacity > 0.0 && refillPerSecond >= 0.0; }
};

struct RateLimitConfig {
    BucketConfig defaultBucket;
    std::map<std::string, BucketConfig> classes; // action class -> параметры

    const BucketConfig& forClass(const std::string& actionClass) const;
    bool validate() const;
    static RateLimitConfig defaults();
};

// Ключ корзины: субъект (user:<id> или ip:<addr>) и класс действия
struct RateLimitKey {
    std::string subject;
    std::string actionClass;

    std::string toString() const { return subject + "|" + actionClass; }
    bool operator<(const RateLimitKey& other) const {
        return subject != other.subject ? subject < other.subject : actionClass < other.actionClass;
    }
};

struct RateLimitDecision {
    bool allowed = true;
    double remaining = 0.0;
    std::chrono::milliseconds retryAfter{0};
};

struct BucketStatistics {
    uint64_t totalRequests = 0;
    uint64_t rejectedRequests = 0;
    double tokens = 0.0;
};

// Корзина токенов с ленивым непрерывным пополнением
class TokenBucket {
public:
    TokenBucket(const BucketConfig& config, TimePoint now);

    bool consume(double cost, TimePoint now);
    double available(TimePoint now);
    void reconfigure(const BucketConfig& config); // Новые параметры, токены урезаются до capacity
    std::chrono::milliseconds timeUntil(double cost) const;

    bool isFull() const { return tokens_ >= capacity_; }
    TimePoint lastRefill() const { return lastRefill_; }
    double capacity() const { return capacity_; }
    double refillPerSecond() const { return refillPerSecond_; }
    BucketStatistics statistics() const { return {total_, rejected_, tokens_}; }

private:
    void refill(TimePoint now);

    double capacity_;
    double refillPerSecond_;
    double tokens_;
    TimePoint lastRefill_;
    uint64_t total_ = 0;
    uint64_t rejected_ = 0;
};

// RateLimiter — корзины по ключу (субъект, класс действия).
// check() ничего не пишет в аудит; admit() при отказе пишет RateLimitExceeded,
// если подключён аудитор.
class RateLimiter {
public:
    explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig::defaults(), Clock clock = nullptr);
    ~RateLimiter();
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    void attachAuditor(std::shared_ptr<audit::SecurityAuditor> auditor);
    void setRecoveryCallback(recovery::RecoveryCallback callback);

    bool admit(const RateLimitKey& key, double cost = 1.0);
    RateLimitDecision check(const RateLimitKey& key, double cost = 1.0);

    std::map<std::string, BucketStatistics> statistics() const;
    size_t bucketCount() const;
    size_t evictIdle(std::chrono::seconds age); // Только полные корзины, простаивающие >= age

    void updateConfig(const std::string& actionClass, const BucketConfig& config);
    RateLimitConfig getConfiguration() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ratelimit
} // namespace core
} // namespace hostguard
