#include "core/audit/SecurityAuditor.hpp"
#include "core/logging/Logger.hpp"
#include "core/recovery/RecoverableState.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <openssl/sha.h>

namespace hostguard {
namespace core {
namespace audit {

namespace {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// Содержимое кольцевого буфера. anchorDigest: digest записи перед первой сохранённой.
struct LogState {
    std::deque<AuditRecord> records;
    std::string lastDigest;
    std::string anchorDigest;
};

} // namespace

struct SecurityAuditor::Impl {
    AuditorConfig config;
    std::shared_ptr<spdlog::logger> logger;
    recovery::RecoverableState<LogState> state{"audit.buffer"};
    std::atomic<uint64_t> nextSequence{1};

    // Очередь пересылки
    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::condition_variable drainedCv;
    std::deque<AuditRecord> queue;
    bool delivering = false;
    bool running = false;
    bool stopRequested = false;
    std::thread dispatcher;

    mutable std::mutex sinkMutex;
    std::vector<std::shared_ptr<AuditSink>> sinks;
    std::vector<EventSubscriber> subscribers;
    Redactor redactor;

    std::atomic<uint64_t> totalEvents{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> evicted{0};
    std::atomic<uint64_t> pruned{0};
    std::atomic<uint64_t> lockRecoveries{0};
    mutable std::mutex kindMutex;
    std::map<std::string, uint64_t> byKind;

    explicit Impl(const AuditorConfig& cfg)
        : config(cfg), logger(logging::getLogger("audit")) {}

    void deliver(const std::deque<AuditRecord>& batch) {
        std::vector<std::shared_ptr<AuditSink>> sinksCopy;
        std::vector<EventSubscriber> subscribersCopy;
        {
            std::lock_guard<std::mutex> lock(sinkMutex);
            sinksCopy = sinks;
            subscribersCopy = subscribers;
        }
        for (const auto& record : batch) {
            for (const auto& sink : sinksCopy) {
                try {
                    sink->write(record);
                } catch (const std::exception& e) {
                    logger->error("SecurityAuditor: sink '{}' failed on #{}: {}", sink->name(), record.sequence, e.what());
                }
            }
            for (const auto& subscriber : subscribersCopy) {
                try {
                    subscriber(record);
                } catch (const std::exception& e) {
                    logger->error("SecurityAuditor: subscriber failed on #{}: {}", record.sequence, e.what());
                }
            }
            ++forwarded;
        }
        for (const auto& sink : sinksCopy) {
            try {
                sink->flush();
            } catch (const std::exception& e) {
                logger->error("SecurityAuditor: sink '{}' flush failed: {}", sink->name(), e.what());
            }
        }
    }

    void dispatchLoop() {
        for (;;) {
            std::deque<AuditRecord> batch;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCv.wait(lock, [this]() { return stopRequested || !queue.empty(); });
                if (queue.empty()) {
                    return; // остановка и очередь пуста
                }
                batch.swap(queue);
                delivering = true;
            }
            deliver(batch);
            {
                std::lock_guard<std::mutex> lock(queueMutex);
                delivering = false;
                if (queue.empty()) {
                    drainedCv.notify_all();
                }
            }
        }
    }

    void enqueue(const AuditRecord& record) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (queue.size() >= config.queueCapacity) {
                ++dropped;
                logger->warn("SecurityAuditor: forwarding queue full, record #{} not forwarded", record.sequence);
                return;
            }
            queue.push_back(record);
        }
        queueCv.notify_one();
    }

    static void trimTo(LogState& s, size_t keep, std::atomic<uint64_t>& counter) {
        while (s.records.size() > keep) {
            s.anchorDigest = s.records.front().chainDigest;
            s.records.pop_front();
            ++counter;
        }
    }
};

SecurityAuditor::SecurityAuditor(const AuditorConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("SecurityAuditor: invalid configuration");
    }
    pImpl->state.setRecoveryCallback([this](const std::string& name, const std::string& reason) {
        logLockRecovered(name, reason);
    });
}

SecurityAuditor::~SecurityAuditor() {
    shutdown();
}

bool SecurityAuditor::initialize() {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    if (pImpl->running) {
        return true;
    }
    if (pImpl->config.enableFileSink) {
        try {
            auto sink = std::make_shared<LogAuditSink>(pImpl->config.logPath, pImpl->config.maxLogSize,
                                                       pImpl->config.maxLogFiles);
            std::lock_guard<std::mutex> sinkLock(pImpl->sinkMutex);
            pImpl->sinks.push_back(std::move(sink));
        } catch (const std::exception& e) {
            pImpl->logger->error("SecurityAuditor: cannot open audit log '{}': {}", pImpl->config.logPath, e.what());
            return false;
        }
    }
    pImpl->stopRequested = false;
    pImpl->running = true;
    pImpl->dispatcher = std::thread([this]() { pImpl->dispatchLoop(); });
    pImpl->logger->info("SecurityAuditor initialized (buffer {}, queue {})",
                        pImpl->config.bufferCapacity, pImpl->config.queueCapacity);
    return true;
}

void SecurityAuditor::shutdown() {
    if (!pImpl) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (!pImpl->running) {
            return;
        }
        pImpl->stopRequested = true;
    }
    pImpl->queueCv.notify_all();
    if (pImpl->dispatcher.joinable()) {
        pImpl->dispatcher.join();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        pImpl->running = false;
    }
    flush(); // записи, поставленные подписчиками во время остановки
    pImpl->logger->info("SecurityAuditor shut down, {} events recorded", pImpl->totalEvents.load());
}

void SecurityAuditor::addSink(std::shared_ptr<AuditSink> sink) {
    if (!sink) {
        throw std::invalid_argument("SecurityAuditor::addSink: null sink");
    }
    std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
    pImpl->sinks.push_back(std::move(sink));
}

void SecurityAuditor::subscribe(EventSubscriber subscriber) {
    std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
    pImpl->subscribers.push_back(std::move(subscriber));
}

void SecurityAuditor::setRedactor(Redactor redactor) {
    std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
    pImpl->redactor = std::move(redactor);
}

uint64_t SecurityAuditor::log(SecurityEvent event) {
    Redactor redactor;
    {
        std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
        redactor = pImpl->redactor;
    }
    if (redactor) {
        event.message = redactor(event.message);
        for (auto& entry : event.details) {
            entry.second = redactor(entry.second);
        }
    }
    if (event.id.empty()) {
        event.id = generateEventId();
    }
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = std::chrono::system_clock::now();
    }

    auto shared = std::make_shared<const SecurityEvent>(std::move(event));
    const std::string canonical = shared->toJson().dump();
    const size_t capacity = pImpl->config.bufferCapacity;

    AuditRecord record = pImpl->state.with([&](LogState& s) {
        AuditRecord r;
        r.sequence = pImpl->nextSequence++;
        r.chainDigest = sha256Hex(s.lastDigest + canonical);
        r.event = shared;
        s.lastDigest = r.chainDigest;
        s.records.push_back(r);
        Impl::trimTo(s, capacity, pImpl->evicted);
        return r;
    });

    ++pImpl->totalEvents;
    {
        std::lock_guard<std::mutex> lock(pImpl->kindMutex);
        ++pImpl->byKind[eventKindToString(shared->kind)];
    }
    pImpl->logger->debug("#{} {} [{}] {} principal={} resource={}", record.sequence,
                         eventKindToString(shared->kind), severityToString(shared->severity),
                         outcomeToString(shared->outcome), shared->principalId.value_or("anonymous"),
                         shared->resource);
    pImpl->enqueue(record);
    return record.sequence;
}

uint64_t SecurityAuditor::logAuthAttempt(const std::optional<std::string>& principal, const std::string& clientIp,
                                         const std::string& method) {
    return log(EventBuilder(EventKind::AuthAttempt)
                   .principal(principal).clientIp(clientIp).action("auth")
                   .detail("method", method)
                   .message("Authentication attempt")
                   .build());
}

uint64_t SecurityAuditor::logAuthSuccess(const std::string& principal, const std::string& clientIp,
                                         const std::string& method) {
    return log(EventBuilder(EventKind::AuthSuccess)
                   .principal(principal).clientIp(clientIp).action("auth")
                   .detail("method", method)
                   .message("Authentication succeeded")
                   .build());
}

uint64_t SecurityAuditor::logAuthFailure(const std::optional<std::string>& principal, const std::string& clientIp,
                                         const std::string& reason) {
    return log(EventBuilder(EventKind::AuthFailure)
                   .principal(principal).clientIp(clientIp).action("auth")
                   .detail("reason", reason)
                   .message("Authentication failed")
                   .build());
}

uint64_t SecurityAuditor::logCapabilityDenied(const std::optional<std::string>& principal, const std::string& resource,
                                              const std::string& capability) {
    return log(EventBuilder(EventKind::CapabilityDenied)
                   .principal(principal).resource(resource)
                   .detail("capability", capability)
                   .message("Missing capability " + capability)
                   .build());
}

uint64_t SecurityAuditor::logValidationFailure(const std::optional<std::string>& principal, const std::string& target,
                                               const std::string& reason) {
    return log(EventBuilder(EventKind::ValidationRejected)
                   .principal(principal)
                   .detail("target", target)
                   .detail("reason", reason)
                   .message("Input rejected: " + reason)
                   .build());
}

uint64_t SecurityAuditor::logSuspiciousActivity(const std::optional<std::string>& principal,
                                                const std::string& clientIp, const std::string& description) {
    return log(EventBuilder(EventKind::SuspiciousActivity)
                   .principal(principal).clientIp(clientIp)
                   .message(description)
                   .build());
}

uint64_t SecurityAuditor::logLockRecovered(const std::string& component, const std::string& reason) {
    ++pImpl->lockRecoveries;
    return log(EventBuilder(EventKind::InternalLockRecovered)
                   .resource(component)
                   .detail("reason", reason)
                   .message("Shared state '" + component + "' reset after a failed mutation")
                   .build());
}

void SecurityAuditor::flush() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    if (pImpl->running) {
        pImpl->drainedCv.wait(lock, [this]() { return pImpl->queue.empty() && !pImpl->delivering; });
        return;
    }
    // Диспетчер не запущен: разбираем очередь в вызывающем потоке
    while (!pImpl->queue.empty()) {
        std::deque<AuditRecord> batch;
        batch.swap(pImpl->queue);
        lock.unlock();
        pImpl->deliver(batch);
        lock.lock();
    }
}

std::vector<AuditRecord> SecurityAuditor::records(size_t limit) const {
    return pImpl->state.with([limit](LogState& s) {
        const size_t count = std::min(limit, s.records.size());
        return std::vector<AuditRecord>(s.records.end() - static_cast<std::ptrdiff_t>(count), s.records.end());
    });
}

std::vector<AuditRecord> SecurityAuditor::query(const AuditQuery& q) const {
    std::vector<AuditRecord> result = pImpl->state.with([&q](LogState& s) {
        std::vector<AuditRecord> matched;
        for (auto it = s.records.rbegin(); it != s.records.rend() && matched.size() < q.limit; ++it) {
            const SecurityEvent& event = *it->event;
            if (it->sequence <= q.sinceSequence) break;
            if (q.principal && event.principalId != q.principal) continue;
            if (q.resource && event.resource != *q.resource) continue;
            if (q.kind && event.kind != *q.kind) continue;
            matched.push_back(*it);
        }
        return matched;
    });
    std::reverse(result.begin(), result.end());
    return result;
}

size_t SecurityAuditor::pruneOlderThan(std::chrono::seconds age) {
    const auto cutoff = std::chrono::system_clock::now() - age;
    const size_t removed = pImpl->state.with([cutoff](LogState& s) {
        size_t count = 0;
        while (!s.records.empty() && s.records.front().event->timestamp < cutoff) {
            s.anchorDigest = s.records.front().chainDigest;
            s.records.pop_front();
            ++count;
        }
        return count;
    });
    pImpl->pruned += removed;
    return removed;
}

size_t SecurityAuditor::pruneKeepLast(size_t keep) {
    std::atomic<uint64_t> counter{0};
    pImpl->state.with([keep, &counter](LogState& s) { Impl::trimTo(s, keep, counter); });
    pImpl->pruned += counter.load();
    return counter.load();
}

bool SecurityAuditor::verifyChain() const {
    return pImpl->state.with([](LogState& s) {
        std::string previous = s.anchorDigest;
        for (const auto& record : s.records) {
            if (sha256Hex(previous + record.event->toJson().dump()) != record.chainDigest) {
                return false;
            }
            previous = record.chainDigest;
        }
        return true;
    });
}

size_t SecurityAuditor::size() const {
    return pImpl->state.with([](LogState& s) { return s.records.size(); });
}

AuditMetrics SecurityAuditor::getMetrics() const {
    AuditMetrics metrics;
    metrics.totalEvents = pImpl->totalEvents.load();
    metrics.bufferedEvents = size();
    metrics.forwardedEvents = pImpl->forwarded.load();
    metrics.droppedForwarding = pImpl->dropped.load();
    metrics.evictedEvents = pImpl->evicted.load();
    metrics.prunedEvents = pImpl->pruned.load();
    metrics.lockRecoveries = pImpl->lockRecoveries.load();
    {
        std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
        metrics.sinkCount = pImpl->sinks.size();
        metrics.subscriberCount = pImpl->subscribers.size();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->kindMutex);
        metrics.eventsByKind = pImpl->byKind;
    }
    return metrics;
}

AuditorConfig SecurityAuditor::getConfiguration() const {
    return pImpl->config;
}

} // namespace audit
} // namespace core
} // namespace hostguard
