#include "core/operations/OperationResult.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <optional>

namespace hostguard {
namespace core {
namespace operations {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ValidationRejected: return "ValidationRejected";
        case ErrorKind::CapabilityDenied: return "CapabilityDenied";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::SecretNotFound: return "SecretNotFound";
        case ErrorKind::SecretAccessDenied: return "SecretAccessDenied";
        case ErrorKind::UpstreamFailure: return "UpstreamFailure";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::InternalLockRecovered: return "InternalLockRecovered";
    }
    return "UpstreamFailure";
}

OperationResult OperationResult::ok(nlohmann::json data) {
    OperationResult result;
    result.success = true;
    result.data = std::move(data);
    return result;
}

OperationResult OperationResult::failure(ErrorKind error, const std::string& reason) {
    OperationResult result;
    result.success = false;
    result.error = error;
    result.reason = reason;
    return result;
}

nlohmann::json OperationResult::toJson() const {
    nlohmann::json j;
    j["success"] = success;
    if (success) {
        j["data"] = data;
        return j;
    }
    j["error"] = errorKindToString(error);
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j;
}

std::string OperationResult::toJsonString() const {
    return toJson().dump();
}

struct OperationHandle::State {
    std::atomic<bool> claimed{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<OperationResult> result;
    SettleCallback onSettle;
    std::chrono::milliseconds timeout{0};

    bool trySettle(OperationResult value) {
        bool expected = false;
        if (!claimed.compare_exchange_strong(expected, true)) {
            return false;
        }
        // Событие пишется до публикации: вернувшийся wait() гарантирует запись в аудите
        if (onSettle) {
            onSettle(value);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            result = std::move(value);
        }
        cv.notify_all();
        return true;
    }
};

OperationHandle OperationHandle::pending(SettleCallback onSettle, std::chrono::milliseconds timeout) {
    OperationHandle handle;
    handle.state_ = std::make_shared<State>();
    handle.state_->onSettle = std::move(onSettle);
    handle.state_->timeout = timeout;
    return handle;
}

OperationHandle OperationHandle::completed(OperationResult result) {
    OperationHandle handle;
    handle.state_ = std::make_shared<State>();
    handle.state_->claimed = true;
    handle.state_->result = std::move(result);
    return handle;
}

bool OperationHandle::isSettled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result.has_value();
}

std::chrono::milliseconds OperationHandle::timeout() const {
    return state_ ? state_->timeout : std::chrono::milliseconds(0);
}

bool OperationHandle::settle(OperationResult result) {
    if (!state_) {
        return false;
    }
    return state_->trySettle(std::move(result));
}

OperationResult OperationHandle::wait() {
    return wait(timeout());
}

OperationResult OperationHandle::wait(std::chrono::milliseconds limit) {
    if (!state_) {
        return OperationResult::failure(ErrorKind::UpstreamFailure, "InvalidHandle");
    }
    if (state_->timeout.count() > 0) {
        limit = std::min(limit, state_->timeout);
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->cv.wait_for(lock, limit, [this]() { return state_->result.has_value(); })) {
        lock.unlock();
        state_->trySettle(OperationResult::failure(ErrorKind::Timeout));
        lock.lock();
        // Проигравший ждёт публикации результата победителя
        state_->cv.wait(lock, [this]() { return state_->result.has_value(); });
    }
    return *state_->result;
}

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key)
    : owner_(owner), key_(std::move(key)) {}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (owner_) {
        owner_->release(key_);
    }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        ++slot->refs;
        entry = slot;
    }
    entry->mutex.lock();
    return Guard(this, key);
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    it->second->mutex.unlock();
    if (--it->second->refs == 0) {
        entries_.erase(it);
    }
}

size_t KeyedMutex::activeKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace operations
} // namespace core
} // namespace hostguard
