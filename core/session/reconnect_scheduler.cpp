#include "reconnect_scheduler.hpp"

#include <limits>

#include "logging/logger.hpp"

namespace tether {
namespace session {

ReconnectScheduler::ReconnectScheduler(ReconnectPolicyConfig policy) : policy_(policy) {}

std::optional<int> ReconnectScheduler::schedule_next() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!policy_.enabled) {
        return std::nullopt;
    }

    if (scheduled_) {
        return scheduled_delay_ms_;
    }

    if (attempt_count_ >= policy_.max_attempts) {
        LOG_WARN("[Reconnect] Giving up after " << attempt_count_ << " attempt(s)");
        return std::nullopt;
    }

    attempt_count_++;
    scheduled_delay_ms_ = delay_for_attempt_locked(attempt_count_);
    scheduled_ = true;
    next_attempt_time_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(scheduled_delay_ms_);

    LOG_INFO("[Reconnect] Scheduling reconnect (attempt " << attempt_count_ << "/" << policy_.max_attempts
                                                          << ", retry in " << scheduled_delay_ms_ << "ms)");
    return scheduled_delay_ms_;
}

bool ReconnectScheduler::is_scheduled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduled_;
}

bool ReconnectScheduler::take_due() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scheduled_ || std::chrono::steady_clock::now() < next_attempt_time_) {
        return false;
    }
    scheduled_ = false;
    return true;
}

std::optional<std::chrono::steady_clock::time_point> ReconnectScheduler::next_attempt_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scheduled_) {
        return std::nullopt;
    }
    return next_attempt_time_;
}

void ReconnectScheduler::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scheduled_) {
        LOG_DEBUG("[Reconnect] Cancelled scheduled attempt " << attempt_count_);
    }
    scheduled_ = false;
}

void ReconnectScheduler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    attempt_count_ = 0;
    scheduled_ = false;
}

void ReconnectScheduler::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_count_ > 0) {
        LOG_INFO("[Reconnect] Recovered after " << attempt_count_ << " attempt(s)");
    }
    attempt_count_ = 0;
    scheduled_ = false;
}

bool ReconnectScheduler::is_exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !scheduled_ && attempt_count_ >= policy_.max_attempts;
}

int ReconnectScheduler::attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_count_;
}

int ReconnectScheduler::delay_for_attempt(int attempt) const { return delay_for_attempt_locked(attempt); }

int ReconnectScheduler::delay_for_attempt_locked(int attempt) const {
    if (attempt < 1) {
        return 0;
    }

    // Saturate instead of overflowing for large attempt counts
    int64_t delay = policy_.base_delay_ms;
    for (int i = 1; i < attempt; ++i) {
        delay *= 2;
        if (delay > std::numeric_limits<int>::max()) {
            return std::numeric_limits<int>::max();
        }
    }
    return static_cast<int>(delay);
}

ReconnectScheduler::Snapshot ReconnectScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Snapshot snap;
    snap.enabled = policy_.enabled;
    snap.attempt_count = attempt_count_;
    snap.max_attempts = policy_.max_attempts;
    snap.scheduled = scheduled_;
    snap.exhausted = !scheduled_ && attempt_count_ >= policy_.max_attempts;

    if (scheduled_) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= next_attempt_time_) {
            snap.next_attempt_in_ms = int64_t{0};
        } else {
            snap.next_attempt_in_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(next_attempt_time_ - now).count();
        }
    }
    return snap;
}

}  // namespace session
}  // namespace tether
