#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace tether {
namespace session {

struct ReconnectPolicyConfig {
    bool enabled = true;        // Reconnect automatically after failures
    int max_attempts = 3;       // Attempts before giving up until the next explicit connect
    int base_delay_ms = 1000;   // Delay before attempt n is base_delay_ms * 2^(n-1)
};

// ReconnectScheduler tracks reconnect attempts with exponential backoff.
// At most one attempt is scheduled at a time; once max_attempts have been
// scheduled without an intervening success the scheduler is exhausted.
class ReconnectScheduler {
public:
    // Immutable snapshot for cross-thread reads
    struct Snapshot {
        bool enabled = false;
        int attempt_count = 0;
        int max_attempts = 0;
        bool scheduled = false;
        bool exhausted = false;
        std::optional<int64_t> next_attempt_in_ms;  // nullopt: nothing scheduled
    };

    explicit ReconnectScheduler(ReconnectPolicyConfig policy = {});

    // Schedules the next attempt and returns its delay.
    // Returns nullopt (and schedules nothing) when disabled or exhausted.
    // While an attempt is already scheduled, returns that attempt's delay
    // without counting a new one.
    std::optional<int> schedule_next();

    bool is_scheduled() const;

    // True once a scheduled attempt's delay has elapsed. Consumes the
    // schedule, so each attempt fires once.
    bool take_due();

    // Earliest time the scheduled attempt may fire
    std::optional<std::chrono::steady_clock::time_point> next_attempt_time() const;

    // Drops the scheduled attempt, keeping the attempt count
    void cancel();

    // Drops the scheduled attempt and zeroes the attempt count
    void reset();

    // Same as reset(), logging recovery after retries
    void record_success();

    bool is_exhausted() const;
    int attempt_count() const;

    // Backoff for a 1-based attempt number
    int delay_for_attempt(int attempt) const;

    const ReconnectPolicyConfig &policy() const { return policy_; }

    Snapshot snapshot() const;

private:
    int delay_for_attempt_locked(int attempt) const;

    const ReconnectPolicyConfig policy_;

    mutable std::mutex mutex_;
    int attempt_count_ = 0;
    bool scheduled_ = false;
    int scheduled_delay_ms_ = 0;
    std::chrono::steady_clock::time_point next_attempt_time_;
};

}  // namespace session
}  // namespace tether
