#pragma once

#include "syncgate/clock.hpp"
#include "syncgate/config.hpp"
#include "syncgate/failure_notifier.hpp"
#include "syncgate/lock_provider.hpp"
#include "syncgate/state_store.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace syncgate {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

const char* to_string(CircuitState state);

struct CircuitSnapshot {
    CircuitState state = CircuitState::Closed;
    int64_t failure_count = 0;
    std::optional<int64_t> opened_at;
    bool probe_claimed = false;
    int64_t seconds_until_probe = 0;   // 0 unless Open
};

/**
 * CircuitBreaker - availability gate in front of the remote service
 *
 * CLOSED -> OPEN after failure_threshold consecutive failed batches.
 * OPEN -> HALF_OPEN once recovery_delay has passed since opened_at.
 * HALF_OPEN -> CLOSED when the probe succeeds, back to OPEN (opened_at = now)
 * when it fails.
 *
 * All state lives in the shared StateStore, never in this object, so any
 * number of processes can hold their own CircuitBreaker over the same store.
 *
 * The half-open probe is single-flight: the caller must first claim the
 * short-lived probe flag (atomic add) and then take the probe mutex with a
 * bounded wait. Losing either leaves the circuit untouched and reports
 * unavailable.
 */
class CircuitBreaker {
private:
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<LockProvider> lock_provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<FailureNotifier> failure_notifier_;
    BreakerConfig config_;

    std::string key_failures_;
    std::string key_opened_at_;
    std::string key_probe_;
    std::string probe_lock_name_;

    std::optional<int64_t> read_opened_at();
    bool try_claim_probe();

public:
    CircuitBreaker(std::shared_ptr<StateStore> store,
                   std::shared_ptr<LockProvider> lock_provider,
                   std::shared_ptr<Clock> clock,
                   const BreakerConfig& config = BreakerConfig{});

    void set_failure_notifier(std::shared_ptr<FailureNotifier> notifier) {
        failure_notifier_ = notifier;
    }

    // Never throws; a store error reads as unavailable
    bool is_available();

    void record_failure();
    void record_success();

    // One weighted outcome for the whole batch: failures/(successes+failures)
    // at or above failure_ratio counts as one failure, anything lower as one success
    void record_batch(int successes, int failures);

    // Operator override, same effect as record_success()
    void reset();

    // Read-only views, no probe claim
    CircuitState state();
    CircuitSnapshot snapshot();

    const BreakerConfig& config() const { return config_; }
};

} // namespace syncgate
