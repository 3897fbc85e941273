#include "syncgate/circuit_breaker.hpp"
#include "syncgate/distributed_mutex.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(std::shared_ptr<StateStore> store,
                               std::shared_ptr<LockProvider> lock_provider,
                               std::shared_ptr<Clock> clock,
                               const BreakerConfig& config)
    : store_(store), lock_provider_(lock_provider), clock_(clock), config_(config) {
    if (!store_) {
        throw std::invalid_argument("State store cannot be null");
    }
    if (!lock_provider_) {
        throw std::invalid_argument("Lock provider cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }

    key_failures_ = config_.key_prefix + "_failures";
    key_opened_at_ = config_.key_prefix + "_opened_at";
    key_probe_ = config_.key_prefix + "_probe";
    probe_lock_name_ = config_.key_prefix + "_probe";
}

std::optional<int64_t> CircuitBreaker::read_opened_at() {
    int64_t opened_at = store_->get_int(key_opened_at_, 0);
    if (opened_at <= 0) {
        return std::nullopt;
    }
    return opened_at;
}

bool CircuitBreaker::is_available() {
    std::optional<int64_t> opened_at;
    try {
        opened_at = read_opened_at();
    } catch (const std::exception& e) {
        spdlog::error("Circuit breaker state unreadable, treating remote as unavailable: {}", e.what());
        return false;
    }

    if (!opened_at) {
        return true;
    }

    if ((clock_->now() - *opened_at) < config_.recovery_delay) {
        return false;
    }

    bool claimed = false;
    try {
        claimed = try_claim_probe();
    } catch (const std::exception& e) {
        spdlog::error("Circuit breaker probe claim failed: {}", e.what());
        return false;
    }

    if (!claimed) {
        return false;
    }

    spdlog::info("Circuit breaker half-open: allowing probe batch");
    return true;
}

bool CircuitBreaker::try_claim_probe() {
    // Cheap guard first: one atomic insert-if-absent in the shared store
    if (!store_->add(key_probe_, std::to_string(clock_->now()), config_.probe_ttl)) {
        spdlog::debug("Circuit breaker probe already claimed");
        return false;
    }

    // Cross-process guard. On failure the flag stays claimed; the probe
    // outcome (or the flag TTL) clears it.
    DistributedMutex probe_mutex(lock_provider_, probe_lock_name_, config_.probe_lock_timeout);
    if (!probe_mutex.acquire()) {
        spdlog::debug("Circuit breaker probe mutex '{}' busy", probe_lock_name_);
        return false;
    }

    probe_mutex.release();
    return true;
}

void CircuitBreaker::record_failure() {
    int64_t count = store_->increment(key_failures_, config_.state_ttl);
    int64_t now = clock_->now();

    if (read_opened_at()) {
        if (store_->get(key_probe_)) {
            // The half-open probe failed: stay open for another full window
            store_->put(key_opened_at_, std::to_string(now), config_.state_ttl);
            store_->remove(key_probe_);
            spdlog::warn("Circuit breaker probe failed, reopened for {}s (failures={})",
                         config_.recovery_delay, count);
        } else {
            spdlog::debug("Circuit breaker failure recorded while open (failures={})", count);
        }
        return;
    }

    if (count < config_.failure_threshold) {
        spdlog::debug("Circuit breaker failure recorded ({}/{})", count, config_.failure_threshold);
        return;
    }

    // Only the caller whose add() creates opened_at owns the CLOSED->OPEN edge
    if (!store_->add(key_opened_at_, std::to_string(now), config_.state_ttl)) {
        return;
    }

    spdlog::warn("Circuit breaker opened: remote service appears unreachable "
                 "(consecutive_batch_failures={}, recovery_delay_seconds={})",
                 count, config_.recovery_delay);

    if (failure_notifier_) {
        failure_notifier_->notify_circuit_breaker_open(count);
    }
}

void CircuitBreaker::record_success() {
    if (read_opened_at()) {
        spdlog::info("Circuit breaker closed: remote service recovered");
    }

    store_->remove(key_failures_);
    store_->remove(key_opened_at_);
    store_->remove(key_probe_);
}

void CircuitBreaker::record_batch(int successes, int failures) {
    int total = successes + failures;
    if (total <= 0) {
        return;
    }

    double failure_ratio = static_cast<double>(failures) / static_cast<double>(total);

    if (failure_ratio >= config_.failure_ratio) {
        spdlog::debug("Batch counted as failure: successes={}, failures={}", successes, failures);
        record_failure();
    } else {
        record_success();
    }
}

void CircuitBreaker::reset() {
    spdlog::info("Circuit breaker reset by operator");
    record_success();
}

CircuitState CircuitBreaker::state() {
    return snapshot().state;
}

CircuitSnapshot CircuitBreaker::snapshot() {
    CircuitSnapshot snap;
    snap.failure_count = store_->get_int(key_failures_, 0);
    snap.opened_at = read_opened_at();
    snap.probe_claimed = store_->get(key_probe_).has_value();

    if (!snap.opened_at) {
        snap.state = CircuitState::Closed;
        return snap;
    }

    int64_t elapsed = clock_->now() - *snap.opened_at;
    if (elapsed >= config_.recovery_delay) {
        snap.state = CircuitState::HalfOpen;
    } else {
        snap.state = CircuitState::Open;
        snap.seconds_until_probe = config_.recovery_delay - elapsed;
    }
    return snap;
}

} // namespace syncgate
