#pragma once

#include "syncgate/clock.hpp"
#include "syncgate/config.hpp"
#include "syncgate/state_store.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace syncgate {

// Outbound channel for operator alerts (mail relay, chat webhook, ...)
class NotificationTransport {
public:
    virtual ~NotificationTransport() = default;
    virtual bool send(const std::string& recipient,
                      const std::string& subject,
                      const std::string& body) = 0;
};

// Writes alerts to the log. Default when no delivery channel is configured.
class LogTransport : public NotificationTransport {
public:
    bool send(const std::string& recipient,
              const std::string& subject,
              const std::string& body) override;
};

/**
 * FailureNotifier - operator alerts for persistent sync failures
 *
 * Two triggers:
 * 1. Circuit breaker opened (global or per module), told once per edge by the breaker
 * 2. Consecutive failed jobs reaching the threshold, fed by check() after each batch
 *
 * Both share one cooldown so an outage produces one alert per cooldown window.
 * Counters and the last-sent timestamp live in the StateStore so every
 * process sees the same cooldown.
 */
class FailureNotifier {
private:
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<NotificationTransport> transport_;
    std::shared_ptr<Clock> clock_;
    NotifierConfig config_;

    static constexpr const char* KEY_CONSECUTIVE = "syncgate_consecutive_failures";
    static constexpr const char* KEY_LAST_SENT = "syncgate_last_failure_notice";

    bool cooldown_active() const;
    bool deliver(const std::string& subject, const std::string& body);

public:
    FailureNotifier(std::shared_ptr<StateStore> store,
                    std::shared_ptr<NotificationTransport> transport,
                    std::shared_ptr<Clock> clock,
                    const NotifierConfig& config = NotifierConfig{});

    // Any success resets the streak; (0, 0) does nothing
    void check(int successes, int failures);

    bool notify_circuit_breaker_open(int64_t failure_count);
    bool notify_module_circuit_open(const std::string& module, int64_t failure_count);

    int64_t consecutive_failures() const;
    const NotifierConfig& config() const { return config_; }
};

} // namespace syncgate
