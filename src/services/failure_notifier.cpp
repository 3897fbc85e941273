#include "syncgate/failure_notifier.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

bool LogTransport::send(const std::string& recipient,
                        const std::string& subject,
                        const std::string& body) {
    spdlog::warn("ALERT to={} subject=\"{}\" body=\"{}\"", recipient, subject, body);
    return true;
}

FailureNotifier::FailureNotifier(std::shared_ptr<StateStore> store,
                                 std::shared_ptr<NotificationTransport> transport,
                                 std::shared_ptr<Clock> clock,
                                 const NotifierConfig& config)
    : store_(store), transport_(transport), clock_(clock), config_(config) {
    if (!store_) {
        throw std::invalid_argument("State store cannot be null");
    }
    if (!transport_) {
        throw std::invalid_argument("Notification transport cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
}

void FailureNotifier::check(int successes, int failures) {
    if (successes > 0) {
        if (store_->get_int(KEY_CONSECUTIVE, 0) > 0) {
            store_->put(KEY_CONSECUTIVE, "0", 0);
        }
        return;
    }

    if (failures <= 0) {
        return;
    }

    int64_t consecutive = store_->increment_by(KEY_CONSECUTIVE, failures, 0);

    if (consecutive < config_.failure_threshold) {
        return;
    }

    std::string subject = config_.subject_prefix + " " + std::to_string(consecutive) +
                          " consecutive sync failures";
    std::string body = "The sync queue has encountered " + std::to_string(consecutive) +
                       " consecutive failures.\n\nPlease check the sync queue.";

    if (deliver(subject, body)) {
        spdlog::warn("Failure notification sent: consecutive_failures={}, recipient={}",
                     consecutive, config_.recipient);
    }
}

bool FailureNotifier::notify_circuit_breaker_open(int64_t failure_count) {
    std::string subject = config_.subject_prefix + " Circuit breaker opened - remote service unreachable";
    std::string body = "The circuit breaker opened after " + std::to_string(failure_count) +
                       " consecutive failed batches. Queue processing is paused and a probe "
                       "batch will be attempted after the recovery delay.";

    bool sent = deliver(subject, body);
    if (sent) {
        spdlog::warn("Circuit breaker notification sent: failures={}, recipient={}",
                     failure_count, config_.recipient);
    }
    return sent;
}

bool FailureNotifier::notify_module_circuit_open(const std::string& module, int64_t failure_count) {
    std::string subject = config_.subject_prefix + " Circuit breaker opened for module " + module;
    std::string body = "Module '" + module + "' was paused after " + std::to_string(failure_count) +
                       " consecutive failed batches. Other modules keep processing.";

    bool sent = deliver(subject, body);
    if (sent) {
        spdlog::warn("Module circuit breaker notification sent: module={}, failures={}",
                     module, failure_count);
    }
    return sent;
}

int64_t FailureNotifier::consecutive_failures() const {
    return store_->get_int(KEY_CONSECUTIVE, 0);
}

bool FailureNotifier::cooldown_active() const {
    int64_t last_sent = store_->get_int(KEY_LAST_SENT, 0);
    if (last_sent <= 0) return false;
    return (clock_->now() - last_sent) < config_.cooldown;
}

bool FailureNotifier::deliver(const std::string& subject, const std::string& body) {
    if (config_.recipient.empty()) {
        spdlog::debug("Notification skipped, no recipient configured: {}", subject);
        return false;
    }

    if (cooldown_active()) {
        spdlog::debug("Notification suppressed by cooldown: {}", subject);
        return false;
    }

    if (!transport_->send(config_.recipient, subject, body)) {
        spdlog::error("Notification transport failed to send: {}", subject);
        return false;
    }

    store_->put(KEY_LAST_SENT, std::to_string(clock_->now()), 0);
    return true;
}

} // namespace syncgate
