/**
 * Failure Notifier Test
 *
 * Consecutive-failure alerts, breaker alerts and the shared cooldown.
 */

#include "syncgate/failure_notifier.hpp"
#include "test_utils/test_support.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace syncgate;
using namespace syncgate::testing;

namespace {

struct Fixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<MemoryStateStore> store = std::make_shared<MemoryStateStore>(clock);
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::unique_ptr<FailureNotifier> notifier;

    explicit Fixture(const std::string& recipient = "ops@example.com") {
        NotifierConfig config;
        config.recipient = recipient;
        notifier = std::make_unique<FailureNotifier>(store, transport, clock, config);
    }
};

// Another worker's failures land the moment this worker touches the
// counter: after its read, or ahead of its atomic increment
class ContendedStateStore : public MemoryStateStore {
private:
    void land_other_worker() {
        if (other_worker_failures > 0) {
            int64_t failures = other_worker_failures;
            other_worker_failures = 0;
            MemoryStateStore::increment_by(COUNTER_KEY, failures, 0);
        }
    }

public:
    static constexpr const char* COUNTER_KEY = "syncgate_consecutive_failures";
    int64_t other_worker_failures = 0;

    using MemoryStateStore::MemoryStateStore;

    std::optional<std::string> get(const std::string& key) override {
        auto value = MemoryStateStore::get(key);
        if (key == COUNTER_KEY) land_other_worker();
        return value;
    }

    int64_t increment_by(const std::string& key, int64_t amount, int ttl_seconds) override {
        if (key == COUNTER_KEY) land_other_worker();
        return MemoryStateStore::increment_by(key, amount, ttl_seconds);
    }
};

bool test_threshold() {
    std::cout << "\n=== Test 1: Consecutive Failure Threshold ===" << std::endl;
    Fixture f;

    f.notifier->check(0, 3);
    f.notifier->check(0, 1);
    TEST_ASSERT(f.notifier->consecutive_failures() == 4, "Failures accumulate across batches");
    TEST_ASSERT(f.transport->sent.empty(), "Nothing sent below the threshold");

    f.notifier->check(0, 1);
    TEST_ASSERT(f.transport->sent.size() == 1, "Alert sent at 5 consecutive failures");
    TEST_ASSERT(f.transport->sent[0].subject.find("5 consecutive") != std::string::npos,
                "Subject carries the count");

    return true;
}

bool test_success_resets() {
    std::cout << "\n=== Test 2: Success Resets the Streak ===" << std::endl;
    Fixture f;

    f.notifier->check(0, 4);
    f.notifier->check(1, 3);
    TEST_ASSERT(f.notifier->consecutive_failures() == 0, "Any success resets the counter");

    f.notifier->check(0, 4);
    TEST_ASSERT(f.transport->sent.empty(), "Counter restarted from zero");

    return true;
}

bool test_empty_batch_noop() {
    std::cout << "\n=== Test 3: Empty Batch ===" << std::endl;
    Fixture f;

    f.notifier->check(0, 4);
    f.notifier->check(0, 0);
    TEST_ASSERT(f.notifier->consecutive_failures() == 4, "(0, 0) leaves the counter alone");
    TEST_ASSERT(f.transport->sent.empty(), "(0, 0) sends nothing");

    return true;
}

bool test_cooldown() {
    std::cout << "\n=== Test 4: Cooldown ===" << std::endl;
    Fixture f;

    f.notifier->check(0, 5);
    f.notifier->check(0, 1);
    TEST_ASSERT(f.transport->sent.size() == 1, "Second alert suppressed by cooldown");

    TEST_ASSERT(!f.notifier->notify_circuit_breaker_open(3), "Breaker alert shares the cooldown");

    f.clock->advance(3600);
    f.notifier->check(0, 1);
    TEST_ASSERT(f.transport->sent.size() == 2, "Alert sent again after the cooldown");

    return true;
}

bool test_breaker_alerts() {
    std::cout << "\n=== Test 5: Breaker Alerts ===" << std::endl;
    Fixture f;

    TEST_ASSERT(f.notifier->notify_circuit_breaker_open(3), "Breaker alert sent");
    TEST_ASSERT(f.transport->sent[0].subject.find("Circuit breaker") != std::string::npos,
                "Subject mentions the circuit breaker");
    TEST_ASSERT(f.transport->sent[0].body.find("3 consecutive") != std::string::npos,
                "Body carries the failure count");

    f.clock->advance(3600);
    TEST_ASSERT(f.notifier->notify_module_circuit_open("crm", 5), "Module alert sent");
    TEST_ASSERT(f.transport->sent[1].subject.find("crm") != std::string::npos, "Subject names the module");

    return true;
}

bool test_no_recipient() {
    std::cout << "\n=== Test 6: No Recipient Configured ===" << std::endl;
    Fixture f("");

    f.notifier->check(0, 10);
    TEST_ASSERT(!f.notifier->notify_circuit_breaker_open(3), "Breaker alert skipped");
    TEST_ASSERT(f.transport->sent.empty(), "Transport never called");
    TEST_ASSERT(f.notifier->consecutive_failures() == 10, "Counter still tracked");

    return true;
}

bool test_transport_failure() {
    std::cout << "\n=== Test 7: Transport Failure ===" << std::endl;
    Fixture f;

    f.transport->succeed = false;
    TEST_ASSERT(!f.notifier->notify_circuit_breaker_open(3), "Failed send reported");

    f.transport->succeed = true;
    TEST_ASSERT(f.notifier->notify_circuit_breaker_open(3), "Failed send does not start the cooldown");

    return true;
}

bool test_concurrent_workers() {
    std::cout << "\n=== Test 8: Failures From Concurrent Workers ===" << std::endl;
    auto clock = std::make_shared<ManualClock>();
    auto store = std::make_shared<ContendedStateStore>(clock);
    auto transport = std::make_shared<RecordingTransport>();
    NotifierConfig config;
    config.recipient = "ops@example.com";
    FailureNotifier notifier(store, transport, clock, config);

    store->other_worker_failures = 2;
    notifier.check(0, 1);
    TEST_ASSERT(notifier.consecutive_failures() == 3, "Other worker's failures not overwritten");

    store->other_worker_failures = 1;
    notifier.check(0, 1);
    TEST_ASSERT(notifier.consecutive_failures() == 5, "Streak counts every worker");
    TEST_ASSERT(transport->sent.size() == 1, "Threshold reached across workers");

    return true;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Failure Notifier Tests                               ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_threshold();
    all_passed &= test_success_resets();
    all_passed &= test_empty_batch_noop();
    all_passed &= test_cooldown();
    all_passed &= test_breaker_alerts();
    all_passed &= test_no_recipient();
    all_passed &= test_transport_failure();
    all_passed &= test_concurrent_workers();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
