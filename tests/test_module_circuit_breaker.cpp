/**
 * Module Circuit Breaker Test
 *
 * Validates per-module isolation:
 * 1. A module opens after five failed batches, other modules keep running
 * 2. Half-open after the recovery delay, closed again on success
 * 3. Stale open state is discarded
 * 4. Busy state lock does not lose the update
 */

#include "syncgate/module_circuit_breaker.hpp"
#include "test_utils/test_support.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

using namespace syncgate;
using namespace syncgate::testing;

namespace {

struct Fixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<MemoryStateStore> store = std::make_shared<MemoryStateStore>(clock);
    std::shared_ptr<ScriptedLockProvider> locks = std::make_shared<ScriptedLockProvider>();
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::unique_ptr<ModuleCircuitBreaker> breaker;

    Fixture() {
        NotifierConfig notifier_config;
        notifier_config.recipient = "ops@example.com";
        notifier_config.cooldown = 0;
        auto notifier = std::make_shared<FailureNotifier>(store, transport, clock, notifier_config);

        breaker = std::make_unique<ModuleCircuitBreaker>(store, locks, clock);
        breaker->set_failure_notifier(notifier);
    }

    void fail(const std::string& module, int batches) {
        for (int i = 0; i < batches; ++i) breaker->record_module_batch(module, 0, 10);
    }
};

bool test_opens_after_five_batches() {
    std::cout << "\n=== Test 1: Opens After Five Failed Batches ===" << std::endl;
    Fixture f;

    f.fail("woocommerce", 4);
    TEST_ASSERT(f.breaker->is_module_available("woocommerce"), "Available after 4 failed batches");
    TEST_ASSERT(f.breaker->get_open_modules().empty(), "Nothing open yet");

    f.fail("woocommerce", 1);
    TEST_ASSERT(!f.breaker->is_module_available("woocommerce"), "Paused after 5 failed batches");
    TEST_ASSERT(f.breaker->is_module_available("crm"), "Other modules unaffected");

    auto open = f.breaker->get_open_modules();
    TEST_ASSERT(open.size() == 1 && open.count("woocommerce") == 1, "Module listed as open");
    TEST_ASSERT(open["woocommerce"].failures == 5, "Failure count recorded");
    TEST_ASSERT(open["woocommerce"].opened_at == f.clock->now(), "Opened timestamp recorded");

    return true;
}

bool test_notifies_with_module_name() {
    std::cout << "\n=== Test 2: Module Notification ===" << std::endl;
    Fixture f;

    f.fail("invoices", 5);
    TEST_ASSERT(f.transport->sent.size() == 1, "One notification on opening");
    TEST_ASSERT(f.transport->sent[0].subject.find("invoices") != std::string::npos,
                "Subject names the module");

    f.fail("invoices", 3);
    TEST_ASSERT(f.transport->sent.size() == 1, "No repeat while open");

    return true;
}

bool test_half_open_and_recovery() {
    std::cout << "\n=== Test 3: Half-Open and Recovery ===" << std::endl;
    Fixture f;
    f.fail("crm", 5);

    f.clock->advance(599);
    TEST_ASSERT(!f.breaker->is_module_available("crm"), "Paused inside the recovery delay");
    f.clock->advance(1);
    TEST_ASSERT(f.breaker->is_module_available("crm"), "Probe batch allowed at 600s");

    f.fail("crm", 1);
    TEST_ASSERT(!f.breaker->is_module_available("crm"), "Failed probe restarts the window");

    f.clock->advance(600);
    TEST_ASSERT(f.breaker->is_module_available("crm"), "Next probe after another 600s");
    f.breaker->record_module_batch("crm", 9, 1);
    TEST_ASSERT(f.breaker->get_open_modules().empty(), "Successful batch closes the module");
    TEST_ASSERT(!f.store->contains("syncgate_module_cb_states"), "Empty state document removed");

    return true;
}

bool test_success_resets_streak() {
    std::cout << "\n=== Test 4: Success Resets Streak ===" << std::endl;
    Fixture f;

    f.fail("events", 4);
    f.breaker->record_module_batch("events", 5, 5);
    f.fail("events", 4);
    TEST_ASSERT(f.breaker->is_module_available("events"), "Ratio 0.5 batch resets the streak");

    f.breaker->record_module_batch("events", 0, 0);
    f.fail("events", 1);
    TEST_ASSERT(!f.breaker->is_module_available("events"), "(0, 0) is ignored, fifth failure opens");

    return true;
}

bool test_stale_state_discarded() {
    std::cout << "\n=== Test 5: Stale State ===" << std::endl;
    Fixture f;
    f.fail("lms", 5);

    f.clock->advance(7201);
    TEST_ASSERT(f.breaker->get_open_modules().empty(), "Stale module not listed");
    TEST_ASSERT(f.breaker->is_module_available("lms"), "Stale state reads as closed");

    f.fail("lms", 4);
    TEST_ASSERT(f.breaker->is_module_available("lms"), "Streak restarted after discard");

    return true;
}

bool test_reset_module() {
    std::cout << "\n=== Test 6: Operator Reset ===" << std::endl;
    Fixture f;
    f.fail("a", 5);
    f.fail("b", 5);

    f.breaker->reset_module("a");
    TEST_ASSERT(f.breaker->is_module_available("a"), "Reset module available");
    TEST_ASSERT(!f.breaker->is_module_available("b"), "Other open module untouched");

    f.breaker->reset_module("unknown");
    TEST_ASSERT(f.breaker->get_open_modules().size() == 1, "Resetting an unknown module is harmless");

    return true;
}

bool test_lock_busy_still_records() {
    std::cout << "\n=== Test 7: State Lock Busy ===" << std::endl;
    Fixture f;

    f.locks->hold_elsewhere("syncgate_module_cb_states");
    f.fail("partners", 5);
    TEST_ASSERT(!f.breaker->is_module_available("partners"), "Updates applied without the lock");
    TEST_ASSERT(f.locks->release_calls == 0, "Lock not released when never acquired");

    return true;
}

bool test_corrupt_state_ignored() {
    std::cout << "\n=== Test 8: Unreadable State Document ===" << std::endl;
    Fixture f;

    f.store->put("syncgate_module_cb_states", "{not json", 0);
    TEST_ASSERT(f.breaker->is_module_available("crm"), "Corrupt document reads as empty");

    f.fail("crm", 5);
    TEST_ASSERT(!f.breaker->is_module_available("crm"), "Document rewritten on next update");

    f.store->fail = true;
    TEST_ASSERT(!f.breaker->is_module_available("crm"), "Store error pauses the module");

    return true;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Module Circuit Breaker Tests                         ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_opens_after_five_batches();
    all_passed &= test_notifies_with_module_name();
    all_passed &= test_half_open_and_recovery();
    all_passed &= test_success_resets_streak();
    all_passed &= test_stale_state_discarded();
    all_passed &= test_reset_module();
    all_passed &= test_lock_busy_still_records();
    all_passed &= test_corrupt_state_ignored();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
