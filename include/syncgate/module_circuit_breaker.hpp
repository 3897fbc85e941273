#pragma once

#include "syncgate/clock.hpp"
#include "syncgate/config.hpp"
#include "syncgate/failure_notifier.hpp"
#include "syncgate/lock_provider.hpp"
#include "syncgate/state_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace syncgate {

struct ModuleCircuitState {
    int64_t failures = 0;
    int64_t opened_at = 0;   // 0 = closed
};

/**
 * ModuleCircuitBreaker - per-module gate next to the global CircuitBreaker
 *
 * The global breaker covers transport-level outages. This one pauses a
 * single module whose batches keep failing (model removed on the remote,
 * access rights changed) while the other modules keep syncing.
 *
 * All module states are stored as one JSON document under
 * ModuleBreakerConfig::state_key. Read-modify-write cycles are serialized
 * with a DistributedMutex; if the mutex is busy the update goes ahead
 * unserialized and a lost increment only delays opening by one batch.
 */
class ModuleCircuitBreaker {
private:
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<LockProvider> lock_provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<FailureNotifier> failure_notifier_;
    ModuleBreakerConfig config_;

    std::map<std::string, ModuleCircuitState> load_states();
    void save_states(const std::map<std::string, ModuleCircuitState>& states);

    void record_module_success(const std::string& module);
    void record_module_failure(const std::string& module);

public:
    ModuleCircuitBreaker(std::shared_ptr<StateStore> store,
                         std::shared_ptr<LockProvider> lock_provider,
                         std::shared_ptr<Clock> clock,
                         const ModuleBreakerConfig& config = ModuleBreakerConfig{});

    void set_failure_notifier(std::shared_ptr<FailureNotifier> notifier) {
        failure_notifier_ = notifier;
    }

    bool is_module_available(const std::string& module);
    void record_module_batch(const std::string& module, int successes, int failures);

    // Open, non-stale modules only
    std::map<std::string, ModuleCircuitState> get_open_modules();

    void reset_module(const std::string& module);
};

} // namespace syncgate
