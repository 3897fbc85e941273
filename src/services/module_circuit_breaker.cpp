#include "syncgate/module_circuit_breaker.hpp"
#include "syncgate/distributed_mutex.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

namespace {

int64_t json_int(const nlohmann::json& obj, const char* field) {
    if (!obj.is_object() || !obj.contains(field)) return 0;
    const auto& v = obj.at(field);
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number()) return static_cast<int64_t>(v.get<double>());
    if (v.is_string()) {
        try {
            return std::stoll(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

ModuleCircuitBreaker::ModuleCircuitBreaker(std::shared_ptr<StateStore> store,
                                           std::shared_ptr<LockProvider> lock_provider,
                                           std::shared_ptr<Clock> clock,
                                           const ModuleBreakerConfig& config)
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
}

std::map<std::string, ModuleCircuitState> ModuleCircuitBreaker::load_states() {
    std::map<std::string, ModuleCircuitState> states;

    auto raw = store_->get(config_.state_key);
    if (!raw || raw->empty()) {
        return states;
    }

    try {
        auto doc = nlohmann::json::parse(*raw);
        if (!doc.is_object()) {
            spdlog::warn("Module circuit state is not an object, ignoring it");
            return states;
        }
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            ModuleCircuitState state;
            state.failures = json_int(it.value(), "failures");
            state.opened_at = json_int(it.value(), "opened_at");
            states[it.key()] = state;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Module circuit state unreadable, ignoring it: {}", e.what());
    }

    return states;
}

void ModuleCircuitBreaker::save_states(const std::map<std::string, ModuleCircuitState>& states) {
    if (states.empty()) {
        store_->remove(config_.state_key);
        return;
    }

    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [module, state] : states) {
        doc[module] = {{"failures", state.failures}, {"opened_at", state.opened_at}};
    }
    store_->put(config_.state_key, doc.dump(), 0);
}

bool ModuleCircuitBreaker::is_module_available(const std::string& module) {
    std::map<std::string, ModuleCircuitState> states;
    try {
        states = load_states();
    } catch (const std::exception& e) {
        spdlog::error("Module circuit state unreadable, pausing module {}: {}", module, e.what());
        return false;
    }

    auto it = states.find(module);
    if (it == states.end() || it->second.opened_at == 0) {
        return true;
    }

    int64_t elapsed = clock_->now() - it->second.opened_at;

    if (elapsed > config_.stale_after) {
        spdlog::info("Module circuit breaker state for {} is stale, discarding", module);
        reset_module(module);
        return true;
    }

    // Half-open: let a probe batch through
    return elapsed >= config_.recovery_delay;
}

void ModuleCircuitBreaker::record_module_batch(const std::string& module, int successes, int failures) {
    int total = successes + failures;
    if (total <= 0) {
        return;
    }

    double failure_ratio = static_cast<double>(failures) / static_cast<double>(total);

    DistributedMutex guard(lock_provider_, config_.state_key, 0);
    if (!guard.acquire()) {
        spdlog::debug("Module circuit state lock busy, updating {} without it", module);
    }

    if (failure_ratio < config_.failure_ratio) {
        record_module_success(module);
    } else {
        record_module_failure(module);
    }
}

void ModuleCircuitBreaker::record_module_success(const std::string& module) {
    auto states = load_states();

    auto it = states.find(module);
    if (it == states.end()) {
        return;
    }

    bool was_open = it->second.opened_at > 0;
    states.erase(it);
    save_states(states);

    if (was_open) {
        spdlog::info("Module circuit breaker closed: module {} recovered", module);
    }
}

void ModuleCircuitBreaker::record_module_failure(const std::string& module) {
    auto states = load_states();
    auto& state = states[module];

    ++state.failures;
    int64_t now = clock_->now();

    if (state.opened_at > 0) {
        // Failed probe (or a straggler batch): restart the recovery window.
        // Keeping the first opened_at would let every batch after the first
        // window through, and stale_after would wipe a module that is still
        // failing.
        state.opened_at = now;
        save_states(states);
        spdlog::debug("Module {} still failing, circuit stays open (failures={})", module, state.failures);
        return;
    }

    if (state.failures < config_.failure_threshold) {
        save_states(states);
        return;
    }

    state.opened_at = now;
    int64_t failures = state.failures;
    save_states(states);

    spdlog::warn("Module circuit breaker opened: module={}, consecutive_failures={}, recovery_delay={}s",
                 module, failures, config_.recovery_delay);

    if (failure_notifier_) {
        failure_notifier_->notify_module_circuit_open(module, failures);
    }
}

std::map<std::string, ModuleCircuitState> ModuleCircuitBreaker::get_open_modules() {
    std::map<std::string, ModuleCircuitState> open;
    int64_t now = clock_->now();

    for (const auto& [module, state] : load_states()) {
        if (state.opened_at > 0 && (now - state.opened_at) <= config_.stale_after) {
            open[module] = state;
        }
    }
    return open;
}

void ModuleCircuitBreaker::reset_module(const std::string& module) {
    auto states = load_states();
    if (states.erase(module) == 0) {
        return;
    }
    save_states(states);
    spdlog::info("Module circuit breaker reset: {}", module);
}

} // namespace syncgate
