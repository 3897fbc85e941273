#include "syncgate/circuit_breaker.hpp"
#include "syncgate/config.hpp"
#include "syncgate/database.hpp"
#include "syncgate/job_repository.hpp"
#include "syncgate/lock_provider.hpp"
#include "syncgate/module_circuit_breaker.hpp"
#include "syncgate/queue_manager.hpp"
#include "syncgate/state_store.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace syncgate;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  migrate                         Create the schema, queue and state tables\n"
              << "  stats                           Queue counts, latency, success rate, depth\n"
              << "  pending [module] [entity_type]  List pending jobs\n"
              << "  cancel <job_id>                 Delete a job that is still pending\n"
              << "  retry-failed                    Move failed jobs back to pending\n"
              << "  cleanup [days]                  Delete old done/failed jobs and expired state\n"
              << "  breaker-status                  Global circuit breaker state\n"
              << "  breaker-reset                   Close the global circuit breaker\n"
              << "  module-status                   Modules with an open circuit\n"
              << "  module-reset <module>           Close one module circuit\n\n"
              << "Options:\n"
              << "  --schema <name>                 Database schema (default: PG_SCHEMA or syncgate)\n"
              << "  --verbose                       Debug logging\n"
              << "  --help                          Show this message\n\n"
              << "Connection settings come from PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD.\n";
}

struct Services {
    std::shared_ptr<DatabasePool> pool;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<PgStateStore> store;
    std::shared_ptr<LockProvider> locks;
    std::shared_ptr<QueueManager> queue;
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<ModuleCircuitBreaker> module_breaker;
};

Services build_services(const Config& config) {
    Services s;
    const auto& db = config.database;

    s.pool = std::make_shared<DatabasePool>(db.connection_string(),
                                            static_cast<size_t>(db.pool_size > 0 ? db.pool_size : 1),
                                            db.pool_acquisition_timeout,
                                            db.statement_timeout,
                                            db.lock_timeout,
                                            db.idle_timeout);
    s.clock = std::make_shared<SystemClock>();
    s.store = std::make_shared<PgStateStore>(s.pool, db.schema);
    s.locks = std::make_shared<PgAdvisoryLockProvider>(s.pool);

    auto repository = std::make_shared<PgJobRepository>(s.pool, db.schema);
    s.queue = std::make_shared<QueueManager>(repository, s.clock, config.queue);

    auto notifier = std::make_shared<FailureNotifier>(s.store, std::make_shared<LogTransport>(),
                                                      s.clock, config.notifier);

    s.breaker = std::make_shared<CircuitBreaker>(s.store, s.locks, s.clock, config.breaker);
    s.breaker->set_failure_notifier(notifier);

    s.module_breaker = std::make_shared<ModuleCircuitBreaker>(s.store, s.locks, s.clock,
                                                             config.module_breaker);
    s.module_breaker->set_failure_notifier(notifier);

    return s;
}

nlohmann::json jobs_to_json(const std::vector<Job>& jobs) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& job : jobs) {
        out.push_back(job.to_json());
    }
    return out;
}

nlohmann::json snapshot_to_json(const CircuitSnapshot& snap) {
    return {
        {"state", to_string(snap.state)},
        {"failure_count", snap.failure_count},
        {"opened_at", snap.opened_at ? nlohmann::json(format_utc(*snap.opened_at)) : nlohmann::json(nullptr)},
        {"probe_claimed", snap.probe_claimed},
        {"seconds_until_probe", snap.seconds_until_probe}
    };
}

std::optional<int64_t> parse_id(const std::string& text) {
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(text, &consumed);
        if (consumed != text.size() || value <= 0) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int run_command(const std::string& command, const std::vector<std::string>& args, const Config& config) {
    if (command == "migrate") {
        DatabasePool pool(config.database.connection_string(), 1, config.database.pool_acquisition_timeout);
        if (!initialize_schema(pool, config.database.schema)) {
            spdlog::error("Migration failed");
            return 1;
        }
        std::cout << "Schema '" << config.database.schema << "' is up to date" << std::endl;
        return 0;
    }

    Services s = build_services(config);

    if (command == "stats") {
        nlohmann::json out = s.queue->get_stats().to_json();
        out["health"] = s.queue->get_health_metrics().to_json();
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (command == "pending") {
        std::optional<std::string> module;
        std::optional<std::string> entity_type;
        if (args.size() > 0) module = args[0];
        if (args.size() > 1) entity_type = args[1];
        std::cout << jobs_to_json(s.queue->get_pending(module, entity_type)).dump(2) << std::endl;
        return 0;
    }

    if (command == "cancel") {
        std::optional<int64_t> id;
        if (!args.empty()) id = parse_id(args[0]);
        if (!id) {
            std::cerr << "cancel needs a numeric job id" << std::endl;
            return 2;
        }
        if (!s.queue->cancel(*id)) {
            std::cerr << "Job " << *id << " is not pending (or does not exist)" << std::endl;
            return 1;
        }
        std::cout << "Cancelled job " << *id << std::endl;
        return 0;
    }

    if (command == "retry-failed") {
        std::cout << "Re-queued " << s.queue->retry_failed() << " failed jobs" << std::endl;
        return 0;
    }

    if (command == "cleanup") {
        int days = args.empty() ? 0 : std::atoi(args[0].c_str());
        std::cout << "Deleted " << s.queue->cleanup(days) << " finished jobs" << std::endl;
        std::cout << "Purged " << s.store->purge_expired() << " expired state entries" << std::endl;
        return 0;
    }

    if (command == "breaker-status") {
        std::cout << snapshot_to_json(s.breaker->snapshot()).dump(2) << std::endl;
        return 0;
    }

    if (command == "breaker-reset") {
        s.breaker->reset();
        std::cout << "Circuit breaker closed" << std::endl;
        return 0;
    }

    if (command == "module-status") {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [module, state] : s.module_breaker->get_open_modules()) {
            out[module] = {{"failures", state.failures}, {"opened_at", format_utc(state.opened_at)}};
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (command == "module-reset") {
        if (args.empty()) {
            std::cerr << "module-reset needs a module name" << std::endl;
            return 2;
        }
        s.module_breaker->reset_module(args[0]);
        std::cout << "Module circuit for '" << args[0] << "' closed" << std::endl;
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    Config config = Config::load();
    init_logging(config.logging);

    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--schema" && i + 1 < argc) {
            config.database.schema = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        return run_command(command, args, config);
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", command, e.what());
        return 1;
    }
}
