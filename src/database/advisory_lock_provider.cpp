#include "syncgate/lock_provider.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace syncgate {

const char* to_string(LockSignal signal) {
    switch (signal) {
        case LockSignal::Acquired: return "acquired";
        case LockSignal::Denied: return "denied";
        case LockSignal::Error: return "error";
    }
    return "error";
}

PgAdvisoryLockProvider::PgAdvisoryLockProvider(std::shared_ptr<DatabasePool> db_pool,
                                               int poll_interval_ms)
    : db_pool_(db_pool), poll_interval_ms_(poll_interval_ms) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    if (poll_interval_ms_ <= 0) {
        poll_interval_ms_ = 100;
    }
}

PgAdvisoryLockProvider::~PgAdvisoryLockProvider() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.empty()) {
        // Closing the sessions drops their advisory locks server-side
        spdlog::warn("Advisory lock provider destroyed with {} lock(s) still held", sessions_.size());
    }
    sessions_.clear();
}

LockSignal PgAdvisoryLockProvider::try_lock(DatabaseConnection& conn, const std::string& name) {
    auto result = QueryResult(conn.exec_params(
        "SELECT pg_try_advisory_lock(hashtextextended($1, 0))", {name}));

    if (!result.is_success() || result.num_rows() != 1 || result.is_null(0, 0)) {
        spdlog::warn("Advisory lock '{}' query failed: {}", name, result.error_message());
        return LockSignal::Error;
    }

    std::string value = result.get_value(0, 0);
    if (value == "t") return LockSignal::Acquired;
    if (value == "f") return LockSignal::Denied;

    spdlog::warn("Advisory lock '{}' returned unexpected value '{}'", name, value);
    return LockSignal::Error;
}

LockSignal PgAdvisoryLockProvider::acquire(const std::string& name, int timeout_seconds) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(timeout_seconds > 0 ? timeout_seconds : 0);

    std::unique_ptr<DatabaseConnection> session;
    try {
        session = db_pool_->open_dedicated_connection();
    } catch (const std::exception& e) {
        spdlog::error("Advisory lock '{}': cannot open session: {}", name, e.what());
        return LockSignal::Error;
    }

    while (true) {
        bool held_locally;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_locally = sessions_.count(name) > 0;
        }

        // Another holder in this process already owns the name; its session
        // would let us in again (advisory locks are re-entrant per session),
        // so only ask the server when nobody here holds it.
        if (!held_locally) {
            LockSignal signal = try_lock(*session, name);
            if (signal == LockSignal::Acquired) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (sessions_.count(name) == 0) {
                    sessions_.emplace(name, std::move(session));
                    spdlog::debug("Advisory lock '{}' acquired", name);
                    return LockSignal::Acquired;
                }
                // Lost a local race after the server said yes; give it back
                auto unlock = QueryResult(session->exec_params(
                    "SELECT pg_advisory_unlock(hashtextextended($1, 0))", {name}));
                if (!unlock.is_success()) {
                    spdlog::warn("Advisory lock '{}' unlock after local race failed: {}",
                                 name, unlock.error_message());
                }
            } else if (signal == LockSignal::Error) {
                return LockSignal::Error;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::debug("Advisory lock '{}' denied after {}s", name, timeout_seconds);
            return LockSignal::Denied;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms_));
    }
}

void PgAdvisoryLockProvider::release(const std::string& name) {
    std::unique_ptr<DatabaseConnection> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            spdlog::debug("Advisory lock '{}' release requested but not held here", name);
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    try {
        auto result = QueryResult(session->exec_params(
            "SELECT pg_advisory_unlock(hashtextextended($1, 0))", {name}));
        if (!result.is_success()) {
            // Lock will be released when the session closes anyway
            spdlog::debug("Advisory lock '{}' explicit unlock failed: {}", name, result.error_message());
        }
    } catch (const std::exception& e) {
        spdlog::debug("Advisory lock '{}' explicit unlock failed: {}", name, e.what());
    }
    spdlog::debug("Advisory lock '{}' released", name);
}

} // namespace syncgate
