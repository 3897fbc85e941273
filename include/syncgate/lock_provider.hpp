#pragma once

#include "syncgate/database.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace syncgate {

// Outcome of a named-lock request. Only Acquired means the caller owns the lock.
enum class LockSignal {
    Acquired,
    Denied,     // Held elsewhere until the wait ran out
    Error       // Connection/SQL failure or an unreadable answer
};

const char* to_string(LockSignal signal);

/**
 * LockProvider - server-side named lock
 *
 * acquire() waits up to timeout_seconds (0 = single attempt) and never throws.
 * release() is fire-and-forget: the provider logs failures and moves on, the
 * server drops the lock with the session anyway.
 */
class LockProvider {
public:
    virtual ~LockProvider() = default;
    virtual LockSignal acquire(const std::string& name, int timeout_seconds) = 0;
    virtual void release(const std::string& name) = 0;
};

/**
 * PostgreSQL advisory locks keyed by hashtextextended(name, 0).
 *
 * Advisory locks belong to the session that took them, so every held lock
 * pins its own dedicated connection until release(). If that connection dies
 * the server releases the lock by itself.
 */
class PgAdvisoryLockProvider : public LockProvider {
private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<DatabaseConnection>> sessions_;
    int poll_interval_ms_;

    LockSignal try_lock(DatabaseConnection& conn, const std::string& name);

public:
    explicit PgAdvisoryLockProvider(std::shared_ptr<DatabasePool> db_pool,
                                    int poll_interval_ms = 100);
    ~PgAdvisoryLockProvider() override;

    LockSignal acquire(const std::string& name, int timeout_seconds) override;
    void release(const std::string& name) override;
};

} // namespace syncgate
