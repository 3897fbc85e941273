#pragma once

#include "syncgate/database.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace syncgate {

/**
 * StateStore - small keyed store shared by every process
 *
 * Holds breaker counters, opened_at, the probe claim flag and notifier
 * bookkeeping. Every entry may carry a TTL in seconds (0 = no expiry); an
 * expired entry reads exactly like a missing one.
 *
 * add() and increment_by() must be atomic with respect to other processes:
 * they are what makes the probe claim and the CLOSED->OPEN edge single-flight.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Insert or overwrite
    virtual void put(const std::string& key, const std::string& value, int ttl_seconds) = 0;

    // Insert only if absent (or expired). Returns true when this call created the entry.
    virtual bool add(const std::string& key, const std::string& value, int ttl_seconds) = 0;

    // Adds amount to an integer entry (missing/expired counts as 0), refreshes
    // the TTL and returns the new value
    virtual int64_t increment_by(const std::string& key, int64_t amount, int ttl_seconds) = 0;

    int64_t increment(const std::string& key, int ttl_seconds) {
        return increment_by(key, 1, ttl_seconds);
    }

    virtual void remove(const std::string& key) = 0;

    // Reads an integer entry; non-numeric content reads as default_value
    int64_t get_int(const std::string& key, int64_t default_value = 0);
};

// PostgreSQL-backed store over <schema>.state
class PgStateStore : public StateStore {
private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::string table_;

public:
    explicit PgStateStore(std::shared_ptr<DatabasePool> db_pool,
                          const std::string& schema_name = "syncgate");

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value, int ttl_seconds) override;
    bool add(const std::string& key, const std::string& value, int ttl_seconds) override;
    int64_t increment_by(const std::string& key, int64_t amount, int ttl_seconds) override;
    void remove(const std::string& key) override;

    // Deletes expired rows; returns how many were removed
    int purge_expired();
};

} // namespace syncgate
