#pragma once

#include "syncgate/database.hpp"
#include "syncgate/job.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncgate {

/**
 * JobRepository - persistence seam of the sync queue
 *
 * Timestamps crossing this interface are UTC "YYYY-MM-DD HH:MM:SS" strings.
 * Listings are ordered by priority, then creation.
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    // Inserts a pending job and returns its id
    virtual int64_t insert(const Job& job) = 0;

    // Pending job with the same module, entity_type, direction and local key
    // (wp_id when > 0, else odoo_id when > 0)
    virtual std::optional<int64_t> find_pending_duplicate(const Job& job) = 0;

    // Overwrites action, payload and priority of a still-pending job
    virtual bool update_pending(int64_t id, const Job& job) = 0;

    // Deletes the job only while it is pending
    virtual bool delete_pending(int64_t id) = 0;

    virtual std::optional<Job> find(int64_t id) = 0;

    virtual std::vector<Job> select_pending(const std::optional<std::string>& module,
                                            const std::optional<std::string>& entity_type) = 0;

    // Pending jobs whose scheduled_at is unset or not after now
    virtual std::vector<Job> select_ready(int limit, const std::string& now) = 0;

    // Only pending or processing rows change; terminal rows stay as they are
    virtual bool update_status(int64_t id, JobStatus status, const JobUpdate& update) = 0;

    virtual QueueStats stats() = 0;

    // Latency and success rate over finished jobs, pending depth per module
    virtual QueueHealth health() = 0;

    // failed -> pending with attempts, error and schedule cleared
    virtual int reset_failed() = 0;

    // Deletes done/failed jobs created before cutoff
    virtual int delete_finished_before(const std::string& cutoff) = 0;
};

// PostgreSQL-backed repository over <schema>.sync_queue
class PgJobRepository : public JobRepository {
private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::string table_;

    std::vector<Job> decode_rows(const QueryResult& result);

public:
    explicit PgJobRepository(std::shared_ptr<DatabasePool> db_pool,
                             const std::string& schema_name = "syncgate");

    int64_t insert(const Job& job) override;
    std::optional<int64_t> find_pending_duplicate(const Job& job) override;
    bool update_pending(int64_t id, const Job& job) override;
    bool delete_pending(int64_t id) override;
    std::optional<Job> find(int64_t id) override;
    std::vector<Job> select_pending(const std::optional<std::string>& module,
                                    const std::optional<std::string>& entity_type) override;
    std::vector<Job> select_ready(int limit, const std::string& now) override;
    bool update_status(int64_t id, JobStatus status, const JobUpdate& update) override;
    QueueStats stats() override;
    QueueHealth health() override;
    int reset_failed() override;
    int delete_finished_before(const std::string& cutoff) override;
};

} // namespace syncgate
