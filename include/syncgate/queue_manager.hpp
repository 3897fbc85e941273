#pragma once

#include "syncgate/clock.hpp"
#include "syncgate/config.hpp"
#include "syncgate/job.hpp"
#include "syncgate/job_repository.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncgate {

/**
 * QueueManager - durable job queue between local entities and the remote
 *
 * push() enqueues local -> remote work, pull() the reverse. A second
 * enqueue for an entity that still has a pending job updates that job in
 * place and returns its id. push() defaults to a short debounce so bursts
 * of saves collapse into one job.
 */
class QueueManager {
private:
    std::shared_ptr<JobRepository> repository_;
    std::shared_ptr<Clock> clock_;
    QueueConfig config_;

    std::optional<int64_t> enqueue(Job job, int debounce_seconds);

public:
    QueueManager(std::shared_ptr<JobRepository> repository,
                 std::shared_ptr<Clock> clock,
                 const QueueConfig& config = QueueConfig{});

    // Without a priority QueueConfig::default_priority applies; either way it
    // is clamped to 1..10. debounce_seconds < 0 uses
    // QueueConfig::push_debounce_seconds.
    std::optional<int64_t> push(const std::string& module,
                                const std::string& entity_type,
                                JobAction action,
                                int64_t wp_id,
                                int64_t odoo_id = 0,
                                const nlohmann::json& payload = nlohmann::json::object(),
                                std::optional<int> priority = std::nullopt,
                                int debounce_seconds = -1);

    std::optional<int64_t> pull(const std::string& module,
                                const std::string& entity_type,
                                JobAction action,
                                int64_t odoo_id,
                                int64_t wp_id = 0,
                                const nlohmann::json& payload = nlohmann::json::object(),
                                std::optional<int> priority = std::nullopt,
                                int debounce_seconds = 0);

    // Only pending jobs can be cancelled
    bool cancel(int64_t job_id);

    std::vector<Job> get_pending(const std::optional<std::string>& module = std::nullopt,
                                 const std::optional<std::string>& entity_type = std::nullopt);

    QueueStats get_stats();
    QueueHealth get_health_metrics();
    int retry_failed();

    // days_old <= 0 uses QueueConfig::cleanup_days
    int cleanup(int days_old = 0);

    // Worker side
    std::vector<Job> fetch_ready(int batch_size = 0);
    bool update_status(int64_t job_id, JobStatus status, const JobUpdate& update = JobUpdate{});

    // Time-ordered UUIDv7, used as correlation id
    static std::string generate_uuid();
};

} // namespace syncgate
