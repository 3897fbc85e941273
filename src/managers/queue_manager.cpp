#include "syncgate/queue_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace syncgate {

QueueManager::QueueManager(std::shared_ptr<JobRepository> repository,
                           std::shared_ptr<Clock> clock,
                           const QueueConfig& config)
    : repository_(repository), clock_(clock), config_(config) {
    if (!repository_) {
        throw std::invalid_argument("Job repository cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
}

std::string QueueManager::generate_uuid() {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;

    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    std::lock_guard<std::mutex> lock(uuid_mutex);

    auto now = std::chrono::system_clock::now();
    uint64_t current_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    // Same millisecond (or clock went backwards): bump the sequence to keep ordering
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;

    // 48-bit unix_ts_ms (big-endian)
    for (int i = 0; i < 6; ++i) {
        bytes[i] = (last_ms >> (40 - 8 * i)) & 0xFF;
    }

    // 4-bit version (0111) and 12-bit sequence
    uint16_t seq = sequence & 0x0FFF;
    bytes[6] = 0x70 | (seq >> 8);
    bytes[7] = seq & 0xFF;

    // 2-bit variant (10) and 62 random bits
    uint64_t rand_data = gen();
    bytes[8] = 0x80 | ((rand_data >> 56) & 0x3F);
    for (int i = 9; i < 16; ++i) {
        bytes[i] = (rand_data >> (8 * (15 - i))) & 0xFF;
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return ss.str();
}

std::optional<int64_t> QueueManager::enqueue(Job job, int debounce_seconds) {
    if (job.module.empty() || job.entity_type.empty()) {
        spdlog::warn("Rejected sync job without module or entity type (module='{}', entity_type='{}')",
                     job.module, job.entity_type);
        return std::nullopt;
    }

    job.priority = std::clamp(job.priority, 1, 10);
    job.wp_id = std::max<int64_t>(0, job.wp_id);
    job.odoo_id = std::max<int64_t>(0, job.odoo_id);
    job.max_attempts = config_.default_max_attempts < 1 ? 3 : config_.default_max_attempts;
    if (debounce_seconds > 0) {
        job.scheduled_at = format_utc(clock_->now() + debounce_seconds);
    }

    if (auto existing = repository_->find_pending_duplicate(job)) {
        if (repository_->update_pending(*existing, job)) {
            spdlog::debug("Coalesced {} {} job into pending job {} ({}/{})",
                          to_string(job.direction), to_string(job.action), *existing,
                          job.module, job.entity_type);
            return existing;
        }
        // Picked up by a worker between lookup and update: enqueue a fresh job
    }

    job.correlation_id = generate_uuid();
    int64_t id = repository_->insert(job);

    spdlog::debug("Enqueued sync job {}: {} {} {}/{} wp_id={} odoo_id={} correlation_id={}",
                  id, to_string(job.direction), to_string(job.action), job.module,
                  job.entity_type, job.wp_id, job.odoo_id, *job.correlation_id);
    return id;
}

std::optional<int64_t> QueueManager::push(const std::string& module,
                                          const std::string& entity_type,
                                          JobAction action,
                                          int64_t wp_id,
                                          int64_t odoo_id,
                                          const nlohmann::json& payload,
                                          std::optional<int> priority,
                                          int debounce_seconds) {
    Job job;
    job.module = module;
    job.direction = Direction::WpToOdoo;
    job.entity_type = entity_type;
    job.action = action;
    job.wp_id = wp_id;
    job.odoo_id = odoo_id;
    job.payload = payload.dump();
    job.priority = priority.value_or(config_.default_priority);

    return enqueue(job, debounce_seconds < 0 ? config_.push_debounce_seconds : debounce_seconds);
}

std::optional<int64_t> QueueManager::pull(const std::string& module,
                                          const std::string& entity_type,
                                          JobAction action,
                                          int64_t odoo_id,
                                          int64_t wp_id,
                                          const nlohmann::json& payload,
                                          std::optional<int> priority,
                                          int debounce_seconds) {
    Job job;
    job.module = module;
    job.direction = Direction::OdooToWp;
    job.entity_type = entity_type;
    job.action = action;
    job.wp_id = wp_id;
    job.odoo_id = odoo_id;
    job.payload = payload.dump();
    job.priority = priority.value_or(config_.default_priority);

    return enqueue(job, debounce_seconds);
}

bool QueueManager::cancel(int64_t job_id) {
    bool cancelled = repository_->delete_pending(job_id);
    if (cancelled) {
        spdlog::info("Cancelled sync job {}", job_id);
    } else {
        spdlog::debug("Sync job {} not cancelled: missing or no longer pending", job_id);
    }
    return cancelled;
}

std::vector<Job> QueueManager::get_pending(const std::optional<std::string>& module,
                                           const std::optional<std::string>& entity_type) {
    return repository_->select_pending(module, entity_type);
}

QueueStats QueueManager::get_stats() {
    return repository_->stats();
}

QueueHealth QueueManager::get_health_metrics() {
    return repository_->health();
}

int QueueManager::retry_failed() {
    int count = repository_->reset_failed();
    if (count > 0) {
        spdlog::info("Re-queued {} failed sync jobs", count);
    }
    return count;
}

int QueueManager::cleanup(int days_old) {
    if (days_old <= 0) {
        days_old = config_.cleanup_days;
    }

    std::string cutoff = format_utc(clock_->now() - static_cast<int64_t>(days_old) * 86400);
    int count = repository_->delete_finished_before(cutoff);

    spdlog::info("Sync queue cleanup removed {} jobs finished before {}", count, cutoff);
    return count;
}

std::vector<Job> QueueManager::fetch_ready(int batch_size) {
    if (batch_size <= 0) {
        batch_size = config_.fetch_batch_size;
    }
    return repository_->select_ready(batch_size, format_utc(clock_->now()));
}

bool QueueManager::update_status(int64_t job_id, JobStatus status, const JobUpdate& update) {
    bool updated = repository_->update_status(job_id, status, update);
    if (!updated) {
        spdlog::warn("Sync job {} not moved to {}: missing or already finished",
                     job_id, to_string(status));
    }
    return updated;
}

} // namespace syncgate
