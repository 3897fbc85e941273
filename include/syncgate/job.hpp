#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace syncgate {

enum class Direction {
    WpToOdoo,
    OdooToWp
};

enum class JobAction {
    Create,
    Update,
    Delete
};

enum class JobStatus {
    Pending,
    Processing,
    Done,
    Failed,
    Cancelled
};

const char* to_string(Direction direction);
const char* to_string(JobAction action);
const char* to_string(JobStatus status);

std::optional<Direction> parse_direction(const std::string& value);
std::optional<JobAction> parse_action(const std::string& value);
// Accepts the legacy name "completed" for Done
std::optional<JobStatus> parse_status(const std::string& value);

bool is_terminal(JobStatus status);

// Raised only for rows that cannot be turned into a Job at all
class JobDecodeError : public std::runtime_error {
public:
    explicit JobDecodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * One row of the sync queue.
 *
 * Timestamps are UTC "YYYY-MM-DD HH:MM:SS" strings, the same form
 * format_utc() produces, so they compare correctly as text.
 */
struct Job {
    int64_t id = 0;
    std::optional<std::string> correlation_id;
    std::string module;
    Direction direction = Direction::WpToOdoo;
    std::string entity_type;
    int64_t wp_id = 0;
    int64_t odoo_id = 0;
    JobAction action = JobAction::Update;
    std::optional<std::string> payload;      // serialized JSON
    int priority = 5;                        // 1 (most urgent) .. 10
    JobStatus status = JobStatus::Pending;
    int attempts = 0;
    int max_attempts = 3;
    std::optional<std::string> error_message;
    std::optional<std::string> scheduled_at;
    std::optional<std::string> processed_at;
    std::string created_at;

    // Tolerant decoding of a persisted row (see QueryResult::row_to_json).
    // Missing fields take their defaults, numeric strings are coerced and
    // out-of-range values are clamped. Throws JobDecodeError when the row is
    // not an object or carries an unknown status.
    static Job from_row(const nlohmann::json& row);

    nlohmann::json to_json() const;

    // Parsed payload; an absent or unparsable payload reads as {}
    nlohmann::json payload_json() const;
};

// Optional column changes applied together with a status transition
struct JobUpdate {
    std::optional<int> attempts;
    std::optional<std::string> error_message;
    std::optional<std::string> scheduled_at;
    std::optional<std::string> processed_at;
};

struct QueueStats {
    int64_t pending = 0;
    int64_t processing = 0;
    int64_t done = 0;
    int64_t failed = 0;
    int64_t cancelled = 0;
    int64_t total = 0;
    std::optional<std::string> last_processed_at;

    nlohmann::json to_json() const;
};

// How well the queue is draining
struct QueueHealth {
    double avg_latency_seconds = 0.0;    // created_at -> processed_at over done jobs
    double success_rate = 100.0;         // done / (done + failed), percent
    std::map<std::string, int64_t> depth_by_module;  // pending jobs

    nlohmann::json to_json() const;
};

} // namespace syncgate
