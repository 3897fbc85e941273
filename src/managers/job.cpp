#include "syncgate/job.hpp"
#include <algorithm>
#include <climits>
#include <cstdint>
#include <cmath>

namespace syncgate {

const char* to_string(Direction direction) {
    switch (direction) {
        case Direction::WpToOdoo: return "wp_to_odoo";
        case Direction::OdooToWp: return "odoo_to_wp";
    }
    return "wp_to_odoo";
}

const char* to_string(JobAction action) {
    switch (action) {
        case JobAction::Create: return "create";
        case JobAction::Update: return "update";
        case JobAction::Delete: return "delete";
    }
    return "update";
}

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Done: return "done";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

std::optional<Direction> parse_direction(const std::string& value) {
    if (value == "wp_to_odoo") return Direction::WpToOdoo;
    if (value == "odoo_to_wp") return Direction::OdooToWp;
    return std::nullopt;
}

std::optional<JobAction> parse_action(const std::string& value) {
    if (value == "create") return JobAction::Create;
    if (value == "update") return JobAction::Update;
    if (value == "delete") return JobAction::Delete;
    return std::nullopt;
}

std::optional<JobStatus> parse_status(const std::string& value) {
    if (value == "pending") return JobStatus::Pending;
    if (value == "processing") return JobStatus::Processing;
    if (value == "done" || value == "completed") return JobStatus::Done;
    if (value == "failed") return JobStatus::Failed;
    if (value == "cancelled") return JobStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Done || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

namespace {

// Numbers pass through, numeric-looking strings are coerced, anything else
// (null, bool, garbage text) falls back to the default
int64_t field_int(const nlohmann::json& row, const char* name, int64_t default_value) {
    auto it = row.find(name);
    if (it == row.end() || it->is_null()) return default_value;

    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        return value > static_cast<uint64_t>(INT64_MAX) ? INT64_MAX : static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) {
        // Outside [-2^63, 2^63) the cast is undefined
        double value = it->get<double>();
        if (!std::isfinite(value) || value < -9223372036854775808.0 || value >= 9223372036854775808.0) {
            return default_value;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) return default_value;
        try {
            size_t consumed = 0;
            int64_t value = std::stoll(text, &consumed);
            return consumed == text.size() ? value : default_value;
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::string field_string(const nlohmann::json& row, const char* name, const std::string& default_value) {
    auto it = row.find(name);
    if (it == row.end() || it->is_null()) return default_value;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<std::string> field_optional_string(const nlohmann::json& row, const char* name) {
    auto it = row.find(name);
    if (it == row.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

Job Job::from_row(const nlohmann::json& row) {
    if (!row.is_object()) {
        throw JobDecodeError("job row is not an object: " + row.dump());
    }

    Job job;
    job.id = field_int(row, "id", 0);
    job.correlation_id = field_optional_string(row, "correlation_id");
    job.module = field_string(row, "module", "");
    job.entity_type = field_string(row, "entity_type", "");
    job.wp_id = std::max<int64_t>(0, field_int(row, "wp_id", 0));
    job.odoo_id = std::max<int64_t>(0, field_int(row, "odoo_id", 0));

    job.direction = parse_direction(field_string(row, "direction", "")).value_or(Direction::WpToOdoo);
    job.action = parse_action(field_string(row, "action", "")).value_or(JobAction::Update);

    job.payload = field_optional_string(row, "payload");

    int64_t priority = field_int(row, "priority", 5);
    job.priority = static_cast<int>(std::clamp<int64_t>(priority, 1, 10));

    std::string status = field_string(row, "status", "pending");
    auto parsed_status = parse_status(status);
    if (!parsed_status) {
        throw JobDecodeError("job " + std::to_string(job.id) + " has unknown status '" + status + "'");
    }
    job.status = *parsed_status;

    int64_t attempts = field_int(row, "attempts", 0);
    job.attempts = static_cast<int>(std::clamp<int64_t>(attempts, 0, INT_MAX));

    int64_t max_attempts = field_int(row, "max_attempts", 3);
    job.max_attempts = max_attempts < 1 ? 3 : static_cast<int>(std::min<int64_t>(max_attempts, INT_MAX));

    job.error_message = field_optional_string(row, "error_message");
    job.scheduled_at = field_optional_string(row, "scheduled_at");
    job.processed_at = field_optional_string(row, "processed_at");
    job.created_at = field_string(row, "created_at", "");

    return job;
}

nlohmann::json Job::to_json() const {
    return {
        {"id", id},
        {"correlation_id", optional_to_json(correlation_id)},
        {"module", module},
        {"direction", to_string(direction)},
        {"entity_type", entity_type},
        {"wp_id", wp_id},
        {"odoo_id", odoo_id},
        {"action", to_string(action)},
        {"payload", payload_json()},
        {"priority", priority},
        {"status", to_string(status)},
        {"attempts", attempts},
        {"max_attempts", max_attempts},
        {"error_message", optional_to_json(error_message)},
        {"scheduled_at", optional_to_json(scheduled_at)},
        {"processed_at", optional_to_json(processed_at)},
        {"created_at", created_at}
    };
}

nlohmann::json Job::payload_json() const {
    if (!payload || payload->empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(*payload, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json::object();
    }
    return parsed;
}

nlohmann::json QueueStats::to_json() const {
    return {
        {"pending", pending},
        {"processing", processing},
        {"done", done},
        {"failed", failed},
        {"cancelled", cancelled},
        {"total", total},
        {"last_processed_at", optional_to_json(last_processed_at)}
    };
}

nlohmann::json QueueHealth::to_json() const {
    return {
        {"avg_latency_seconds", avg_latency_seconds},
        {"success_rate", success_rate},
        {"depth_by_module", depth_by_module}
    };
}

} // namespace syncgate
