#include "syncgate/job_repository.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

namespace {

// Timestamps go out as UTC text so they compare against Clock-derived values
const char* SELECT_COLUMNS = R"(
    id, correlation_id, module, direction, entity_type, wp_id, odoo_id, action,
    payload, priority, status, attempts, max_attempts, error_message,
    to_char(scheduled_at AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS scheduled_at,
    to_char(processed_at AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS processed_at,
    to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS created_at
)";

// libpq params carry no NULL here; an empty string stands for NULL
std::string utc_param(int n) {
    return "(NULLIF($" + std::to_string(n) + ", '')::timestamp AT TIME ZONE 'UTC')";
}

} // namespace

PgJobRepository::PgJobRepository(std::shared_ptr<DatabasePool> db_pool, const std::string& schema_name)
    : db_pool_(db_pool) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    table_ = checked_identifier(schema_name) + ".sync_queue";
}

std::vector<Job> PgJobRepository::decode_rows(const QueryResult& result) {
    std::vector<Job> jobs;
    jobs.reserve(result.num_rows());

    for (int i = 0; i < result.num_rows(); ++i) {
        try {
            jobs.push_back(Job::from_row(result.row_to_json(i)));
        } catch (const JobDecodeError& e) {
            spdlog::warn("Skipping undecodable sync job: {}", e.what());
        }
    }
    return jobs;
}

int64_t PgJobRepository::insert(const Job& job) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "INSERT INTO " + table_ + R"( (
            correlation_id, module, direction, entity_type, wp_id, odoo_id,
            action, payload, priority, status, max_attempts, scheduled_at
        ) VALUES (
            NULLIF($1, ''), $2, $3, $4, $5::bigint, $6::bigint,
            $7, NULLIF($8, ''), $9::smallint, 'pending', $10::int, )" + utc_param(11) + R"(
        ) RETURNING id)";

    std::vector<std::string> params = {
        job.correlation_id.value_or(""),
        job.module,
        to_string(job.direction),
        job.entity_type,
        std::to_string(job.wp_id),
        std::to_string(job.odoo_id),
        to_string(job.action),
        job.payload.value_or(""),
        std::to_string(job.priority),
        std::to_string(job.max_attempts),
        job.scheduled_at.value_or("")
    };

    auto result = QueryResult(conn->exec_params(sql, params));
    result.throw_if_failed("sync job insert");

    if (result.num_rows() == 0) {
        throw std::runtime_error("sync job insert returned no id");
    }
    return std::stoll(result.get_value(0, "id"));
}

std::optional<int64_t> PgJobRepository::find_pending_duplicate(const Job& job) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = "SELECT id FROM " + table_ +
                      " WHERE module = $1 AND entity_type = $2 AND direction = $3"
                      " AND status = 'pending'";
    std::vector<std::string> params = {job.module, job.entity_type, to_string(job.direction)};

    if (job.wp_id > 0) {
        sql += " AND wp_id = $4::bigint";
        params.push_back(std::to_string(job.wp_id));
    } else if (job.odoo_id > 0) {
        sql += " AND odoo_id = $4::bigint";
        params.push_back(std::to_string(job.odoo_id));
    }
    sql += " ORDER BY id LIMIT 1";

    auto result = QueryResult(conn->exec_params(sql, params));
    result.throw_if_failed("sync job duplicate lookup");

    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return std::stoll(result.get_value(0, 0));
}

bool PgJobRepository::update_pending(int64_t id, const Job& job) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "UPDATE " + table_ + " SET action = $2, payload = NULLIF($3, ''), priority = $4::smallint"
        " WHERE id = $1::bigint AND status = 'pending'",
        {std::to_string(id), to_string(job.action), job.payload.value_or(""),
         std::to_string(job.priority)}));
    result.throw_if_failed("sync job update");

    return result.affected_rows() > 0;
}

bool PgJobRepository::delete_pending(int64_t id) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "DELETE FROM " + table_ + " WHERE id = $1::bigint AND status = 'pending'",
        {std::to_string(id)}));
    result.throw_if_failed("sync job cancel");

    return result.affected_rows() > 0;
}

std::optional<Job> PgJobRepository::find(int64_t id) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        std::string("SELECT ") + SELECT_COLUMNS + " FROM " + table_ + " WHERE id = $1::bigint",
        {std::to_string(id)}));
    result.throw_if_failed("sync job lookup");

    auto jobs = decode_rows(result);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::vector<Job> PgJobRepository::select_pending(const std::optional<std::string>& module,
                                                 const std::optional<std::string>& entity_type) {
    std::string sql = std::string("SELECT ") + SELECT_COLUMNS + " FROM " + table_ +
                      " WHERE status = 'pending'";
    std::vector<std::string> params;

    if (module) {
        params.push_back(*module);
        sql += " AND module = $" + std::to_string(params.size());
    }
    if (entity_type) {
        params.push_back(*entity_type);
        sql += " AND entity_type = $" + std::to_string(params.size());
    }
    sql += " ORDER BY priority ASC, created_at ASC, id ASC";

    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(sql, params));
    result.throw_if_failed("pending sync jobs");

    return decode_rows(result);
}

std::vector<Job> PgJobRepository::select_ready(int limit, const std::string& now) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        std::string("SELECT ") + SELECT_COLUMNS + " FROM " + table_ +
        " WHERE status = 'pending' AND (scheduled_at IS NULL OR scheduled_at <= " + utc_param(1) + ")"
        " ORDER BY priority ASC, created_at ASC, id ASC LIMIT $2::int",
        {now, std::to_string(limit)}));
    result.throw_if_failed("ready sync jobs");

    return decode_rows(result);
}

bool PgJobRepository::update_status(int64_t id, JobStatus status, const JobUpdate& update) {
    std::vector<std::string> params = {std::to_string(id), to_string(status)};
    std::string sets = "status = $2";

    if (update.attempts) {
        params.push_back(std::to_string(*update.attempts));
        sets += ", attempts = $" + std::to_string(params.size()) + "::int";
    }
    if (update.error_message) {
        params.push_back(*update.error_message);
        sets += ", error_message = NULLIF($" + std::to_string(params.size()) + ", '')";
    }
    if (update.scheduled_at) {
        params.push_back(*update.scheduled_at);
        sets += ", scheduled_at = " + utc_param(static_cast<int>(params.size()));
    }
    if (update.processed_at) {
        params.push_back(*update.processed_at);
        sets += ", processed_at = " + utc_param(static_cast<int>(params.size()));
    }

    // Finished rows are frozen; only retry_failed() brings them back
    std::string sql = "UPDATE " + table_ + " SET " + sets +
                      " WHERE id = $1::bigint AND status IN ('pending', 'processing')";

    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(sql, params));
    result.throw_if_failed("sync job status update");

    return result.affected_rows() > 0;
}

QueueStats PgJobRepository::stats() {
    ScopedConnection conn(db_pool_.get());

    auto result = QueryResult(conn->exec(
        "SELECT status, COUNT(*) AS count FROM " + table_ + " GROUP BY status"));
    result.throw_if_failed("sync queue stats");

    QueueStats stats;
    for (int i = 0; i < result.num_rows(); ++i) {
        int64_t count = std::stoll(result.get_value(i, "count"));
        stats.total += count;

        auto status = parse_status(result.get_value(i, "status"));
        if (!status) continue;

        switch (*status) {
            case JobStatus::Pending: stats.pending += count; break;
            case JobStatus::Processing: stats.processing += count; break;
            case JobStatus::Done: stats.done += count; break;
            case JobStatus::Failed: stats.failed += count; break;
            case JobStatus::Cancelled: stats.cancelled += count; break;
        }
    }

    auto last = QueryResult(conn->exec(
        "SELECT to_char(MAX(processed_at) AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') FROM " + table_));
    last.throw_if_failed("sync queue last processed");

    if (last.num_rows() > 0 && !last.is_null(0, 0)) {
        stats.last_processed_at = last.get_value(0, 0);
    }
    return stats;
}

QueueHealth PgJobRepository::health() {
    ScopedConnection conn(db_pool_.get());

    auto finished = QueryResult(conn->exec(
        "SELECT COALESCE(AVG(EXTRACT(EPOCH FROM (processed_at - created_at)))"
        " FILTER (WHERE status IN ('done', 'completed') AND processed_at IS NOT NULL), 0) AS avg_latency,"
        " COUNT(*) FILTER (WHERE status IN ('done', 'completed')) AS done,"
        " COUNT(*) FILTER (WHERE status = 'failed') AS failed"
        " FROM " + table_));
    finished.throw_if_failed("sync queue latency");

    QueueHealth health;
    if (finished.num_rows() > 0) {
        health.avg_latency_seconds = std::stod(finished.get_value(0, "avg_latency"));
        int64_t done = std::stoll(finished.get_value(0, "done"));
        int64_t failed = std::stoll(finished.get_value(0, "failed"));
        if (done + failed > 0) {
            health.success_rate = 100.0 * static_cast<double>(done) / static_cast<double>(done + failed);
        }
    }

    auto depth = QueryResult(conn->exec(
        "SELECT module, COUNT(*) AS depth FROM " + table_ +
        " WHERE status = 'pending' GROUP BY module"));
    depth.throw_if_failed("sync queue depth");

    for (int i = 0; i < depth.num_rows(); ++i) {
        health.depth_by_module[depth.get_value(i, "module")] = std::stoll(depth.get_value(i, "depth"));
    }
    return health;
}

int PgJobRepository::reset_failed() {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec(
        "UPDATE " + table_ + " SET status = 'pending', attempts = 0, error_message = NULL,"
        " scheduled_at = NULL WHERE status = 'failed'"));
    result.throw_if_failed("sync job retry");

    return result.affected_rows();
}

int PgJobRepository::delete_finished_before(const std::string& cutoff) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "DELETE FROM " + table_ + " WHERE status IN ('done', 'completed', 'failed')"
        " AND created_at < " + utc_param(1),
        {cutoff}));
    result.throw_if_failed("sync queue cleanup");

    return result.affected_rows();
}

} // namespace syncgate
