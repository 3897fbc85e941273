#include "syncgate/state_store.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

int64_t StateStore::get_int(const std::string& key, int64_t default_value) {
    auto value = get(key);
    if (!value || value->empty()) return default_value;
    try {
        return std::stoll(*value);
    } catch (const std::exception&) {
        spdlog::debug("State key '{}' is not numeric ('{}'), using {}", key, *value, default_value);
        return default_value;
    }
}

namespace {

// NULL expiry for ttl <= 0, else NOW() + ttl seconds; ttl is bind parameter $n
std::string expiry_expr(int n) {
    const std::string p = "$" + std::to_string(n) + "::int";
    return "CASE WHEN " + p + " > 0 THEN NOW() + make_interval(secs => " + p + ") ELSE NULL END";
}

} // namespace

PgStateStore::PgStateStore(std::shared_ptr<DatabasePool> db_pool, const std::string& schema_name)
    : db_pool_(db_pool) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    table_ = checked_identifier(schema_name) + ".state";
}

std::optional<std::string> PgStateStore::get(const std::string& key) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "SELECT value FROM " + table_ +
        " WHERE key = $1 AND (expires_at IS NULL OR expires_at > NOW())",
        {key}));
    result.throw_if_failed("state get '" + key + "'");

    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return result.get_value(0, 0);
}

void PgStateStore::put(const std::string& key, const std::string& value, int ttl_seconds) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "INSERT INTO " + table_ + " (key, value, expires_at, updated_at) "
        "VALUES ($1, $2, " + expiry_expr(3) + ", NOW()) "
        "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, "
        "expires_at = EXCLUDED.expires_at, updated_at = NOW()",
        {key, value, std::to_string(ttl_seconds)}));
    result.throw_if_failed("state put '" + key + "'");
}

bool PgStateStore::add(const std::string& key, const std::string& value, int ttl_seconds) {
    // The conditional DO UPDATE takes over an expired row; a live row makes
    // the statement return nothing. Either way it is one atomic statement.
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "INSERT INTO " + table_ + " AS s (key, value, expires_at, updated_at) "
        "VALUES ($1, $2, " + expiry_expr(3) + ", NOW()) "
        "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, "
        "expires_at = EXCLUDED.expires_at, updated_at = NOW() "
        "WHERE s.expires_at IS NOT NULL AND s.expires_at <= NOW() "
        "RETURNING key",
        {key, value, std::to_string(ttl_seconds)}));
    result.throw_if_failed("state add '" + key + "'");

    return result.num_rows() == 1;
}

int64_t PgStateStore::increment_by(const std::string& key, int64_t amount, int ttl_seconds) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "INSERT INTO " + table_ + " AS s (key, value, expires_at, updated_at) "
        "VALUES ($1, $3::bigint::text, " + expiry_expr(2) + ", NOW()) "
        "ON CONFLICT (key) DO UPDATE SET value = ("
        "  CASE WHEN (s.expires_at IS NOT NULL AND s.expires_at <= NOW()) "
        "         OR s.value !~ '^-?[0-9]+$' THEN 0 "
        "       ELSE s.value::bigint END + $3::bigint)::text, "
        "expires_at = EXCLUDED.expires_at, updated_at = NOW() "
        "RETURNING value",
        {key, std::to_string(ttl_seconds), std::to_string(amount)}));
    result.throw_if_failed("state increment '" + key + "'");

    if (result.num_rows() == 0) {
        throw std::runtime_error("state increment '" + key + "' returned no row");
    }
    return std::stoll(result.get_value(0, 0));
}

void PgStateStore::remove(const std::string& key) {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(
        "DELETE FROM " + table_ + " WHERE key = $1", {key}));
    result.throw_if_failed("state remove '" + key + "'");
}

int PgStateStore::purge_expired() {
    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec(
        "DELETE FROM " + table_ + " WHERE expires_at IS NOT NULL AND expires_at <= NOW()"));
    result.throw_if_failed("state purge");
    return result.affected_rows();
}

} // namespace syncgate
