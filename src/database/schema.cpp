#include "syncgate/database.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace syncgate {

const std::string& checked_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) {
        throw std::invalid_argument("Invalid schema name: '" + name + "'");
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) {
            throw std::invalid_argument("Invalid schema name: '" + name + "'");
        }
    }
    return name;
}

bool initialize_schema(DatabasePool& pool, const std::string& schema) {
    const std::string& s = checked_identifier(schema);

    try {
        ScopedConnection conn(&pool);

        auto result1 = QueryResult(conn->exec("CREATE SCHEMA IF NOT EXISTS " + s));
        if (!result1.is_success()) {
            spdlog::error("Failed to create schema: {}", result1.error_message());
            return false;
        }

        std::string create_tables_sql = R"(
            CREATE TABLE IF NOT EXISTS )" + s + R"(.sync_queue (
                id BIGSERIAL PRIMARY KEY,
                correlation_id VARCHAR(36),
                module VARCHAR(64) NOT NULL,
                direction VARCHAR(16) NOT NULL DEFAULT 'wp_to_odoo',
                entity_type VARCHAR(64) NOT NULL,
                wp_id BIGINT NOT NULL DEFAULT 0,
                odoo_id BIGINT NOT NULL DEFAULT 0,
                action VARCHAR(16) NOT NULL DEFAULT 'update',
                payload TEXT,
                priority SMALLINT NOT NULL DEFAULT 5,
                status VARCHAR(16) NOT NULL DEFAULT 'pending',
                attempts INTEGER NOT NULL DEFAULT 0,
                max_attempts INTEGER NOT NULL DEFAULT 3,
                error_message TEXT,
                scheduled_at TIMESTAMPTZ,
                processed_at TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );

            CREATE TABLE IF NOT EXISTS )" + s + R"(.state (
                key VARCHAR(191) PRIMARY KEY,
                value TEXT NOT NULL,
                expires_at TIMESTAMPTZ,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );
        )";

        auto result2 = QueryResult(conn->exec(create_tables_sql));
        if (!result2.is_success()) {
            spdlog::error("Failed to create tables: {}", result2.error_message());
            return false;
        }

        std::string create_indexes_sql =
            "CREATE INDEX IF NOT EXISTS idx_sync_queue_status_priority ON " + s +
            ".sync_queue(status, priority, created_at);"
            "CREATE INDEX IF NOT EXISTS idx_sync_queue_module_entity ON " + s +
            ".sync_queue(module, entity_type, status);"
            "CREATE INDEX IF NOT EXISTS idx_sync_queue_scheduled ON " + s +
            ".sync_queue(scheduled_at) WHERE status = 'pending';"
            "CREATE INDEX IF NOT EXISTS idx_state_expires ON " + s +
            ".state(expires_at) WHERE expires_at IS NOT NULL;";

        auto result3 = QueryResult(conn->exec(create_indexes_sql));
        if (!result3.is_success()) {
            spdlog::warn("Some indexes may not have been created: {}", result3.error_message());
        } else {
            spdlog::info("Database schema '{}' ready", s);
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Schema initialization failed: {}", e.what());
        return false;
    }
}

} // namespace syncgate
