#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace syncgate {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "syncgate";

    // SSL configuration
    bool use_ssl = false;
    bool ssl_reject_unauthorized = true;

    // Pool configuration
    int pool_size = 10;
    int idle_timeout = 30000;            // 30 seconds
    int connection_timeout = 2000;       // 2 seconds
    int statement_timeout = 30000;       // 30 seconds
    int lock_timeout = 10000;            // 10 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds - timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("PG_SCHEMA", "syncgate");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);
        config.ssl_reject_unauthorized = get_env_bool("PG_SSL_REJECT_UNAUTHORIZED", true);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        if (use_ssl) {
            // Allow self-signed certificates when verification is off
            conn_str += ssl_reject_unauthorized ? " sslmode=require" : " sslmode=prefer";
        } else {
            conn_str += " sslmode=disable";
        }

        // connect_timeout is in seconds and is the only timeout that is safe in
        // the connection string (PgBouncer rejects the others as startup options).
        // statement/lock/idle timeouts are applied with SET after connecting.
        int connect_seconds = connection_timeout / 1000;
        if (connect_seconds < 1) connect_seconds = 1;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds);

        return conn_str;
    }
};

struct BreakerConfig {
    int failure_threshold = 3;           // Consecutive failed batches before opening
    int recovery_delay = 300;            // Seconds before a half-open probe is allowed
    double failure_ratio = 0.8;          // Batch counts as failed at or above this ratio
    int state_ttl = 3600;                // Seconds before counters/opened_at go stale
    int probe_ttl = 360;                 // Must exceed recovery_delay + worker batch time
    int probe_lock_timeout = 0;          // Seconds to wait for the probe mutex
    std::string key_prefix = "syncgate_cb";

    static BreakerConfig from_env() {
        BreakerConfig config;
        config.failure_threshold = get_env_int("SYNCGATE_CB_FAILURE_THRESHOLD", 3);
        config.recovery_delay = get_env_int("SYNCGATE_CB_RECOVERY_DELAY", 300);
        config.failure_ratio = get_env_double("SYNCGATE_CB_FAILURE_RATIO", 0.8);
        config.state_ttl = get_env_int("SYNCGATE_CB_STATE_TTL", 3600);
        config.probe_ttl = get_env_int("SYNCGATE_CB_PROBE_TTL", 360);
        config.probe_lock_timeout = get_env_int("SYNCGATE_CB_PROBE_LOCK_TIMEOUT", 0);
        config.key_prefix = get_env_string("SYNCGATE_CB_KEY_PREFIX", "syncgate_cb");
        return config;
    }
};

struct ModuleBreakerConfig {
    int failure_threshold = 5;           // More patient than the global breaker
    int recovery_delay = 600;
    double failure_ratio = 0.8;
    int stale_after = 7200;              // Discard open state older than 2h
    std::string state_key = "syncgate_module_cb_states";

    static ModuleBreakerConfig from_env() {
        ModuleBreakerConfig config;
        config.failure_threshold = get_env_int("SYNCGATE_MODULE_CB_FAILURE_THRESHOLD", 5);
        config.recovery_delay = get_env_int("SYNCGATE_MODULE_CB_RECOVERY_DELAY", 600);
        config.failure_ratio = get_env_double("SYNCGATE_MODULE_CB_FAILURE_RATIO", 0.8);
        config.stale_after = get_env_int("SYNCGATE_MODULE_CB_STALE_AFTER", 7200);
        return config;
    }
};

struct NotifierConfig {
    std::string recipient;               // Empty disables notifications
    int failure_threshold = 5;           // Consecutive failed jobs before alerting
    int cooldown = 3600;                 // Minimum seconds between alerts
    std::string subject_prefix = "[syncgate]";

    static NotifierConfig from_env() {
        NotifierConfig config;
        config.recipient = get_env_string("SYNCGATE_NOTIFY_RECIPIENT", "");
        config.failure_threshold = get_env_int("SYNCGATE_FAILURE_THRESHOLD", 5);
        config.cooldown = get_env_int("SYNCGATE_FAILURE_COOLDOWN", 3600);
        config.subject_prefix = get_env_string("SYNCGATE_SUBJECT_PREFIX", "[syncgate]");
        return config;
    }
};

struct QueueConfig {
    int default_priority = 5;
    int default_max_attempts = 3;
    int push_debounce_seconds = 5;       // Coalesce rapid-fire pushes for the same entity
    int cleanup_days = 7;
    int fetch_batch_size = 50;

    static QueueConfig from_env() {
        QueueConfig config;
        config.default_priority = get_env_int("SYNCGATE_DEFAULT_PRIORITY", 5);
        config.default_max_attempts = get_env_int("SYNCGATE_MAX_ATTEMPTS", 3);
        config.push_debounce_seconds = get_env_int("SYNCGATE_PUSH_DEBOUNCE", 5);
        config.cleanup_days = get_env_int("SYNCGATE_CLEANUP_DAYS", 7);
        config.fetch_batch_size = get_env_int("SYNCGATE_FETCH_BATCH_SIZE", 50);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_pattern = get_env_string("LOG_PATTERN", "[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    BreakerConfig breaker;
    ModuleBreakerConfig module_breaker;
    NotifierConfig notifier;
    QueueConfig queue;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.breaker = BreakerConfig::from_env();
        config.module_breaker = ModuleBreakerConfig::from_env();
        config.notifier = NotifierConfig::from_env();
        config.queue = QueueConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

// Applies level and pattern to the default spdlog logger
void init_logging(const LoggingConfig& config);

} // namespace syncgate
