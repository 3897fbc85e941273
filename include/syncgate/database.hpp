#pragma once

#include <libpq-fe.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>

namespace syncgate {

// One libpq session with the per-session timeouts applied
class DatabaseConnection {
private:
    PGconn* conn_;

public:
    explicit DatabaseConnection(const std::string& connection_string,
                                int statement_timeout_ms = 30000,
                                int lock_timeout_ms = 10000,
                                int idle_in_transaction_timeout_ms = 30000);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool is_valid() const;

    // Both return nullptr when the session is gone; QueryResult treats that
    // as a failed statement
    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const std::vector<std::string>& params);
};

// Bounded pool. Broken sessions are replaced on checkout and on return, and
// an exhausted pool opens one extra session rather than failing outright.
class DatabasePool {
private:
    std::queue<std::unique_ptr<DatabaseConnection>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::string connection_string_;
    size_t pool_size_;
    size_t current_size_;
    int acquisition_timeout_ms_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;
    int idle_in_transaction_timeout_ms_;

    std::unique_ptr<DatabaseConnection> create_connection();

public:
    explicit DatabasePool(const std::string& connection_string,
                          size_t pool_size = 10,
                          int acquisition_timeout_ms = 10000,
                          int statement_timeout_ms = 30000,
                          int lock_timeout_ms = 10000,
                          int idle_in_transaction_timeout_ms = 30000);

    std::unique_ptr<DatabaseConnection> get_connection();
    void return_connection(std::unique_ptr<DatabaseConnection> conn);

    // Opens a connection that is never pooled. Used where the session itself
    // carries state, e.g. advisory locks.
    std::unique_ptr<DatabaseConnection> open_dedicated_connection();

    size_t size() const;
    size_t available() const;
};

// RAII connection wrapper
class ScopedConnection {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;

public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
};

// Owns a PGresult
class QueryResult {
private:
    PGresult* result_;

public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;

    bool is_success() const {
        return result_ && (PQresultStatus(result_) == PGRES_COMMAND_OK ||
                           PQresultStatus(result_) == PGRES_TUPLES_OK);
    }

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }

    // Rows touched by INSERT/UPDATE/DELETE
    int affected_rows() const;

    std::string get_value(int row, int col) const;
    std::string get_value(int row, const std::string& field_name) const;

    bool is_null(int row, int col) const {
        return result_ && PQgetisnull(result_, row, col);
    }

    std::string error_message() const {
        return result_ ? PQresultErrorMessage(result_) : "No result";
    }

    // Throws std::runtime_error carrying the server message unless the
    // statement succeeded
    void throw_if_failed(const std::string& context) const;

    // Integer and float columns become JSON numbers, booleans JSON booleans,
    // everything else (text, timestamps, payload) stays a string
    nlohmann::json row_to_json(int row) const;
};

// Schema names are spliced into SQL text, so only [a-z0-9_] is accepted.
// Throws std::invalid_argument otherwise.
const std::string& checked_identifier(const std::string& name);

// Creates the schema, the sync queue table and the keyed state table
bool initialize_schema(DatabasePool& pool, const std::string& schema = "syncgate");

} // namespace syncgate
