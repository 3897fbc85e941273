#include "syncgate/database.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <chrono>
#include <cstdlib>

namespace syncgate {

DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(PQconnectdb(connection_string.c_str())) {
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Timeouts go through SET so they also work behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    auto result = QueryResult(PQexec(conn_, set_timeouts.c_str()));
    if (!result.is_success()) {
        std::string error = result.error_message();
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to set session timeouts: " + error);
    }
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(values.size()),
                        nullptr, values.data(), nullptr, nullptr, 0);
}

DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms,
                           int idle_in_transaction_timeout_ms)
    : connection_string_(connection_string),
      pool_size_(pool_size),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms) {

    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            available_connections_.push(create_connection());
            ++current_size_;
        } catch (const std::exception& e) {
            spdlog::error("Failed to open initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw std::runtime_error("Failed to create any database connections");
    }

    spdlog::info("Database pool ready with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::open_dedicated_connection() {
    return create_connection();
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                                     [this] { return !available_connections_.empty(); });

    if (ready) {
        auto conn = std::move(available_connections_.front());
        available_connections_.pop();
        if (conn->is_valid()) {
            return conn;
        }
        spdlog::warn("Dropping broken pooled connection, opening a replacement");
        --current_size_;
    } else {
        // Exhausted: one extra session lets callers recover once PostgreSQL is back
        spdlog::warn("Pool acquisition timed out after {}ms (pool: {}/{}), opening a new connection",
                     acquisition_timeout_ms_, current_size_, pool_size_);
    }

    lock.unlock();
    std::unique_ptr<DatabaseConnection> fresh;
    try {
        fresh = create_connection();
    } catch (const std::exception& e) {
        spdlog::error("Could not open database connection: {}", e.what());
        if (ready) throw;
        throw std::runtime_error("Database connection pool timeout (waited " +
                                 std::to_string(acquisition_timeout_ms_) + "ms)");
    }
    lock.lock();

    ++current_size_;
    return fresh;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned connection is broken, replacing it");
    --current_size_;

    try {
        available_connections_.push(create_connection());
        ++current_size_;
    } catch (const std::exception& e) {
        spdlog::error("Could not replace broken connection: {} (pool now {}/{})",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

size_t DatabasePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
}

ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

int QueryResult::affected_rows() const {
    if (!result_) return 0;
    const char* tuples = PQcmdTuples(result_);
    if (!tuples || tuples[0] == '\0') return 0;
    return std::atoi(tuples);
}

std::string QueryResult::get_value(int row, int col) const {
    if (!result_ || row >= PQntuples(result_) || col >= PQnfields(result_)) return "";
    const char* value = PQgetvalue(result_, row, col);
    return value ? std::string(value) : "";
}

std::string QueryResult::get_value(int row, const std::string& field_name) const {
    if (!result_) return "";
    int col = PQfnumber(result_, field_name.c_str());
    return col < 0 ? "" : get_value(row, col);
}

void QueryResult::throw_if_failed(const std::string& context) const {
    if (!is_success()) {
        throw std::runtime_error(context + ": " + error_message());
    }
}

nlohmann::json QueryResult::row_to_json(int row) const {
    nlohmann::json out = nlohmann::json::object();
    if (!result_ || row >= num_rows()) {
        return out;
    }

    for (int col = 0; col < PQnfields(result_); ++col) {
        const char* name = PQfname(result_, col);
        if (!name) continue;

        if (is_null(row, col)) {
            out[name] = nullptr;
            continue;
        }

        std::string value = get_value(row, col);
        switch (PQftype(result_, col)) {
            case 16: // bool
                out[name] = (value == "t" || value == "true");
                break;
            case 20: // int8
            case 21: // int2
            case 23: // int4
                try {
                    out[name] = std::stoll(value);
                } catch (const std::exception&) {
                    out[name] = value;
                }
                break;
            case 700: // float4
            case 701: // float8
            case 1700: // numeric
                try {
                    out[name] = std::stod(value);
                } catch (const std::exception&) {
                    out[name] = value;
                }
                break;
            default:
                out[name] = value;
                break;
        }
    }

    return out;
}

} // namespace syncgate
