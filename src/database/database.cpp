#include "agentcost/database.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace agentcost {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Timeouts go through SET so they also apply behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to set timeout parameters: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
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

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                       nullptr, param_values.data(), nullptr, nullptr, 0);
}

PGresult* DatabaseConnection::exec_params_nullable(const std::string& query,
                                                   const std::vector<const std::string*>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto* param : params) {
        param_values.push_back(param ? param->c_str() : nullptr);
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                       nullptr, param_values.data(), nullptr, nullptr, 0);
}

bool DatabaseConnection::begin_transaction() {
    auto result = QueryResult(exec("BEGIN"));
    return result.is_success();
}

bool DatabaseConnection::commit_transaction() {
    auto result = QueryResult(exec("COMMIT"));
    return result.is_success();
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    return result.is_success();
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "No connection";
}

// DatabasePool Implementation
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

    // Pre-populate the pool
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw std::runtime_error("Failed to create any database connections");
    }

    spdlog::info("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                             [this] { return !available_connections_.empty(); })) {
        // Pool exhausted: a fresh connection lets us recover once the database is back
        spdlog::warn("Pool timeout - attempting to create new connection (pool: {}/{})", current_size_, pool_size_);

        try {
            lock.unlock();
            auto new_conn = create_connection();
            lock.lock();

            if (new_conn && new_conn->is_valid()) {
                ++current_size_;
                spdlog::info("Created new connection during timeout, pool now {}/{}", current_size_, pool_size_);
                return new_conn;
            }
            throw std::runtime_error("Failed to create connection - database may be down");
        } catch (const std::exception& e) {
            spdlog::error("Failed to create connection on timeout: {}", e.what());
            throw std::runtime_error("Database connection pool timeout (waited " +
                                     std::to_string(acquisition_timeout_ms_) + "ms)");
        }
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");
        --current_size_;

        lock.unlock();
        auto new_conn = create_connection();
        lock.lock();

        if (!new_conn || !new_conn->is_valid()) {
            spdlog::error("Failed to create replacement connection, pool size reduced to {}/{}", current_size_, pool_size_);
            throw std::runtime_error("Failed to create valid database connection");
        }
        ++current_size_;
        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
    --current_size_;

    try {
        auto new_conn = create_connection();
        if (new_conn && new_conn->is_valid()) {
            available_connections_.push(std::move(new_conn));
            ++current_size_;
            spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
        } else {
            spdlog::error("Failed to create replacement connection, pool size reduced to {}/{}", current_size_, pool_size_);
        }
    } catch (const std::exception& e) {
        spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

// QueryResult Implementation
double QueryResult::get_double(int row, const std::string& field_name, double default_value) const {
    if (is_null(row, field_name)) return default_value;
    try {
        return std::stod(get_value(row, field_name));
    } catch (const std::exception&) {
        return default_value;
    }
}

int64_t QueryResult::get_int64(int row, const std::string& field_name, int64_t default_value) const {
    if (is_null(row, field_name)) return default_value;
    try {
        return std::stoll(get_value(row, field_name));
    } catch (const std::exception&) {
        return default_value;
    }
}

bool QueryResult::get_bool(int row, const std::string& field_name) const {
    std::string value = get_value(row, field_name);
    return value == "t" || value == "true";
}

std::string QueryResult::sql_state() const {
    if (!result_) return "";
    const char* state = PQresultErrorField(result_, PG_DIAG_SQLSTATE);
    return state ? std::string(state) : "";
}

} // namespace agentcost
