#include "kvsession/db_pool.hpp"
#include "kvsession/errors.hpp"

namespace kvsession {
namespace db {

ConnectionLease::ConnectionLease(std::unique_ptr<pqxx::connection> conn, ConnectionPool* pool)
    : conn_(std::move(conn)), pool_(pool) {}

ConnectionLease::~ConnectionLease() {
    give_back();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : conn_(std::move(other.conn_)), pool_(other.pool_) {
    other.pool_ = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        give_back();
        conn_ = std::move(other.conn_);
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ConnectionLease::give_back() {
    if (conn_ && pool_) {
        pool_->release(std::move(conn_));
    }
}

pqxx::connection& ConnectionLease::get() {
    if (!conn_) {
        throw StoreError("connection lease is empty");
    }
    return *conn_;
}

ConnectionPool::ConnectionPool(const Config& config)
    : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.reserve(static_cast<size_t>(config_.pool_size));
    for (int i = 0; i < config_.pool_size; ++i) {
        idle_.push_back(open_connection());
    }
    logger_.info("Opened " + std::to_string(config_.pool_size) + " connections to " +
                 config_.host + ":" + config_.port + "/" + config_.dbname);
}

ConnectionPool::~ConnectionPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

std::unique_ptr<pqxx::connection> ConnectionPool::open_connection() {
    try {
        auto conn = std::make_unique<pqxx::connection>(config_.connection_string());
        if (!conn->is_open()) {
            throw StoreError("database connection is not open");
        }
        return conn;
    } catch (const std::exception& e) {
        logger_.error(std::string("Database connection error: ") + e.what());
        throw;
    }
}

ConnectionLease ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = cv_.wait_for(lock, timeout, [this] { return !idle_.empty() || shutdown_; });
    if (shutdown_) {
        throw StoreError("connection pool is shutting down");
    }
    if (!ready) {
        throw StoreError("connection pool timeout: no connections available");
    }

    auto conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();

    if (!conn->is_open()) {
        logger_.warning("Replacing closed database connection");
        try {
            conn = open_connection();
        } catch (...) {
            release(std::move(conn));
            throw;
        }
    }

    return ConnectionLease(std::move(conn), this);
}

void ConnectionPool::release(std::unique_ptr<pqxx::connection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || !conn) {
            return;
        }
        // Closed connections are kept and reopened lazily by acquire()
        idle_.push_back(std::move(conn));
    }
    cv_.notify_one();
}

size_t ConnectionPool::size() const {
    return static_cast<size_t>(config_.pool_size);
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace db
} // namespace kvsession
