#pragma once
#include <pqxx/pqxx>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include "kvsession/db_config.hpp"
#include "kvsession/logger.hpp"

namespace kvsession {
namespace db {

class ConnectionPool;

// Connection borrowed from a ConnectionPool; handed back on destruction.
class ConnectionLease {
public:
    ConnectionLease(std::unique_ptr<pqxx::connection> conn, ConnectionPool* pool);
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&&) noexcept;
    ConnectionLease& operator=(ConnectionLease&&) noexcept;

    pqxx::connection& get();
    pqxx::connection* operator->() { return conn_.get(); }

private:
    void give_back();

    std::unique_ptr<pqxx::connection> conn_;
    ConnectionPool* pool_;
};

// Fixed-size pool of PostgreSQL connections. Broken connections are replaced
// on the next acquire; connection failures surface as pqxx exceptions.
class ConnectionPool {
public:
    explicit ConnectionPool(const Config& config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Blocks until a connection is free; throws StoreError on timeout.
    ConnectionLease acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    size_t size() const;
    size_t available() const;

private:
    friend class ConnectionLease;

    void release(std::unique_ptr<pqxx::connection> conn);
    std::unique_ptr<pqxx::connection> open_connection();

    Config config_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
    log::Logger logger_{ "ConnectionPool" };
};

} // namespace db
} // namespace kvsession
