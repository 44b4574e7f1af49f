#pragma once

#include <pqxx/pqxx>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cloudpulse::store {

// Connection lease; the deleter hands the connection back to its pool.
using PgConnectionPtr = std::unique_ptr<pqxx::connection, std::function<void(pqxx::connection*)>>;

/**
 * @brief Bounded set of Postgres connections shared by PgObjectStore calls.
 *
 * Connections are opened on demand until max_connections are leased. A
 * caller that finds the pool exhausted waits up to acquire_timeout. Every
 * acquisition failure (timeout, shutdown, connect error) is a
 * StoreError(Io), so the store seam reports errors one way.
 */
class PgConnectionPool {
public:
    PgConnectionPool(std::string conn_str,
                     size_t max_connections,
                     std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5));
    ~PgConnectionPool();

    PgConnectionPool(const PgConnectionPool&) = delete;
    PgConnectionPool& operator=(const PgConnectionPool&) = delete;

    auto Acquire() -> PgConnectionPtr;

    struct PoolStats {
        size_t size;
        size_t in_use;
        size_t available;
        long long total_acquires;
        long long total_timeouts;
    };
    auto GetStats() const -> PoolStats;

private:
    auto Open() -> std::unique_ptr<pqxx::connection>;
    auto Lease(std::unique_ptr<pqxx::connection> conn) -> PgConnectionPtr;
    auto Return(pqxx::connection* conn) -> void;

    std::string conn_str_;
    size_t max_connections_;
    std::chrono::milliseconds acquire_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable returned_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    size_t leased_ = 0;
    long long total_acquires_ = 0;
    long long total_timeouts_ = 0;
    bool closing_ = false;
};

} // namespace cloudpulse::store
