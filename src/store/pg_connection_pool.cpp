#include "store/pg_connection_pool.h"

#include <stdexcept>

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "store/object_store.h"

namespace cloudpulse::store {

PgConnectionPool::PgConnectionPool(std::string conn_str,
                                   size_t max_connections,
                                   std::chrono::milliseconds acquire_timeout)
    : conn_str_(std::move(conn_str)),
      max_connections_(max_connections),
      acquire_timeout_(acquire_timeout) {
    if (max_connections_ == 0) {
        throw std::invalid_argument("Postgres pool needs at least one connection");
    }
    idle_.reserve(max_connections_);
    obs::LogEvent(obs::LogLevel::Info, "pg_pool_created", "pg_pool",
                  {{"max_connections", max_connections_}, {"acquire_timeout_ms", acquire_timeout_.count()}});
}

PgConnectionPool::~PgConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    closing_ = true;
    idle_.clear();
    returned_.notify_all();
}

auto PgConnectionPool::Open() -> std::unique_ptr<pqxx::connection> {
    try {
        return std::make_unique<pqxx::connection>(conn_str_);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "pg_connect_failed", "pg_pool",
                      {{"error_code", obs::kErrDbConnectFailed}, {"error", e.what()}});
        throw StoreError(StoreError::Kind::Io, std::string("Cannot connect to Postgres: ") + e.what());
    }
}

auto PgConnectionPool::Lease(std::unique_ptr<pqxx::connection> conn) -> PgConnectionPtr {
    return PgConnectionPtr(conn.release(), [this](pqxx::connection* c) { Return(c); });
}

auto PgConnectionPool::Acquire() -> PgConnectionPtr {
    auto started = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = returned_.wait_for(lock, acquire_timeout_, [this] {
        return closing_ || !idle_.empty() || leased_ < max_connections_;
    });
    if (closing_) {
        throw StoreError(StoreError::Kind::Io, "Postgres connection pool is closing");
    }
    if (!ready) {
        total_timeouts_++;
        lock.unlock();
        obs::EmitCounter("store_pool_timeouts_total", 1, "timeouts", "pg_pool");
        throw StoreError(StoreError::Kind::Io,
                         "Timed out after " + std::to_string(acquire_timeout_.count()) +
                         "ms waiting for a Postgres connection");
    }

    std::unique_ptr<pqxx::connection> conn;
    if (!idle_.empty()) {
        conn = std::move(idle_.back());
        idle_.pop_back();
    }
    // Reserve the slot before connecting so the lock is not held during connect.
    leased_++;
    lock.unlock();

    if (!conn) {
        try {
            conn = Open();
        } catch (const StoreError&) {
            std::lock_guard<std::mutex> relock(mutex_);
            leased_--;
            returned_.notify_one();
            throw;
        }
    }

    size_t in_use = 0;
    {
        std::lock_guard<std::mutex> relock(mutex_);
        total_acquires_++;
        in_use = leased_;
    }
    obs::EmitGauge("store_pool_in_use", static_cast<double>(in_use), "connections", "pg_pool");
    auto waited_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    if (waited_ms > 100.0) {
        obs::LogEvent(obs::LogLevel::Warn, "pg_pool_slow_acquire", "pg_pool",
                      {{"wait_ms", waited_ms}, {"in_use", in_use}, {"max_connections", max_connections_}});
    }
    return Lease(std::move(conn));
}

auto PgConnectionPool::Return(pqxx::connection* raw) -> void {
    std::unique_ptr<pqxx::connection> conn(raw);
    std::lock_guard<std::mutex> lock(mutex_);
    leased_--;
    // Broken connections are dropped; the freed slot reconnects on demand.
    if (!closing_ && conn->is_open()) {
        idle_.push_back(std::move(conn));
    }
    returned_.notify_one();
}

auto PgConnectionPool::GetStats() const -> PoolStats {
    std::lock_guard<std::mutex> lock(mutex_);
    return {max_connections_, leased_, idle_.size(), total_acquires_, total_timeouts_};
}

} // namespace cloudpulse::store
