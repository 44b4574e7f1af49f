#include "store/pg_object_store.h"

#include <spdlog/spdlog.h>

namespace cloudpulse::store {

PgObjectStore::PgObjectStore(std::shared_ptr<PgConnectionPool> pool) : pool_(std::move(pool)) {}

auto PgObjectStore::EnsureSchema() -> void {
    try {
        auto conn = pool_->Acquire();
        pqxx::work W(*conn);
        W.exec("CREATE TABLE IF NOT EXISTS cloudpulse_objects ("
               "key TEXT PRIMARY KEY, "
               "body TEXT NOT NULL, "
               "updated_at TIMESTAMPTZ NOT NULL DEFAULT now())");
        W.commit();
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::Io, std::string("Schema setup failed: ") + e.what());
    }
}

auto PgObjectStore::List(const std::string& prefix) -> std::vector<std::string> {
    std::vector<std::string> keys;
    try {
        auto conn = pool_->Acquire();
        pqxx::read_transaction R(*conn);
        auto rows = R.exec_params(
            "SELECT key FROM cloudpulse_objects WHERE left(key, length($1)) = $1 ORDER BY key COLLATE \"C\"",
            prefix);
        keys.reserve(rows.size());
        for (const auto& row : rows) {
            keys.push_back(row[0].as<std::string>());
        }
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::Io, "List failed for prefix " + prefix + ": " + e.what());
    }
    return keys;
}

auto PgObjectStore::Get(const std::string& key) -> std::string {
    pqxx::result rows;
    try {
        auto conn = pool_->Acquire();
        pqxx::read_transaction R(*conn);
        rows = R.exec_params("SELECT body FROM cloudpulse_objects WHERE key = $1", key);
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::Io, "Get failed for " + key + ": " + e.what());
    }
    if (rows.empty()) {
        throw StoreError(StoreError::Kind::NotFound, "No such object: " + key);
    }
    return rows[0][0].as<std::string>();
}

auto PgObjectStore::Put(const std::string& key, const std::string& body) -> void {
    try {
        auto conn = pool_->Acquire();
        pqxx::work W(*conn);
        W.exec_params(
            "INSERT INTO cloudpulse_objects (key, body, updated_at) VALUES ($1, $2, now()) "
            "ON CONFLICT (key) DO UPDATE SET body = EXCLUDED.body, updated_at = now()",
            key, body);
        W.commit();
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::Io, "Put failed for " + key + ": " + e.what());
    }
    spdlog::debug("Stored object {} ({} bytes)", key, body.size());
}

} // namespace cloudpulse::store
