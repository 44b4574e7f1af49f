#pragma once

#include <memory>
#include <string>
#include <vector>

#include "store/object_store.h"
#include "store/pg_connection_pool.h"

namespace cloudpulse::store {

// Object store backed by a single Postgres table keyed by object key.
class PgObjectStore : public IObjectStore {
public:
    explicit PgObjectStore(std::shared_ptr<PgConnectionPool> pool);

    // Creates the backing table if it does not exist.
    auto EnsureSchema() -> void;

    auto List(const std::string& prefix) -> std::vector<std::string> override;
    auto Get(const std::string& key) -> std::string override;
    auto Put(const std::string& key, const std::string& body) -> void override;

private:
    std::shared_ptr<PgConnectionPool> pool_;
};

} // namespace cloudpulse::store
