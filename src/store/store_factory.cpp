#include "store/store_factory.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "store/fs_object_store.h"
#include "store/pg_object_store.h"

namespace cloudpulse::store {

auto MakeObjectStore(const StoreConfig& config) -> std::shared_ptr<IObjectStore> {
    if (config.backend == "fs") {
        spdlog::info("Using filesystem object store at {}", config.root);
        return std::make_shared<FsObjectStore>(config.root);
    }
    if (config.backend == "postgres") {
        spdlog::info("Using Postgres object store (pool size {})", config.db_pool_size);
        auto pool = std::make_shared<PgConnectionPool>(config.db_connection, config.db_pool_size,
                                                       config.db_acquire_timeout);
        auto pg = std::make_shared<PgObjectStore>(pool);
        pg->EnsureSchema();
        return pg;
    }
    throw std::invalid_argument("Unknown store backend: " + config.backend);
}

} // namespace cloudpulse::store
