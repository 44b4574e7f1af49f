#pragma once

#include <memory>

#include "config.h"
#include "store/object_store.h"

namespace cloudpulse::store {

// "fs" -> FsObjectStore at config.root; "postgres" -> PgObjectStore with its
// schema ensured. Throws std::invalid_argument for any other backend.
auto MakeObjectStore(const StoreConfig& config) -> std::shared_ptr<IObjectStore>;

} // namespace cloudpulse::store
