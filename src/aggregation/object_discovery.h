#pragma once

#include <memory>
#include <string>
#include <vector>

#include "store/object_store.h"

namespace cloudpulse::aggregation {

struct PrefixFailure {
    std::string prefix;
    std::string error;
};

struct DiscoveryResult {
    std::vector<std::string> keys; // prefix order, then store listing order
    std::vector<PrefixFailure> failed_prefixes;
};

class ObjectDiscovery {
public:
    explicit ObjectDiscovery(std::shared_ptr<store::IObjectStore> store);

    // A prefix whose listing fails contributes no keys; the rest still run.
    auto Discover(const std::vector<std::string>& prefixes) -> DiscoveryResult;

private:
    std::shared_ptr<store::IObjectStore> store_;
};

} // namespace cloudpulse::aggregation
