#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "store/object_store.h"

namespace cloudpulse::store {

// Maps each key onto a file below root_. Writes go to a temporary sibling
// first and are renamed into place.
class FsObjectStore : public IObjectStore {
public:
    explicit FsObjectStore(std::filesystem::path root);

    auto List(const std::string& prefix) -> std::vector<std::string> override;
    auto Get(const std::string& key) -> std::string override;
    auto Put(const std::string& key, const std::string& body) -> void override;

    [[nodiscard]] auto Root() const -> const std::filesystem::path& { return root_; }

private:
    auto PathForKey(const std::string& key) const -> std::filesystem::path;

    std::filesystem::path root_;
};

} // namespace cloudpulse::store
