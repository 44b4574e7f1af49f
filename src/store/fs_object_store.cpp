#include "store/fs_object_store.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace cloudpulse::store {

namespace fs = std::filesystem;

namespace {

auto IsSafeKey(const std::string& key) -> bool {
    if (key.empty() || key.front() == '/') return false;
    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment == "..") return false;
    }
    return true;
}

auto TempSuffix() -> std::string {
    static std::atomic<unsigned long> counter{0};
    std::ostringstream oss;
    oss << ".tmp-" << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "-" << counter++;
    return oss.str();
}

} // namespace

FsObjectStore::FsObjectStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StoreError(StoreError::Kind::Io, "Cannot create store root " + root_.string() + ": " + ec.message());
    }
}

auto FsObjectStore::PathForKey(const std::string& key) const -> fs::path {
    if (!IsSafeKey(key)) {
        throw StoreError(StoreError::Kind::Io, "Invalid object key: " + key);
    }
    return root_ / fs::path(key);
}

auto FsObjectStore::List(const std::string& prefix) -> std::vector<std::string> {
    // Walk from the deepest directory the prefix names, then filter.
    auto slash = prefix.rfind('/');
    fs::path start = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);

    std::vector<std::string> keys;
    std::error_code ec;
    if (!fs::exists(start, ec)) {
        return keys;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(start)) {
            if (!entry.is_regular_file()) continue;
            std::string key = fs::relative(entry.path(), root_).generic_string();
            if (key.find(".tmp-") != std::string::npos) continue;
            if (key.compare(0, prefix.size(), prefix) == 0) {
                keys.push_back(std::move(key));
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw StoreError(StoreError::Kind::Io, "Cannot list " + start.string() + ": " + e.what());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

auto FsObjectStore::Get(const std::string& key) -> std::string {
    auto path = PathForKey(key);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            throw StoreError(StoreError::Kind::NotFound, "No such object: " + key);
        }
        throw StoreError(StoreError::Kind::Io, "Cannot open object: " + key);
    }
    std::ostringstream body;
    body << in.rdbuf();
    if (in.bad()) {
        throw StoreError(StoreError::Kind::Io, "Read failed for object: " + key);
    }
    return body.str();
}

auto FsObjectStore::Put(const std::string& key, const std::string& body) -> void {
    auto path = PathForKey(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError(StoreError::Kind::Io, "Cannot create directory for " + key + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += TempSuffix();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreError(StoreError::Kind::Io, "Cannot open " + tmp.string() + " for writing");
        }
        out << body;
        out.flush();
        if (!out) {
            throw StoreError(StoreError::Kind::Io, "Write failed for object: " + key);
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StoreError(StoreError::Kind::Io, "Cannot move object into place: " + key);
    }
}

} // namespace cloudpulse::store
