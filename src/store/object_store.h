#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace cloudpulse::store {

class StoreError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        Io
    };

    StoreError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] auto kind() const -> Kind { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Key-value blob store addressed by hierarchical '/'-separated keys.
 *
 * Implementations must be safe to call from several threads at once.
 * Failures are reported by throwing StoreError.
 */
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    /**
     * @brief Keys starting with prefix, in lexicographic order.
     */
    virtual auto List(const std::string& prefix) -> std::vector<std::string> = 0;

    /**
     * @brief Body stored at key. Throws StoreError(NotFound) if absent.
     */
    virtual auto Get(const std::string& key) -> std::string = 0;

    /**
     * @brief Stores body at key, replacing any previous body.
     */
    virtual auto Put(const std::string& key, const std::string& body) -> void = 0;
};

} // namespace cloudpulse::store
