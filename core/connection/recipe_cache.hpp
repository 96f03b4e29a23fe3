#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

#include "common/status.hpp"
#include "connection_recipe.hpp"

namespace kasa {
namespace connection {

/**
 * @brief Last working ConnectionRecipe per host
 *
 * Negotiation tries the cached recipe before the candidate list. The cache
 * is persisted as a RecipeCacheFile protobuf message; a missing file loads
 * as an empty cache.
 *
 * Thread-safety: all methods may be called concurrently.
 */
class RecipeCache {
public:
    static constexpr uint32_t kFormatVersion = 1;

    std::optional<ConnectionRecipe> lookup(const std::string& host) const;
    void remember(const std::string& host, const ConnectionRecipe& recipe);
    void forget(const std::string& host);

    size_t size() const;

    bool load(const std::string& path, Status& status);
    bool save(const std::string& path, Status& status) const;

private:
    struct Entry {
        ConnectionRecipe recipe;
        int64_t updated_at_ms = 0;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace connection
}  // namespace kasa
