#include "recipe_cache.hpp"

#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>

#include "logging/logger.hpp"
#include "recipe_cache.pb.h"

namespace kasa {
namespace connection {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

std::optional<ConnectionRecipe> RecipeCache::lookup(const std::string& host) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(host);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.recipe;
}

void RecipeCache::remember(const std::string& host, const ConnectionRecipe& recipe) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[host] = Entry{recipe, now_ms()};
}

void RecipeCache::forget(const std::string& host) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(host);
}

size_t RecipeCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool RecipeCache::load(const std::string& path, Status& status) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_DEBUG("[RecipeCache] No cache at " << path << ", starting empty");
        status = Status::success();
        return true;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    kasa::cache::v1::RecipeCacheFile file;
    if (!file.ParseFromString(buffer.str())) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "Failed to parse recipe cache " + path);
        return false;
    }
    if (file.version() != kFormatVersion) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR,
                               "Unsupported recipe cache version " + std::to_string(file.version()));
        return false;
    }

    std::map<std::string, Entry> loaded;
    for (const auto& entry : file.entries()) {
        std::optional<int> login_version;
        if (entry.has_login_version()) {
            login_version = entry.login_version();
        }
        std::optional<int> http_port;
        if (entry.has_http_port()) {
            http_port = entry.http_port();
        }
        ConnectionRecipe recipe;
        Status entry_status;
        if (!recipe_from_values(entry.device_family(), entry.encryption_type(), entry.https(), login_version,
                                http_port, recipe, entry_status)) {
            LOG_WARN("[RecipeCache] Skipping cached recipe for " << entry.host() << ": " << entry_status.message);
            continue;
        }
        loaded[entry.host()] = Entry{recipe, entry.updated_at_ms()};
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_ = std::move(loaded);
    }
    LOG_INFO("[RecipeCache] Loaded " << size() << " recipes from " << path);
    status = Status::success();
    return true;
}

bool RecipeCache::save(const std::string& path, Status& status) const {
    kasa::cache::v1::RecipeCacheFile file;
    file.set_version(kFormatVersion);
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& item : entries_) {
            const ConnectionRecipe& recipe = item.second.recipe;
            auto* entry = file.add_entries();
            entry->set_host(item.first);
            entry->set_device_family(device_family_to_string(recipe.family));
            entry->set_encryption_type(transport_kind_to_string(recipe.transport));
            entry->set_https(recipe.https);
            if (recipe.login_version) {
                entry->set_login_version(*recipe.login_version);
            }
            if (recipe.http_port) {
                entry->set_http_port(*recipe.http_port);
            }
            entry->set_updated_at_ms(item.second.updated_at_ms);
        }
    }

    std::string serialized;
    if (!file.SerializeToString(&serialized)) {
        status = Status::error(StatusCode::INTERNAL, "Failed to serialize recipe cache");
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "Cannot write recipe cache " + path);
        return false;
    }
    out.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
    if (!out) {
        status = Status::error(StatusCode::INTERNAL, "Short write to recipe cache " + path);
        return false;
    }
    status = Status::success();
    return true;
}

}  // namespace connection
}  // namespace kasa
