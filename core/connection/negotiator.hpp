#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "connection_recipe.hpp"
#include "device_config.hpp"
#include "recipe_cache.hpp"

namespace kasa {
namespace device {
class Device;
class DeviceFactory;
}  // namespace device

namespace connection {

struct NegotiationAttempt {
    ConnectionRecipe recipe;
    Status status;
};

struct NegotiationResult {
    std::shared_ptr<device::Device> device;  // null unless a candidate worked
    Status status;                           // NO_WORKING_CONNECTION when every candidate failed
    std::vector<NegotiationAttempt> attempts;

    bool ok() const { return device != nullptr; }
};

// Called once per attempted recipe, in attempt order
using NegotiationObserver = std::function<void(const ConnectionRecipe& recipe, bool success)>;

/**
 * @brief Finds a working ConnectionRecipe by trying candidates in order
 *
 * Each attempt builds transport, protocol and device for one recipe and
 * performs the first refresh. The first attempt to succeed wins; failed
 * attempts are recorded and their connections closed. A recipe cached for
 * the host is tried before the fixed candidate list and dropped from the
 * cache when it no longer works.
 */
class Negotiator {
public:
    using Clock = std::chrono::steady_clock;

    explicit Negotiator(std::shared_ptr<device::DeviceFactory> factory, std::shared_ptr<RecipeCache> cache = nullptr);

    // Replaces candidate_recipes()
    void set_candidates(std::vector<ConnectionRecipe> candidates) { candidates_ = std::move(candidates); }
    const std::vector<ConnectionRecipe>& candidates() const { return candidates_; }

    // Attempts not started before the deadline are skipped
    NegotiationResult try_connect_all(const DeviceConfig& config, const NegotiationObserver& observer = nullptr,
                                      std::optional<Clock::time_point> deadline = std::nullopt) const;

private:
    std::shared_ptr<device::DeviceFactory> factory_;
    std::shared_ptr<RecipeCache> cache_;
    std::vector<ConnectionRecipe> candidates_;
};

}  // namespace connection
}  // namespace kasa
