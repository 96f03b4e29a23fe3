#include "negotiator.hpp"

#include <algorithm>
#include <sstream>

#include "device/device.hpp"
#include "device/device_factory.hpp"
#include "logging/logger.hpp"

namespace kasa {
namespace connection {

Negotiator::Negotiator(std::shared_ptr<device::DeviceFactory> factory, std::shared_ptr<RecipeCache> cache)
    : factory_(std::move(factory)), cache_(std::move(cache)), candidates_(candidate_recipes()) {}

NegotiationResult Negotiator::try_connect_all(const DeviceConfig& config, const NegotiationObserver& observer,
                                              std::optional<Clock::time_point> deadline) const {
    NegotiationResult result;

    std::vector<ConnectionRecipe> order;
    std::optional<ConnectionRecipe> cached;
    if (cache_) {
        cached = cache_->lookup(config.host);
        if (cached) {
            LOG_DEBUG("[Negotiator] Trying cached recipe " << cached->to_string() << " for " << config.host << " first");
            order.push_back(*cached);
        }
    }
    for (const auto& candidate : candidates_) {
        if (std::find(order.begin(), order.end(), candidate) == order.end()) {
            order.push_back(candidate);
        }
    }

    bool expired = false;
    for (const auto& recipe : order) {
        if (deadline && Clock::now() >= *deadline) {
            LOG_WARN("[Negotiator] Deadline reached for " << config.host << " after " << result.attempts.size()
                                                          << " attempts");
            expired = true;
            break;
        }

        DeviceConfig attempt_config = config;
        attempt_config.connection_type = recipe;

        Status status;
        std::shared_ptr<device::Device> device = factory_->connect(attempt_config, status);
        bool success = device != nullptr;
        result.attempts.push_back(NegotiationAttempt{recipe, success ? Status::success() : status});

        if (observer) {
            observer(recipe, success);
        }

        if (success) {
            LOG_INFO("[Negotiator] Connected to " << config.host << " with " << recipe.to_string());
            if (cache_) {
                cache_->remember(config.host, recipe);
            }
            result.device = std::move(device);
            result.status = Status::success();
            return result;
        }

        LOG_DEBUG("[Negotiator] " << recipe.to_string() << " failed for " << config.host << ": " << status);
        if (cached && recipe == *cached && cache_) {
            cache_->forget(config.host);
        }
    }

    std::ostringstream message;
    message << "No working connection to " << config.host << " after " << result.attempts.size() << " attempts";
    if (expired) {
        message << " (deadline reached)";
    }
    for (const auto& attempt : result.attempts) {
        message << "; " << attempt.recipe.to_string() << ": " << attempt.status.to_string();
    }
    result.status = Status::error(StatusCode::NO_WORKING_CONNECTION, message.str());
    LOG_WARN("[Negotiator] " << result.status.message);
    return result;
}

}  // namespace connection
}  // namespace kasa
