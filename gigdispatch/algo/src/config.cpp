#include <gigdispatch/algo/config.hpp>
#include <gigdispatch/algo/error.hpp>

#include <array>
#include <utility>

namespace gigdispatch::algo {

void validate_config(const AllocationConfig& config) {
    if (config.offer_timeout_seconds <= 0.0) {
        throw ConfigError("offer_timeout_seconds", "must be positive");
    }
    if (config.max_concurrent_offers == 0) {
        throw ConfigError("max_concurrent_offers", "must be at least 1");
    }
    if (config.max_worker_distance_km <= 0.0) {
        throw ConfigError("max_worker_distance_km", "must be positive");
    }
    if (config.min_worker_rating < 0.0 || config.min_worker_rating > 5.0) {
        throw ConfigError("min_worker_rating", "must be within [0, 5]");
    }
    if (config.max_tasks_per_worker == 0) {
        throw ConfigError("max_tasks_per_worker", "must be at least 1");
    }
    if (config.heartbeat_timeout_seconds <= 0.0) {
        throw ConfigError("heartbeat_timeout_seconds", "must be positive");
    }

    const std::array<std::pair<const char*, double>, 6> weights{{
        {"distance_weight", config.distance_weight},
        {"rating_weight", config.rating_weight},
        {"experience_weight", config.experience_weight},
        {"acceptance_rate_weight", config.acceptance_rate_weight},
        {"on_time_rate_weight", config.on_time_rate_weight},
        {"load_balance_weight", config.load_balance_weight},
    }};
    for (const auto& [name, value] : weights) {
        if (value < 0.0) {
            throw ConfigError(name, "must not be negative");
        }
    }
}

} // namespace gigdispatch::algo
