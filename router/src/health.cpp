#include "health.hpp"

HealthChecker::HealthChecker(PoolUpdateSubscriber& subscriber, PgPoolSource& pool_source,
                             PoolRegistry& registry, RouteCache& route_cache)
    : subscriber_(subscriber), pool_source_(pool_source), registry_(registry), route_cache_(route_cache) {}

HealthChecker::Status HealthChecker::check_health() {
    Status status;
    status.redis_connected = subscriber_.check_health();
    status.database_connected = pool_source_.check_health();
    status.cached_route_sets = route_cache_.size();
    status.refreshes_in_flight = route_cache_.refreshes_in_flight();

    for (const auto& chain : registry_.loaded_chains()) {
        status.chains.push_back({chain, registry_.size(chain)});
    }

    // Loaded registries keep serving without the database; updates need Redis
    status.ok = status.redis_connected;

    if (!status.redis_connected) {
        status.last_error = "Redis connection failed";
    } else if (!status.database_connected) {
        status.last_error = "Pool database unreachable";
    }

    return status;
}
