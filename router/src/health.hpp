#pragma once
#include "pg_pool_source.hpp"
#include "pool_registry.hpp"
#include "pool_update_subscriber.hpp"
#include "route_cache.hpp"
#include <string>
#include <vector>

class HealthChecker {
public:
    HealthChecker(PoolUpdateSubscriber& subscriber, PgPoolSource& pool_source,
                  PoolRegistry& registry, RouteCache& route_cache);

    struct ChainStatus {
        std::string chain;
        size_t pools;
    };

    struct Status {
        bool ok;
        bool redis_connected;
        bool database_connected;
        std::vector<ChainStatus> chains;
        size_t cached_route_sets;
        size_t refreshes_in_flight;
        std::string last_error;
    };

    Status check_health();

private:
    PoolUpdateSubscriber& subscriber_;
    PgPoolSource& pool_source_;
    PoolRegistry& registry_;
    RouteCache& route_cache_;
};
